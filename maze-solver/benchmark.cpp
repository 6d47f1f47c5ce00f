#include <iostream>
#include <chrono>
#include <string>

#include "grid.hpp"
#include "maze_file_operations.hpp"
#include "frontier.hpp"
#include "search_engine.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file;
    string policy_raw = "stack";
    int runs = 1;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--policy" && i + 1 < argc) { policy_raw = argv[++i]; }
        else if (a == "--runs" && i + 1 < argc) {
            try {
                runs = stoi(argv[++i]);
            } catch (const std::exception& e) {
                cerr << "Error: invalid --runs value: " << e.what() << '\n';
                return 3;
            }
        }
        else if (a == "--help") {
            cout << "Usage: maze-benchmark --input-file FILE [--policy stack|queue] [--runs N]\n";
            return 0;
        }
    }

    if (input_file.empty()) {
        cerr << "Error: --input-file is required\n";
        return 3;
    }
    if (runs < 1) {
        cerr << "Error: runs must be at least 1\n";
        return 3;
    }

    FrontierPolicy policy;
    try {
        policy = parse_policy(policy_raw);
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 3;
    }

    try {
        Grid grid = read_maze_from_file(input_file);

        SearchEngine engine(policy);
        SearchResult result = {SearchState::READY, {}, 0, {}};
        auto t0 = chrono::steady_clock::now();
        for (int r = 0; r < runs; ++r) {
            result = engine.solve(grid);
        }
        auto t1 = chrono::steady_clock::now();
        double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count() / runs;

        bool found = result.solved();
        size_t plen = result.solution.size();

        cout << "policy: " << policy_name(policy) << ", time: " << ms << "ms, solution found: " << (found?1:0) << ", steps: " << plen << ", explored: " << result.explored_count << '\n';
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }

    return 0;
}
