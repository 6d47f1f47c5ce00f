#include <exception>
#include <iostream>
#include <string>

#include "grid.hpp"
#include "maze_file_operations.hpp"
#include "maze_render.hpp"
#include "search_engine.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file = "maze1.txt";
    if (argc > 1) {
        string a = argv[1];
        if (a == "--help") {
            cout << "Usage: maze-solver [maze-file]\n";
            return 0;
        }
        if (a.rfind("--", 0) == 0) {
            cerr << "Error: unknown option " << a << '\n';
            return 3;
        }
        input_file = a;
    }

    try {
        Grid grid = read_maze_from_file(input_file);
        cout << "Maze:\n";
        cout << '\n' << render_maze(grid) << '\n';

        cout << "Solving...\n";
        SearchEngine engine;
        SearchResult result = engine.solve(grid);
        if (!result.solved()) {
            cerr << "No solution.\n";
            return 1;
        }
        cout << "States Explored: " << result.explored_count << '\n';
        cout << "Solution:\n";
        cout << '\n' << render_maze(grid, &result.solution) << '\n';
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
