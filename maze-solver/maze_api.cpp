#include <chrono>
#include <exception>
#include <string>

#include "grid.hpp"
#include "maze_file_operations.hpp"
#include "frontier.hpp"
#include "search_engine.hpp"
#include "maze_api.h"

extern "C" {
    int maze_run_instance(
        const char* input_file,
        int policy,
        double* out_time_ms,
        int* out_steps,
        int* out_explored
    ) {
        if (!input_file || !out_time_ms || !out_steps || !out_explored) {
            return -1;
        }
        FrontierPolicy frontier_policy;
        if (policy == MAZE_POLICY_STACK) frontier_policy = FrontierPolicy::STACK;
        else if (policy == MAZE_POLICY_QUEUE) frontier_policy = FrontierPolicy::QUEUE;
        else return -1;

        try {
            Grid grid = read_maze_from_file(std::string(input_file));

            SearchEngine engine(frontier_policy);
            auto t0 = std::chrono::steady_clock::now();
            SearchResult result = engine.solve(grid);
            auto t1 = std::chrono::steady_clock::now();
            double ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();

            *out_time_ms = ms;
            *out_steps = static_cast<int>(result.solution.size());
            *out_explored = result.explored_count;
            return result.solved() ? 1 : 0;
        } catch (const std::exception&) {
            return -2;
        }
    }
}
