#ifndef __MAZE_API_H___
#define __MAZE_API_H___

/**
 * @file maze_api.h
 * @brief C entry points for driving the maze search from other languages.
 */

#define MAZE_POLICY_STACK 0
#define MAZE_POLICY_QUEUE 1

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Load a maze file and solve it once.
 *
 * @param input_file Path to the maze text file.
 * @param policy MAZE_POLICY_STACK or MAZE_POLICY_QUEUE.
 * @param out_time_ms Receives the search time in milliseconds.
 * @param out_steps Receives the solution length (0 if unsolvable).
 * @param out_explored Receives the number of explored states.
 * @return 1 if solved, 0 if no solution exists, -1 on invalid arguments,
 *         -2 if the maze cannot be loaded.
 */
int maze_run_instance(
    const char* input_file,
    int policy,
    double* out_time_ms,
    int* out_steps,
    int* out_explored
);

#ifdef __cplusplus
}
#endif

#endif // __MAZE_API_H___
