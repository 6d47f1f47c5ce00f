#ifndef __SEARCH_ENGINE_HPP___
#define __SEARCH_ENGINE_HPP___

/**
 * @file search_engine.hpp
 * @brief Uninformed maze search (depth-first or breadth-first by frontier policy).
 */

#include <set>
#include <vector>

#include "grid.hpp"
#include "search_node.hpp"
#include "frontier.hpp"

/**
 * @brief Lifecycle of one search run.
 *
 * READY before the first run, RUNNING while steps remain, then SOLVED or
 * UNSOLVABLE once the run is over.
 */
enum class SearchState {
    READY,
    RUNNING,
    SOLVED,
    UNSOLVABLE
};

const char* search_state_name(SearchState state);

/**
 * @brief Outcome of `SearchEngine::solve`.
 *
 * @var status SOLVED or UNSOLVABLE.
 * @var solution Steps from start to goal; empty unless SOLVED.
 * @var explored_count Nodes removed from the frontier, goal node included.
 * @var explored Cells expanded during the run.
 */
struct SearchResult {
    SearchState status;
    Solution solution;
    int explored_count;
    std::set<Cell> explored;

    bool solved() const { return status == SearchState::SOLVED; }
};

/**
 * @brief Drives the search loop over a `Grid` and a `Frontier`.
 *
 * The engine owns the state of the current run (frontier, explored set,
 * expanded-node arena). `start()` resets it, so one engine can solve any
 * number of mazes in sequence. It is not meant to be shared between threads;
 * use one engine per concurrent search.
 */
class SearchEngine {

private:
    FrontierPolicy policy;
    // only set while RUNNING
    const Grid* grid;
    SearchState state;
    Frontier frontier;
    std::set<Cell> explored;
    // expanded nodes; SearchNode::parent indexes into this
    std::vector<SearchNode> nodes;
    int explored_count;
    Solution solution;

    void build_solution(size_t goal_index);
public:
    explicit SearchEngine(FrontierPolicy policy = FrontierPolicy::STACK);

    /**
     * @brief Reset the run state and seed the frontier with the start cell.
     *
     * @param grid Maze to search; must outlive the run. The engine drops its
     *        pointer to it as soon as the run is SOLVED or UNSOLVABLE.
     */
    void start(const Grid& grid);

    /**
     * @brief Run one iteration of the search loop.
     *
     * Removes one node from the frontier. If it is the goal the path is
     * rebuilt and the run becomes SOLVED; otherwise its unexplored neighbours
     * that are not already pending are added to the frontier. An empty
     * frontier makes the run UNSOLVABLE. Outside RUNNING this is a no-op.
     *
     * @return State of the run after the step.
     */
    SearchState step();

    /**
     * @brief Search the maze from start to goal.
     *
     * @param grid Maze to search.
     * @return Status, solution and exploration counters of this run.
     */
    SearchResult solve(const Grid& grid);

    /**
     * @brief Grid of the run in progress, or nullptr once the run is over.
     */
    const Grid* get_grid() const;

    SearchState get_state() const;
    FrontierPolicy get_policy() const;
    int get_explored_count() const;
    const std::set<Cell>& get_explored() const;
    const Solution& get_solution() const;
};

#endif // __SEARCH_ENGINE_HPP___
