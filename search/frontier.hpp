#ifndef __FRONTIER_HPP___
#define __FRONTIER_HPP___

/**
 * @file frontier.hpp
 * @brief Ordered container of pending search nodes with a removal policy.
 */

#include <deque>
#include <map>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "search_node.hpp"

/**
 * @brief Which end of the frontier `remove()` takes from.
 *
 * STACK removes the most recently added node (depth-first search), QUEUE the
 * oldest one (breadth-first search).
 */
enum class FrontierPolicy {
    STACK,
    QUEUE
};

/**
 * @brief Name of a policy ("stack" or "queue").
 */
const char* policy_name(FrontierPolicy policy);

/**
 * @brief Parse a policy name ("stack"/"lifo"/"dfs" or "queue"/"fifo"/"bfs").
 *
 * @throws std::invalid_argument on an unknown name.
 */
FrontierPolicy parse_policy(const std::string& name);

/**
 * @brief Raised by `Frontier::remove()` on an empty frontier.
 */
class EmptyFrontierError : public std::out_of_range {
public:
    EmptyFrontierError() : std::out_of_range("empty frontier") {}
};

class Frontier {

private:
    FrontierPolicy policy;
    std::deque<SearchNode> nodes;
    // number of held nodes per state
    std::map<Cell, int> state_counts;
public:
    explicit Frontier(FrontierPolicy policy = FrontierPolicy::STACK);

    /**
     * @brief Append a node; always succeeds.
     */
    void add(const SearchNode& node);

    /**
     * @brief True iff some node currently held has this state.
     */
    bool contains_state(const Cell& state) const;

    bool is_empty() const;
    size_t size() const;
    FrontierPolicy get_policy() const;

    /**
     * @brief Remove and return one node according to the policy.
     *
     * @throws EmptyFrontierError if the frontier is empty.
     */
    SearchNode remove();
};

#endif // __FRONTIER_HPP___
