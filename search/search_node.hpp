#ifndef __SEARCH_NODE_HPP___
#define __SEARCH_NODE_HPP___

/**
 * @file search_node.hpp
 * @brief Search tree node and solution types.
 */

#include <cstddef>
#include <vector>

#include "grid.hpp"

/**
 * @brief Parent index of the root node.
 */
const size_t NO_PARENT = static_cast<size_t>(-1);

/**
 * @brief A node of the search tree.
 *
 * `parent` indexes the node this one was expanded from in the engine's node
 * arena, or is NO_PARENT for the root. `action` is the move that led here and
 * has no meaning for the root.
 */
struct SearchNode {
    Cell state;
    size_t parent;
    Action action;

    SearchNode(const Cell& state, size_t parent, Action action)
        : state(state), parent(parent), action(action) {}

    bool is_root() const { return parent == NO_PARENT; }
};

/**
 * @brief One entry of a solution: the action taken and the cell it reaches.
 */
struct Step {
    Action action;
    Cell cell;

    bool operator==(const Step& rhs) const {
        return action == rhs.action && cell == rhs.cell;
    }
};

// Steps from start (exclusive) to goal (inclusive).
typedef std::vector<Step> Solution;

#endif // __SEARCH_NODE_HPP___
