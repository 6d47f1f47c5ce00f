/**
 * @file grid.hpp
 * @brief Maze grid representation (walls, bounds, start and goal cells).
 *
 * This header declares the Grid class and the Cell/Action/Move value types
 * shared by the parser, the renderer and the search engine.
 */

#ifndef __GRID_HPP___
#define __GRID_HPP___

#include <string>
#include <utility>
#include <vector>

using namespace std;

/**
 * @brief A grid coordinate: first is the row, second is the column.
 *
 * std::pair gives the row-major ordering needed by ordered containers.
 */
typedef pair<int, int> Cell;

/**
 * @brief Cardinal move between two adjacent cells.
 */
enum class Action {
    UP,
    DOWN,
    LEFT,
    RIGHT
};

/**
 * @brief Lowercase name of an action ("up", "down", "left", "right").
 */
const char* action_name(Action action);

/**
 * @brief Row/column delta applied by an action.
 */
Cell action_delta(Action action);

/**
 * @brief Cell reached from `from` by applying `action` (no bounds check).
 */
Cell apply_action(const Cell& from, Action action);

/**
 * @brief A legal move out of a cell: the action and the cell it leads to.
 */
struct Move {
    Action action;
    Cell cell;

    bool operator==(const Move& rhs) const {
        return action == rhs.action && cell == rhs.cell;
    }
};

/**
 * @brief Immutable walkable-cell model of a maze.
 *
 * The grid stores a rectangular wall matrix plus the start and goal cells.
 * It is never modified after construction, so a single instance can be shared
 * read-only between several searches.
 */
class Grid {

private:
    int height;
    int width;
    vector<vector<bool>> walls;
    Cell start;
    Cell goal;
public:
    /**
     * @brief Construct a grid from an already-parsed wall matrix.
     *
     * @param walls Row-major wall flags; every row must have the same length.
     * @param start Start cell.
     * @param goal Goal cell.
     * @throws std::invalid_argument if the matrix is empty or ragged, or if
     *         start/goal are out of bounds or on a wall.
     */
    Grid(const vector<vector<bool>>& walls, const Cell& start, const Cell& goal);
    ~Grid() = default;

    Grid(const Grid& other) = default;
    Grid& operator=(const Grid& other) = default;
    Grid(Grid&& other) = default;
    Grid& operator=(Grid&& other) = default;

    int get_height() const;
    int get_width() const;
    const Cell& get_start() const;
    const Cell& get_goal() const;

    /**
     * @brief True if the cell lies in [0,height) x [0,width).
     */
    bool in_bounds(const Cell& cell) const;

    /**
     * @brief True if the cell is a wall.
     *
     * @throws std::out_of_range if the cell is outside the grid.
     */
    bool is_wall(const Cell& cell) const;

    /**
     * @brief Generate the legal moves out of a cell.
     *
     * Candidates are evaluated in the fixed order up, down, left, right and a
     * candidate is kept iff it is in bounds and not a wall. The order is part
     * of the contract: it decides which branch a stack frontier explores first.
     *
     * @param state Cell to expand; must be in bounds.
     * @return Legal moves, in up/down/left/right order.
     * @throws std::out_of_range if `state` is outside the grid.
     */
    vector<Move> neighbors(const Cell& state) const;
};

#endif // __GRID_HPP___
