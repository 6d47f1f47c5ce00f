#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"

using namespace std;

const char* action_name(Action action) {
    switch (action) {
        case Action::UP: return "up";
        case Action::DOWN: return "down";
        case Action::LEFT: return "left";
        case Action::RIGHT: return "right";
    }
    return "unknown";
}

Cell action_delta(Action action) {
    switch (action) {
        case Action::UP: return Cell(-1, 0);
        case Action::DOWN: return Cell(1, 0);
        case Action::LEFT: return Cell(0, -1);
        case Action::RIGHT: return Cell(0, 1);
    }
    return Cell(0, 0);
}

Cell apply_action(const Cell& from, Action action) {
    Cell delta = action_delta(action);
    return Cell(from.first + delta.first, from.second + delta.second);
}

Grid::Grid(const vector<vector<bool>>& walls, const Cell& start, const Cell& goal) {
    if (walls.empty() || walls[0].empty()) {
        throw invalid_argument("Grid must have at least one row and one column");
    }
    size_t row_length = walls[0].size();
    for (const auto& row : walls) {
        if (row.size() != row_length) {
            throw invalid_argument("Grid rows must all have the same length");
        }
    }
    this->height = static_cast<int>(walls.size());
    this->width = static_cast<int>(row_length);
    this->walls = walls;
    if (!in_bounds(start) || this->walls[start.first][start.second]) {
        throw invalid_argument("Start cell must be an open cell inside the grid");
    }
    if (!in_bounds(goal) || this->walls[goal.first][goal.second]) {
        throw invalid_argument("Goal cell must be an open cell inside the grid");
    }
    this->start = start;
    this->goal = goal;
}

int Grid::get_height() const {
    return height;
}

int Grid::get_width() const {
    return width;
}

const Cell& Grid::get_start() const {
    return start;
}

const Cell& Grid::get_goal() const {
    return goal;
}

bool Grid::in_bounds(const Cell& cell) const {
    return cell.first >= 0 && cell.first < height && cell.second >= 0 && cell.second < width;
}

bool Grid::is_wall(const Cell& cell) const {
    if (!in_bounds(cell)) {
        throw out_of_range("Cell (" + to_string(cell.first) + ", " + to_string(cell.second) + ") is outside the grid");
    }
    return walls[cell.first][cell.second];
}

vector<Move> Grid::neighbors(const Cell& state) const {
    if (!in_bounds(state)) {
        throw out_of_range("Cell (" + to_string(state.first) + ", " + to_string(state.second) + ") is outside the grid");
    }
    vector<Move> moves;
    // Check possible moves (up, down, left, right)
    const Action directions[] = {Action::UP, Action::DOWN, Action::LEFT, Action::RIGHT};
    for (Action dir : directions) {
        Cell candidate = apply_action(state, dir);
        if (in_bounds(candidate) && !walls[candidate.first][candidate.second]) {
            moves.push_back(Move{dir, candidate});
        }
    }
    return moves;
}
