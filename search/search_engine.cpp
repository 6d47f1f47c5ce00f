#include <algorithm>
#include <set>
#include <vector>

#include "grid.hpp"
#include "frontier.hpp"
#include "search_engine.hpp"

using namespace std;

const char* search_state_name(SearchState state) {
    switch (state) {
        case SearchState::READY: return "ready";
        case SearchState::RUNNING: return "running";
        case SearchState::SOLVED: return "solved";
        case SearchState::UNSOLVABLE: return "unsolvable";
    }
    return "unknown";
}

SearchEngine::SearchEngine(FrontierPolicy policy)
    : policy(policy), grid(nullptr), state(SearchState::READY), frontier(policy), explored_count(0)
{
}

void SearchEngine::start(const Grid& grid) {
    this->grid = &grid;
    frontier = Frontier(policy);
    explored.clear();
    nodes.clear();
    solution.clear();
    explored_count = 0;

    frontier.add(SearchNode(grid.get_start(), NO_PARENT, Action::UP));
    state = SearchState::RUNNING;
}

SearchState SearchEngine::step() {
    if (state != SearchState::RUNNING) {
        return state;
    }
    if (frontier.is_empty()) {
        state = SearchState::UNSOLVABLE;
        grid = nullptr;
        return state;
    }

    nodes.push_back(frontier.remove());
    size_t index = nodes.size() - 1;
    Cell current = nodes[index].state;
    explored_count++;

    if (current == grid->get_goal()) {
        build_solution(index);
        state = SearchState::SOLVED;
        grid = nullptr;
        return state;
    }

    explored.insert(current);
    for (const auto& move : grid->neighbors(current)) {
        if (explored.find(move.cell) == explored.end() && !frontier.contains_state(move.cell)) {
            frontier.add(SearchNode(move.cell, index, move.action));
        }
    }
    return state;
}

void SearchEngine::build_solution(size_t goal_index) {
    solution.clear();
    for (size_t i = goal_index; !nodes[i].is_root(); i = nodes[i].parent) {
        solution.push_back(Step{nodes[i].action, nodes[i].state});
    }
    reverse(solution.begin(), solution.end());
}

SearchResult SearchEngine::solve(const Grid& grid) {
    start(grid);
    SearchState result = SearchState::RUNNING;
    do {
        result = step();
    } while (result == SearchState::RUNNING);

    return SearchResult{result, solution, explored_count, explored};
}

const Grid* SearchEngine::get_grid() const {
    return grid;
}

SearchState SearchEngine::get_state() const {
    return state;
}

FrontierPolicy SearchEngine::get_policy() const {
    return policy;
}

int SearchEngine::get_explored_count() const {
    return explored_count;
}

const set<Cell>& SearchEngine::get_explored() const {
    return explored;
}

const Solution& SearchEngine::get_solution() const {
    return solution;
}
