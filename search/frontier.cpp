#include <deque>
#include <map>
#include <stdexcept>
#include <string>

#include "frontier.hpp"

using namespace std;

const char* policy_name(FrontierPolicy policy) {
    switch (policy) {
        case FrontierPolicy::STACK: return "stack";
        case FrontierPolicy::QUEUE: return "queue";
    }
    return "unknown";
}

FrontierPolicy parse_policy(const string& name) {
    if (name == "stack" || name == "lifo" || name == "dfs") return FrontierPolicy::STACK;
    if (name == "queue" || name == "fifo" || name == "bfs") return FrontierPolicy::QUEUE;
    throw invalid_argument("Unknown frontier policy: " + name);
}

Frontier::Frontier(FrontierPolicy policy)
    : policy(policy)
{
}

void Frontier::add(const SearchNode& node) {
    nodes.push_back(node);
    ++state_counts[node.state];
}

bool Frontier::contains_state(const Cell& state) const {
    return state_counts.find(state) != state_counts.end();
}

bool Frontier::is_empty() const {
    return nodes.empty();
}

size_t Frontier::size() const {
    return nodes.size();
}

FrontierPolicy Frontier::get_policy() const {
    return policy;
}

SearchNode Frontier::remove() {
    if (is_empty()) {
        throw EmptyFrontierError();
    }
    SearchNode node = (policy == FrontierPolicy::STACK) ? nodes.back() : nodes.front();
    if (policy == FrontierPolicy::STACK) {
        nodes.pop_back();
    } else {
        nodes.pop_front();
    }
    auto it = state_counts.find(node.state);
    if (--it->second == 0) state_counts.erase(it);
    return node;
}
