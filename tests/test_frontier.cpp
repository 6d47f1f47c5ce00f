// Google Test for Frontier (stack and queue removal policies)
#include <gtest/gtest.h>
#include <stdexcept>

#include "frontier.hpp"

static SearchNode node_at(int row, int col) {
    return SearchNode(Cell(row, col), NO_PARENT, Action::UP);
}

TEST(FrontierTest, StackRemovesMostRecent) {
    Frontier f(FrontierPolicy::STACK);
    f.add(node_at(0, 0));
    f.add(node_at(0, 1));
    f.add(node_at(0, 2));

    EXPECT_EQ(f.size(), 3u);
    EXPECT_EQ(f.remove().state, Cell(0, 2));
    EXPECT_EQ(f.remove().state, Cell(0, 1));
    f.add(node_at(5, 5));
    EXPECT_EQ(f.remove().state, Cell(5, 5));
    EXPECT_EQ(f.remove().state, Cell(0, 0));
    EXPECT_TRUE(f.is_empty());
}

TEST(FrontierTest, QueueRemovesOldest) {
    Frontier f(FrontierPolicy::QUEUE);
    f.add(node_at(0, 0));
    f.add(node_at(0, 1));
    f.add(node_at(0, 2));

    EXPECT_EQ(f.remove().state, Cell(0, 0));
    f.add(node_at(5, 5));
    EXPECT_EQ(f.remove().state, Cell(0, 1));
    EXPECT_EQ(f.remove().state, Cell(0, 2));
    EXPECT_EQ(f.remove().state, Cell(5, 5));
    EXPECT_TRUE(f.is_empty());
}

TEST(FrontierTest, DefaultPolicyIsStack) {
    Frontier f;
    EXPECT_EQ(f.get_policy(), FrontierPolicy::STACK);
}

TEST(FrontierTest, ContainsStateTracksHeldNodes) {
    Frontier f(FrontierPolicy::QUEUE);
    EXPECT_FALSE(f.contains_state(Cell(1, 1)));

    f.add(node_at(1, 1));
    EXPECT_TRUE(f.contains_state(Cell(1, 1)));
    EXPECT_FALSE(f.contains_state(Cell(1, 2)));

    // two nodes for the same state: still held after one removal
    f.add(node_at(1, 1));
    f.remove();
    EXPECT_TRUE(f.contains_state(Cell(1, 1)));
    f.remove();
    EXPECT_FALSE(f.contains_state(Cell(1, 1)));
}

TEST(FrontierTest, RemoveKeepsParentAndAction) {
    Frontier f;
    f.add(SearchNode(Cell(2, 3), 7, Action::LEFT));
    SearchNode n = f.remove();
    EXPECT_EQ(n.state, Cell(2, 3));
    EXPECT_EQ(n.parent, 7u);
    EXPECT_EQ(n.action, Action::LEFT);
    EXPECT_FALSE(n.is_root());
    EXPECT_TRUE(node_at(0, 0).is_root());
}

TEST(FrontierTest, RemoveOnEmptyThrows) {
    Frontier stack(FrontierPolicy::STACK);
    Frontier queue(FrontierPolicy::QUEUE);
    EXPECT_THROW(stack.remove(), EmptyFrontierError);
    EXPECT_THROW(queue.remove(), std::out_of_range);
}

TEST(FrontierTest, PolicyNames) {
    EXPECT_EQ(parse_policy("stack"), FrontierPolicy::STACK);
    EXPECT_EQ(parse_policy("dfs"), FrontierPolicy::STACK);
    EXPECT_EQ(parse_policy("queue"), FrontierPolicy::QUEUE);
    EXPECT_EQ(parse_policy("fifo"), FrontierPolicy::QUEUE);
    EXPECT_STREQ(policy_name(FrontierPolicy::QUEUE), "queue");
    EXPECT_THROW(parse_policy("astar"), std::invalid_argument);
}
