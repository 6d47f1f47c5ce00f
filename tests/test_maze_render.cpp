// Google Test for render_maze
#include <gtest/gtest.h>
#include <string>

#include "grid.hpp"
#include "maze_file_operations.hpp"
#include "maze_render.hpp"
#include "search_engine.hpp"

static MazeGlyphs ascii_glyphs() {
    MazeGlyphs glyphs;
    glyphs.wall = "#";
    return glyphs;
}

TEST(RenderMaze, DefaultGlyphsWithoutSolution) {
    Grid g = parse_maze("A #\n  #\n B");
    std::string block = "\xE2\x96\x88";

    EXPECT_EQ(render_maze(g), "A " + block + "\n  " + block + "\n B \n");
}

TEST(RenderMaze, SolutionPathIsDrawn) {
    Grid g = parse_maze("A #\n  #\n B");
    SearchResult result = SearchEngine().solve(g);
    ASSERT_TRUE(result.solved());
    EXPECT_EQ(result.solution.size(), 3u);

    EXPECT_EQ(render_maze(g, &result.solution, ascii_glyphs()),
              "A*#\n"
              " *#\n"
              " B \n");
}

TEST(RenderMaze, WallStartGoalTakePriorityOverPath) {
    Grid g = parse_maze("AB#");
    // a hand-built solution that claims every cell
    Solution claimed = {
        {Action::RIGHT, Cell(0, 0)},
        {Action::RIGHT, Cell(0, 1)},
        {Action::RIGHT, Cell(0, 2)},
    };
    EXPECT_EQ(render_maze(g, &claimed, ascii_glyphs()), "AB#\n");
}

TEST(RenderMaze, CustomGlyphs) {
    Grid g = parse_maze("A  \n## \nB  ");
    SearchResult result = SearchEngine(FrontierPolicy::QUEUE).solve(g);
    ASSERT_TRUE(result.solved());

    MazeGlyphs glyphs;
    glyphs.wall = "X";
    glyphs.start = "S";
    glyphs.goal = "G";
    glyphs.path = "o";
    glyphs.open = ".";
    EXPECT_EQ(render_maze(g, &result.solution, glyphs),
              "Soo\n"
              "XXo\n"
              "Goo\n");
}
