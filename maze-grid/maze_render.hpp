#ifndef __MAZE_RENDER_HPP___
#define __MAZE_RENDER_HPP___

#include <string>

#include "grid.hpp"
#include "search_node.hpp"

/**
 * @file maze_render.hpp
 * @brief Text rendering of a `Grid`, optionally with a solution path overlaid.
 */

/**
 * @brief Glyphs used for each kind of cell.
 */
struct MazeGlyphs {
    std::string wall;
    std::string start;
    std::string goal;
    std::string path;
    std::string open;

    MazeGlyphs() :
        wall("\xE2\x96\x88"), // U+2588 FULL BLOCK
        start("A"),
        goal("B"),
        path("*"),
        open(" ") {}
};

/**
 * @brief Render the maze as text, one line per row.
 *
 * Each cell gets the first glyph that applies, in the order wall, start,
 * goal, path (the cell is part of `solution`), open.
 *
 * @param grid Maze to draw.
 * @param solution Optional solution whose cells are drawn as path.
 * @param glyphs Glyph set.
 * @return Rendered text; every row ends with '\n'.
 */
std::string render_maze(const Grid& grid, const Solution* solution = nullptr, const MazeGlyphs& glyphs = MazeGlyphs());

#endif // __MAZE_RENDER_HPP___
