#include <set>
#include <string>

#include "grid.hpp"
#include "search_node.hpp"
#include "maze_render.hpp"

using namespace std;

string render_maze(const Grid& grid, const Solution* solution, const MazeGlyphs& glyphs) {
    set<Cell> path;
    if (solution) {
        for (const auto& step : *solution) path.insert(step.cell);
    }

    string out;
    for (int i = 0; i < grid.get_height(); ++i) {
        for (int j = 0; j < grid.get_width(); ++j) {
            Cell cell(i, j);
            if (grid.is_wall(cell)) {
                out += glyphs.wall;
            } else if (cell == grid.get_start()) {
                out += glyphs.start;
            } else if (cell == grid.get_goal()) {
                out += glyphs.goal;
            } else if (path.count(cell)) {
                out += glyphs.path;
            } else {
                out += glyphs.open;
            }
        }
        out += '\n';
    }
    return out;
}
