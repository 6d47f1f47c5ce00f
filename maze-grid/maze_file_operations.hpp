#ifndef __MAZE_FILE_OPERATIONS_HPP___
#define __MAZE_FILE_OPERATIONS_HPP___

#include <stdexcept>
#include <string>

#include "grid.hpp"

/**
 * @file maze_file_operations.hpp
 * @brief Helpers to build a `Grid` from the plain-text maze format.
 *
 * The format is one text line per grid row: `A` marks the start, `B` the goal,
 * `#` a wall, and any other character is open floor. Lines may have different
 * lengths; the grid is as wide as the longest line and the missing cells of
 * shorter lines are open floor.
 */

/**
 * @brief Raised when a maze source does not hold exactly one start and one goal.
 */
class MazeFormatError : public std::invalid_argument {
public:
    explicit MazeFormatError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Parse a maze from its text contents.
 *
 * The text is decoded as UTF-8 and every code point is one cell. Lines are
 * split on "\n", "\r\n", "\r", "\v", "\f", U+001C..U+001E, U+0085, U+2028
 * and U+2029. A read past the end of a short line is treated as open floor,
 * not as an error.
 *
 * @param contents Full maze text (UTF-8).
 * @throws MazeFormatError if the text does not contain exactly one `A` and
 *         exactly one `B`.
 * @return Constructed `Grid`.
 */
Grid parse_maze(const std::string& contents);

/**
 * @brief Read and parse a maze from a plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws MazeFormatError on an invalid start/goal count.
 * @return Constructed `Grid`.
 */
Grid read_maze_from_file(const std::string& filename);

#endif // __MAZE_FILE_OPERATIONS_HPP___
