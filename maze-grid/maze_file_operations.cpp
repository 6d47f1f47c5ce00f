#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"
#include "maze_file_operations.hpp"

using namespace std;

// Decode UTF-8 into code points; a malformed byte becomes one U+FFFD.
static u32string decode_utf8(const string& contents) {
    u32string out;
    size_t i = 0;
    while (i < contents.size()) {
        unsigned char lead = static_cast<unsigned char>(contents[i]);
        size_t extra = 0;
        char32_t cp = lead;
        if (lead >= 0xC2 && lead <= 0xDF) { extra = 1; cp = lead & 0x1F; }
        else if (lead >= 0xE0 && lead <= 0xEF) { extra = 2; cp = lead & 0x0F; }
        else if (lead >= 0xF0 && lead <= 0xF4) { extra = 3; cp = lead & 0x07; }
        else if (lead >= 0x80) { out.push_back(0xFFFD); ++i; continue; }

        if (i + extra >= contents.size()) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char c = static_cast<unsigned char>(contents[i + k]);
            if ((c & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (!valid) {
            out.push_back(0xFFFD);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

static bool is_line_break(char32_t c) {
    switch (c) {
        case U'\n': case U'\r': case U'\v': case U'\f':
        case 0x1C: case 0x1D: case 0x1E:
        case 0x85: case 0x2028: case 0x2029:
            return true;
    }
    return false;
}

// Same separators as Python's str.splitlines(); "\r\n" counts as one break.
static vector<u32string> split_lines(const u32string& text) {
    vector<u32string> lines;
    u32string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char32_t c = text[i];
        if (is_line_break(c)) {
            lines.push_back(current);
            current.clear();
            if (c == U'\r' && i + 1 < text.size() && text[i + 1] == U'\n') ++i;
        } else {
            current.push_back(c);
        }
    }
    // a trailing line break does not start a new row
    if (!current.empty()) lines.push_back(current);
    return lines;
}

Grid parse_maze(const string& contents) {
    // 'A' and 'B' never occur inside a multibyte UTF-8 sequence
    if (count(contents.begin(), contents.end(), 'A') != 1) {
        throw MazeFormatError("maze must have exactly one start point");
    }
    if (count(contents.begin(), contents.end(), 'B') != 1) {
        throw MazeFormatError("maze must have exactly one goal");
    }

    // one cell per code point
    vector<u32string> lines = split_lines(decode_utf8(contents));
    size_t width = 0;
    for (const auto& line : lines) width = max(width, line.size());

    vector<vector<bool>> walls;
    Cell start, goal;
    for (size_t i = 0; i < lines.size(); ++i) {
        vector<bool> row(width, false);
        // cells past the end of a short line stay open floor
        for (size_t j = 0; j < lines[i].size(); ++j) {
            char32_t c = lines[i][j];
            if (c == U'A') {
                start = Cell(static_cast<int>(i), static_cast<int>(j));
            } else if (c == U'B') {
                goal = Cell(static_cast<int>(i), static_cast<int>(j));
            } else if (c == U'#') {
                row[j] = true;
            }
        }
        walls.push_back(row);
    }
    return Grid(walls, start, goal);
}

Grid read_maze_from_file(const string& filename) {
    ifstream infile(filename, ios::in | ios::binary);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    stringstream buffer;
    buffer << infile.rdbuf();
    return parse_maze(buffer.str());
}
