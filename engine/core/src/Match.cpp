#include "crystal/core/Match.hpp"

#include <algorithm>
#include <set>

namespace crystal::core {

namespace {

constexpr int kMinRun = 3;

bool SameColor(const Tile* tile, Rgb color) {
    return tile != nullptr && tile->color == color;
}

}  // namespace

int MatchMask::count() const noexcept {
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), std::uint8_t{1}));
}

std::vector<Cell> MatchMask::cells() const {
    std::vector<Cell> out;
    for (int row = 0; row < size_; ++row) {
        for (int col = 0; col < size_; ++col) {
            if (cells_[index(row, col)] != 0) {
                out.push_back(Cell{row, col});
            }
        }
    }
    return out;
}

ScanResult ScanMatches(const Board& board) {
    const int n = board.size();
    ScanResult result{MatchMask(n), 0};

    for (int row = 0; row < n; ++row) {
        int col = 0;
        while (col < n) {
            const Tile* tile = board.tileAt(row, col);
            if (tile == nullptr) {
                ++col;
                continue;
            }
            const int start = col;
            while (col + 1 < n && SameColor(board.tileAt(row, col + 1), tile->color)) {
                ++col;
            }
            if (col - start + 1 >= kMinRun) {
                for (int c = start; c <= col; ++c) {
                    result.mask.mark(row, c);
                }
                ++result.groups;
            }
            ++col;
        }
    }

    for (int col = 0; col < n; ++col) {
        int row = 0;
        while (row < n) {
            const Tile* tile = board.tileAt(row, col);
            if (tile == nullptr) {
                ++row;
                continue;
            }
            const int start = row;
            while (row + 1 < n && SameColor(board.tileAt(row + 1, col), tile->color)) {
                ++row;
            }
            if (row - start + 1 >= kMinRun) {
                for (int r = start; r <= row; ++r) {
                    result.mask.mark(r, col);
                }
                ++result.groups;
            }
            ++row;
        }
    }

    return result;
}

bool HasMatchAt(const Board& board, int row, int col) {
    const Tile* tile = board.tileAt(row, col);
    if (tile == nullptr) {
        return false;
    }
    int count = 1;
    for (int c = col - 1; SameColor(board.tileAt(row, c), tile->color); --c) {
        ++count;
    }
    for (int c = col + 1; SameColor(board.tileAt(row, c), tile->color); ++c) {
        ++count;
    }
    if (count >= kMinRun) {
        return true;
    }
    count = 1;
    for (int r = row - 1; SameColor(board.tileAt(r, col), tile->color); --r) {
        ++count;
    }
    for (int r = row + 1; SameColor(board.tileAt(r, col), tile->color); ++r) {
        ++count;
    }
    return count >= kMinRun;
}

bool HasMatchAt(const Board& board, const Cell& cell) {
    return HasMatchAt(board, cell.row, cell.col);
}

bool HasImmediateMatches(const Board& board) {
    return ScanMatches(board).groups > 0;
}

MatchMask ExpandSpecialEffects(const Board& board, const MatchMask& mask) {
    const int n = board.size();
    MatchMask expanded = mask;
    std::set<int> color_clears;

    for (int row = 0; row < n; ++row) {
        for (int col = 0; col < n; ++col) {
            if (!mask.test(row, col)) {
                continue;
            }
            const Tile* tile = board.tileAt(row, col);
            if (tile == nullptr) {
                continue;
            }
            switch (tile->power) {
                case TilePower::Bomb:
                    for (int dr = -1; dr <= 1; ++dr) {
                        for (int dc = -1; dc <= 1; ++dc) {
                            if (!board.isBlocked(row + dr, col + dc)) {
                                expanded.mark(row + dr, col + dc);
                            }
                        }
                    }
                    break;
                case TilePower::LineHorizontal:
                    for (int c = 0; c < n; ++c) {
                        if (!board.isBlocked(row, c)) {
                            expanded.mark(row, c);
                        }
                    }
                    break;
                case TilePower::LineVertical:
                    for (int r = 0; r < n; ++r) {
                        if (!board.isBlocked(r, col)) {
                            expanded.mark(r, col);
                        }
                    }
                    break;
                case TilePower::ColorClear:
                    color_clears.insert(tile->type_index);
                    break;
                case TilePower::ScoreBoost:
                case TilePower::None:
                    break;
            }
        }
    }

    if (!color_clears.empty()) {
        for (int row = 0; row < n; ++row) {
            for (int col = 0; col < n; ++col) {
                const Tile* tile = board.tileAt(row, col);
                if (tile != nullptr && color_clears.count(tile->type_index) > 0) {
                    expanded.mark(row, col);
                }
            }
        }
    }

    return expanded;
}

}  // namespace crystal::core
