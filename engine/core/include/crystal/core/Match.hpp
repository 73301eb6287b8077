#pragma once

#include <cstdint>
#include <vector>

#include "crystal/core/Board.hpp"

namespace crystal::core {

class MatchMask {
public:
    MatchMask() = default;
    explicit MatchMask(int size)
        : size_(size), cells_(static_cast<std::size_t>(size) * static_cast<std::size_t>(size), 0) {}

    int size() const noexcept { return size_; }

    bool test(int row, int col) const noexcept {
        return row >= 0 && row < size_ && col >= 0 && col < size_ && cells_[index(row, col)] != 0;
    }
    bool test(const Cell& cell) const noexcept { return test(cell.row, cell.col); }

    void mark(int row, int col) noexcept {
        if (row >= 0 && row < size_ && col >= 0 && col < size_) {
            cells_[index(row, col)] = 1;
        }
    }

    int count() const noexcept;
    std::vector<Cell> cells() const;

    bool operator==(const MatchMask& other) const noexcept {
        return size_ == other.size_ && cells_ == other.cells_;
    }
    bool operator!=(const MatchMask& other) const noexcept { return !(*this == other); }

private:
    std::size_t index(int row, int col) const noexcept {
        return static_cast<std::size_t>(row) * static_cast<std::size_t>(size_) + static_cast<std::size_t>(col);
    }

    int size_{0};
    std::vector<std::uint8_t> cells_;
};

struct ScanResult {
    MatchMask mask;
    int groups = 0;
};

// Marks every horizontal and vertical run of three or more same-colored tiles.
// Empty and blocked cells break a run. A cell shared by a horizontal and a
// vertical run is marked once, but both runs count toward groups.
ScanResult ScanMatches(const Board& board);

bool HasMatchAt(const Board& board, int row, int col);
bool HasMatchAt(const Board& board, const Cell& cell);
bool HasImmediateMatches(const Board& board);

// One expansion pass over the powered tiles inside mask. Tiles caught by an
// expansion do not fire their own power in the same pass.
MatchMask ExpandSpecialEffects(const Board& board, const MatchMask& mask);

}  // namespace crystal::core
