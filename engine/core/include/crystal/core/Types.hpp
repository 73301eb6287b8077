#pragma once

#include <cstdint>

namespace crystal::core {

using Rgb = std::uint32_t;

struct Cell {
    std::int32_t row{};
    std::int32_t col{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return row == other.row && col == other.col;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }
};

struct Move {
    Cell a{};
    Cell b{};
};

constexpr bool AreAdjacent(const Cell& a, const Cell& b) noexcept {
    const int dr = a.row > b.row ? a.row - b.row : b.row - a.row;
    const int dc = a.col > b.col ? a.col - b.col : b.col - a.col;
    return dr + dc == 1;
}

enum class TilePower { None, Bomb, LineHorizontal, LineVertical, ColorClear, ScoreBoost };

}  // namespace crystal::core
