#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "crystal/core/Types.hpp"
#include "crystal/core/VariantConfig.hpp"

namespace crystal::core {

inline constexpr int kGenerationAttempts = 8;

enum class CellState { Blocked, Empty, Occupied };

struct Tile {
    std::uint32_t id = 0;
    int type_index = -1;
    Rgb color = 0;
    TilePower power = TilePower::None;
    int bonus_score = 0;
};

// Square grid with a fixed set of blocked cells. Tiles live in a flat arena
// indexed by row * size + col; every cell is tagged Blocked, Empty or Occupied.
class Board {
public:
    Board() = default;
    Board(int size, std::vector<BlockType> catalog, const std::vector<Cell>& blocked_cells,
          std::uint32_t seed = std::random_device{}());

    int size() const noexcept { return size_; }

    bool inBounds(int row, int col) const noexcept;
    bool inBounds(const Cell& cell) const noexcept { return inBounds(cell.row, cell.col); }

    // Out-of-bounds cells count as blocked.
    bool isBlocked(int row, int col) const noexcept;
    bool isBlocked(const Cell& cell) const noexcept { return isBlocked(cell.row, cell.col); }

    CellState state(int row, int col) const noexcept;
    CellState state(const Cell& cell) const noexcept { return state(cell.row, cell.col); }

    const Tile* tileAt(int row, int col) const noexcept;
    const Tile* tileAt(const Cell& cell) const noexcept { return tileAt(cell.row, cell.col); }

    // Throws std::logic_error for blocked or out-of-bounds cells.
    const Tile& place(int row, int col, int type_index);
    const Tile& placeRandom(int row, int col);

    void clear(int row, int col) noexcept;

    bool swapCells(const Cell& a, const Cell& b) noexcept;
    bool swapCells(const Move& move) noexcept { return swapCells(move.a, move.b); }

    int compactColumn(int col);
    int refillColumn(int col);

    int pickBlockType();
    int findBlockType(const std::string& id) const noexcept;
    const std::vector<BlockType>& catalog() const noexcept { return catalog_; }

    std::vector<Cell> freeCells() const;
    int blockedCount() const noexcept;
    bool full() const noexcept;

    std::mt19937& rng() noexcept { return rng_; }
    const std::mt19937& rng() const noexcept { return rng_; }

private:
    struct Slot {
        CellState state = CellState::Empty;
        Tile tile{};
    };

    int index(int row, int col) const noexcept { return row * size_ + col; }

    int size_{0};
    std::vector<Slot> cells_;
    std::vector<BlockType> catalog_;
    double total_weight_{0.0};
    std::uint32_t next_tile_id_{1};
    std::mt19937 rng_{};
};

// Fills every free cell, redrawing tiles that would complete a run. When random
// redraws keep failing, the tile is drawn from the types that cannot complete
// one, so a catalog with three or more colors never yields a run.
Board NewBoard(int size, std::vector<BlockType> catalog, const std::vector<Cell>& blocked_cells,
               std::uint32_t seed = std::random_device{}());

// Redraws every tile inside a run for up to kGenerationAttempts passes, then
// regenerates the grid. Returns true when no run remains.
bool BreakRuns(Board& board);

}  // namespace crystal::core
