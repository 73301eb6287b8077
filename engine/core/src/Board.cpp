#include "crystal/core/Board.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <stdexcept>

#include "crystal/core/Match.hpp"

namespace crystal::core {

namespace {

constexpr int kRedrawTries = 20;

void RedrawUntilStable(Board& board, int row, int col) {
    board.placeRandom(row, col);
    int tries = 0;
    while (HasMatchAt(board, row, col) && tries <= kRedrawTries) {
        board.placeRandom(row, col);
        ++tries;
    }
}

int SameColorRun(const Board& board, int row, int col, int d_row, int d_col, Rgb color) {
    int count = 0;
    for (int r = row + d_row, c = col + d_col;; r += d_row, c += d_col) {
        const Tile* tile = board.tileAt(r, c);
        if (tile == nullptr || tile->color != color) {
            return count;
        }
        ++count;
    }
}

bool CompletesRun(const Board& board, int row, int col, Rgb color) {
    const int horizontal =
        1 + SameColorRun(board, row, col, 0, -1, color) + SameColorRun(board, row, col, 0, 1, color);
    const int vertical =
        1 + SameColorRun(board, row, col, -1, 0, color) + SameColorRun(board, row, col, 1, 0, color);
    return horizontal >= 3 || vertical >= 3;
}

void PlaceWithoutRun(Board& board, int row, int col) {
    for (int tries = 0; tries <= kRedrawTries; ++tries) {
        board.placeRandom(row, col);
        if (!HasMatchAt(board, row, col)) {
            return;
        }
    }

    // Random draws kept landing on a run (skewed weights); draw again among
    // the types that cannot complete one here.
    board.clear(row, col);
    const auto& catalog = board.catalog();
    std::vector<int> candidates;
    double total_weight = 0.0;
    for (std::size_t i = 0; i < catalog.size(); ++i) {
        if (!CompletesRun(board, row, col, catalog[i].color)) {
            candidates.push_back(static_cast<int>(i));
            total_weight += std::max(0.0, catalog[i].spawn_weight);
        }
    }
    if (candidates.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "No block type avoids a run at (%d, %d)", row, col);
        board.placeRandom(row, col);
        return;
    }
    if (total_weight <= 0.0) {
        std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
        board.place(row, col, candidates[pick(board.rng())]);
        return;
    }
    std::uniform_real_distribution<double> dist(0.0, total_weight);
    const double roll = dist(board.rng());
    double accumulator = 0.0;
    for (int type_index : candidates) {
        accumulator += std::max(0.0, catalog[static_cast<std::size_t>(type_index)].spawn_weight);
        if (roll <= accumulator) {
            board.place(row, col, type_index);
            return;
        }
    }
    board.place(row, col, candidates.back());
}

// Row-major fill; a cell only sees tiles above and to its left, so at most
// two colors are ruled out.
void FillWithoutRuns(Board& board) {
    for (int row = 0; row < board.size(); ++row) {
        for (int col = 0; col < board.size(); ++col) {
            board.clear(row, col);
        }
    }
    for (int row = 0; row < board.size(); ++row) {
        for (int col = 0; col < board.size(); ++col) {
            if (!board.isBlocked(row, col)) {
                PlaceWithoutRun(board, row, col);
            }
        }
    }
}

}  // namespace

Board::Board(int size, std::vector<BlockType> catalog, const std::vector<Cell>& blocked_cells,
             std::uint32_t seed)
    : size_(std::clamp(size, kMinGridSize, kMaxGridSize)),
      cells_(static_cast<std::size_t>(size_) * static_cast<std::size_t>(size_)),
      catalog_(std::move(catalog)),
      rng_(seed) {
    if (catalog_.empty()) {
        catalog_ = FallbackBlockTypes();
    }
    for (const auto& type : catalog_) {
        total_weight_ += type.spawn_weight;
    }
    if (total_weight_ <= 0.0) {
        total_weight_ = static_cast<double>(catalog_.size());
    }
    for (const auto& cell : blocked_cells) {
        if (inBounds(cell)) {
            cells_[index(cell.row, cell.col)].state = CellState::Blocked;
        }
    }
}

bool Board::inBounds(int row, int col) const noexcept {
    return row >= 0 && row < size_ && col >= 0 && col < size_;
}

bool Board::isBlocked(int row, int col) const noexcept {
    if (!inBounds(row, col)) {
        return true;
    }
    return cells_[index(row, col)].state == CellState::Blocked;
}

CellState Board::state(int row, int col) const noexcept {
    if (!inBounds(row, col)) {
        return CellState::Blocked;
    }
    return cells_[index(row, col)].state;
}

const Tile* Board::tileAt(int row, int col) const noexcept {
    if (!inBounds(row, col)) {
        return nullptr;
    }
    const Slot& slot = cells_[index(row, col)];
    return slot.state == CellState::Occupied ? &slot.tile : nullptr;
}

const Tile& Board::place(int row, int col, int type_index) {
    if (isBlocked(row, col)) {
        throw std::logic_error("Attempted to place a tile in blocked cell (" + std::to_string(row) + ", " +
                               std::to_string(col) + ")");
    }
    if (type_index < 0 || type_index >= static_cast<int>(catalog_.size())) {
        throw std::logic_error("Unknown block type index " + std::to_string(type_index));
    }
    const BlockType& type = catalog_[static_cast<std::size_t>(type_index)];
    Slot& slot = cells_[index(row, col)];
    slot.state = CellState::Occupied;
    slot.tile.id = next_tile_id_++;
    slot.tile.type_index = type_index;
    slot.tile.color = type.color;
    slot.tile.power = type.power;
    slot.tile.bonus_score = type.bonus_score;
    return slot.tile;
}

const Tile& Board::placeRandom(int row, int col) {
    return place(row, col, pickBlockType());
}

void Board::clear(int row, int col) noexcept {
    if (!inBounds(row, col)) {
        return;
    }
    Slot& slot = cells_[index(row, col)];
    if (slot.state == CellState::Occupied) {
        slot.state = CellState::Empty;
        slot.tile = Tile{};
    }
}

bool Board::swapCells(const Cell& a, const Cell& b) noexcept {
    if (!AreAdjacent(a, b) || isBlocked(a) || isBlocked(b)) {
        return false;
    }
    std::swap(cells_[index(a.row, a.col)], cells_[index(b.row, b.col)]);
    return true;
}

int Board::compactColumn(int col) {
    if (col < 0 || col >= size_) {
        return 0;
    }
    int moved = 0;
    int write = size_ - 1;
    for (int row = size_ - 1; row >= 0; --row) {
        Slot& slot = cells_[index(row, col)];
        if (slot.state == CellState::Blocked) {
            // A blocked cell starts a new gravity segment above it.
            write = row - 1;
            continue;
        }
        if (slot.state != CellState::Occupied) {
            continue;
        }
        if (write != row) {
            Slot& target = cells_[index(write, col)];
            target = slot;
            slot.state = CellState::Empty;
            slot.tile = Tile{};
            ++moved;
        }
        --write;
    }
    return moved;
}

int Board::refillColumn(int col) {
    if (col < 0 || col >= size_) {
        return 0;
    }
    int spawned = 0;
    for (int row = 0; row < size_; ++row) {
        if (cells_[index(row, col)].state == CellState::Empty) {
            placeRandom(row, col);
            ++spawned;
        }
    }
    return spawned;
}

int Board::pickBlockType() {
    if (catalog_.empty()) {
        catalog_ = FallbackBlockTypes();
        total_weight_ = static_cast<double>(catalog_.size());
    }
    std::uniform_real_distribution<double> dist(0.0, total_weight_);
    const double roll = dist(rng_);
    double accumulator = 0.0;
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        accumulator += catalog_[i].spawn_weight;
        if (roll <= accumulator) {
            return static_cast<int>(i);
        }
    }
    return static_cast<int>(catalog_.size()) - 1;
}

int Board::findBlockType(const std::string& id) const noexcept {
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        if (catalog_[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<Cell> Board::freeCells() const {
    std::vector<Cell> cells;
    for (int row = 0; row < size_; ++row) {
        for (int col = 0; col < size_; ++col) {
            if (cells_[index(row, col)].state == CellState::Empty) {
                cells.push_back(Cell{row, col});
            }
        }
    }
    return cells;
}

int Board::blockedCount() const noexcept {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
                                          [](const Slot& slot) { return slot.state == CellState::Blocked; }));
}

bool Board::full() const noexcept {
    return std::none_of(cells_.begin(), cells_.end(),
                        [](const Slot& slot) { return slot.state == CellState::Empty; });
}

Board NewBoard(int size, std::vector<BlockType> catalog, const std::vector<Cell>& blocked_cells,
               std::uint32_t seed) {
    Board board(size, std::move(catalog), blocked_cells, seed);
    FillWithoutRuns(board);
    return board;
}

bool BreakRuns(Board& board) {
    for (int attempt = 0; attempt < kGenerationAttempts; ++attempt) {
        const ScanResult scan = ScanMatches(board);
        if (scan.groups == 0) {
            return true;
        }
        for (int row = 0; row < board.size(); ++row) {
            for (int col = 0; col < board.size(); ++col) {
                if (scan.mask.test(row, col)) {
                    RedrawUntilStable(board, row, col);
                }
            }
        }
    }
    if (!HasImmediateMatches(board)) {
        return true;
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Runs survived %d redraw passes, regenerating grid",
                 kGenerationAttempts);
    FillWithoutRuns(board);
    return !HasImmediateMatches(board);
}

}  // namespace crystal::core
