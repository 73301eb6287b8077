#pragma once

#include <optional>

#include "crystal/core/Board.hpp"
#include "crystal/core/Cascade.hpp"

namespace crystal::core::ai {

struct BestMoveResult {
    Move move{};
    int score = 0;
    ResolveResult simulation{};
};

// Swaps a and b, scans, and swaps back. True when the swap makes a run.
bool LegalSwap(Board& board, const Move& move);

bool AnyLegalMoves(const Board& board);

// Highest scoring swap, simulated on copies of the board. Refill draws come
// from each copy's own generator, so the live board is never advanced.
std::optional<BestMoveResult> BestMove(const Board& board);

}  // namespace crystal::core::ai
