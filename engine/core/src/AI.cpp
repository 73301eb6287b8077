#include "crystal/core/AI.hpp"

#include "crystal/core/Match.hpp"

namespace crystal::core::ai {

namespace {

constexpr int kForwardOffsets[2][2] = {{0, 1}, {1, 0}};

}  // namespace

bool LegalSwap(Board& board, const Move& move) {
    if (!board.swapCells(move)) {
        return false;
    }
    const bool ok = HasMatchAt(board, move.a) || HasMatchAt(board, move.b);
    board.swapCells(move);
    return ok;
}

bool AnyLegalMoves(const Board& board) {
    Board scratch = board;
    for (int row = 0; row < scratch.size(); ++row) {
        for (int col = 0; col < scratch.size(); ++col) {
            for (const auto& offset : kForwardOffsets) {
                const Move move{{row, col}, {row + offset[0], col + offset[1]}};
                if (LegalSwap(scratch, move)) {
                    return true;
                }
            }
        }
    }
    return false;
}

std::optional<BestMoveResult> BestMove(const Board& board) {
    BestMoveResult best{};
    bool has_best = false;

    Board scratch = board;
    for (int row = 0; row < board.size(); ++row) {
        for (int col = 0; col < board.size(); ++col) {
            for (const auto& offset : kForwardOffsets) {
                const Move move{{row, col}, {row + offset[0], col + offset[1]}};
                if (!LegalSwap(scratch, move)) {
                    continue;
                }

                Board sim_board = board;
                sim_board.swapCells(move);
                RoundSession scratch;
                ResolveResult sim = ResolveCascades(sim_board, scratch);

                if (!has_best || sim.points > best.score) {
                    best.move = move;
                    best.score = sim.points;
                    best.simulation = std::move(sim);
                    has_best = true;
                }
            }
        }
    }

    if (!has_best) {
        return std::nullopt;
    }
    return best;
}

}  // namespace crystal::core::ai
