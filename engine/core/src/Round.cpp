#include "crystal/core/Round.hpp"

#include <SDL2/SDL.h>

namespace crystal::core {

namespace {

std::vector<Cell> BlockedCellsOf(const VariantSettings& variant) {
    if (!variant.board_modifier) {
        return {};
    }
    return variant.board_modifier->blocked_cells;
}

}  // namespace

Round::Round(VariantSettings variant, const RoundParams& params, std::uint32_t seed, RoundListener* listener)
    : variant_(std::move(variant)),
      params_(params),
      board_(NewBoard(params.grid_size, variant_.block_types, BlockedCellsOf(variant_), seed)),
      session_(StartSession(params.target_matches, params.move_budget)),
      listener_(listener) {
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Round '%s': %dx%d grid, %d blocked, target %d, %d moves",
                variant_.meta.codename.c_str(), board_.size(), board_.size(), board_.blockedCount(),
                session_.target_matches, session_.moves_left);
}

Round Round::FromJson(const Json& config, std::uint32_t seed, RoundListener* listener) {
    VariantSettings variant;
    if (config.is_object() && config.contains("variant")) {
        variant = VariantSettings::FromJson(config["variant"]);
    } else {
        variant = ExtractVariant(config);
    }
    const Json params = config.is_object() && config.contains("params") ? config["params"] : Json::object();
    const RoundParams round_params = ResolveRoundParams(params, variant.meta);
    return Round(std::move(variant), round_params, seed, listener);
}

void Round::select(int row, int col) {
    if (session_.ended() || state_ == SelectionState::Resolving) {
        return;
    }
    const Cell cell{row, col};
    if (board_.isBlocked(cell)) {
        return;
    }
    if (!selected_) {
        selected_ = cell;
        state_ = SelectionState::FirstSelected;
        return;
    }
    if (*selected_ == cell) {
        selected_.reset();
        state_ = SelectionState::Idle;
        return;
    }
    if (!AreAdjacent(*selected_, cell)) {
        selected_ = cell;
        return;
    }

    const Move move{*selected_, cell};
    selected_.reset();
    playSwap(move);
}

void Round::playSwap(const Move& move) {
    state_ = SelectionState::Resolving;

    SwapReport report;
    report.move = move;
    if (!board_.swapCells(move)) {
        state_ = SelectionState::Idle;
        return;
    }

    report.resolve = ResolveCascades(board_, session_);
    report.matched = report.resolve.had_matches;

    bool ended_now = false;
    if (report.matched) {
        emitScore(report.resolve.points);

        const BonusContext context{report.resolve.cascades, session_.combo_multiplier, session_.matches};
        report.bonuses = EvaluateBonusRules(variant_.bonus_rules, context, session_, board_);
        for (const auto& bonus : report.bonuses) {
            if (bonus.reward.score != 0) {
                emitScore(bonus.reward.score);
            }
            if (bonus.reward.extra_moves != 0 && listener_) {
                listener_->onMovesLeftChanged(session_.moves_left);
            }
            if (listener_) {
                listener_->onBonusTriggered(bonus.rule_id, bonus.summary);
            }
        }
        if (listener_) {
            listener_->onMatchProgress(session_.matches, session_.target_matches);
        }

        const ObjectiveUpdate victory = CheckVictory(session_);
        if (victory.ended_now) {
            emitScore(victory.bonus_points);
            ended_now = true;
        }
    } else {
        // Nothing matched: the swap is undone and the combo resets.
        board_.swapCells(move);
        session_.combo_multiplier = 1.0;
    }

    const ObjectiveUpdate objective = ConsumeMove(session_, report.matched);
    if (listener_) {
        listener_->onMovesLeftChanged(session_.moves_left);
    }
    if (objective.ended_now) {
        if (objective.bonus_points != 0) {
            emitScore(objective.bonus_points);
        }
        ended_now = true;
    }

    last_swap_ = std::move(report);
    state_ = SelectionState::Idle;

    if (ended_now) {
        emitRoundEnded();
    }
}

void Round::emitScore(int amount) {
    if (amount != 0 && listener_) {
        listener_->onScoreDelta(amount);
    }
}

void Round::emitRoundEnded() {
    const bool success = session_.outcome == RoundOutcome::Won;
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Round %s with %d points (%d/%d matches)", OutcomeName(session_.outcome),
                session_.score, session_.matches, session_.target_matches);
    if (listener_) {
        listener_->onRoundEnded(success, session_.score);
    }
}

}  // namespace crystal::core
