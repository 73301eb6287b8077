#include "crystal/core/BonusRules.hpp"

#include <SDL2/SDL.h>

#include <random>

namespace crystal::core {

bool BonusConditionMet(const BonusRule& rule, const BonusContext& context) noexcept {
    switch (rule.trigger) {
        case BonusTrigger::TotalMatches:
            return context.total_matches >= rule.threshold;
        case BonusTrigger::Combo:
            return context.combo >= rule.threshold;
        case BonusTrigger::Cascade:
            return context.cascades >= rule.threshold;
    }
    return false;
}

std::vector<FiredBonus> EvaluateBonusRules(const std::vector<BonusRule>& rules, const BonusContext& context,
                                           RoundSession& session, Board& board) {
    std::vector<FiredBonus> fired;
    for (const auto& rule : rules) {
        if (session.triggered_bonuses.count(rule.id) > 0) {
            continue;
        }
        if (!BonusConditionMet(rule, context)) {
            continue;
        }
        session.triggered_bonuses.insert(rule.id);

        FiredBonus bonus;
        bonus.rule_id = rule.id;
        bonus.rule_name = rule.name;
        bonus.reward = rule.reward;
        bonus.summary = FormatReward(rule.reward);

        if (rule.reward.extra_moves != 0) {
            AddMoves(session, rule.reward.extra_moves);
        }
        if (rule.reward.score != 0) {
            session.score += rule.reward.score;
        }
        if (!rule.reward.spawn_special_block_id.empty()) {
            bonus.spawned_at = SpawnSpecialTile(board, rule.reward.spawn_special_block_id);
        }

        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Bonus '%s' fired: %s", rule.id.c_str(), bonus.summary.c_str());
        fired.push_back(std::move(bonus));
    }
    return fired;
}

std::optional<Cell> SpawnSpecialTile(Board& board, const std::string& block_type_id) {
    int type_index = board.findBlockType(block_type_id);
    if (type_index < 0) {
        if (board.catalog().empty()) {
            return std::nullopt;
        }
        type_index = 0;
    }
    const std::vector<Cell> free_cells = board.freeCells();
    if (free_cells.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> dist(0, free_cells.size() - 1);
    const Cell target = free_cells[dist(board.rng())];
    board.place(target.row, target.col, type_index);
    return target;
}

std::string FormatReward(const BonusReward& reward) {
    std::string text;
    auto append = [&text](const std::string& part) {
        if (!text.empty()) {
            text += ", ";
        }
        text += part;
    };
    if (reward.extra_moves != 0) {
        const char* unit = (reward.extra_moves == 1 || reward.extra_moves == -1) ? " move" : " moves";
        append((reward.extra_moves > 0 ? "+" : "") + std::to_string(reward.extra_moves) + unit);
    }
    if (reward.score != 0) {
        append((reward.score > 0 ? "+" : "") + std::to_string(reward.score) + " points");
    }
    if (!reward.spawn_special_block_id.empty()) {
        append("block " + reward.spawn_special_block_id);
    }
    return text;
}

}  // namespace crystal::core
