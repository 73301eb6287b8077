#pragma once

#include <optional>
#include <string>
#include <vector>

#include "crystal/core/Board.hpp"
#include "crystal/core/RoundSession.hpp"
#include "crystal/core/VariantConfig.hpp"

namespace crystal::core {

struct BonusContext {
    int cascades = 0;
    double combo = 1.0;
    int total_matches = 0;
};

struct FiredBonus {
    std::string rule_id;
    std::string rule_name;
    std::string summary;
    BonusReward reward{};
    std::optional<Cell> spawned_at;
};

bool BonusConditionMet(const BonusRule& rule, const BonusContext& context) noexcept;

// Fires every rule not yet in session.triggered_bonuses whose condition
// holds, applying its reward to the session and the board.
std::vector<FiredBonus> EvaluateBonusRules(const std::vector<BonusRule>& rules, const BonusContext& context,
                                           RoundSession& session, Board& board);

// Places one tile of the given type on a random free cell. Unknown ids use the
// first catalog entry; a full board makes this a no-op.
std::optional<Cell> SpawnSpecialTile(Board& board, const std::string& block_type_id);

std::string FormatReward(const BonusReward& reward);

}  // namespace crystal::core
