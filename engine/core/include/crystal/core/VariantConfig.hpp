#pragma once

#include <optional>
#include <string>
#include <vector>

#include "crystal/core/Json.hpp"
#include "crystal/core/Types.hpp"

namespace crystal::core {

inline constexpr int kMinGridSize = 4;
inline constexpr int kMaxGridSize = 9;
inline constexpr int kDefaultGridSize = 6;

struct BlockType {
    std::string id;
    std::string name;
    Rgb color = 0;
    double spawn_weight = 1.0;
    TilePower power = TilePower::None;
    int bonus_score = 0;
};

enum class BonusTrigger { TotalMatches, Combo, Cascade };

struct BonusReward {
    int extra_moves = 0;
    int score = 0;
    std::string spawn_special_block_id;

    bool empty() const noexcept {
        return extra_moves == 0 && score == 0 && spawn_special_block_id.empty();
    }
};

struct BonusRule {
    std::string id;
    std::string name;
    std::string description;
    BonusTrigger trigger = BonusTrigger::TotalMatches;
    int threshold = 1;
    BonusReward reward{};
};

struct BoardModifier {
    std::string preset_name = "Custom Layout";
    std::string description;
    std::vector<Cell> blocked_cells;
};

struct VariantMeta {
    std::string codename = "Crystal Charge";
    std::string flavor_text = "Chain the crystals and charge the artifact!";
    std::optional<int> base_grid_size;
    std::optional<double> target_matches_modifier;
    std::optional<double> move_budget_modifier;
    double combo_decay_seconds = 2.0;
};

// Sanitized puzzle variant. FromJson accepts anything and never throws:
// invalid entries are dropped or replaced with defaults, and block_types is
// never empty.
struct VariantSettings {
    VariantMeta meta{};
    std::vector<BlockType> block_types;
    std::vector<BonusRule> bonus_rules;
    std::optional<BoardModifier> board_modifier;

    Json ToJson() const;
    static VariantSettings FromJson(const Json& json);

    std::string Serialize() const;
    static VariantSettings Deserialize(const std::string& json_string);
};

// Reads mechanics.puzzleVariant out of a generated game document.
VariantSettings ExtractVariant(const Json& game_data);

std::vector<BlockType> FallbackBlockTypes();

std::optional<Rgb> ParseHexColor(const std::string& input);
std::string FormatHexColor(Rgb color);

std::optional<TilePower> ParseTilePower(const std::string& name);
const char* TilePowerName(TilePower power) noexcept;

std::optional<BonusTrigger> ParseBonusTrigger(const std::string& name);
const char* BonusTriggerName(BonusTrigger trigger) noexcept;

// Numeric read with clamping. Non-numeric, non-finite or missing values give
// the fallback; numeric strings are accepted.
double SafeNumber(const Json& value, double fallback, double min, double max);

struct RoundParams {
    int grid_size = kDefaultGridSize;
    int target_matches = 14;
    int move_budget = 16;
};

RoundParams ResolveRoundParams(const Json& params, const VariantMeta& meta);

}  // namespace crystal::core
