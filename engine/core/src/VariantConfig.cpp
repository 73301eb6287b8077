#include "crystal/core/VariantConfig.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <set>

namespace crystal::core {

namespace {

constexpr std::size_t kMaxBlockTypes = 12;
constexpr std::size_t kMaxBonusRules = 12;
constexpr std::size_t kMaxBlockedCells = kMaxGridSize * kMaxGridSize;
constexpr std::size_t kMinDistinctColors = 3;

constexpr Rgb kBaseColors[] = {0xff5f6d, 0xffc371, 0x1dd1a1, 0x54a0ff, 0x9b59b6};

std::string Trim(const std::string& text) {
    auto begin = text.begin();
    auto end = text.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(begin, end);
}

std::string TrimmedString(const Json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_string()) {
        return {};
    }
    return Trim(json[key].get<std::string>());
}

std::optional<double> ReadNumber(const Json& value) {
    double parsed = 0.0;
    if (value.is_number()) {
        parsed = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = Trim(value.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> ReadField(const Json& json, const char* key) {
    if (!json.is_object() || !json.contains(key)) {
        return std::nullopt;
    }
    return ReadNumber(json[key]);
}

bool IsHexDigits(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
}

std::vector<BlockType> NormalizeBlockTypes(const Json& input) {
    std::vector<BlockType> normalized;
    if (!input.is_array()) {
        return normalized;
    }

    std::set<std::string> seen_ids;
    for (std::size_t index = 0; index < input.size(); ++index) {
        const Json& entry = input[index];
        if (!entry.is_object()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "blockTypes[%d] is not an object, dropped", static_cast<int>(index));
            continue;
        }
        std::optional<Rgb> color;
        if (entry.contains("color") && entry["color"].is_string()) {
            color = ParseHexColor(entry["color"].get<std::string>());
        }
        if (!color) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "blockTypes[%d] has no valid color, dropped", static_cast<int>(index));
            continue;
        }
        if (normalized.size() >= kMaxBlockTypes) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "blockTypes truncated to %d entries", static_cast<int>(kMaxBlockTypes));
            break;
        }

        BlockType block;
        block.id = TrimmedString(entry, "id");
        if (block.id.empty()) {
            block.id = "block-" + std::to_string(index);
        }
        if (!seen_ids.insert(block.id).second) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "blockTypes[%d] duplicates id '%s', dropped", static_cast<int>(index),
                        block.id.c_str());
            continue;
        }
        block.name = TrimmedString(entry, "name");
        if (block.name.empty()) {
            block.name = "Block " + std::to_string(index + 1);
        }
        block.color = *color;
        if (entry.contains("power") && entry["power"].is_string()) {
            block.power = ParseTilePower(entry["power"].get<std::string>()).value_or(TilePower::None);
        }
        block.spawn_weight =
            SafeNumber(entry.contains("spawnWeight") ? entry["spawnWeight"] : Json(), 1.0, 0.2, 12.0);
        block.bonus_score = static_cast<int>(std::lround(
            SafeNumber(entry.contains("bonusScore") ? entry["bonusScore"] : Json(), 0.0, 0.0, 120.0)));
        normalized.push_back(std::move(block));
    }
    return normalized;
}

BonusReward NormalizeReward(const Json& reward) {
    BonusReward normalized;
    if (!reward.is_object()) {
        return normalized;
    }
    if (auto extra = ReadField(reward, "extraMoves")) {
        normalized.extra_moves = static_cast<int>(std::lround(std::clamp(*extra, -20.0, 20.0)));
    }
    if (auto score = ReadField(reward, "score")) {
        normalized.score = static_cast<int>(std::lround(std::clamp(*score, -1000.0, 1000.0)));
    }
    normalized.spawn_special_block_id = TrimmedString(reward, "spawnSpecialBlockId");
    return normalized;
}

std::vector<BonusRule> NormalizeBonusRules(const Json& input) {
    std::vector<BonusRule> normalized;
    if (!input.is_array()) {
        return normalized;
    }

    std::set<std::string> seen_ids;
    for (std::size_t index = 0; index < input.size(); ++index) {
        const Json& entry = input[index];
        if (!entry.is_object()) {
            continue;
        }
        std::optional<BonusTrigger> trigger;
        if (entry.contains("triggerType") && entry["triggerType"].is_string()) {
            trigger = ParseBonusTrigger(entry["triggerType"].get<std::string>());
        }
        if (!trigger) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "bonusRules[%d] has unknown trigger, dropped", static_cast<int>(index));
            continue;
        }
        BonusReward reward = NormalizeReward(entry.contains("reward") ? entry["reward"] : Json());
        if (reward.empty()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "bonusRules[%d] has no reward, dropped", static_cast<int>(index));
            continue;
        }
        if (normalized.size() >= kMaxBonusRules) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "bonusRules truncated to %d entries", static_cast<int>(kMaxBonusRules));
            break;
        }

        BonusRule rule;
        rule.id = TrimmedString(entry, "id");
        if (rule.id.empty()) {
            rule.id = "bonus-" + std::to_string(index);
        }
        if (!seen_ids.insert(rule.id).second) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "bonusRules[%d] duplicates id '%s', dropped", static_cast<int>(index),
                        rule.id.c_str());
            continue;
        }
        rule.name = TrimmedString(entry, "name");
        if (rule.name.empty()) {
            rule.name = "Bonus " + std::to_string(index + 1);
        }
        rule.description = TrimmedString(entry, "description");
        if (rule.description.empty()) {
            rule.description = rule.name;
        }
        rule.trigger = *trigger;
        rule.threshold = static_cast<int>(
            std::lround(SafeNumber(entry.contains("threshold") ? entry["threshold"] : Json(), 1.0, 1.0, 999.0)));
        rule.reward = std::move(reward);
        normalized.push_back(std::move(rule));
    }
    return normalized;
}

// Fewer than three colors make every refill a guaranteed match.
void EnsureColorVariety(std::vector<BlockType>& blocks) {
    std::set<Rgb> colors;
    for (const auto& block : blocks) {
        colors.insert(block.color);
    }
    std::set<std::string> ids;
    for (const auto& block : blocks) {
        ids.insert(block.id);
    }
    for (auto& fallback : FallbackBlockTypes()) {
        if (colors.size() >= kMinDistinctColors) {
            break;
        }
        if (colors.count(fallback.color) > 0 || ids.count(fallback.id) > 0) {
            continue;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Variant palette too small, adding %s", fallback.id.c_str());
        colors.insert(fallback.color);
        blocks.push_back(std::move(fallback));
    }
}

std::optional<BoardModifier> NormalizeBoardModifier(const Json& input) {
    if (!input.is_object()) {
        return std::nullopt;
    }

    BoardModifier modifier;
    const std::string preset = TrimmedString(input, "presetName");
    if (!preset.empty()) {
        modifier.preset_name = preset;
    }
    if (input.contains("description") && input["description"].is_string()) {
        modifier.description = input["description"].get<std::string>();
    }
    if (input.contains("blockedCells") && input["blockedCells"].is_array()) {
        for (const auto& cell : input["blockedCells"]) {
            if (!cell.is_object()) {
                continue;
            }
            const auto row = ReadField(cell, "row");
            const auto col = ReadField(cell, "col");
            if (!row || !col) {
                continue;
            }
            if (modifier.blocked_cells.size() >= kMaxBlockedCells) {
                break;
            }
            // Far out-of-range coordinates can never land on a grid.
            if (std::fabs(*row) > kMaxGridSize * 2 || std::fabs(*col) > kMaxGridSize * 2) {
                continue;
            }
            modifier.blocked_cells.push_back(
                Cell{static_cast<std::int32_t>(std::lround(*row)), static_cast<std::int32_t>(std::lround(*col))});
        }
    }
    return modifier;
}

}  // namespace

std::vector<BlockType> FallbackBlockTypes() {
    std::vector<BlockType> blocks;
    int index = 0;
    for (Rgb color : kBaseColors) {
        BlockType block;
        block.id = "fallback-" + std::to_string(index);
        block.name = "Block " + std::to_string(index + 1);
        block.color = color;
        block.spawn_weight = 1.0;
        block.bonus_score = 6;
        blocks.push_back(std::move(block));
        ++index;
    }
    return blocks;
}

std::optional<Rgb> ParseHexColor(const std::string& input) {
    std::string text = Trim(input);
    std::string digits;
    if (text.size() > 1 && text[0] == '#') {
        digits = text.substr(1);
        if (digits.size() == 3) {
            digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
        }
    } else if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        digits = text.substr(2);
    } else {
        return std::nullopt;
    }
    if (digits.size() != 6 || !IsHexDigits(digits)) {
        return std::nullopt;
    }
    return static_cast<Rgb>(std::strtoul(digits.c_str(), nullptr, 16));
}

std::string FormatHexColor(Rgb color) {
    char buffer[8];
    SDL_snprintf(buffer, sizeof(buffer), "#%06x", static_cast<unsigned>(color & 0xffffffu));
    return buffer;
}

std::optional<TilePower> ParseTilePower(const std::string& name) {
    if (name == "bomb") {
        return TilePower::Bomb;
    }
    if (name == "lineHorizontal") {
        return TilePower::LineHorizontal;
    }
    if (name == "lineVertical") {
        return TilePower::LineVertical;
    }
    if (name == "colorClear") {
        return TilePower::ColorClear;
    }
    if (name == "scoreBoost") {
        return TilePower::ScoreBoost;
    }
    if (name == "none") {
        return TilePower::None;
    }
    return std::nullopt;
}

const char* TilePowerName(TilePower power) noexcept {
    switch (power) {
        case TilePower::Bomb:
            return "bomb";
        case TilePower::LineHorizontal:
            return "lineHorizontal";
        case TilePower::LineVertical:
            return "lineVertical";
        case TilePower::ColorClear:
            return "colorClear";
        case TilePower::ScoreBoost:
            return "scoreBoost";
        case TilePower::None:
            break;
    }
    return "none";
}

std::optional<BonusTrigger> ParseBonusTrigger(const std::string& name) {
    if (name == "totalMatches") {
        return BonusTrigger::TotalMatches;
    }
    if (name == "combo") {
        return BonusTrigger::Combo;
    }
    if (name == "cascade") {
        return BonusTrigger::Cascade;
    }
    return std::nullopt;
}

const char* BonusTriggerName(BonusTrigger trigger) noexcept {
    switch (trigger) {
        case BonusTrigger::TotalMatches:
            return "totalMatches";
        case BonusTrigger::Combo:
            return "combo";
        case BonusTrigger::Cascade:
            return "cascade";
    }
    return "totalMatches";
}

double SafeNumber(const Json& value, double fallback, double min, double max) {
    const auto parsed = ReadNumber(value);
    if (!parsed) {
        return fallback;
    }
    return std::clamp(*parsed, min, max);
}

Json VariantSettings::ToJson() const {
    Json json;
    json["codename"] = meta.codename;
    json["flavorText"] = meta.flavor_text;
    if (meta.base_grid_size) {
        json["baseGridSize"] = *meta.base_grid_size;
    }
    if (meta.target_matches_modifier) {
        json["targetMatchesModifier"] = *meta.target_matches_modifier;
    }
    if (meta.move_budget_modifier) {
        json["moveBudgetModifier"] = *meta.move_budget_modifier;
    }
    json["comboDecaySeconds"] = meta.combo_decay_seconds;

    json["blockTypes"] = Json::array();
    for (const auto& block : block_types) {
        Json entry;
        entry["id"] = block.id;
        entry["name"] = block.name;
        entry["color"] = FormatHexColor(block.color);
        entry["spawnWeight"] = block.spawn_weight;
        entry["power"] = TilePowerName(block.power);
        entry["bonusScore"] = block.bonus_score;
        json["blockTypes"].push_back(std::move(entry));
    }

    json["bonusRules"] = Json::array();
    for (const auto& rule : bonus_rules) {
        Json reward = Json::object();
        if (rule.reward.extra_moves != 0) {
            reward["extraMoves"] = rule.reward.extra_moves;
        }
        if (rule.reward.score != 0) {
            reward["score"] = rule.reward.score;
        }
        if (!rule.reward.spawn_special_block_id.empty()) {
            reward["spawnSpecialBlockId"] = rule.reward.spawn_special_block_id;
        }
        Json entry;
        entry["id"] = rule.id;
        entry["name"] = rule.name;
        entry["description"] = rule.description;
        entry["triggerType"] = BonusTriggerName(rule.trigger);
        entry["threshold"] = rule.threshold;
        entry["reward"] = std::move(reward);
        json["bonusRules"].push_back(std::move(entry));
    }

    if (board_modifier) {
        Json modifier;
        modifier["presetName"] = board_modifier->preset_name;
        if (!board_modifier->description.empty()) {
            modifier["description"] = board_modifier->description;
        }
        modifier["blockedCells"] = Json::array();
        for (const auto& cell : board_modifier->blocked_cells) {
            modifier["blockedCells"].push_back({{"row", cell.row}, {"col", cell.col}});
        }
        json["boardModifiers"] = std::move(modifier);
    }
    return json;
}

VariantSettings VariantSettings::FromJson(const Json& json) {
    VariantSettings settings;
    if (!json.is_object()) {
        settings.block_types = FallbackBlockTypes();
        return settings;
    }

    const std::string codename = TrimmedString(json, "codename");
    if (!codename.empty()) {
        settings.meta.codename = codename;
    }
    const std::string flavor = TrimmedString(json, "flavorText");
    if (!flavor.empty()) {
        settings.meta.flavor_text = flavor;
    }
    if (auto grid = ReadField(json, "baseGridSize")) {
        settings.meta.base_grid_size =
            static_cast<int>(std::lround(std::clamp(*grid, double(kMinGridSize), double(kMaxGridSize))));
    }
    if (auto modifier = ReadField(json, "targetMatchesModifier")) {
        settings.meta.target_matches_modifier = std::clamp(*modifier, 0.5, 2.0);
    }
    if (auto modifier = ReadField(json, "moveBudgetModifier")) {
        settings.meta.move_budget_modifier = std::clamp(*modifier, 0.5, 2.0);
    }
    settings.meta.combo_decay_seconds =
        SafeNumber(json.contains("comboDecaySeconds") ? json["comboDecaySeconds"] : Json(), 2.0, 0.8, 6.0);

    settings.block_types = NormalizeBlockTypes(json.contains("blockTypes") ? json["blockTypes"] : Json());
    if (settings.block_types.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Variant has no usable block types, using fallback catalog");
        settings.block_types = FallbackBlockTypes();
    }
    EnsureColorVariety(settings.block_types);
    settings.bonus_rules = NormalizeBonusRules(json.contains("bonusRules") ? json["bonusRules"] : Json());

    if (json.contains("boardModifiers")) {
        settings.board_modifier = NormalizeBoardModifier(json["boardModifiers"]);
    } else if (json.contains("boardModifier")) {
        settings.board_modifier = NormalizeBoardModifier(json["boardModifier"]);
    }
    return settings;
}

std::string VariantSettings::Serialize() const {
    return ToJson().dump();
}

VariantSettings VariantSettings::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Variant JSON is malformed, using defaults");
        return FromJson(Json());
    }
    return FromJson(json);
}

VariantSettings ExtractVariant(const Json& game_data) {
    if (game_data.is_object() && game_data.contains("mechanics") && game_data["mechanics"].is_object()) {
        const Json& mechanics = game_data["mechanics"];
        if (mechanics.contains("puzzleVariant")) {
            return VariantSettings::FromJson(mechanics["puzzleVariant"]);
        }
    }
    return VariantSettings::FromJson(Json());
}

RoundParams ResolveRoundParams(const Json& params, const VariantMeta& meta) {
    RoundParams round;

    const auto requested_grid = ReadField(params, "gridSize");
    if (requested_grid && *requested_grid > 0) {
        round.grid_size = std::clamp(static_cast<int>(std::lround(*requested_grid)), kMinGridSize, kMaxGridSize);
    } else if (meta.base_grid_size) {
        round.grid_size = std::clamp(*meta.base_grid_size, kMinGridSize, kMaxGridSize);
    } else {
        round.grid_size = kDefaultGridSize;
    }

    double target = 0.0;
    if (auto requested = ReadField(params, "targetMatches"); requested && *requested > 0) {
        target = *requested;
    } else {
        target = std::max(14, round.grid_size * 2);
    }
    if (meta.target_matches_modifier) {
        target = std::round(target * *meta.target_matches_modifier);
    }
    round.target_matches = std::max(6, static_cast<int>(std::ceil(std::min(target, 9999.0))));

    double moves = 0.0;
    auto requested_moves = ReadField(params, "moves");
    if (!requested_moves) {
        requested_moves = ReadField(params, "moveBudget");
    }
    if (requested_moves && *requested_moves > 0) {
        moves = *requested_moves;
    } else {
        moves = std::max(16, round.grid_size * 2 + 2);
    }
    if (meta.move_budget_modifier) {
        moves = std::round(moves * *meta.move_budget_modifier);
    }
    // Fast tempo trims the budget, slow tempo extends it.
    const double time_scale =
        SafeNumber(params.is_object() && params.contains("timeScale") ? params["timeScale"] : Json(), 1.0, 0.7, 1.8);
    const double tempo_factor = time_scale >= 1.0 ? time_scale : 1.0 / time_scale;
    const double adjusted = time_scale > 1.0 ? moves / tempo_factor : moves * tempo_factor;
    round.move_budget = std::max(6, static_cast<int>(std::lround(std::min(adjusted, 9999.0))));
    return round;
}

}  // namespace crystal::core
