#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <set>
#include <string>

#include "crystal/core/VariantConfig.hpp"

using namespace crystal::core;

namespace {

bool IsFallbackCatalog(const std::vector<BlockType>& blocks) {
    const auto fallback = FallbackBlockTypes();
    if (blocks.size() != fallback.size()) {
        return false;
    }
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (blocks[i].id != fallback[i].id || blocks[i].color != fallback[i].color ||
            blocks[i].bonus_score != fallback[i].bonus_score) {
            return false;
        }
    }
    return true;
}

Json ThreeColors() {
    return Json::array({
        {{"id", "ruby"}, {"color", "#ff0000"}},
        {{"id", "jade"}, {"color", "#00ff00"}},
        {{"id", "opal"}, {"color", "#0000ff"}},
    });
}

void TestInvalidColorFallsBackToFullCatalog() {
    const Json input = {{"blockTypes", Json::array({{{"id", "x"}, {"color", "not-a-color"}}})}};
    const auto variant = VariantSettings::FromJson(input);
    assert(IsFallbackCatalog(variant.block_types));
    assert(variant.bonus_rules.empty());
    assert(!variant.board_modifier.has_value());

    assert(IsFallbackCatalog(VariantSettings::FromJson(Json()).block_types));
    assert(IsFallbackCatalog(VariantSettings::FromJson(Json::array()).block_types));
    assert(IsFallbackCatalog(VariantSettings::FromJson("crystal").block_types));
    assert(IsFallbackCatalog(VariantSettings::FromJson({{"blockTypes", 7}}).block_types));

    const auto fallback = FallbackBlockTypes();
    assert(fallback.size() == 5);
    assert(fallback[0].color == 0xff5f6d);
    assert(fallback[4].color == 0x9b59b6);
    assert(fallback[2].bonus_score == 6);
}

void TestColorFormats() {
    assert(ParseHexColor("#fff") == Rgb{0xffffff});
    assert(ParseHexColor("#1dd1a1") == Rgb{0x1dd1a1});
    assert(ParseHexColor("0x54A0FF") == Rgb{0x54a0ff});
    assert(ParseHexColor("  #ABCDEF ") == Rgb{0xabcdef});
    assert(ParseHexColor("#f0a") == Rgb{0xff00aa});

    assert(!ParseHexColor("red").has_value());
    assert(!ParseHexColor("ff5f6d").has_value());
    assert(!ParseHexColor("#12345").has_value());
    assert(!ParseHexColor("#1234567").has_value());
    assert(!ParseHexColor("0x12345g").has_value());
    assert(!ParseHexColor("#").has_value());
    assert(!ParseHexColor("").has_value());

    assert(FormatHexColor(0x1dd1a1) == "#1dd1a1");
    assert(FormatHexColor(0x0000ff) == "#0000ff");
}

void TestBlockTypeClamps() {
    Json blocks = ThreeColors();
    blocks[0]["spawnWeight"] = 100;
    blocks[0]["bonusScore"] = -5;
    blocks[0]["power"] = "bomb";
    blocks[1]["spawnWeight"] = 0;
    blocks[1]["bonusScore"] = 500;
    blocks[1]["power"] = "laser";
    blocks[2]["spawnWeight"] = "3";
    blocks[2]["bonusScore"] = "lots";
    blocks[2]["name"] = "  Opal  ";

    const auto variant = VariantSettings::FromJson({{"blockTypes", blocks}});
    assert(variant.block_types.size() == 3);
    assert(variant.block_types[0].spawn_weight == 12.0);
    assert(variant.block_types[0].bonus_score == 0);
    assert(variant.block_types[0].power == TilePower::Bomb);
    assert(variant.block_types[1].spawn_weight == 0.2);
    assert(variant.block_types[1].bonus_score == 120);
    assert(variant.block_types[1].power == TilePower::None);
    assert(variant.block_types[2].spawn_weight == 3.0);
    assert(variant.block_types[2].bonus_score == 0);
    assert(variant.block_types[2].name == "Opal");
    assert(variant.block_types[0].name == "Block 1");
}

void TestBlockTypeIdsAndBounds() {
    Json blocks = ThreeColors();
    blocks.push_back(Json{{"id", "ruby"}, {"color", "#123456"}});
    blocks.push_back(Json{{"color", "#abcdef"}});
    blocks.push_back(42);

    const auto variant = VariantSettings::FromJson({{"blockTypes", blocks}});
    assert(variant.block_types.size() == 4);
    assert(variant.block_types[3].id == "block-4");

    Json many = Json::array();
    for (int i = 0; i < 20; ++i) {
        char color[8];
        std::snprintf(color, sizeof(color), "#%06x", 0x0a0a0a * (i + 1));
        many.push_back(Json{{"id", "t" + std::to_string(i)}, {"color", color}});
    }
    assert(VariantSettings::FromJson({{"blockTypes", many}}).block_types.size() == 12);
}

void TestSmallPaletteIsToppedUp() {
    const Json blocks = Json::array({
        {{"id", "a"}, {"color", "#ff5f6d"}},
        {{"id", "b"}, {"color", "#ff5f6d"}},
    });
    const auto variant = VariantSettings::FromJson({{"blockTypes", blocks}});
    assert(variant.block_types.size() == 4);
    assert(variant.block_types[0].id == "a");
    assert(variant.block_types[1].id == "b");
    assert(variant.block_types[2].id == "fallback-1");
    assert(variant.block_types[3].id == "fallback-2");

    std::set<Rgb> colors;
    for (const auto& block : variant.block_types) {
        colors.insert(block.color);
    }
    assert(colors.size() == 3);
}

void TestBonusRuleFiltering() {
    const Json rules = Json::array({
        {{"id", "ok"}, {"triggerType", "combo"}, {"threshold", 0}, {"reward", {{"extraMoves", 50}}}},
        {{"id", "bad-trigger"}, {"triggerType", "swipe"}, {"reward", {{"score", 10}}}},
        {{"id", "no-reward"}, {"triggerType", "cascade"}, {"reward", {{"extraMoves", 0}, {"score", 0}}}},
        {{"id", "missing-reward"}, {"triggerType", "cascade"}},
        {{"id", "spawn"}, {"triggerType", "totalMatches"}, {"threshold", "12"},
         {"reward", {{"spawnSpecialBlockId", " ruby "}, {"score", -5000}}}},
        {{"id", "ok"}, {"triggerType", "cascade"}, {"reward", {{"score", 5}}}},
    });
    const auto variant = VariantSettings::FromJson({{"blockTypes", ThreeColors()}, {"bonusRules", rules}});
    assert(variant.bonus_rules.size() == 2);

    const BonusRule& first = variant.bonus_rules[0];
    assert(first.id == "ok");
    assert(first.trigger == BonusTrigger::Combo);
    assert(first.threshold == 1);
    assert(first.reward.extra_moves == 20);
    assert(first.name == "Bonus 1");
    assert(first.description == first.name);

    const BonusRule& second = variant.bonus_rules[1];
    assert(second.id == "spawn");
    assert(second.trigger == BonusTrigger::TotalMatches);
    assert(second.threshold == 12);
    assert(second.reward.spawn_special_block_id == "ruby");
    assert(second.reward.score == -1000);
}

void TestBoardModifier() {
    const Json modifier = {
        {"presetName", "Cracked Corners"},
        {"blockedCells", Json::array({{{"row", 0}, {"col", 0}}, {{"row", "2"}, {"col", 3}}, {{"row", 1}},
                                      {{"row", 100}, {"col", 1}}, "bad"})},
    };
    const auto variant = VariantSettings::FromJson({{"boardModifiers", modifier}});
    assert(variant.board_modifier.has_value());
    assert(variant.board_modifier->preset_name == "Cracked Corners");
    assert(variant.board_modifier->blocked_cells.size() == 2);
    assert(variant.board_modifier->blocked_cells[1] == (Cell{2, 3}));

    const auto alias = VariantSettings::FromJson({{"boardModifier", {{"blockedCells", Json::array()}}}});
    assert(alias.board_modifier.has_value());
    assert(alias.board_modifier->preset_name == "Custom Layout");
    assert(alias.board_modifier->blocked_cells.empty());
}

void TestMetaClamps() {
    const Json input = {
        {"codename", "  Glacier  "},
        {"baseGridSize", 20},
        {"targetMatchesModifier", 5},
        {"moveBudgetModifier", 0.1},
        {"comboDecaySeconds", "abc"},
    };
    const auto variant = VariantSettings::FromJson(input);
    assert(variant.meta.codename == "Glacier");
    assert(variant.meta.flavor_text == VariantMeta{}.flavor_text);
    assert(*variant.meta.base_grid_size == kMaxGridSize);
    assert(*variant.meta.target_matches_modifier == 2.0);
    assert(*variant.meta.move_budget_modifier == 0.5);
    assert(variant.meta.combo_decay_seconds == 2.0);

    assert(VariantSettings::FromJson({{"comboDecaySeconds", 10}}).meta.combo_decay_seconds == 6.0);
    assert(SafeNumber(Json(std::nan("")), 4.0, 0.0, 10.0) == 4.0);
    assert(SafeNumber(Json("7.5"), 4.0, 0.0, 10.0) == 7.5);
    assert(SafeNumber(Json(true), 4.0, 0.0, 10.0) == 4.0);
}

void TestSerializeAndDeserialize() {
    assert(IsFallbackCatalog(VariantSettings::Deserialize("{oops").block_types));
    assert(IsFallbackCatalog(VariantSettings::Deserialize("").block_types));

    const Json input = {
        {"codename", "Ember"},
        {"blockTypes", ThreeColors()},
        {"bonusRules", Json::array({{{"id", "heat"}, {"triggerType", "cascade"}, {"threshold", 2},
                                     {"reward", {{"extraMoves", 2}, {"spawnSpecialBlockId", "ruby"}}}}})},
        {"boardModifiers", {{"blockedCells", Json::array({{{"row", 1}, {"col", 1}}})}}},
    };
    const auto original = VariantSettings::FromJson(input);
    const auto restored = VariantSettings::Deserialize(original.Serialize());
    assert(restored.meta.codename == "Ember");
    assert(restored.block_types.size() == 3);
    assert(restored.block_types[2].color == 0x0000ff);
    assert(restored.bonus_rules.size() == 1);
    assert(restored.bonus_rules[0].reward.spawn_special_block_id == "ruby");
    assert(restored.board_modifier->blocked_cells.size() == 1);
}

void TestExtractVariant() {
    const Json game = {{"mechanics", {{"puzzleVariant", {{"codename", "Tidepool"}, {"blockTypes", ThreeColors()}}}}}};
    const auto variant = ExtractVariant(game);
    assert(variant.meta.codename == "Tidepool");
    assert(variant.block_types.size() == 3);

    const auto missing = ExtractVariant({{"mechanics", "none"}});
    assert(missing.meta.codename == VariantMeta{}.codename);
    assert(IsFallbackCatalog(missing.block_types));
}

void TestResolveRoundParams() {
    const VariantMeta plain;

    RoundParams params = ResolveRoundParams(Json::object(), plain);
    assert(params.grid_size == 6);
    assert(params.target_matches == 14);
    assert(params.move_budget == 16);

    params = ResolveRoundParams({{"gridSize", 9}}, plain);
    assert(params.grid_size == 9);
    assert(params.target_matches == 18);
    assert(params.move_budget == 20);

    params = ResolveRoundParams({{"gridSize", 2}, {"targetMatches", 3}}, plain);
    assert(params.grid_size == 4);
    assert(params.target_matches == 6);
    assert(params.move_budget == 16);

    // Fractional targets round up: 7 matches do not reach 7.6.
    params = ResolveRoundParams({{"targetMatches", 7.6}}, plain);
    assert(params.target_matches == 8);
    params = ResolveRoundParams({{"targetMatches", 9.0}}, plain);
    assert(params.target_matches == 9);

    VariantMeta tuned;
    tuned.base_grid_size = 8;
    tuned.target_matches_modifier = 0.5;
    tuned.move_budget_modifier = 1.5;
    params = ResolveRoundParams(Json(), tuned);
    assert(params.grid_size == 8);
    assert(params.target_matches == 8);
    assert(params.move_budget == 27);

    params = ResolveRoundParams({{"moveBudget", 30}}, plain);
    assert(params.move_budget == 30);
    params = ResolveRoundParams({{"moves", "12"}, {"moveBudget", 30}}, plain);
    assert(params.move_budget == 12);

    // Tempo: fast rounds get fewer moves, slow rounds more.
    params = ResolveRoundParams({{"moves", 10}, {"timeScale", 2.0}}, plain);
    assert(params.move_budget == 6);
    params = ResolveRoundParams({{"moves", 20}, {"timeScale", 0.7}}, plain);
    assert(params.move_budget == 29);
}

}  // namespace

int main() {
    TestInvalidColorFallsBackToFullCatalog();
    TestColorFormats();
    TestBlockTypeClamps();
    TestBlockTypeIdsAndBounds();
    TestSmallPaletteIsToppedUp();
    TestBonusRuleFiltering();
    TestBoardModifier();
    TestMetaClamps();
    TestSerializeAndDeserialize();
    TestExtractVariant();
    TestResolveRoundParams();
    std::cout << "All variant config tests passed.\n";
    return 0;
}
