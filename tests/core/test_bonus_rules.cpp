#undef NDEBUG
#include <cassert>
#include <iostream>

#include "TestBoards.hpp"
#include "crystal/core/BonusRules.hpp"

using namespace crystal::core;
using crystal::test::PlainCatalog;
using crystal::test::TestCatalog;

namespace {

BonusRule MakeRule(const char* id, BonusTrigger trigger, int threshold, BonusReward reward) {
    BonusRule rule;
    rule.id = id;
    rule.name = id;
    rule.trigger = trigger;
    rule.threshold = threshold;
    rule.reward = std::move(reward);
    return rule;
}

void TestCascadeRuleFiresOnce() {
    auto board = NewBoard(6, PlainCatalog(), {}, 21);
    RoundSession session = StartSession(30, 10);
    const std::vector<BonusRule> rules = {
        MakeRule("double-chain", BonusTrigger::Cascade, 2, BonusReward{1, 0, ""}),
    };

    auto fired = EvaluateBonusRules(rules, BonusContext{1, 1.0, 3}, session, board);
    assert(fired.empty());
    assert(session.triggered_bonuses.empty());

    fired = EvaluateBonusRules(rules, BonusContext{2, 1.5, 5}, session, board);
    assert(fired.size() == 1);
    assert(fired[0].rule_id == "double-chain");
    assert(fired[0].summary == "+1 move");
    assert(session.moves_left == 11);
    assert(session.triggered_bonuses.count("double-chain") == 1);

    fired = EvaluateBonusRules(rules, BonusContext{2, 1.5, 8}, session, board);
    assert(fired.empty());
    fired = EvaluateBonusRules(rules, BonusContext{4, 2.5, 12}, session, board);
    assert(fired.empty());
    assert(session.moves_left == 11);
}

void TestTriggerThresholds() {
    const BonusRule matches = MakeRule("m", BonusTrigger::TotalMatches, 10, BonusReward{0, 50, ""});
    assert(!BonusConditionMet(matches, BonusContext{5, 3.0, 9}));
    assert(BonusConditionMet(matches, BonusContext{1, 1.0, 10}));

    const BonusRule combo = MakeRule("c", BonusTrigger::Combo, 2, BonusReward{0, 50, ""});
    assert(!BonusConditionMet(combo, BonusContext{9, 1.5, 99}));
    assert(BonusConditionMet(combo, BonusContext{1, 2.0, 0}));

    const BonusRule cascade = MakeRule("k", BonusTrigger::Cascade, 3, BonusReward{0, 50, ""});
    assert(!BonusConditionMet(cascade, BonusContext{2, 9.0, 99}));
    assert(BonusConditionMet(cascade, BonusContext{3, 1.0, 0}));
}

void TestRewardsApplyInOrder() {
    auto board = NewBoard(6, PlainCatalog(), {}, 4);
    RoundSession session = StartSession(30, 2);
    const std::vector<BonusRule> rules = {
        MakeRule("points", BonusTrigger::TotalMatches, 1, BonusReward{0, 120, ""}),
        MakeRule("penalty", BonusTrigger::TotalMatches, 1, BonusReward{-5, 0, ""}),
        MakeRule("far", BonusTrigger::TotalMatches, 50, BonusReward{3, 0, ""}),
    };

    const auto fired = EvaluateBonusRules(rules, BonusContext{1, 1.0, 4}, session, board);
    assert(fired.size() == 2);
    assert(fired[0].rule_id == "points");
    assert(fired[1].rule_id == "penalty");
    assert(session.score == 120);
    // Negative rewards clamp at zero.
    assert(session.moves_left == 0);
    assert(session.triggered_bonuses.count("far") == 0);
}

void TestSpawnOnFullBoardIsNoOp() {
    auto board = NewBoard(6, TestCatalog(), {}, 8);
    assert(board.full());
    RoundSession session = StartSession(30, 10);
    const std::vector<BonusRule> rules = {
        MakeRule("drop-bomb", BonusTrigger::TotalMatches, 1, BonusReward{0, 0, "bomb"}),
    };

    const auto fired = EvaluateBonusRules(rules, BonusContext{1, 1.0, 1}, session, board);
    assert(fired.size() == 1);
    assert(!fired[0].spawned_at.has_value());
    assert(session.triggered_bonuses.count("drop-bomb") == 1);
}

void TestSpawnLandsOnFreeCell() {
    std::vector<Cell> blocked;
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            if (!(row == 3 && col == 3) && !(row == 1 && col == 2)) {
                blocked.push_back(Cell{row, col});
            }
        }
    }
    Board board(4, TestCatalog(), blocked, 17);
    board.place(1, 2, 0);

    const auto spawned = SpawnSpecialTile(board, "bomb");
    assert(spawned.has_value());
    assert(*spawned == (Cell{3, 3}));
    assert(board.tileAt(3, 3)->power == TilePower::Bomb);
    assert(board.tileAt(3, 3)->type_index == board.findBlockType("bomb"));

    assert(!SpawnSpecialTile(board, "bomb").has_value());

    Board open(4, TestCatalog(), {}, 2);
    const auto fallback = SpawnSpecialTile(open, "no-such-block");
    assert(fallback.has_value());
    assert(open.tileAt(*fallback)->type_index == 0);
}

void TestFormatReward() {
    assert(FormatReward(BonusReward{2, 100, "core"}) == "+2 moves, +100 points, block core");
    assert(FormatReward(BonusReward{-1, 0, ""}) == "-1 move");
    assert(FormatReward(BonusReward{0, -30, ""}) == "-30 points");
    assert(FormatReward(BonusReward{}).empty());
}

}  // namespace

int main() {
    TestCascadeRuleFiresOnce();
    TestTriggerThresholds();
    TestRewardsApplyInOrder();
    TestSpawnOnFullBoardIsNoOp();
    TestSpawnLandsOnFreeCell();
    TestFormatReward();
    std::cout << "All bonus rule tests passed.\n";
    return 0;
}
