#pragma once

#include <set>
#include <string>

namespace crystal::core {

inline constexpr int kVictoryBonus = 200;
inline constexpr int kConsolationBonus = 50;

enum class RoundOutcome { InProgress, Won, Lost };

// Mutable state of one round. Created at round start and dropped when the
// round ends; nothing in the engine keeps it anywhere else.
struct RoundSession {
    int matches = 0;
    int moves_left = 0;
    int target_matches = 0;
    double combo_multiplier = 1.0;
    int score = 0;
    std::set<std::string> triggered_bonuses;
    RoundOutcome outcome = RoundOutcome::InProgress;

    bool ended() const noexcept { return outcome != RoundOutcome::InProgress; }
};

RoundSession StartSession(int target_matches, int move_budget);

struct ObjectiveUpdate {
    RoundOutcome outcome = RoundOutcome::InProgress;
    int bonus_points = 0;
    bool ended_now = false;
};

// Win check run right after a resolve. Awards the victory bonus once.
ObjectiveUpdate CheckVictory(RoundSession& session);

// Spends one move and checks for running out of moves. move_matched decides
// whether a losing round still earns the consolation bonus.
ObjectiveUpdate ConsumeMove(RoundSession& session, bool move_matched);

// Bonus move rewards; never drops below zero.
void AddMoves(RoundSession& session, int delta) noexcept;

const char* OutcomeName(RoundOutcome outcome) noexcept;

}  // namespace crystal::core
