#include "crystal/core/RoundSession.hpp"

#include <algorithm>

namespace crystal::core {

RoundSession StartSession(int target_matches, int move_budget) {
    RoundSession session;
    session.target_matches = std::max(1, target_matches);
    session.moves_left = std::max(0, move_budget);
    return session;
}

ObjectiveUpdate CheckVictory(RoundSession& session) {
    ObjectiveUpdate update;
    update.outcome = session.outcome;
    if (session.ended() || session.matches < session.target_matches) {
        return update;
    }
    session.outcome = RoundOutcome::Won;
    session.score += kVictoryBonus;
    update.outcome = session.outcome;
    update.bonus_points = kVictoryBonus;
    update.ended_now = true;
    return update;
}

ObjectiveUpdate ConsumeMove(RoundSession& session, bool move_matched) {
    session.moves_left = std::max(0, session.moves_left - 1);

    ObjectiveUpdate update;
    update.outcome = session.outcome;
    if (session.moves_left > 0 || session.ended()) {
        return update;
    }
    if (session.matches >= session.target_matches) {
        return CheckVictory(session);
    }
    if (move_matched) {
        session.score += kConsolationBonus;
        update.bonus_points = kConsolationBonus;
    }
    session.outcome = RoundOutcome::Lost;
    update.outcome = session.outcome;
    update.ended_now = true;
    return update;
}

void AddMoves(RoundSession& session, int delta) noexcept {
    session.moves_left = std::max(0, session.moves_left + delta);
}

const char* OutcomeName(RoundOutcome outcome) noexcept {
    switch (outcome) {
        case RoundOutcome::Won:
            return "won";
        case RoundOutcome::Lost:
            return "lost";
        case RoundOutcome::InProgress:
            break;
    }
    return "in progress";
}

}  // namespace crystal::core
