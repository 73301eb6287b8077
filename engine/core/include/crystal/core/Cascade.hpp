#pragma once

#include <vector>

#include "crystal/core/Board.hpp"
#include "crystal/core/Match.hpp"
#include "crystal/core/RoundSession.hpp"

namespace crystal::core {

inline constexpr int kPointsPerTile = 15;
inline constexpr int kMaxCascades = 64;

struct CascadeStep {
    int index = 0;
    int groups = 0;
    int destroyed = 0;
    int tile_bonus = 0;
    int points = 0;
    double combo = 1.0;
    MatchMask cleared;
};

struct ResolveResult {
    bool had_matches = false;
    int cascades = 0;
    int groups = 0;
    int destroyed = 0;
    int points = 0;
    std::vector<CascadeStep> steps;
};

int CascadePoints(int destroyed, int cascade_index);
double ComboForCascade(int cascade_index);
int TileDestroyBonus(const Tile& tile);

// Scan, expand, destroy, score and refill until the grid holds no run.
// Updates matches, combo and score on the session.
ResolveResult ResolveCascades(Board& board, RoundSession& session);

}  // namespace crystal::core
