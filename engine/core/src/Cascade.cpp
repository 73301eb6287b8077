#include "crystal/core/Cascade.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cmath>

namespace crystal::core {

int CascadePoints(int destroyed, int cascade_index) {
    const double cascade_bonus = 1.0 + (std::max(1, cascade_index) - 1) * 0.25;
    return static_cast<int>(std::lround(destroyed * kPointsPerTile * cascade_bonus));
}

double ComboForCascade(int cascade_index) {
    const double combo = 1.0 + (std::max(1, cascade_index) - 1) * 0.5;
    return std::round(combo * 10.0) / 10.0;
}

int TileDestroyBonus(const Tile& tile) {
    int bonus = std::max(0, tile.bonus_score);
    if (tile.power == TilePower::ScoreBoost) {
        bonus += std::max(6, tile.bonus_score > 0 ? tile.bonus_score : 12);
    }
    return bonus;
}

ResolveResult ResolveCascades(Board& board, RoundSession& session) {
    ResolveResult result;
    int cascade = 1;

    while (true) {
        const ScanResult scan = ScanMatches(board);
        if (scan.groups == 0) {
            break;
        }
        if (cascade > kMaxCascades) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cascade limit %d reached, settling grid", kMaxCascades);
            if (!BreakRuns(board)) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Grid still holds runs after settling");
            }
            break;
        }

        CascadeStep step;
        step.index = cascade;
        step.groups = scan.groups;
        step.cleared = ExpandSpecialEffects(board, scan.mask);

        for (const auto& cell : step.cleared.cells()) {
            const Tile* tile = board.tileAt(cell);
            if (tile == nullptr) {
                continue;
            }
            step.tile_bonus += TileDestroyBonus(*tile);
            board.clear(cell.row, cell.col);
            ++step.destroyed;
        }

        step.points = step.tile_bonus + CascadePoints(step.destroyed, cascade);
        step.combo = ComboForCascade(cascade);

        session.combo_multiplier = step.combo;
        session.matches += scan.groups;
        session.score += step.points;

        for (int col = 0; col < board.size(); ++col) {
            board.compactColumn(col);
            board.refillColumn(col);
        }

        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Cascade %d: %d groups, %d cleared, %d points", cascade,
                     step.groups, step.destroyed, step.points);

        result.groups += step.groups;
        result.destroyed += step.destroyed;
        result.points += step.points;
        result.steps.push_back(std::move(step));
        ++cascade;
    }

    result.cascades = cascade - 1;
    result.had_matches = cascade > 1;
    return result;
}

}  // namespace crystal::core
