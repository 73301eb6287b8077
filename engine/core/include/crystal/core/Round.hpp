#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "crystal/core/BonusRules.hpp"
#include "crystal/core/Board.hpp"
#include "crystal/core/Cascade.hpp"
#include "crystal/core/Json.hpp"
#include "crystal/core/RoundSession.hpp"
#include "crystal/core/VariantConfig.hpp"

namespace crystal::core {

// Outward events of a round. Default implementations ignore everything.
class RoundListener {
public:
    virtual ~RoundListener() = default;

    virtual void onScoreDelta(int /*amount*/) {}
    virtual void onMovesLeftChanged(int /*moves_left*/) {}
    virtual void onMatchProgress(int /*matches*/, int /*target*/) {}
    virtual void onBonusTriggered(const std::string& /*rule_id*/, const std::string& /*reward_summary*/) {}
    virtual void onRoundEnded(bool /*success*/, int /*final_score*/) {}
};

enum class SelectionState { Idle, FirstSelected, Resolving };

struct SwapReport {
    Move move{};
    bool matched = false;
    ResolveResult resolve{};
    std::vector<FiredBonus> bonuses;
};

class Round {
public:
    Round(VariantSettings variant, const RoundParams& params, std::uint32_t seed = std::random_device{}(),
          RoundListener* listener = nullptr);

    // Accepts {"params": {...}, "variant": {...}} or a generated game document
    // carrying mechanics.puzzleVariant next to its params.
    static Round FromJson(const Json& config, std::uint32_t seed = std::random_device{}(),
                          RoundListener* listener = nullptr);

    // Pointer/tap event. Ignored while a swap resolves and once the round ended.
    void select(int row, int col);
    void select(const Cell& cell) { select(cell.row, cell.col); }

    void setListener(RoundListener* listener) noexcept { listener_ = listener; }

    const Board& board() const noexcept { return board_; }
    Board& board() noexcept { return board_; }
    const RoundSession& session() const noexcept { return session_; }
    const VariantSettings& variant() const noexcept { return variant_; }
    const RoundParams& params() const noexcept { return params_; }

    SelectionState selectionState() const noexcept { return state_; }
    std::optional<Cell> selected() const noexcept { return selected_; }
    const std::optional<SwapReport>& lastSwap() const noexcept { return last_swap_; }
    bool ended() const noexcept { return session_.ended(); }

private:
    void playSwap(const Move& move);
    void emitScore(int amount);
    void emitRoundEnded();

    VariantSettings variant_;
    RoundParams params_;
    Board board_;
    RoundSession session_;
    RoundListener* listener_{nullptr};
    SelectionState state_{SelectionState::Idle};
    std::optional<Cell> selected_;
    std::optional<SwapReport> last_swap_;
};

}  // namespace crystal::core
