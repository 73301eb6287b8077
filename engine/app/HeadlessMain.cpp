#define SDL_MAIN_HANDLED

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include <SDL2/SDL.h>

#include "crystal/app/AssetFS.hpp"
#include "crystal/core/AI.hpp"
#include "crystal/core/Json.hpp"
#include "crystal/core/Round.hpp"
#include "crystal/core/VariantConfig.hpp"

using crystal::app::ReadTextFile;
using crystal::app::ResolveVariantPath;
using crystal::core::Json;
using crystal::core::Move;
using crystal::core::Round;
using crystal::core::RoundListener;
using crystal::core::VariantSettings;

namespace {

constexpr const char* kDefaultVariant = "crystal_charge";

struct Options {
    std::string variant = kDefaultVariant;
    std::optional<std::uint32_t> seed;
    Json params = Json::object();
    bool dump_variant = false;
    bool verbose = false;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--variant <name|file>] [--seed <n>] [--grid <n>] [--target <n>] [--moves <n>]"
                 " [--time-scale <x>] [--dump-variant] [--verbose]\n";
}

bool ParseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s needs a value", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--variant") {
            const char* value = next("--variant");
            if (!value) {
                return false;
            }
            options.variant = value;
        } else if (arg == "--seed") {
            const char* value = next("--seed");
            if (!value) {
                return false;
            }
            char* end = nullptr;
            const unsigned long seed = std::strtoul(value, &end, 10);
            if (end == value || *end != '\0') {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid seed '%s'", value);
                return false;
            }
            options.seed = static_cast<std::uint32_t>(seed);
        } else if (arg == "--grid" || arg == "--target" || arg == "--moves" || arg == "--time-scale") {
            const char* value = next(arg.c_str());
            if (!value) {
                return false;
            }
            // Round params go through the same sanitizer as generated ones.
            const char* key = arg == "--grid"     ? "gridSize"
                              : arg == "--target" ? "targetMatches"
                              : arg == "--moves"  ? "moves"
                                                  : "timeScale";
            options.params[key] = value;
        } else if (arg == "--dump-variant") {
            options.dump_variant = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown argument '%s'", arg.c_str());
            return false;
        }
    }
    return true;
}

class LoggingListener : public RoundListener {
public:
    void onScoreDelta(int amount) override {
        SDL_Log("score %+d", amount);
    }
    void onMovesLeftChanged(int moves_left) override {
        SDL_Log("moves left %d", moves_left);
    }
    void onMatchProgress(int matches, int target) override {
        SDL_Log("matches %d/%d", matches, target);
    }
    void onBonusTriggered(const std::string& rule_id, const std::string& reward_summary) override {
        SDL_Log("bonus %s: %s", rule_id.c_str(), reward_summary.c_str());
    }
    void onRoundEnded(bool success, int final_score) override {
        SDL_Log("round %s, final score %d", success ? "won" : "lost", final_score);
        success_ = success;
    }

    bool success() const noexcept { return success_; }

private:
    bool success_ = false;
};

// First adjacent pair of open cells, used when no swap can match.
std::optional<Move> AnyOpenPair(const crystal::core::Board& board) {
    for (int row = 0; row < board.size(); ++row) {
        for (int col = 0; col < board.size(); ++col) {
            if (board.isBlocked(row, col)) {
                continue;
            }
            if (!board.isBlocked(row, col + 1)) {
                return Move{{row, col}, {row, col + 1}};
            }
            if (!board.isBlocked(row + 1, col)) {
                return Move{{row, col}, {row + 1, col}};
            }
        }
    }
    return std::nullopt;
}

}  // namespace

int main(int argc, char* argv[]) {
    SDL_SetMainReady();

    Options options;
    if (!ParseOptions(argc, argv, options)) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (options.verbose) {
        SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
    }

    VariantSettings variant;
    if (const auto path = ResolveVariantPath(options.variant)) {
        const auto text = ReadTextFile(*path);
        if (!text) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unable to read %s", path->string().c_str());
            return 1;
        }
        variant = VariantSettings::Deserialize(*text);
    } else if (options.variant == kDefaultVariant) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Default variant not found, using built-in catalog");
        variant = VariantSettings::FromJson(Json());
    } else {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Variant '%s' not found", options.variant.c_str());
        return 1;
    }

    if (options.dump_variant) {
        std::cout << variant.ToJson().dump(2) << "\n";
        return 0;
    }

    const std::uint32_t seed = options.seed.value_or(std::random_device{}());
    SDL_Log("seed %u", static_cast<unsigned>(seed));

    LoggingListener listener;
    const auto params = crystal::core::ResolveRoundParams(options.params, variant.meta);
    Round round(std::move(variant), params, seed, &listener);

    while (!round.ended()) {
        std::optional<Move> move;
        if (auto hint = crystal::core::ai::BestMove(round.board())) {
            move = hint->move;
        } else {
            move = AnyOpenPair(round.board());
        }
        if (!move) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Board has no open pair of cells");
            return 1;
        }
        round.select(move->a);
        round.select(move->b);
    }

    return listener.success() ? 0 : 3;
}
