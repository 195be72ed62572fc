#pragma once

#include "character.h"
#include "entropy.h"
#include "negotiation.h"
#include "sales_config.h"
#include "sales_game.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// Host-side decisions for a whole game. Action lists are played in order
// while the client is active; once exhausted the runner keeps pitching.
struct GameScript {
    TravelChoice travel = TravelChoice::Train;
    std::vector<NegotiationAction> firstClientActions;
    CrossroadsChoice crossroads = CrossroadsChoice::Grind;
    VPChoice vp = VPChoice::Safe;
    WhaleInvestment investment = WhaleInvestment::Research;
    std::vector<NegotiationAction> whaleActions;
};

using EntropySet = std::array<EntropyBundle, kEntropySlotCount>;

struct GameRunResult {
    GameState state;
    Tier tier = Tier::Fired;
    std::uint64_t stateHash = 0;
};

// Commits one client seed per slot (derived from `seedBase`), then reveals
// against consecutive blocks of `source` starting at `firstHeight`.
EntropySet commitAndReveal(EntropySource& source, const std::string& seedBase, std::int64_t firstHeight);

// Character rolled from the block at `height` and a seed derived from `seedBase`.
Character rollCharacterFromSource(const std::string& name,
                                  EntropySource& source,
                                  const std::string& seedBase,
                                  std::int64_t height);

GameRunResult runScriptedGame(const Character& character,
                              const EntropySet& entropy,
                              const GameScript& script,
                              const SalesConfig& config);

std::uint64_t computeStateHash(const GameState& state);
