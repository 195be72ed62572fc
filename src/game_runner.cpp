#include "game_runner.h"

#include "dice.h"

#include <cstdlib>
#include <iostream>

namespace {

std::uint64_t mixHash(std::uint64_t h, std::uint64_t v) {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
}

std::uint64_t hashString(const std::string& s) {
    std::uint64_t h = 1469598103934665603ull;
    for (const char ch : s) {
        h ^= static_cast<std::uint8_t>(ch);
        h *= 1099511628211ull;
    }
    return h;
}

std::uint64_t hashInt(int v) {
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(v));
}

bool determinismTraceEnabled() {
    static const bool enabled = []() {
        const char* v = std::getenv("SALESSIM_TRACE");
        return v && *v && std::string(v) != "0";
    }();
    return enabled;
}

void maybeTraceDeterminismStage(const char* stage, const SalesGame& game) {
    if (!determinismTraceEnabled()) {
        return;
    }
    const std::uint64_t h = computeStateHash(game.state());
    std::cout << "[det-trace] phase=" << phaseName(game.phase()) << " stage=" << stage
              << " money=" << game.money() << " hash=" << h << std::endl;
}

void playEncounter(SalesGame& game, const std::vector<NegotiationAction>& actions) {
    auto clientActive = [&]() {
        const Encounter* enc = game.currentEncounter();
        return enc && enc->client.active;
    };
    for (NegotiationAction action : actions) {
        if (!clientActive()) break;
        if (action == NegotiationAction::Ability && game.state().spiritAbilityUsed) {
            action = NegotiationAction::Pitch;
        }
        game.negotiate(action);
    }
    while (clientActive()) {
        game.negotiate(NegotiationAction::Pitch);
    }
}

} // namespace

EntropySet commitAndReveal(EntropySource& source, const std::string& seedBase, std::int64_t firstHeight) {
    EntropySet set;
    for (int slot = 0; slot < kEntropySlotCount; ++slot) {
        const std::string seed = sha256Hex(seedBase + ":slot" + std::to_string(slot + 1));
        const Commitment c = createCommitment(seed, firstHeight + slot);
        set[static_cast<std::size_t>(slot)] = revealCommitment(c, source);
    }
    return set;
}

Character rollCharacterFromSource(const std::string& name,
                                  EntropySource& source,
                                  const std::string& seedBase,
                                  std::int64_t height) {
    const BlockInfo block = source.waitForHeight(height);
    return rollCharacter(name, block.height, block.hash, sha256Hex(seedBase + ":character"));
}

std::uint64_t computeStateHash(const GameState& state) {
    std::uint64_t h = 0x5A1E5C0DE0000001ull;
    h = mixHash(h, static_cast<std::uint64_t>(state.phase));
    h = mixHash(h, hashInt(state.startingMoney));
    h = mixHash(h, hashInt(state.money));
    h = mixHash(h, state.territory ? static_cast<std::uint64_t>(*state.territory) + 1 : 0);
    h = mixHash(h, static_cast<std::uint64_t>(state.legendaryUnlocked));
    h = mixHash(h, static_cast<std::uint64_t>(state.spiritAbilityUsed));
    h = mixHash(h, hashInt(state.whaleValue));
    for (const Encounter* e : {&state.firstClient, &state.whale}) {
        h = mixHash(h, hashInt(e->client.dealValue));
        h = mixHash(h, hashInt(e->client.patience));
        h = mixHash(h, hashInt(e->client.resistance));
        h = mixHash(h, static_cast<std::uint64_t>(e->rounds.size()));
    }
    for (const ActiveModifier& m : state.modifiers.entries()) {
        h = mixHash(h, static_cast<std::uint64_t>(m.effect));
        h = mixHash(h, hashInt(m.value));
        h = mixHash(h, hashInt(m.phasesRemaining));
    }
    for (const GameRoll& r : state.rolls) {
        h = mixHash(h, hashString(r.label));
        h = mixHash(h, hashInt(r.result));
        h = mixHash(h, hashInt(r.total));
    }
    for (const std::string& c : state.choices) {
        h = mixHash(h, hashString(c));
    }
    h = mixHash(h, state.tier ? static_cast<std::uint64_t>(*state.tier) + 1 : 0);
    return h;
}

GameRunResult runScriptedGame(const Character& character,
                              const EntropySet& entropy,
                              const GameScript& script,
                              const SalesConfig& config) {
    SalesGame game(character, config);
    for (int slot = 1; slot <= kEntropySlotCount; ++slot) {
        game.supplyEntropy(slot, entropy[static_cast<std::size_t>(slot - 1)]);
    }
    maybeTraceDeterminismStage("start", game);

    game.assignTerritory();
    maybeTraceDeterminismStage("territory", game);
    game.advancePhase();

    game.applyTravelChoice(script.travel);
    if (script.travel == TravelChoice::Drive) {
        game.rollDriveTrouble();
    } else {
        game.rollJourney();
    }
    maybeTraceDeterminismStage("travel", game);
    game.advancePhase();

    game.startFirstClient();
    playEncounter(game, script.firstClientActions);
    game.completeFirstClient();
    maybeTraceDeterminismStage("firstClient", game);
    game.advancePhase();

    game.applyCrossroadsChoice(script.crossroads);
    maybeTraceDeterminismStage("crossroads", game);
    game.advancePhase();

    game.rollQuarterEvent();
    maybeTraceDeterminismStage("quarterEvent", game);
    game.advancePhase();

    game.applyVPChoice(script.vp);
    game.advancePhase();

    game.applyWhaleInvestment(script.investment);
    game.rollLuckyItem();
    maybeTraceDeterminismStage("whalePrep", game);
    game.advancePhase();

    game.startWhale();
    playEncounter(game, script.whaleActions);
    game.completeWhale();
    maybeTraceDeterminismStage("whale", game);
    game.advancePhase();

    GameRunResult result;
    result.tier = game.computeTier();
    maybeTraceDeterminismStage("tier", game);
    result.state = game.state();
    result.stateHash = computeStateHash(result.state);
    return result;
}
