#include "game_runner.h"

#include "test_fixtures.h"
#include "test_harness.h"

#include <string>

int test_runner() {
    int failures = 0;
    const SalesConfig config;

    SyntheticEntropySource source("runner-chain", 499);
    const Character hero = rollCharacterFromSource("Runner", source, "runner-seed", 500);
    CHECK(hero.verification.blockHeight == 500);
    CHECK(verifyCharacterOffline(hero).valid);
    const EntropySet entropy = commitAndReveal(source, "runner-seed", 501);
    CHECK(entropy[0].blockHeight == 501);

    GameScript script;
    script.travel = TravelChoice::Fly;
    script.firstClientActions = {NegotiationAction::Listen, NegotiationAction::Pitch, NegotiationAction::Ability};
    script.crossroads = CrossroadsChoice::Hunt;
    script.vp = VPChoice::Stretch;
    script.investment = WhaleInvestment::Gift;
    script.whaleActions = {NegotiationAction::Pitch, NegotiationAction::Ability, NegotiationAction::Listen};

    // ---- Same inputs, same game ----
    {
        const GameRunResult a = runScriptedGame(hero, entropy, script, config);
        const GameRunResult b = runScriptedGame(hero, entropy, script, config);
        CHECK(a.stateHash == b.stateHash);
        CHECK(a.tier == b.tier);
        CHECK(a.state.money == b.state.money);
        CHECK(a.state.rolls.size() == b.state.rolls.size());
        CHECK(a.stateHash == computeStateHash(a.state));

        const GameState& s = a.state;
        CHECK(s.phase == Phase::QuarterEnd);
        CHECK(s.tier.has_value() && *s.tier == a.tier);
        CHECK(s.firstClient.completed);
        CHECK(s.whale.completed);
        CHECK(!s.firstClient.client.active);
        CHECK(!s.whale.client.active);
        CHECK(s.spiritAbilityUsed);
        CHECK(s.legendaryUnlocked);
        CHECK(s.travel && *s.travel == TravelChoice::Fly);
        CHECK(s.luckyItem.has_value());
        CHECK(s.quarterEvent.has_value());
        CHECK(!s.firstClient.rounds.empty());
        CHECK(s.firstClient.rounds[0].action == NegotiationAction::Listen);
        // Ability never shows up as a recorded round.
        for (const Encounter* e : {&s.firstClient, &s.whale}) {
            for (const RoundResult& r : e->rounds) {
                CHECK(r.action != NegotiationAction::Ability);
            }
        }
        CHECK(!s.rolls.empty() && s.rolls[0].label == "territory");
    }

    // ---- Different entropy moves the hash ----
    {
        const GameRunResult a = runScriptedGame(hero, entropy, script, config);
        const EntropySet other = makeEntropy("runner-other-chain", 900);
        const GameRunResult c = runScriptedGame(hero, other, script, config);
        CHECK(a.stateHash != c.stateHash);
    }

    // ---- Default script pitches every client out ----
    {
        const GameRunResult r = runScriptedGame(hero, entropy, GameScript{}, config);
        CHECK(r.state.phase == Phase::QuarterEnd);
        CHECK(!r.state.spiritAbilityUsed);
        CHECK(!r.state.legendaryUnlocked);
        CHECK(r.tier != Tier::Legendary);
        for (const RoundResult& round : r.state.firstClient.rounds) {
            CHECK(round.action == NegotiationAction::Pitch);
        }
    }

    return failures;
}
