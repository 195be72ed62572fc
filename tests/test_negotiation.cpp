#include "game_errors.h"
#include "negotiation.h"

#include "test_fixtures.h"
#include "test_harness.h"

#include <optional>

namespace {

Client makeClient(int budget, int resistance, int patience, int dealValue = 0) {
    Client c;
    c.name = "Test Client";
    c.territory = Territory::Retail;
    c.budget = budget;
    c.resistance = resistance;
    c.patience = patience;
    c.maxPatience = patience;
    c.dealValue = dealValue;
    c.active = true;
    return c;
}

ActiveModifier oneShot(ModifierEffect effect, int value) {
    ActiveModifier m;
    m.description = modifierEffectName(effect);
    m.value = value;
    m.source = ModifierSource::Spirit;
    m.effect = effect;
    m.phasesRemaining = kPermanentPhases;
    return m;
}

} // namespace

int test_negotiation() {
    int failures = 0;
    const SalesConfig config;
    // STR +3, CHA +3, everything else 0. Retail favors CHA.
    const Character closer = makeCharacter({{3, 0, 0, 0, 0, 3}});

    // ---- Pitch value formula ----
    {
        CHECK(pitchValue(3000, 3, 300, 0, config) == 817);
        CHECK(pitchValue(3000, 10, 0, 0, config) == 562);
        CHECK(pitchValue(3000, 0, 0, 3000, config) == 3450);
        CHECK(pitchValue(100, 0, -500, 0, config) == 100);
    }

    // ---- Body-language table and clamp ----
    {
        CHECK(interpretBodyLanguage(1) == BodyLanguage::ArmsCrossed);
        CHECK(interpretBodyLanguage(2) == BodyLanguage::Skeptical);
        CHECK(interpretBodyLanguage(3) == BodyLanguage::Neutral);
        CHECK(interpretBodyLanguage(4) == BodyLanguage::Neutral);
        CHECK(interpretBodyLanguage(5) == BodyLanguage::Interested);
        CHECK(interpretBodyLanguage(6) == BodyLanguage::Engaged);
        CHECK(shiftBodyLanguageRoll(6, 3, 6) == 6);
        CHECK(shiftBodyLanguageRoll(1, -3, 6) == 1);
        CHECK(shiftBodyLanguageRoll(3, 2, 6) == 5);

        Client c = makeClient(3000, 5, 5, 1000);
        applyBodyLanguage(c, BodyLanguage::Interested, config);
        CHECK(c.resistance == 5);
        CHECK(applyBodyLanguage(c, BodyLanguage::Engaged, config) == 100);
        CHECK(c.resistance == 5);
        CHECK(c.dealValue == 1100);
    }

    // ---- Successful pitch, neutral read ----
    {
        ModifierLedger ledger;
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 12, 5);
        const RoundResult r = resolvePitch(c, ctx, 12, 3);
        CHECK(r.pitchModifier == 3);
        CHECK(r.pitchTotal == 15);
        CHECK(r.success);
        CHECK(r.valueGained == 817);
        CHECK(r.bodyLanguage == BodyLanguage::Neutral);
        CHECK(c.dealValue == 817);
        CHECK(c.patience == 4);
        CHECK(c.resistance == 12);
        CHECK(c.active);
    }

    // ---- Engaged bonus applies after the pitch value ----
    {
        ModifierLedger ledger;
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 12, 5);
        const RoundResult r = resolvePitch(c, ctx, 12, 6);
        CHECK(r.bodyLanguage == BodyLanguage::Engaged);
        CHECK(r.engagedBonus == 81);
        CHECK(c.dealValue == 898);
        CHECK(c.resistance == 10);
    }

    // ---- Missed pitch with arms crossed ----
    {
        ModifierLedger ledger;
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 12, 5);
        const RoundResult r = resolvePitch(c, ctx, 1, 1);
        CHECK(!r.success);
        CHECK(r.valueGained == 0);
        CHECK(r.bodyLanguage == BodyLanguage::ArmsCrossed);
        CHECK(c.patience == 2);
        CHECK(c.resistance == 13);
        CHECK(c.dealValue == 0);
    }

    // ---- Pitch success is judged before body language shifts resistance ----
    {
        ModifierLedger ledger;
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 15, 5);
        const RoundResult r = resolvePitch(c, ctx, 12, 2);
        CHECK(r.success);
        CHECK(r.resistanceBefore == 15);
        CHECK(c.resistance == 17);
    }

    // ---- Round two adds INT ----
    {
        const Character sharp = makeCharacter({{0, 0, 0, 2, 0, 1}});
        ModifierLedger ledger;
        CHECK(pitchModifier(sharp, Territory::Tech, 1, ledger, false) == 2);
        CHECK(pitchModifier(sharp, Territory::Tech, 2, ledger, false) == 4);
        CHECK(pitchModifier(sharp, Territory::Retail, 1, ledger, false) == 1);
    }

    // ---- Listen buff is spent by the next pitch ----
    {
        ModifierLedger ledger;
        ActiveModifier research;
        research.value = 2;
        research.source = ModifierSource::Research;
        research.effect = ModifierEffect::ListenBonus;
        research.phasesRemaining = kPermanentPhases;
        ledger.add(research);

        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 12, 5);
        const RoundResult listen = resolveListen(c, ctx, 4);
        CHECK(listen.listenBuff == 4);
        CHECK(c.patience == 4);
        CHECK(ledger.total(ModifierEffect::NextPitchBonus) == 4);

        ctx.round = 2;
        const RoundResult pitch = resolvePitch(c, ctx, 5, 3);
        CHECK(pitch.pitchModifier == 7);
        CHECK(pitch.pitchTotal == 12);
        CHECK(pitch.success);
        CHECK(!ledger.has(ModifierEffect::NextPitchBonus));
        CHECK(ledger.has(ModifierEffect::ListenBonus));
    }

    // ---- Bear, Eagle and Tiger one-shots ----
    {
        ModifierLedger ledger;
        ledger.add(oneShot(ModifierEffect::BlockObjection, 1));
        ledger.add(oneShot(ModifierEffect::AutoSucceed, 1));
        ledger.add(oneShot(ModifierEffect::DealBonus, 3000));
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 20, 5);

        const RoundResult r = resolvePitch(c, ctx, 1, 1);
        CHECK(r.autoSucceeded);
        CHECK(r.success);
        CHECK(r.valueGained == 450 + 300 + 3000);
        CHECK(r.objectionBlocked);
        CHECK(r.bodyLanguage == BodyLanguage::Neutral);
        CHECK(c.patience == 4);
        CHECK(c.resistance == 20);
        CHECK(ledger.empty());

        ctx.round = 2;
        const RoundResult again = resolvePitch(c, ctx, 1, 1);
        CHECK(!again.success);
        CHECK(!again.objectionBlocked);
        CHECK(c.patience == 1);
    }

    // ---- Patience runs out exactly at zero ----
    {
        ModifierLedger ledger;
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 12, 2);
        resolveListen(c, ctx, 3);
        CHECK(c.patience == 1);
        CHECK(c.active);
        ctx.round = 2;
        const RoundResult r = resolveListen(c, ctx, 1);
        CHECK(r.patienceAfter == 0);
        CHECK(!r.clientActiveAfter);
        CHECK(r.valueGained == 0);
        CHECK(!c.active);
        CHECK(c.patience == 0);
        CHECK_THROWS(resolvePitch(c, ctx, 10, 3), PreconditionViolation);
        CHECK_THROWS(resolveListen(c, ctx, 3), PreconditionViolation);
        CHECK_THROWS(resolveConcede(c, ctx), PreconditionViolation);
    }

    // ---- Concede ----
    {
        ModifierLedger ledger;
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 3};
        Client c = makeClient(3000, 12, 4, 1000);
        const RoundResult r = resolveConcede(c, ctx);
        CHECK(r.dealValueAfter == 800);
        CHECK(r.valueGained == 800);
        CHECK(c.dealValue == 800);
        CHECK(!c.active);
        CHECK(c.patience == 4);
        CHECK(negotiationOutcome(c) == NegotiationOutcome::Closed);
    }

    // ---- Missing rolls ----
    {
        ModifierLedger ledger;
        NegotiationContext ctx{closer, config, Territory::Retail, ledger, false, 1};
        Client c = makeClient(3000, 12, 5);
        CHECK_THROWS(resolvePitch(c, ctx, std::nullopt, 3), MissingInput);
        CHECK_THROWS(resolvePitch(c, ctx, 10, std::nullopt), MissingInput);
        CHECK_THROWS(resolveListen(c, ctx, std::nullopt), MissingInput);
        CHECK(c.patience == 5);
    }

    return failures;
}
