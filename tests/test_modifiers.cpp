#include "abilities.h"
#include "game_errors.h"
#include "modifier.h"

#include "test_fixtures.h"
#include "test_harness.h"

namespace {

ActiveModifier entry(ModifierEffect effect, int value, int phases, ModifierSource source = ModifierSource::Travel) {
    ActiveModifier m;
    m.description = modifierEffectName(effect);
    m.value = value;
    m.effect = effect;
    m.source = source;
    m.phasesRemaining = phases;
    return m;
}

} // namespace

int test_modifiers() {
    int failures = 0;
    const SalesConfig config;

    // ---- Ledger: phase ticking and pitch sums ----
    {
        ModifierLedger ledger;
        ledger.add(entry(ModifierEffect::PitchBonus, 2, 2));
        ledger.add(entry(ModifierEffect::WhalePitchBonus, 4, 99, ModifierSource::Hunt));
        ledger.add(entry(ModifierEffect::NextPitchBonus, 2, 1, ModifierSource::Listen));
        ledger.add(entry(ModifierEffect::DealBonus, 3000, 99, ModifierSource::Spirit));

        CHECK(ledger.pitchBonus(false) == 4);
        CHECK(ledger.pitchBonus(true) == 8);

        ledger.tickPhase();
        CHECK(ledger.entries().size() == 3);
        CHECK(ledger.pitchBonus(false) == 2);
        ledger.tickPhase();
        CHECK(ledger.pitchBonus(false) == 0);
        CHECK(ledger.pitchBonus(true) == 4);
        CHECK(ledger.has(ModifierEffect::DealBonus));
        CHECK(ledger.consumeAll(ModifierEffect::DealBonus) == 3000);
        CHECK(!ledger.has(ModifierEffect::DealBonus));
    }

    // ---- Ledger: one-shot consumption and round income ----
    {
        ModifierLedger ledger;
        ledger.add(entry(ModifierEffect::SetbackWard, 1, 99, ModifierSource::Spirit));
        ActiveModifier taken;
        CHECK(ledger.consumeFirst(ModifierEffect::SetbackWard, &taken));
        CHECK(taken.source == ModifierSource::Spirit);
        CHECK(!ledger.consumeFirst(ModifierEffect::SetbackWard));

        ActiveModifier frog = entry(ModifierEffect::RoundIncome, 900, 99, ModifierSource::Spirit);
        frog.roundsRemaining = 3;
        ledger.add(frog);
        CHECK(ledger.collectRoundIncome() == 900);
        CHECK(ledger.collectRoundIncome() == 900);
        CHECK(ledger.collectRoundIncome() == 900);
        CHECK(ledger.collectRoundIncome() == 0);
        CHECK(ledger.empty());
    }

    // ---- Element passives ----
    {
        CHECK(elementDealBonus(Element::Fire, false, config) == 500);
        CHECK(elementDealBonus(Element::Metal, true, config) == 200);
        CHECK(elementDealBonus(Element::Air, true, config) == 300);
        CHECK(elementDealBonus(Element::Air, false, config) == 0);
        CHECK(elementDealBonus(Element::Water, true, config) == 0);
        CHECK(elementSetbackReduction(Element::Earth, 150, config) == 0);
        CHECK(elementSetbackReduction(Element::Earth, 1000, config) == 800);
        CHECK(elementSetbackReduction(Element::Fire, 1000, config) == 1000);
        CHECK(elementPhaseIncome(Element::Wood, config) == 100);
        CHECK(elementPhaseIncome(Element::Metal, config) == 0);
    }

    // ---- Setback pipeline: ward, element, CON ----
    {
        ModifierLedger ledger;
        const Character fire = makeCharacter({{0, 0, 2, 0, 0, 0}}, Element::Fire);
        CHECK(resolveSetbackLoss(3000, fire, config, ledger) == 2800);

        const Character earth = makeCharacter({{0, 0, 2, 0, 0, 0}}, Element::Earth);
        CHECK(resolveSetbackLoss(3000, earth, config, ledger) == 2600);
        CHECK(resolveSetbackLoss(300, earth, config, ledger) == 0);

        ledger.add(entry(ModifierEffect::SetbackWard, 1, 99, ModifierSource::Spirit));
        CHECK(resolveSetbackLoss(3000, fire, config, ledger) == 0);
        CHECK(resolveSetbackLoss(3000, fire, config, ledger) == 2800);
        CHECK(resolveSetbackLoss(0, fire, config, ledger) == 0);
    }

    // ---- Spirit abilities ----
    {
        auto run = [&](SpiritAnimal animal, int wis, ModifierLedger& ledger, Client* client, int successes) {
            const Character c = makeCharacter({{0, 0, 0, 0, wis, 0}}, Element::Water, animal);
            SpiritContext ctx{c, config, ledger, client, successes};
            return resolveSpiritAbility(ctx);
        };

        ModifierLedger ledger;
        CHECK(run(SpiritAnimal::Wolf, 2, ledger, nullptr, 0).moneyGained == 3000);
        CHECK(run(SpiritAnimal::Wolf, -5, ledger, nullptr, 0).moneyGained == 0);
        CHECK(run(SpiritAnimal::Dragon, 0, ledger, nullptr, 0).moneyGained == 5000);
        CHECK(run(SpiritAnimal::Owl, 1, ledger, nullptr, 0).moneyGained == 2000);
        CHECK(run(SpiritAnimal::Whale, -1, ledger, nullptr, 0).moneyGained == 3500);
        CHECK(run(SpiritAnimal::Elephant, 1, ledger, nullptr, 3).moneyGained == 3600);
        CHECK(run(SpiritAnimal::Elephant, 1, ledger, nullptr, 0).moneyGained == 0);
        CHECK(ledger.empty());

        const SpiritResult tiger = run(SpiritAnimal::Tiger, 2, ledger, nullptr, 0);
        CHECK(tiger.modifierAdded);
        CHECK(tiger.moneyGained == 0);
        CHECK(ledger.total(ModifierEffect::DealBonus) == 4000);

        run(SpiritAnimal::Frog, 3, ledger, nullptr, 0);
        CHECK(ledger.total(ModifierEffect::RoundIncome) == 1100);
        bool frogRounds = false;
        for (const ActiveModifier& m : ledger.entries()) {
            if (m.effect == ModifierEffect::RoundIncome) frogRounds = (m.roundsRemaining == 3);
        }
        CHECK(frogRounds);

        run(SpiritAnimal::Bear, 0, ledger, nullptr, 0);
        run(SpiritAnimal::Eagle, 0, ledger, nullptr, 0);
        run(SpiritAnimal::Octopus, 0, ledger, nullptr, 0);
        run(SpiritAnimal::Spider, 0, ledger, nullptr, 0);
        CHECK(ledger.has(ModifierEffect::BlockObjection));
        CHECK(ledger.has(ModifierEffect::AutoSucceed));
        CHECK(ledger.has(ModifierEffect::EscapePenalty));
        CHECK(ledger.has(ModifierEffect::SetbackWard));

        CHECK_THROWS(run(SpiritAnimal::Deer, 0, ledger, nullptr, 0), PreconditionViolation);
        Client client;
        client.name = "Deer Target";
        client.budget = 3000;
        client.patience = 3;
        client.dealValue = 500;
        client.active = true;
        const SpiritResult deer = run(SpiritAnimal::Deer, 0, ledger, &client, 0);
        CHECK(deer.closedNegotiation);
        CHECK(client.dealValue == 1500);
        CHECK(!client.active);

        Client rich = client;
        rich.active = true;
        rich.dealValue = 2000;
        run(SpiritAnimal::Deer, 0, ledger, &rich, 0);
        CHECK(rich.dealValue == 2000);
    }

    return failures;
}
