#include "abilities.h"

#include "game_errors.h"

#include <algorithm>
#include <sstream>

int elementDealBonus(Element element, bool firstClientDeal, const SalesConfig& config) {
    switch (element) {
        case Element::Fire: return config.elements.fireDealBonus;
        case Element::Metal: return config.elements.metalDealBonus;
        case Element::Air: return firstClientDeal ? config.elements.airFirstDealBonus : 0;
        case Element::Earth:
        case Element::Wood:
        case Element::Water:
            return 0;
    }
    return 0;
}

int elementSetbackReduction(Element element, int loss, const SalesConfig& config) {
    switch (element) {
        case Element::Earth: return std::max(0, loss - config.elements.earthSetbackReduction);
        case Element::Fire:
        case Element::Water:
        case Element::Air:
        case Element::Wood:
        case Element::Metal:
            return loss;
    }
    return loss;
}

int elementPhaseIncome(Element element, const SalesConfig& config) {
    switch (element) {
        case Element::Wood: return config.elements.woodPhaseIncome;
        case Element::Fire:
        case Element::Water:
        case Element::Earth:
        case Element::Air:
        case Element::Metal:
            return 0;
    }
    return 0;
}

int resolveSetbackLoss(int loss, const Character& character, const SalesConfig& config, ModifierLedger& modifiers) {
    if (loss <= 0) {
        return 0;
    }
    if (modifiers.consumeFirst(ModifierEffect::SetbackWard)) {
        return 0;
    }
    const int afterElement = elementSetbackReduction(character.traits.element, loss, config);
    return applyConResilience(afterElement, character, config);
}

int spiritBondAmount(int base, int perWisPoint, int wisMod) {
    return std::max(0, base + wisMod * perWisPoint);
}

namespace {

ActiveModifier spiritModifier(const std::string& description, ModifierEffect effect, int value) {
    ActiveModifier m;
    m.description = description;
    m.kind = ModifierKind::Buff;
    m.value = value;
    m.source = ModifierSource::Spirit;
    m.effect = effect;
    m.phasesRemaining = kPermanentPhases;
    return m;
}

} // namespace

SpiritResult resolveSpiritAbility(SpiritContext& ctx) {
    const SalesConfig::Spirit& s = ctx.config.spirit;
    const int wis = ctx.character.mod(Stat::WIS);

    SpiritResult r;
    r.animal = ctx.character.traits.spiritAnimal;
    std::ostringstream summary;

    switch (r.animal) {
        case SpiritAnimal::Wolf:
            r.moneyGained = spiritBondAmount(s.wolfBase, s.wisBondPerPoint, wis);
            summary << "Wolf Pack: +" << r.moneyGained;
            break;
        case SpiritAnimal::Dragon:
            r.moneyGained = spiritBondAmount(s.dragonBase, s.wisBondPerPoint, wis);
            summary << "Dragon Fire: +" << r.moneyGained;
            break;
        case SpiritAnimal::Owl:
            r.moneyGained = spiritBondAmount(s.owlBase, s.wisBondPerPoint, wis);
            summary << "Owl Wisdom: +" << r.moneyGained;
            break;
        case SpiritAnimal::Whale:
            r.moneyGained = spiritBondAmount(s.whaleBase, s.wisBondPerPoint, wis);
            summary << "Whale Recovery: +" << r.moneyGained;
            break;
        case SpiritAnimal::Elephant: {
            const int perSuccess = spiritBondAmount(s.elephantPerSuccess, s.elephantWisPerPoint, wis);
            r.moneyGained = std::max(0, ctx.successfulRounds) * perSuccess;
            summary << "Elephant Memory: " << ctx.successfulRounds << " x " << perSuccess;
            break;
        }
        case SpiritAnimal::Tiger: {
            const int bonus = spiritBondAmount(s.tigerBase, s.wisBondPerPoint, wis);
            ctx.modifiers.add(spiritModifier("Tiger Strike", ModifierEffect::DealBonus, bonus));
            r.modifierAdded = true;
            summary << "Tiger Strike: +" << bonus << " on next deal";
            break;
        }
        case SpiritAnimal::Frog: {
            const int perRound = spiritBondAmount(s.frogPerRound, s.frogWisPerPoint, wis);
            ActiveModifier m = spiritModifier("Frog Fortune", ModifierEffect::RoundIncome, perRound);
            m.roundsRemaining = std::max(1, s.frogRounds);
            ctx.modifiers.add(m);
            r.modifierAdded = true;
            summary << "Frog Fortune: +" << perRound << " per round for " << m.roundsRemaining << " rounds";
            break;
        }
        case SpiritAnimal::Bear:
            ctx.modifiers.add(spiritModifier("Bear Presence", ModifierEffect::BlockObjection, 1));
            r.modifierAdded = true;
            summary << "Bear Presence: next objection blocked";
            break;
        case SpiritAnimal::Eagle:
            ctx.modifiers.add(spiritModifier("Eagle Eye", ModifierEffect::AutoSucceed, 1));
            r.modifierAdded = true;
            summary << "Eagle Eye: next pitch lands";
            break;
        case SpiritAnimal::Octopus:
            ctx.modifiers.add(spiritModifier("Octopus Escape", ModifierEffect::EscapePenalty, 1));
            r.modifierAdded = true;
            summary << "Octopus Escape: all-in penalty waived";
            break;
        case SpiritAnimal::Spider:
            ctx.modifiers.add(spiritModifier("Spider Web", ModifierEffect::SetbackWard, 1));
            r.modifierAdded = true;
            summary << "Spider Web: next setback absorbed";
            break;
        case SpiritAnimal::Deer: {
            Client* client = ctx.activeClient;
            if (!client || !client->active) {
                throw PreconditionViolation("Deer Grace needs an active negotiation");
            }
            const int floorValue = client->budget * s.deerClosePercent / 100;
            client->dealValue = std::max(client->dealValue, floorValue);
            client->active = false;
            r.closedNegotiation = true;
            summary << "Deer Grace: closed at " << client->dealValue;
            break;
        }
    }

    r.summary = summary.str();
    return r;
}
