#include "negotiation.h"

#include "game_errors.h"

#include <algorithm>
#include <string>

namespace {

void requireActive(const Client& client, const char* action) {
    if (!client.active) {
        throw PreconditionViolation(std::string(action) + " on inactive client " + client.name);
    }
}

void settlePatience(Client& client) {
    if (client.patience <= 0) {
        client.patience = 0;
        client.active = false;
    }
}

bool isObjection(BodyLanguage bl) {
    return bl == BodyLanguage::ArmsCrossed || bl == BodyLanguage::Skeptical;
}

void readBodyLanguage(Client& client, NegotiationContext& ctx, int rawRoll, RoundResult& r) {
    r.bodyRoll = rawRoll;
    r.bodyShift = bodyLanguageShift(ctx.character, ctx.round);
    r.bodyShifted = shiftBodyLanguageRoll(rawRoll, r.bodyShift, ctx.config.negotiation.bodyLanguageDie);
    r.bodyLanguage = interpretBodyLanguage(r.bodyShifted);
    if (isObjection(r.bodyLanguage) && ctx.modifiers.consumeFirst(ModifierEffect::BlockObjection)) {
        r.bodyLanguage = BodyLanguage::Neutral;
        r.objectionBlocked = true;
    }
    r.engagedBonus = applyBodyLanguage(client, r.bodyLanguage, ctx.config);
}

void snapshot(const Client& client, RoundResult& r) {
    r.patienceAfter = client.patience;
    r.resistanceAfter = client.resistance;
    r.dealValueAfter = client.dealValue;
    r.clientActiveAfter = client.active;
}

} // namespace

BodyLanguage interpretBodyLanguage(int shiftedRoll) {
    if (shiftedRoll <= 1) return BodyLanguage::ArmsCrossed;
    if (shiftedRoll == 2) return BodyLanguage::Skeptical;
    if (shiftedRoll <= 4) return BodyLanguage::Neutral;
    if (shiftedRoll == 5) return BodyLanguage::Interested;
    return BodyLanguage::Engaged;
}

int shiftBodyLanguageRoll(int rawRoll, int shift, int dieSize) {
    return std::clamp(rawRoll + shift, 1, std::max(1, dieSize));
}

const char* bodyLanguageName(BodyLanguage bl) {
    switch (bl) {
        case BodyLanguage::ArmsCrossed: return "arms_crossed";
        case BodyLanguage::Skeptical: return "skeptical";
        case BodyLanguage::Neutral: return "neutral";
        case BodyLanguage::Interested: return "interested";
        case BodyLanguage::Engaged: return "engaged";
    }
    return "?";
}

const char* negotiationActionName(NegotiationAction action) {
    switch (action) {
        case NegotiationAction::Pitch: return "pitch";
        case NegotiationAction::Listen: return "listen";
        case NegotiationAction::Concede: return "concede";
        case NegotiationAction::Ability: return "ability";
    }
    return "?";
}

int applyBodyLanguage(Client& client, BodyLanguage bl, const SalesConfig& config) {
    const int minRes = config.negotiation.minResistance;
    int engaged = 0;
    switch (bl) {
        case BodyLanguage::ArmsCrossed:
            client.patience -= 2;
            client.resistance += 1;
            break;
        case BodyLanguage::Skeptical:
            client.resistance += 2;
            break;
        case BodyLanguage::Neutral:
            break;
        case BodyLanguage::Interested:
            client.resistance = std::max(minRes, client.resistance - 1);
            break;
        case BodyLanguage::Engaged:
            client.resistance = std::max(minRes, client.resistance - 2);
            engaged = client.dealValue * config.negotiation.engagedDealBonusPercent / 100;
            client.dealValue += engaged;
            break;
    }
    settlePatience(client);
    return engaged;
}

int pitchModifier(const Character& character,
                  Territory territory,
                  int round,
                  const ModifierLedger& modifiers,
                  bool againstWhale) {
    int mod = std::max(character.mod(Stat::CHA), character.mod(favoredStat(territory)));
    if (round >= 2) {
        mod += character.mod(Stat::INT);
    }
    return mod + modifiers.pitchBonus(againstWhale);
}

int pitchValue(int budget, int margin, int closing, int dealBuffs, const SalesConfig& config) {
    const SalesConfig::Negotiation& n = config.negotiation;
    const int base = budget * n.pitchBudgetSharePercent / 100;
    const int bonusPercent = std::min(n.marginBonusCapPercent, n.marginBonusPercentPerPoint * std::max(0, margin));
    const int value = base * (100 + bonusPercent) / 100 + closing + dealBuffs;
    return std::max(n.minimumPitchValue, value);
}

RoundResult resolvePitch(Client& client,
                         NegotiationContext& ctx,
                         std::optional<int> pitchRoll,
                         std::optional<int> bodyRoll) {
    requireActive(client, "pitch");
    if (!pitchRoll) {
        throw MissingInput("pitch roll missing for round " + std::to_string(ctx.round));
    }
    if (!bodyRoll) {
        throw MissingInput("body language roll missing for round " + std::to_string(ctx.round));
    }

    RoundResult r;
    r.round = ctx.round;
    r.action = NegotiationAction::Pitch;
    r.pitchRoll = *pitchRoll;
    r.pitchModifier = pitchModifier(ctx.character, ctx.territory, ctx.round, ctx.modifiers, ctx.againstWhale);
    r.pitchTotal = r.pitchRoll + r.pitchModifier;
    r.resistanceBefore = client.resistance;

    // Listen buffs are spent by this pitch whether it lands or not.
    ctx.modifiers.consumeAll(ModifierEffect::NextPitchBonus);
    r.autoSucceeded = ctx.modifiers.consumeFirst(ModifierEffect::AutoSucceed);
    r.success = r.autoSucceeded || r.pitchTotal >= client.resistance;

    if (r.success) {
        const int margin = std::max(0, r.pitchTotal - client.resistance);
        const int dealBuffs = ctx.modifiers.consumeAll(ModifierEffect::DealBonus);
        r.valueGained = pitchValue(client.budget, margin, closingBonus(ctx.character, ctx.config), dealBuffs, ctx.config);
        client.dealValue += r.valueGained;
    }

    client.patience -= 1;
    readBodyLanguage(client, ctx, *bodyRoll, r);
    settlePatience(client);
    snapshot(client, r);
    return r;
}

RoundResult resolveListen(Client& client, NegotiationContext& ctx, std::optional<int> bodyRoll) {
    requireActive(client, "listen");
    if (!bodyRoll) {
        throw MissingInput("body language roll missing for round " + std::to_string(ctx.round));
    }

    RoundResult r;
    r.round = ctx.round;
    r.action = NegotiationAction::Listen;
    r.resistanceBefore = client.resistance;
    r.listenBuff = ctx.config.negotiation.listenBonus + ctx.modifiers.total(ModifierEffect::ListenBonus);

    ActiveModifier buff;
    buff.description = "Active Listening";
    buff.kind = ModifierKind::Buff;
    buff.value = r.listenBuff;
    buff.source = ModifierSource::Listen;
    buff.effect = ModifierEffect::NextPitchBonus;
    buff.phasesRemaining = 1;
    ctx.modifiers.add(buff);

    client.patience -= 1;
    readBodyLanguage(client, ctx, *bodyRoll, r);
    settlePatience(client);
    snapshot(client, r);
    return r;
}

RoundResult resolveConcede(Client& client, NegotiationContext& ctx) {
    requireActive(client, "concede");

    RoundResult r;
    r.round = ctx.round;
    r.action = NegotiationAction::Concede;
    r.resistanceBefore = client.resistance;
    client.dealValue = client.dealValue * ctx.config.negotiation.concedePercent / 100;
    client.active = false;
    r.valueGained = client.dealValue;
    snapshot(client, r);
    return r;
}
