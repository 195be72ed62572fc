#pragma once

#include "character.h"
#include "client.h"
#include "modifier.h"
#include "sales_config.h"

#include <optional>

enum class NegotiationAction { Pitch, Listen, Concede, Ability };

enum class BodyLanguage { ArmsCrossed, Skeptical, Neutral, Interested, Engaged };

// Outcome of one resolved action. Fields that do not apply stay at defaults.
struct RoundResult {
    int round = 0;
    NegotiationAction action = NegotiationAction::Pitch;

    int pitchRoll = 0;
    int pitchModifier = 0;
    int pitchTotal = 0;
    int resistanceBefore = 0;
    bool success = false;
    bool autoSucceeded = false;
    int valueGained = 0; // pitch value, or the deal kept by a concede

    int bodyRoll = 0;
    int bodyShift = 0;
    int bodyShifted = 0;
    BodyLanguage bodyLanguage = BodyLanguage::Neutral;
    bool objectionBlocked = false;
    int engagedBonus = 0;

    int listenBuff = 0;

    int patienceAfter = 0;
    int resistanceAfter = 0;
    int dealValueAfter = 0;
    bool clientActiveAfter = true;
};

struct NegotiationContext {
    const Character& character;
    const SalesConfig& config;
    Territory territory;
    ModifierLedger& modifiers;
    bool againstWhale = false;
    int round = 1;
};

BodyLanguage interpretBodyLanguage(int shiftedRoll);
int shiftBodyLanguageRoll(int rawRoll, int shift, int dieSize);
const char* bodyLanguageName(BodyLanguage bl);
const char* negotiationActionName(NegotiationAction action);

// Applies patience/resistance/deal effects; deactivates at zero patience.
// Returns the Engaged deal increase (0 for other reads).
int applyBodyLanguage(Client& client, BodyLanguage bl, const SalesConfig& config);

// max(CHA, favored) + INT from round 2 + pitch buffs from the ledger.
int pitchModifier(const Character& character,
                  Territory territory,
                  int round,
                  const ModifierLedger& modifiers,
                  bool againstWhale);

// floor(floor(budget * share) * (100 + min(cap, perPoint * margin)) / 100)
// + closing + dealBuffs, floored at the configured minimum.
int pitchValue(int budget, int margin, int closing, int dealBuffs, const SalesConfig& config);

// Throw PreconditionViolation on an inactive client and MissingInput when a
// required roll is absent.
RoundResult resolvePitch(Client& client,
                         NegotiationContext& ctx,
                         std::optional<int> pitchRoll,
                         std::optional<int> bodyRoll);
RoundResult resolveListen(Client& client, NegotiationContext& ctx, std::optional<int> bodyRoll);
RoundResult resolveConcede(Client& client, NegotiationContext& ctx);
