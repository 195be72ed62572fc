#pragma once

#include "character.h"
#include "client.h"
#include "modifier.h"
#include "sales_config.h"

#include <string>

// Element passives. Elements are rules evaluated at trigger points, never
// ledger entries.
int elementDealBonus(Element element, bool firstClientDeal, const SalesConfig& config);
int elementSetbackReduction(Element element, int loss, const SalesConfig& config);
int elementPhaseIncome(Element element, const SalesConfig& config);

// Involuntary loss pipeline: Spider ward, then element reduction, then CON.
// Returns the amount actually lost (>= 0, <= loss).
int resolveSetbackLoss(int loss, const Character& character, const SalesConfig& config, ModifierLedger& modifiers);

struct SpiritContext {
    const Character& character;
    const SalesConfig& config;
    ModifierLedger& modifiers;
    Client* activeClient = nullptr; // negotiation in progress, if any
    int successfulRounds = 0;       // rounds with value gained, both encounters
};

struct SpiritResult {
    SpiritAnimal animal = SpiritAnimal::Wolf;
    int moneyGained = 0;
    bool modifierAdded = false;
    bool closedNegotiation = false;
    std::string summary;
};

// Wisdom-scaled spirit bond amount, never negative.
int spiritBondAmount(int base, int perWisPoint, int wisMod);

// Throws PreconditionViolation when the animal needs a live negotiation
// (Deer) and none is active. The single-use guard lives with the caller.
SpiritResult resolveSpiritAbility(SpiritContext& ctx);
