#pragma once

#include "character.h"
#include "sales_config.h"

#include <string>

enum class Territory { Tech = 0, Retail = 1, Finance = 2 };

enum class ClientTier { Ordinary, Whale };

struct Client {
    std::string name;
    Territory territory = Territory::Tech;
    int patience = 0;
    int maxPatience = 0;
    int budget = 0;
    int resistance = 0;
    int dealValue = 0;
    bool active = true;
};

enum class NegotiationOutcome { Ongoing, Closed, Lost };

// d6: 1-2 Tech, 3-4 Retail, 5-6 Finance.
Territory territoryFromRoll(int roll);
Stat favoredStat(Territory territory);
const char* territoryName(Territory territory);
const char* territoryDisplayName(Territory territory);

// Picks template (roll - 1) % count and scales its budget with floor.
Client createClient(const SalesConfig& config,
                    Territory territory,
                    ClientTier tier,
                    int pickRoll,
                    double budgetScale);

NegotiationOutcome negotiationOutcome(const Client& client);
const char* negotiationOutcomeName(NegotiationOutcome outcome);
