#include "client.h"

#include "game_errors.h"

#include <cmath>

Territory territoryFromRoll(int roll) {
    if (roll <= 2) {
        return Territory::Tech;
    }
    if (roll <= 4) {
        return Territory::Retail;
    }
    return Territory::Finance;
}

Stat favoredStat(Territory territory) {
    switch (territory) {
        case Territory::Tech: return Stat::INT;
        case Territory::Retail: return Stat::CHA;
        case Territory::Finance: return Stat::WIS;
    }
    return Stat::CHA;
}

const char* territoryName(Territory territory) {
    switch (territory) {
        case Territory::Tech: return "tech";
        case Territory::Retail: return "retail";
        case Territory::Finance: return "finance";
    }
    return "?";
}

const char* territoryDisplayName(Territory territory) {
    switch (territory) {
        case Territory::Tech: return "Technology";
        case Territory::Retail: return "Retail";
        case Territory::Finance: return "Finance";
    }
    return "?";
}

Client createClient(const SalesConfig& config,
                    Territory territory,
                    ClientTier tier,
                    int pickRoll,
                    double budgetScale) {
    const auto& byTerritory = (tier == ClientTier::Whale) ? config.whaleClients : config.firstClients;
    const std::size_t t = static_cast<std::size_t>(territory);
    if (t >= byTerritory.size() || byTerritory[t].empty()) {
        throw PreconditionViolation(std::string("no client templates for territory ") + territoryName(territory));
    }
    const auto& templates = byTerritory[t];
    const int count = static_cast<int>(templates.size());
    const int index = ((pickRoll - 1) % count + count) % count;
    const SalesConfig::ClientTemplate& tpl = templates[static_cast<std::size_t>(index)];

    Client c;
    c.name = tpl.name;
    c.territory = territory;
    c.patience = tpl.patience;
    c.maxPatience = tpl.patience;
    c.budget = static_cast<int>(std::floor(static_cast<double>(tpl.budget) * budgetScale));
    c.resistance = tpl.resistance;
    c.dealValue = 0;
    c.active = true;
    return c;
}

NegotiationOutcome negotiationOutcome(const Client& client) {
    if (client.active) {
        return NegotiationOutcome::Ongoing;
    }
    return (client.dealValue > 0) ? NegotiationOutcome::Closed : NegotiationOutcome::Lost;
}

const char* negotiationOutcomeName(NegotiationOutcome outcome) {
    switch (outcome) {
        case NegotiationOutcome::Ongoing: return "ongoing";
        case NegotiationOutcome::Closed: return "closed";
        case NegotiationOutcome::Lost: return "lost";
    }
    return "?";
}
