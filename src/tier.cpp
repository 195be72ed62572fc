#include "tier.h"

Tier computeTier(int money, int startingMoney, bool legendaryUnlocked, const SalesConfig& config) {
    if (money <= 0) {
        return Tier::Fired;
    }
    if (startingMoney <= 0) {
        return legendaryUnlocked ? Tier::Legendary : Tier::Promotion;
    }
    const double ratio = static_cast<double>(money) / static_cast<double>(startingMoney);
    if (ratio < 1.0) {
        return Tier::UnderReview;
    }
    if (ratio < config.tiers.promotionThreshold) {
        return Tier::Employed;
    }
    if (ratio < config.tiers.legendaryThreshold || !legendaryUnlocked) {
        return Tier::Promotion;
    }
    return Tier::Legendary;
}

bool isStorableTier(Tier tier) {
    return tier == Tier::Promotion || tier == Tier::Legendary;
}

const char* tierName(Tier tier) {
    switch (tier) {
        case Tier::Fired: return "Fired";
        case Tier::UnderReview: return "UnderReview";
        case Tier::Employed: return "Employed";
        case Tier::Promotion: return "Promotion";
        case Tier::Legendary: return "Legendary";
    }
    return "?";
}
