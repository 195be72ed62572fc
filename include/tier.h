#pragma once

#include "sales_config.h"

enum class Tier { Fired, UnderReview, Employed, Promotion, Legendary };

// money <= 0 is Fired regardless of ratio. Without the legendary unlock the
// result is capped at Promotion even when the ratio clears the legendary bar.
Tier computeTier(int money, int startingMoney, bool legendaryUnlocked, const SalesConfig& config);

// Only Promotion and Legendary may be stored as achievements.
bool isStorableTier(Tier tier);
const char* tierName(Tier tier);
