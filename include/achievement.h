#pragma once

#include "entropy.h"
#include "sales_game.h"
#include "tier.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AchievementRecord {
    std::string characterName;
    std::int64_t characterRollHeight = 0;
    int startingMoney = 0;
    int finalMoney = 0;
    Tier tier = Tier::Promotion;

    struct SeedPair {
        std::string seed;
        std::string hash;
    };
    std::array<SeedPair, kEntropySlotCount> blocks{};

    GameRoll territoryRoll;
    std::vector<std::string> firstClientActions;
    std::vector<std::string> whaleActions;
    std::vector<std::string> choices;

    std::int64_t completedAtBlock = 0;
    std::int64_t timestamp = 0;
};

// nullopt for an unfinished game, a non-storable tier or a missing
// territory roll.
std::optional<AchievementRecord> buildAchievementRecord(const GameState& state,
                                                        const std::array<EntropyBundle, kEntropySlotCount>& entropy,
                                                        std::int64_t timestamp);

// Storage-side checks; the ledger rejects anything below Promotion.
bool validateAchievementForStorage(const AchievementRecord& record, std::string* errorMessage = nullptr);

std::string jsonEscape(const std::string& input);
std::string achievementToJson(const AchievementRecord& record);
