#pragma once

#include "sales_config.h"

#include <array>
#include <cstdint>
#include <string>

enum class Stat {
    STR = 0,
    DEX = 1,
    CON = 2,
    INT = 3,
    WIS = 4,
    CHA = 5
};

enum class Element { Fire, Water, Earth, Air, Wood, Metal };

enum class SpiritAnimal {
    Wolf,
    Bear,
    Eagle,
    Dragon,
    Octopus,
    Owl,
    Tiger,
    Deer,
    Spider,
    Whale,
    Elephant,
    Frog
};

enum class Sex { Male, Female };

constexpr int kStatCount = 6;
constexpr int kElementCount = 6;
constexpr int kSpiritAnimalCount = 12;

struct StatRoll {
    std::array<int, 4> dice{{0, 0, 0, 0}};
    int total = 0;
    int modifier = 0;
};

struct CharacterTraits {
    Element element = Element::Fire;
    SpiritAnimal spiritAnimal = SpiritAnimal::Wolf;
    Sex sex = Sex::Male;
};

struct CharacterVerification {
    std::int64_t blockHeight = 0;
    std::string blockHash;
    std::string clientSeed;
};

struct Character {
    std::string name;
    std::array<StatRoll, kStatCount> stats{};
    CharacterTraits traits{};
    CharacterVerification verification{};

    int mod(Stat s) const { return stats[static_cast<int>(s)].modifier; }
    const StatRoll& stat(Stat s) const { return stats[static_cast<int>(s)]; }
};

// Rolls 4d6 per stat plus element (d6), spirit animal (d12) and sex (d2).
Character rollCharacter(const std::string& name,
                        std::int64_t blockHeight,
                        const std::string& blockHash,
                        const std::string& clientSeed);

struct CharacterVerificationResult {
    bool valid = false;
    bool statsMatch = false;
    bool traitsMatch = false;
    Character computed;
};

// Re-derives the roll from the verification block; no block-chain lookup.
CharacterVerificationResult verifyCharacterOffline(const Character& character);

const char* statName(Stat s);
const char* elementName(Element e);
const char* spiritAnimalName(SpiritAnimal s);
const char* sexName(Sex s);

// Mathematical floor division (rounds toward negative infinity).
int floorDiv(int a, int b);

// ---------------------------------------------------------------------------
// Economy projections. Read-only views of the six modifiers.

int calculateStartingMoney(const Character& character, const SalesConfig& config);
double calculateBudgetScale(int startingMoney, const SalesConfig& config);
int conAdjustment(const Character& character, const SalesConfig& config);
// Reduces a loss (L >= 0); never below zero and never above L.
int applyConResilience(int loss, const Character& character, const SalesConfig& config);
int closingBonus(const Character& character, const SalesConfig& config);
int bodyLanguageShift(const Character& character, int negotiationRound);
