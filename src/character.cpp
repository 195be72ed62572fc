#include "character.h"

#include "dice.h"

#include <algorithm>
#include <vector>

namespace {

const char* kStatLabelPrefixes[kStatCount] = {"str", "dex", "con", "int", "wis", "cha"};

constexpr Element kElementsByRoll[kElementCount] = {
    Element::Fire, Element::Water, Element::Earth, Element::Air, Element::Wood, Element::Metal
};

constexpr SpiritAnimal kSpiritsByRoll[kSpiritAnimalCount] = {
    SpiritAnimal::Wolf,
    SpiritAnimal::Bear,
    SpiritAnimal::Eagle,
    SpiritAnimal::Dragon,
    SpiritAnimal::Octopus,
    SpiritAnimal::Owl,
    SpiritAnimal::Tiger,
    SpiritAnimal::Deer,
    SpiritAnimal::Spider,
    SpiritAnimal::Whale,
    SpiritAnimal::Elephant,
    SpiritAnimal::Frog
};

} // namespace

Character rollCharacter(const std::string& name,
                        std::int64_t blockHeight,
                        const std::string& blockHash,
                        const std::string& clientSeed) {
    const Digest256 seed = combineSeed(blockHash, clientSeed);

    // 24 stat dice followed by the three trait rolls.
    std::vector<RollRequest> requests;
    requests.reserve(kStatCount * 4 + 3);
    for (int s = 0; s < kStatCount; ++s) {
        for (int d = 1; d <= 4; ++d) {
            requests.push_back({std::string(kStatLabelPrefixes[s]) + "_d" + std::to_string(d), 6, 0});
        }
    }
    requests.push_back({"element", kElementCount, 0});
    requests.push_back({"spirit_animal", kSpiritAnimalCount, 0});
    requests.push_back({"sex", 2, 0});

    deriveRolls(seed, requests);

    Character c;
    c.name = name;
    for (int s = 0; s < kStatCount; ++s) {
        StatRoll& roll = c.stats[s];
        roll.total = 0;
        for (int d = 0; d < 4; ++d) {
            roll.dice[d] = requests[s * 4 + d].result;
            roll.total += roll.dice[d];
        }
        roll.modifier = statModifierFromTotal(roll.total);
    }
    const std::size_t traitBase = static_cast<std::size_t>(kStatCount * 4);
    c.traits.element = kElementsByRoll[requests[traitBase].result - 1];
    c.traits.spiritAnimal = kSpiritsByRoll[requests[traitBase + 1].result - 1];
    c.traits.sex = (requests[traitBase + 2].result == 1) ? Sex::Male : Sex::Female;
    c.verification.blockHeight = blockHeight;
    c.verification.blockHash = blockHash;
    c.verification.clientSeed = clientSeed;
    return c;
}

CharacterVerificationResult verifyCharacterOffline(const Character& character) {
    CharacterVerificationResult result;
    result.computed = rollCharacter(character.name,
                                    character.verification.blockHeight,
                                    character.verification.blockHash,
                                    character.verification.clientSeed);

    result.statsMatch = true;
    for (int s = 0; s < kStatCount; ++s) {
        const StatRoll& a = character.stats[s];
        const StatRoll& b = result.computed.stats[s];
        if (a.total != b.total || a.dice != b.dice) {
            result.statsMatch = false;
            break;
        }
    }
    result.traitsMatch = character.traits.element == result.computed.traits.element &&
                         character.traits.spiritAnimal == result.computed.traits.spiritAnimal &&
                         character.traits.sex == result.computed.traits.sex;
    result.valid = result.statsMatch && result.traitsMatch;
    return result;
}

const char* statName(Stat s) {
    switch (s) {
        case Stat::STR: return "STR";
        case Stat::DEX: return "DEX";
        case Stat::CON: return "CON";
        case Stat::INT: return "INT";
        case Stat::WIS: return "WIS";
        case Stat::CHA: return "CHA";
    }
    return "?";
}

const char* elementName(Element e) {
    switch (e) {
        case Element::Fire: return "Fire";
        case Element::Water: return "Water";
        case Element::Earth: return "Earth";
        case Element::Air: return "Air";
        case Element::Wood: return "Wood";
        case Element::Metal: return "Metal";
    }
    return "?";
}

const char* spiritAnimalName(SpiritAnimal s) {
    switch (s) {
        case SpiritAnimal::Wolf: return "Wolf";
        case SpiritAnimal::Bear: return "Bear";
        case SpiritAnimal::Eagle: return "Eagle";
        case SpiritAnimal::Dragon: return "Dragon";
        case SpiritAnimal::Octopus: return "Octopus";
        case SpiritAnimal::Owl: return "Owl";
        case SpiritAnimal::Tiger: return "Tiger";
        case SpiritAnimal::Deer: return "Deer";
        case SpiritAnimal::Spider: return "Spider";
        case SpiritAnimal::Whale: return "Whale";
        case SpiritAnimal::Elephant: return "Elephant";
        case SpiritAnimal::Frog: return "Frog";
    }
    return "?";
}

const char* sexName(Sex s) {
    return (s == Sex::Male) ? "Male" : "Female";
}

int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

int calculateStartingMoney(const Character& character, const SalesConfig& config) {
    const SalesConfig::Economy& e = config.economy;
    const int total = e.baseMoney +
                      character.mod(Stat::CHA) * e.chaMultiplier +
                      character.mod(Stat::INT) * e.intMultiplier +
                      character.mod(Stat::WIS) * e.wisMultiplier;
    return std::max(total, e.minimumMoney);
}

double calculateBudgetScale(int startingMoney, const SalesConfig& config) {
    const double ratio = static_cast<double>(startingMoney) / static_cast<double>(config.economy.baseMoney);
    return std::max(config.economy.budgetScaleFloor, ratio);
}

int conAdjustment(const Character& character, const SalesConfig& config) {
    return character.mod(Stat::CON) * config.economy.setbackUnit;
}

int applyConResilience(int loss, const Character& character, const SalesConfig& config) {
    if (loss <= 0) {
        return 0;
    }
    return std::max(0, loss - std::max(0, conAdjustment(character, config)));
}

int closingBonus(const Character& character, const SalesConfig& config) {
    return character.mod(Stat::STR) * config.economy.closingUnit;
}

int bodyLanguageShift(const Character& character, int negotiationRound) {
    int shift = floorDiv(character.mod(Stat::DEX), 2);
    if (negotiationRound >= 2) {
        shift += floorDiv(character.mod(Stat::WIS), 2);
    }
    return shift;
}
