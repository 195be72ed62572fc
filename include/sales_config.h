#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct SalesConfig {
    // One row of a d6 event table. pitchBuff > 0 inserts a pitch modifier.
    struct EventEntry {
        int roll = 0;
        std::string name;
        int moneyChange = 0;
        int pitchBuff = 0;
        int buffPhases = 0;
    };

    struct ClientTemplate {
        std::string name;
        int patience = 0;
        int budget = 0;
        int resistance = 0;
    };

    struct Economy {
        int baseMoney = 10000;
        int chaMultiplier = 2000;
        int intMultiplier = 1000;
        int wisMultiplier = 500;
        int minimumMoney = 3000;
        double budgetScaleFloor = 0.5;
        int setbackUnit = 100;  // CON resilience per modifier point
        int closingUnit = 100;  // STR closing power per modifier point
    } economy{};

    struct Tiers {
        double promotionThreshold = 2.0;
        double legendaryThreshold = 3.0;
    } tiers{};

    struct Negotiation {
        int pitchDie = 20;
        int bodyLanguageDie = 6;
        int clientPickDie = 3;
        int pitchBudgetSharePercent = 15;
        int marginBonusPercentPerPoint = 5;
        int marginBonusCapPercent = 25;
        int minimumPitchValue = 100;
        int concedePercent = 80;
        int engagedDealBonusPercent = 10;
        int minResistance = 5;
        int listenBonus = 2;
    } negotiation{};

    struct VPOption {
        bool legendaryGated = true;
        double whaleMultiplier = 1.0;
        int failurePenalty = 0;
    };

    struct VP {
        VPOption safe{true, 1.0, 0};
        VPOption stretch{false, 1.25, 0};
        VPOption allin{false, 1.5, 3000};
    } vp{};

    struct Elements {
        int fireDealBonus = 500;
        int metalDealBonus = 200;
        int airFirstDealBonus = 300;
        int earthSetbackReduction = 200;
        int woodPhaseIncome = 100;
    } elements{};

    struct Spirit {
        int wisBondPerPoint = 500;
        int wolfBase = 2000;
        int dragonBase = 5000;
        int owlBase = 1500;
        int whaleBase = 4000;
        int tigerBase = 3000;
        int elephantPerSuccess = 1000;
        int elephantWisPerPoint = 200;
        int frogPerRound = 800;
        int frogWisPerPoint = 100;
        int frogRounds = 3;
        int deerClosePercent = 50;
    } spirit{};

    struct Travel {
        int flyCost = 800;
        int flyPitchBonus = 2;
        int flyBuffPhases = 2;
        int trainCost = 200;
        int driveCost = 50;
    } travel{};

    struct CrossroadsOption {
        int dc = 10;
        int successMoney = 0;
        int failMoney = 0;
    };

    struct Crossroads {
        int checkDie = 20;
        CrossroadsOption grind{10, 1500, 800};
        CrossroadsOption climb{14, 2500, 200};
        CrossroadsOption hunt{16, 0, 0};
        int huntWhaleBonus = 4;
        int huntWhalePenalty = -2;
        int huntPhases = 99;
    } crossroads{};

    struct WhalePrep {
        int researchCost = 400;
        int researchListenBonus = 2;
        int giftCost = 600;
        int giftCheckBonus = 1;
        int giftPatienceBonus = 2;
        int dinnerCost = 800;
        int dinnerResistanceReduction = 2;
        int whaleMinResistance = 8;
        int investmentPhases = 99;
    } whalePrep{};

    std::vector<EventEntry> journeyEvents = defaultJourneyEvents();
    std::vector<EventEntry> driveTroubleEvents = defaultDriveTroubleEvents();
    std::vector<EventEntry> quarterEvents = defaultQuarterEvents();
    std::vector<EventEntry> luckyItems = defaultLuckyItems();

    // Indexed by Territory (Tech, Retail, Finance).
    std::vector<std::vector<ClientTemplate>> firstClients = defaultFirstClients();
    std::vector<std::vector<ClientTemplate>> whaleClients = defaultWhaleClients();

    static std::vector<EventEntry> defaultJourneyEvents();
    static std::vector<EventEntry> defaultDriveTroubleEvents();
    static std::vector<EventEntry> defaultQuarterEvents();
    static std::vector<EventEntry> defaultLuckyItems();
    static std::vector<std::vector<ClientTemplate>> defaultFirstClients();
    static std::vector<std::vector<ClientTemplate>> defaultWhaleClients();
};

// Loads overrides from a TOML file on top of the built-in defaults.
// On failure `config` is left at defaults and `errorMessage` explains why.
bool loadSalesConfig(const std::string& path, SalesConfig& config, std::string* errorMessage = nullptr);

std::string hashFileFNV1a(const std::string& path);

// Finds the table row for a die result; falls back to `fallbackIndex`.
const SalesConfig::EventEntry& lookupEvent(const std::vector<SalesConfig::EventEntry>& table,
                                           int roll,
                                           std::size_t fallbackIndex);
