#include "sales_config.h"

#include "game_errors.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

void readVPOption(const toml::table& root, std::string_view key, SalesConfig::VPOption& option) {
    const toml::node_view<const toml::node> view = root["vp"][key];
    if (const auto v = view["legendaryGated"].value<bool>()) {
        option.legendaryGated = *v;
    }
    if (const auto v = view["whaleMultiplier"].value<double>()) {
        option.whaleMultiplier = *v;
    } else if (const auto vi = view["whaleMultiplier"].value<std::int64_t>()) {
        option.whaleMultiplier = static_cast<double>(*vi);
    }
    if (const auto v = view["failurePenalty"].value<std::int64_t>()) {
        option.failurePenalty = static_cast<int>(*v);
    }
}

void readCrossroadsOption(const toml::table& root, std::string_view key, SalesConfig::CrossroadsOption& option) {
    const toml::node_view<const toml::node> view = root["crossroads"][key];
    if (const auto v = view["dc"].value<std::int64_t>()) {
        option.dc = static_cast<int>(*v);
    }
    if (const auto v = view["successMoney"].value<std::int64_t>()) {
        option.successMoney = static_cast<int>(*v);
    }
    if (const auto v = view["failMoney"].value<std::int64_t>()) {
        option.failMoney = static_cast<int>(*v);
    }
}

// Replaces `table` only when the TOML array is present and yields rows.
void readEventTable(const toml::table& root, std::string_view key, std::vector<SalesConfig::EventEntry>& table) {
    const toml::array* rows = root["tables"][key].as_array();
    if (!rows) {
        return;
    }
    std::vector<SalesConfig::EventEntry> parsed;
    for (const toml::node& node : *rows) {
        const toml::table* t = node.as_table();
        if (!t) continue;
        SalesConfig::EventEntry e;
        e.roll = static_cast<int>((*t)["roll"].value_or<std::int64_t>(0));
        e.name = (*t)["name"].value_or<std::string>("");
        e.moneyChange = static_cast<int>((*t)["moneyChange"].value_or<std::int64_t>(0));
        e.pitchBuff = static_cast<int>((*t)["pitchBuff"].value_or<std::int64_t>(0));
        e.buffPhases = static_cast<int>((*t)["buffPhases"].value_or<std::int64_t>(0));
        if (e.roll <= 0 || e.name.empty()) continue;
        parsed.push_back(e);
    }
    if (!parsed.empty()) {
        table = std::move(parsed);
    }
}

void readClientTable(const toml::table& root,
                     std::string_view key,
                     std::vector<std::vector<SalesConfig::ClientTemplate>>& byTerritory) {
    static const char* kTerritoryKeys[] = {"tech", "retail", "finance"};
    for (std::size_t i = 0; i < byTerritory.size() && i < 3; ++i) {
        const toml::array* rows = root["clients"][key][kTerritoryKeys[i]].as_array();
        if (!rows) continue;
        std::vector<SalesConfig::ClientTemplate> parsed;
        for (const toml::node& node : *rows) {
            const toml::table* t = node.as_table();
            if (!t) continue;
            SalesConfig::ClientTemplate c;
            c.name = (*t)["name"].value_or<std::string>("");
            c.patience = static_cast<int>((*t)["patience"].value_or<std::int64_t>(0));
            c.budget = static_cast<int>((*t)["budget"].value_or<std::int64_t>(0));
            c.resistance = static_cast<int>((*t)["resistance"].value_or<std::int64_t>(0));
            if (c.name.empty() || c.patience <= 0 || c.budget <= 0) continue;
            parsed.push_back(c);
        }
        if (!parsed.empty()) {
            byTerritory[i] = std::move(parsed);
        }
    }
}

} // namespace

bool loadSalesConfig(const std::string& path, SalesConfig& config, std::string* errorMessage) {
    config = SalesConfig{};
    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "economy", "baseMoney", config.economy.baseMoney);
        readTomlValue(root, "economy", "chaMultiplier", config.economy.chaMultiplier);
        readTomlValue(root, "economy", "intMultiplier", config.economy.intMultiplier);
        readTomlValue(root, "economy", "wisMultiplier", config.economy.wisMultiplier);
        readTomlValue(root, "economy", "minimumMoney", config.economy.minimumMoney);
        readTomlValue(root, "economy", "budgetScaleFloor", config.economy.budgetScaleFloor);
        readTomlValue(root, "economy", "setbackUnit", config.economy.setbackUnit);
        readTomlValue(root, "economy", "closingUnit", config.economy.closingUnit);

        readTomlValue(root, "tiers", "promotionThreshold", config.tiers.promotionThreshold);
        readTomlValue(root, "tiers", "legendaryThreshold", config.tiers.legendaryThreshold);

        readTomlValue(root, "negotiation", "pitchDie", config.negotiation.pitchDie);
        readTomlValue(root, "negotiation", "bodyLanguageDie", config.negotiation.bodyLanguageDie);
        readTomlValue(root, "negotiation", "clientPickDie", config.negotiation.clientPickDie);
        readTomlValue(root, "negotiation", "pitchBudgetSharePercent", config.negotiation.pitchBudgetSharePercent);
        readTomlValue(root, "negotiation", "marginBonusPercentPerPoint", config.negotiation.marginBonusPercentPerPoint);
        readTomlValue(root, "negotiation", "marginBonusCapPercent", config.negotiation.marginBonusCapPercent);
        readTomlValue(root, "negotiation", "minimumPitchValue", config.negotiation.minimumPitchValue);
        readTomlValue(root, "negotiation", "concedePercent", config.negotiation.concedePercent);
        readTomlValue(root, "negotiation", "engagedDealBonusPercent", config.negotiation.engagedDealBonusPercent);
        readTomlValue(root, "negotiation", "minResistance", config.negotiation.minResistance);
        readTomlValue(root, "negotiation", "listenBonus", config.negotiation.listenBonus);

        readVPOption(root, "safe", config.vp.safe);
        readVPOption(root, "stretch", config.vp.stretch);
        readVPOption(root, "allin", config.vp.allin);

        readTomlValue(root, "elements", "fireDealBonus", config.elements.fireDealBonus);
        readTomlValue(root, "elements", "metalDealBonus", config.elements.metalDealBonus);
        readTomlValue(root, "elements", "airFirstDealBonus", config.elements.airFirstDealBonus);
        readTomlValue(root, "elements", "earthSetbackReduction", config.elements.earthSetbackReduction);
        readTomlValue(root, "elements", "woodPhaseIncome", config.elements.woodPhaseIncome);

        readTomlValue(root, "spirit", "wisBondPerPoint", config.spirit.wisBondPerPoint);
        readTomlValue(root, "spirit", "wolfBase", config.spirit.wolfBase);
        readTomlValue(root, "spirit", "dragonBase", config.spirit.dragonBase);
        readTomlValue(root, "spirit", "owlBase", config.spirit.owlBase);
        readTomlValue(root, "spirit", "whaleBase", config.spirit.whaleBase);
        readTomlValue(root, "spirit", "tigerBase", config.spirit.tigerBase);
        readTomlValue(root, "spirit", "elephantPerSuccess", config.spirit.elephantPerSuccess);
        readTomlValue(root, "spirit", "elephantWisPerPoint", config.spirit.elephantWisPerPoint);
        readTomlValue(root, "spirit", "frogPerRound", config.spirit.frogPerRound);
        readTomlValue(root, "spirit", "frogWisPerPoint", config.spirit.frogWisPerPoint);
        readTomlValue(root, "spirit", "frogRounds", config.spirit.frogRounds);
        readTomlValue(root, "spirit", "deerClosePercent", config.spirit.deerClosePercent);

        readTomlValue(root, "travel", "flyCost", config.travel.flyCost);
        readTomlValue(root, "travel", "flyPitchBonus", config.travel.flyPitchBonus);
        readTomlValue(root, "travel", "flyBuffPhases", config.travel.flyBuffPhases);
        readTomlValue(root, "travel", "trainCost", config.travel.trainCost);
        readTomlValue(root, "travel", "driveCost", config.travel.driveCost);

        readTomlValue(root, "crossroads", "checkDie", config.crossroads.checkDie);
        readCrossroadsOption(root, "grind", config.crossroads.grind);
        readCrossroadsOption(root, "climb", config.crossroads.climb);
        readCrossroadsOption(root, "hunt", config.crossroads.hunt);
        readTomlValue(root, "crossroads", "huntWhaleBonus", config.crossroads.huntWhaleBonus);
        readTomlValue(root, "crossroads", "huntWhalePenalty", config.crossroads.huntWhalePenalty);
        readTomlValue(root, "crossroads", "huntPhases", config.crossroads.huntPhases);

        readTomlValue(root, "whalePrep", "researchCost", config.whalePrep.researchCost);
        readTomlValue(root, "whalePrep", "researchListenBonus", config.whalePrep.researchListenBonus);
        readTomlValue(root, "whalePrep", "giftCost", config.whalePrep.giftCost);
        readTomlValue(root, "whalePrep", "giftCheckBonus", config.whalePrep.giftCheckBonus);
        readTomlValue(root, "whalePrep", "giftPatienceBonus", config.whalePrep.giftPatienceBonus);
        readTomlValue(root, "whalePrep", "dinnerCost", config.whalePrep.dinnerCost);
        readTomlValue(root, "whalePrep", "dinnerResistanceReduction", config.whalePrep.dinnerResistanceReduction);
        readTomlValue(root, "whalePrep", "whaleMinResistance", config.whalePrep.whaleMinResistance);
        readTomlValue(root, "whalePrep", "investmentPhases", config.whalePrep.investmentPhases);

        readEventTable(root, "journey", config.journeyEvents);
        readEventTable(root, "driveTrouble", config.driveTroubleEvents);
        readEventTable(root, "quarter", config.quarterEvents);
        readEventTable(root, "lucky", config.luckyItems);
        readClientTable(root, "first", config.firstClients);
        readClientTable(root, "whale", config.whaleClients);

        // Guard rails: these feed divisions and die sizes.
        if (config.economy.baseMoney <= 0) config.economy.baseMoney = SalesConfig::Economy{}.baseMoney;
        if (config.negotiation.pitchDie <= 0) config.negotiation.pitchDie = SalesConfig::Negotiation{}.pitchDie;
        if (config.negotiation.bodyLanguageDie <= 0) config.negotiation.bodyLanguageDie = SalesConfig::Negotiation{}.bodyLanguageDie;
        if (config.negotiation.clientPickDie <= 0) config.negotiation.clientPickDie = SalesConfig::Negotiation{}.clientPickDie;
        if (config.crossroads.checkDie <= 0) config.crossroads.checkDie = SalesConfig::Crossroads{}.checkDie;
        return true;
    } catch (const toml::parse_error& err) {
        config = SalesConfig{};
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        config = SalesConfig{};
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    return false;
}

std::string hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

const SalesConfig::EventEntry& lookupEvent(const std::vector<SalesConfig::EventEntry>& table,
                                           int roll,
                                           std::size_t fallbackIndex) {
    if (table.empty()) {
        throw PreconditionViolation("event table is empty");
    }
    for (const auto& e : table) {
        if (e.roll == roll) {
            return e;
        }
    }
    return table[fallbackIndex < table.size() ? fallbackIndex : 0];
}

std::vector<SalesConfig::EventEntry> SalesConfig::defaultJourneyEvents() {
    return {
        {1, "delays", 0, 0, 0},
        {2, "contacts", 300, 0, 0},
        {3, "intel", 0, 1, 2},
        {4, "luggage", -100, 0, 0},
        {5, "leads", 500, 0, 0},
        {6, "smooth", 0, 0, 0},
    };
}

std::vector<SalesConfig::EventEntry> SalesConfig::defaultDriveTroubleEvents() {
    return {
        {1, "breakdown", -400, 0, 0},
        {2, "traffic", 0, 0, 0},
        {3, "fine", -150, 0, 0},
        {4, "shortcut", 100, 0, 0},
        {5, "scenic", 0, 1, 2},
        {6, "podcasts", 0, 2, 2},
    };
}

std::vector<SalesConfig::EventEntry> SalesConfig::defaultQuarterEvents() {
    return {
        {1, "crash", -1500, 0, 0},
        {2, "competitor", -1000, 0, 0},
        {3, "recall", -500, 0, 0},
        {4, "quiet", 0, 0, 0},
        {5, "press", 800, 0, 0},
        {6, "referral", 500, 0, 0},
    };
}

std::vector<SalesConfig::EventEntry> SalesConfig::defaultLuckyItems() {
    return {
        {1, "watch", 200, 0, 0},
        {2, "spill", -50, 0, 0},
        {3, "clover", 0, 1, 99},
        {4, "usb", 0, 1, 99},
        {5, "parking", 0, 0, 0},
        {6, "bird", 100, 0, 0},
    };
}

std::vector<std::vector<SalesConfig::ClientTemplate>> SalesConfig::defaultFirstClients() {
    return {
        {
            {"StartupBot Inc.", 5, 3000, 12},
            {"CodeCraft Solutions", 6, 2500, 11},
            {"DataFlow Systems", 4, 3500, 13},
        },
        {
            {"Main Street Goods", 6, 2500, 11},
            {"Corner Shop Network", 5, 2800, 12},
            {"Family Mart Chain", 7, 2200, 10},
        },
        {
            {"Regional Credit Union", 4, 3200, 13},
            {"Prudent Advisors LLC", 5, 3000, 12},
            {"Capital Partners Group", 5, 3500, 14},
        },
    };
}

std::vector<std::vector<SalesConfig::ClientTemplate>> SalesConfig::defaultWhaleClients() {
    return {
        {
            {"MegaCorp Technologies", 7, 6000, 14},
            {"Quantum Systems International", 6, 7000, 15},
            {"CloudNine Enterprises", 8, 5500, 13},
        },
        {
            {"National Retail Holdings", 8, 5500, 13},
            {"BigBox Superstores", 7, 6500, 14},
            {"Premium Brands Collective", 6, 7500, 15},
        },
        {
            {"First National Bank", 6, 7000, 15},
            {"Apex Investment Group", 7, 8000, 16},
            {"Sterling Financial Services", 5, 6500, 14},
        },
    };
}
