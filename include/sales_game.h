#pragma once

#include "abilities.h"
#include "character.h"
#include "client.h"
#include "entropy.h"
#include "modifier.h"
#include "negotiation.h"
#include "sales_config.h"
#include "tier.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Phase {
    Assignment = 0,
    FirstTrip,
    FirstClient,
    Crossroads,
    QuarterEvent,
    VPMeeting,
    WhalePrep,
    Whale,
    QuarterEnd
};

constexpr int kPhaseCount = 9;
constexpr int kEntropySlotCount = 4;

enum class TravelChoice { Fly, Train, Drive };
enum class CrossroadsChoice { Grind, Climb, Hunt };
enum class VPChoice { Safe, Stretch, AllIn };
enum class WhaleInvestment { Research, Gift, Dinner, WingIt };

enum class RollOutcome { Success, Fail, Critical };

struct GameRoll {
    std::string label;
    std::string action;
    std::string rollSeed;
    std::string rollSeedHash;
    std::int64_t blockHeight = 0;
    std::string blockHash;
    int dieSize = 0;
    int result = 0;
    int modifier = 0;
    int total = 0;
    std::optional<int> target;
    std::optional<RollOutcome> outcome;
};

struct Encounter {
    Client client;
    std::vector<RoundResult> rounds;
    bool started = false;
    bool completed = false;
    int payout = 0;
};

struct GameState {
    Character character;
    Phase phase = Phase::Assignment;
    int startingMoney = 0;
    double budgetScale = 1.0;
    int money = 0;

    std::optional<Territory> territory;
    std::optional<TravelChoice> travel;
    std::optional<std::string> journeyEvent;
    std::optional<std::string> driveEvent;
    Encounter firstClient;
    std::optional<CrossroadsChoice> crossroads;
    bool crossroadsSuccess = false;
    std::optional<std::string> quarterEvent;
    std::optional<VPChoice> vpChoice;
    std::optional<WhaleInvestment> whaleInvestment;
    std::optional<std::string> luckyItem;
    Encounter whale;
    int whaleValue = 0;

    bool legendaryUnlocked = false;
    bool spiritAbilityUsed = false;

    ModifierLedger modifiers;
    std::vector<GameRoll> rolls;
    std::vector<std::string> choices;
    std::optional<Tier> tier;
};

class SalesGame {
public:
    explicit SalesGame(Character character, SalesConfig config = SalesConfig{});

    static void setDebugMode(bool enabled) { s_debugMode = enabled; }
    static bool getDebugMode() { return s_debugMode; }

    // Slots are 1-based. Re-supplying a slot replaces it.
    void supplyEntropy(int slot, const EntropyBundle& bundle);
    bool hasEntropy(int slot) const;

    const GameState& state() const { return m_state; }
    const SalesConfig& config() const { return m_config; }
    Phase phase() const { return m_state.phase; }
    int money() const { return m_state.money; }

    // Phase 1
    Territory assignTerritory();

    // Phase 2
    void applyTravelChoice(TravelChoice choice);
    const SalesConfig::EventEntry& rollJourney();
    const SalesConfig::EventEntry& rollDriveTrouble();

    // Phase 3
    const Client& startFirstClient();
    int completeFirstClient();

    // Phase 4: returns whether the check succeeded.
    bool applyCrossroadsChoice(CrossroadsChoice choice);

    // Phase 5
    const SalesConfig::EventEntry& rollQuarterEvent();

    // Phase 6
    void applyVPChoice(VPChoice choice);

    // Phase 7
    void applyWhaleInvestment(WhaleInvestment investment);
    const SalesConfig::EventEntry& rollLuckyItem();

    // Phase 8
    const Client& startWhale();
    int completeWhale();

    // Resolves one action against the client of the current encounter.
    // Ability delegates to useSpiritAbility and does not count as a round.
    RoundResult negotiate(NegotiationAction action);
    SpiritResult useSpiritAbility();

    void advancePhase();

    // Phase 9
    Tier computeTier();

    // Current encounter for FirstClient / Whale, nullptr elsewhere.
    const Encounter* currentEncounter() const;

private:
    static bool s_debugMode;

    void requirePhase(Phase expected, const char* operation) const;
    // Throws MissingInput when the slot has not been supplied.
    int deriveFromSlot(int slot, const std::string& label, int dieSize) const;
    void recordRoll(int slot,
                    const std::string& label,
                    const std::string& action,
                    int dieSize,
                    int result,
                    int modifier,
                    int total,
                    std::optional<int> target,
                    std::optional<RollOutcome> outcome);
    // Plain table roll: derive and log with no modifier or target.
    int roll(int slot, const std::string& label, const std::string& action, int dieSize);

    void applyEventDelta(int delta, const char* reason);
    int applySetback(int loss, const char* reason);
    void applyEventEntry(const SalesConfig::EventEntry& entry, ModifierSource source);
    // Air only pays on the first client.
    int payDeal(int dealValue, bool firstClientDeal);
    void beginEncounter(Encounter& encounter, ClientTier tier, int slot, const char* label);
    Encounter* activeEncounter();
    // Rounds that earned value: landed pitches and concedes with a deal.
    int successfulRounds() const;

    void log(const std::string& message) const;

    SalesConfig m_config;
    GameState m_state;
    std::array<std::optional<EntropyBundle>, kEntropySlotCount> m_entropy;
};

const char* phaseName(Phase phase);
const char* travelChoiceName(TravelChoice choice);
const char* crossroadsChoiceName(CrossroadsChoice choice);
const char* vpChoiceName(VPChoice choice);
const char* whaleInvestmentName(WhaleInvestment investment);
const char* rollOutcomeName(RollOutcome outcome);
