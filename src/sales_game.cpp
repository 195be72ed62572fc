#include "sales_game.h"

#include "dice.h"
#include "game_errors.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

bool SalesGame::s_debugMode = false;

namespace {

ActiveModifier makeModifier(const std::string& description,
                            int value,
                            ModifierSource source,
                            ModifierEffect effect,
                            int phases) {
    ActiveModifier m;
    m.description = description;
    m.kind = (value >= 0) ? ModifierKind::Buff : ModifierKind::Debuff;
    m.value = value;
    m.source = source;
    m.effect = effect;
    m.phasesRemaining = std::max(1, phases);
    return m;
}

const SalesConfig::VPOption& vpOption(const SalesConfig& config, VPChoice choice) {
    switch (choice) {
        case VPChoice::Safe: return config.vp.safe;
        case VPChoice::Stretch: return config.vp.stretch;
        case VPChoice::AllIn: return config.vp.allin;
    }
    return config.vp.safe;
}

} // namespace

SalesGame::SalesGame(Character character, SalesConfig config)
    : m_config(std::move(config)) {
    m_state.character = std::move(character);
    m_state.startingMoney = calculateStartingMoney(m_state.character, m_config);
    m_state.budgetScale = calculateBudgetScale(m_state.startingMoney, m_config);
    m_state.money = m_state.startingMoney;
}

void SalesGame::supplyEntropy(int slot, const EntropyBundle& bundle) {
    if (slot < 1 || slot > kEntropySlotCount) {
        throw PreconditionViolation("entropy slot out of range: " + std::to_string(slot));
    }
    m_entropy[static_cast<std::size_t>(slot - 1)] = bundle;
}

bool SalesGame::hasEntropy(int slot) const {
    if (slot < 1 || slot > kEntropySlotCount) {
        return false;
    }
    return m_entropy[static_cast<std::size_t>(slot - 1)].has_value();
}

void SalesGame::requirePhase(Phase expected, const char* operation) const {
    if (m_state.phase != expected) {
        std::ostringstream oss;
        oss << operation << " requires phase " << phaseName(expected)
            << " (current " << phaseName(m_state.phase) << ")";
        throw PreconditionViolation(oss.str());
    }
}

int SalesGame::deriveFromSlot(int slot, const std::string& label, int dieSize) const {
    if (!hasEntropy(slot)) {
        throw MissingInput("entropy slot " + std::to_string(slot) + " not supplied for roll '" + label + "'");
    }
    const EntropyBundle& b = *m_entropy[static_cast<std::size_t>(slot - 1)];
    return deriveRoll(combineSeed(b.blockHash, b.clientSeed), label, dieSize);
}

void SalesGame::recordRoll(int slot,
                           const std::string& label,
                           const std::string& action,
                           int dieSize,
                           int result,
                           int modifier,
                           int total,
                           std::optional<int> target,
                           std::optional<RollOutcome> outcome) {
    const EntropyBundle& b = *m_entropy[static_cast<std::size_t>(slot - 1)];
    GameRoll r;
    r.label = label;
    r.action = action;
    r.rollSeed = b.clientSeed;
    r.rollSeedHash = commitmentHash(b.clientSeed);
    r.blockHeight = b.blockHeight;
    r.blockHash = b.blockHash;
    r.dieSize = dieSize;
    r.result = result;
    r.modifier = modifier;
    r.total = total;
    r.target = target;
    r.outcome = outcome;
    m_state.rolls.push_back(std::move(r));
}

int SalesGame::roll(int slot, const std::string& label, const std::string& action, int dieSize) {
    const int result = deriveFromSlot(slot, label, dieSize);
    recordRoll(slot, label, action, dieSize, result, 0, result, std::nullopt, std::nullopt);
    return result;
}

void SalesGame::log(const std::string& message) const {
    if (s_debugMode) {
        std::cout << "[Sales] " << phaseName(m_state.phase) << ": " << message
                  << " (money=" << m_state.money << ")\n";
    }
}

void SalesGame::applyEventDelta(int delta, const char* reason) {
    if (delta >= 0) {
        m_state.money += delta;
        return;
    }
    applySetback(-delta, reason);
}

int SalesGame::applySetback(int loss, const char* reason) {
    const int actual = resolveSetbackLoss(loss, m_state.character, m_config, m_state.modifiers);
    m_state.money -= actual;
    std::ostringstream oss;
    oss << "setback " << reason << " " << loss << " -> " << actual;
    log(oss.str());
    return actual;
}

void SalesGame::applyEventEntry(const SalesConfig::EventEntry& entry, ModifierSource source) {
    applyEventDelta(entry.moneyChange, entry.name.c_str());
    if (entry.pitchBuff != 0) {
        m_state.modifiers.add(makeModifier(entry.name, entry.pitchBuff, source, ModifierEffect::PitchBonus, entry.buffPhases));
    }
}

int SalesGame::payDeal(int dealValue, bool firstClientDeal) {
    if (dealValue <= 0) {
        return 0;
    }
    const int bonus = elementDealBonus(m_state.character.traits.element, firstClientDeal, m_config);
    m_state.money += dealValue + bonus;
    return dealValue + bonus;
}

Territory SalesGame::assignTerritory() {
    requirePhase(Phase::Assignment, "assignTerritory");
    if (m_state.territory) {
        throw PreconditionViolation("territory already assigned");
    }
    const int r = roll(1, "territory", "assign_territory", 6);
    const Territory t = territoryFromRoll(r);
    m_state.territory = t;
    m_state.choices.push_back(std::string("territory:") + territoryName(t));
    log(std::string("territory ") + territoryDisplayName(t));
    return t;
}

void SalesGame::applyTravelChoice(TravelChoice choice) {
    requirePhase(Phase::FirstTrip, "applyTravelChoice");
    if (m_state.travel) {
        throw PreconditionViolation("travel already chosen");
    }
    const SalesConfig::Travel& t = m_config.travel;
    switch (choice) {
        case TravelChoice::Fly:
            m_state.money -= t.flyCost;
            m_state.modifiers.add(makeModifier("Well Rested", t.flyPitchBonus, ModifierSource::Travel,
                                               ModifierEffect::PitchBonus, t.flyBuffPhases));
            break;
        case TravelChoice::Train:
            m_state.money -= t.trainCost;
            break;
        case TravelChoice::Drive:
            m_state.money -= t.driveCost;
            break;
    }
    m_state.travel = choice;
    m_state.choices.push_back(std::string("travel:") + travelChoiceName(choice));
    log(std::string("travel ") + travelChoiceName(choice));
}

const SalesConfig::EventEntry& SalesGame::rollJourney() {
    requirePhase(Phase::FirstTrip, "rollJourney");
    if (!m_state.travel || *m_state.travel == TravelChoice::Drive) {
        throw PreconditionViolation("journey needs a fly or train travel choice");
    }
    if (m_state.journeyEvent) {
        throw PreconditionViolation("journey already rolled");
    }
    const int r = roll(1, "journey", "journey", 6);
    const SalesConfig::EventEntry& e = lookupEvent(m_config.journeyEvents, r, 0);
    applyEventEntry(e, ModifierSource::Journey);
    m_state.journeyEvent = e.name;
    log("journey " + e.name);
    return e;
}

const SalesConfig::EventEntry& SalesGame::rollDriveTrouble() {
    requirePhase(Phase::FirstTrip, "rollDriveTrouble");
    if (!m_state.travel || *m_state.travel != TravelChoice::Drive) {
        throw PreconditionViolation("drive trouble needs the drive travel choice");
    }
    if (m_state.driveEvent) {
        throw PreconditionViolation("drive trouble already rolled");
    }
    const int r = roll(1, "drive_trouble", "drive_trouble", 6);
    const SalesConfig::EventEntry& e = lookupEvent(m_config.driveTroubleEvents, r, 0);
    applyEventEntry(e, ModifierSource::Drive);
    m_state.driveEvent = e.name;
    log("drive " + e.name);
    return e;
}

void SalesGame::beginEncounter(Encounter& encounter, ClientTier tier, int slot, const char* label) {
    if (!m_state.territory) {
        throw PreconditionViolation("negotiation before territory assignment");
    }
    if (encounter.started) {
        throw PreconditionViolation(std::string(label) + " already started");
    }
    const int pick = roll(slot, label, "pick_client", m_config.negotiation.clientPickDie);
    encounter.client = createClient(m_config, *m_state.territory, tier, pick, m_state.budgetScale);
    encounter.started = true;
}

const Client& SalesGame::startFirstClient() {
    requirePhase(Phase::FirstClient, "startFirstClient");
    beginEncounter(m_state.firstClient, ClientTier::Ordinary, 2, "first_client");
    log("first client " + m_state.firstClient.client.name);
    return m_state.firstClient.client;
}

const Client& SalesGame::startWhale() {
    requirePhase(Phase::Whale, "startWhale");
    beginEncounter(m_state.whale, ClientTier::Whale, 4, "whale_client");

    Client& c = m_state.whale.client;
    const int patienceBonus = m_state.modifiers.total(ModifierEffect::PatienceBonus);
    if (patienceBonus > 0) {
        c.patience += patienceBonus;
        c.maxPatience += patienceBonus;
    }
    const int reduction = m_state.modifiers.total(ModifierEffect::ResistanceReduction);
    if (reduction > 0) {
        c.resistance = std::max(m_config.whalePrep.whaleMinResistance, c.resistance - reduction);
    }
    log("whale " + c.name);
    return c;
}

Encounter* SalesGame::activeEncounter() {
    switch (m_state.phase) {
        case Phase::FirstClient: return &m_state.firstClient;
        case Phase::Whale: return &m_state.whale;
        default: return nullptr;
    }
}

const Encounter* SalesGame::currentEncounter() const {
    switch (m_state.phase) {
        case Phase::FirstClient: return &m_state.firstClient;
        case Phase::Whale: return &m_state.whale;
        default: return nullptr;
    }
}

int SalesGame::successfulRounds() const {
    int n = 0;
    for (const Encounter* e : {&m_state.firstClient, &m_state.whale}) {
        for (const RoundResult& r : e->rounds) {
            if (r.valueGained > 0) {
                ++n;
            }
        }
    }
    return n;
}

RoundResult SalesGame::negotiate(NegotiationAction action) {
    Encounter* enc = activeEncounter();
    if (!enc || !enc->started || enc->completed) {
        throw PreconditionViolation(std::string("no negotiation in progress during ") + phaseName(m_state.phase));
    }
    if (!m_state.territory) {
        throw PreconditionViolation("negotiation before territory assignment");
    }
    Client& client = enc->client;
    const bool whale = (enc == &m_state.whale);
    const int slot = whale ? 4 : 2;
    const std::string prefix = whale ? "whale" : "client1";

    NegotiationContext ctx{m_state.character, m_config, *m_state.territory, m_state.modifiers, whale,
                           static_cast<int>(enc->rounds.size()) + 1};
    const std::string roundTag = prefix + "_r" + std::to_string(ctx.round);

    if (action == NegotiationAction::Ability) {
        useSpiritAbility();
        RoundResult r;
        r.round = ctx.round;
        r.action = NegotiationAction::Ability;
        r.resistanceBefore = client.resistance;
        r.patienceAfter = client.patience;
        r.resistanceAfter = client.resistance;
        r.dealValueAfter = client.dealValue;
        r.clientActiveAfter = client.active;
        return r;
    }

    if (!client.active) {
        throw PreconditionViolation(std::string(negotiationActionName(action)) + " on inactive client " + client.name);
    }

    const int bodyDie = m_config.negotiation.bodyLanguageDie;
    RoundResult result;
    switch (action) {
        case NegotiationAction::Pitch: {
            const int pitchDie = m_config.negotiation.pitchDie;
            const int pitch = deriveFromSlot(slot, roundTag + "_pitch", pitchDie);
            const int body = deriveFromSlot(slot, roundTag + "_body", bodyDie);
            result = resolvePitch(client, ctx, pitch, body);

            RollOutcome outcome = result.success ? RollOutcome::Success : RollOutcome::Fail;
            if (result.success && pitch == pitchDie) {
                outcome = RollOutcome::Critical;
            }
            recordRoll(slot, roundTag + "_pitch", "pitch", pitchDie, pitch, result.pitchModifier, result.pitchTotal,
                       result.resistanceBefore, outcome);
            recordRoll(slot, roundTag + "_body", "body_language", bodyDie, body, result.bodyShift, result.bodyShifted,
                       std::nullopt, std::nullopt);
            break;
        }
        case NegotiationAction::Listen: {
            const int body = deriveFromSlot(slot, roundTag + "_body", bodyDie);
            result = resolveListen(client, ctx, body);
            recordRoll(slot, roundTag + "_body", "body_language", bodyDie, body, result.bodyShift, result.bodyShifted,
                       std::nullopt, std::nullopt);
            break;
        }
        case NegotiationAction::Concede:
            result = resolveConcede(client, ctx);
            break;
        case NegotiationAction::Ability:
            break;
    }
    enc->rounds.push_back(result);

    const int income = m_state.modifiers.collectRoundIncome();
    m_state.money += income;

    std::ostringstream oss;
    oss << roundTag << " " << negotiationActionName(action)
        << (action == NegotiationAction::Pitch ? (result.success ? " success" : " miss") : "")
        << " body=" << bodyLanguageName(result.bodyLanguage)
        << " patience=" << result.patienceAfter
        << " resistance=" << result.resistanceAfter
        << " deal=" << result.dealValueAfter;
    if (income > 0) {
        oss << " income=" << income;
    }
    log(oss.str());
    return result;
}

SpiritResult SalesGame::useSpiritAbility() {
    if (m_state.phase == Phase::QuarterEnd) {
        throw PreconditionViolation("spirit ability after the quarter has ended");
    }
    if (m_state.spiritAbilityUsed) {
        throw PreconditionViolation("spirit ability already used this game");
    }

    Client* client = nullptr;
    if (Encounter* enc = activeEncounter()) {
        if (enc->started && !enc->completed && enc->client.active) {
            client = &enc->client;
        }
    }
    SpiritContext ctx{m_state.character, m_config, m_state.modifiers, client, successfulRounds()};
    SpiritResult r = resolveSpiritAbility(ctx);

    m_state.spiritAbilityUsed = true;
    m_state.money += r.moneyGained;
    m_state.choices.push_back(std::string("spirit:") + spiritAnimalName(r.animal));
    log(r.summary);
    return r;
}

int SalesGame::completeFirstClient() {
    requirePhase(Phase::FirstClient, "completeFirstClient");
    Encounter& enc = m_state.firstClient;
    if (!enc.started || enc.completed) {
        throw PreconditionViolation("first client is not awaiting completion");
    }
    if (enc.client.active) {
        throw PreconditionViolation("first client negotiation still in progress");
    }
    enc.payout = payDeal(enc.client.dealValue, true);
    enc.completed = true;
    log(std::string("first client ") + negotiationOutcomeName(negotiationOutcome(enc.client)) +
        " payout=" + std::to_string(enc.payout));
    return enc.payout;
}

bool SalesGame::applyCrossroadsChoice(CrossroadsChoice choice) {
    requirePhase(Phase::Crossroads, "applyCrossroadsChoice");
    if (m_state.crossroads) {
        throw PreconditionViolation("crossroads already chosen");
    }
    const SalesConfig::Crossroads& cr = m_config.crossroads;
    const SalesConfig::CrossroadsOption* option = &cr.grind;
    Stat stat = Stat::CHA;
    switch (choice) {
        case CrossroadsChoice::Grind:
            option = &cr.grind;
            stat = Stat::CHA;
            break;
        case CrossroadsChoice::Climb:
            option = &cr.climb;
            stat = Stat::INT;
            break;
        case CrossroadsChoice::Hunt:
            option = &cr.hunt;
            stat = Stat::WIS;
            break;
    }

    const int mod = m_state.character.mod(stat);
    const int r = deriveFromSlot(3, "crossroads", cr.checkDie);
    const int total = r + mod;
    const bool success = total >= option->dc;
    RollOutcome outcome = success ? RollOutcome::Success : RollOutcome::Fail;
    if (success && r == cr.checkDie) {
        outcome = RollOutcome::Critical;
    }
    recordRoll(3, "crossroads", std::string("crossroads_") + crossroadsChoiceName(choice), cr.checkDie, r, mod, total,
               option->dc, outcome);

    applyEventDelta(success ? option->successMoney : option->failMoney, "crossroads");
    if (choice == CrossroadsChoice::Hunt) {
        const int value = success ? cr.huntWhaleBonus : cr.huntWhalePenalty;
        m_state.modifiers.add(makeModifier(success ? "Hunt Success" : "Hunt Failure", value, ModifierSource::Hunt,
                                           ModifierEffect::WhalePitchBonus, cr.huntPhases));
    }

    m_state.crossroads = choice;
    m_state.crossroadsSuccess = success;
    m_state.choices.push_back(std::string("crossroads:") + crossroadsChoiceName(choice) + (success ? ":success" : ":fail"));
    log(std::string("crossroads ") + crossroadsChoiceName(choice) + " total=" + std::to_string(total) +
        " dc=" + std::to_string(option->dc));
    return success;
}

const SalesConfig::EventEntry& SalesGame::rollQuarterEvent() {
    requirePhase(Phase::QuarterEvent, "rollQuarterEvent");
    if (m_state.quarterEvent) {
        throw PreconditionViolation("quarter event already rolled");
    }
    const int r = roll(3, "quarter_event", "quarter_event", 6);
    const SalesConfig::EventEntry& e = lookupEvent(m_config.quarterEvents, r, 3);
    applyEventEntry(e, ModifierSource::Market);
    m_state.quarterEvent = e.name;
    log("quarter event " + e.name);
    return e;
}

void SalesGame::applyVPChoice(VPChoice choice) {
    requirePhase(Phase::VPMeeting, "applyVPChoice");
    if (m_state.vpChoice) {
        throw PreconditionViolation("VP choice already made");
    }
    m_state.vpChoice = choice;
    m_state.legendaryUnlocked = !vpOption(m_config, choice).legendaryGated;
    m_state.choices.push_back(std::string("vp:") + vpChoiceName(choice));
    log(std::string("vp ") + vpChoiceName(choice));
}

void SalesGame::applyWhaleInvestment(WhaleInvestment investment) {
    requirePhase(Phase::WhalePrep, "applyWhaleInvestment");
    if (m_state.whaleInvestment) {
        throw PreconditionViolation("whale investment already made");
    }
    const SalesConfig::WhalePrep& w = m_config.whalePrep;
    switch (investment) {
        case WhaleInvestment::Research:
            m_state.money -= w.researchCost;
            m_state.modifiers.add(makeModifier("Client Research", w.researchListenBonus, ModifierSource::Research,
                                               ModifierEffect::ListenBonus, w.investmentPhases));
            break;
        case WhaleInvestment::Gift:
            m_state.money -= w.giftCost;
            m_state.modifiers.add(makeModifier("Thoughtful Gift", w.giftCheckBonus, ModifierSource::Gift,
                                               ModifierEffect::PitchBonus, w.investmentPhases));
            m_state.modifiers.add(makeModifier("Thoughtful Gift", w.giftPatienceBonus, ModifierSource::Gift,
                                               ModifierEffect::PatienceBonus, w.investmentPhases));
            break;
        case WhaleInvestment::Dinner:
            m_state.money -= w.dinnerCost;
            m_state.modifiers.add(makeModifier("Power Dinner", w.dinnerResistanceReduction, ModifierSource::Dinner,
                                               ModifierEffect::ResistanceReduction, w.investmentPhases));
            break;
        case WhaleInvestment::WingIt:
            break;
    }
    m_state.whaleInvestment = investment;
    m_state.choices.push_back(std::string("whaleinvest:") + whaleInvestmentName(investment));
    log(std::string("whale investment ") + whaleInvestmentName(investment));
}

const SalesConfig::EventEntry& SalesGame::rollLuckyItem() {
    requirePhase(Phase::WhalePrep, "rollLuckyItem");
    if (m_state.luckyItem) {
        throw PreconditionViolation("lucky item already rolled");
    }
    const int r = roll(1, "lucky_item", "lucky_item", 6);
    const SalesConfig::EventEntry& e = lookupEvent(m_config.luckyItems, r, 4);
    applyEventEntry(e, ModifierSource::Lucky);
    m_state.luckyItem = e.name;
    log("lucky item " + e.name);
    return e;
}

int SalesGame::completeWhale() {
    requirePhase(Phase::Whale, "completeWhale");
    Encounter& enc = m_state.whale;
    if (!enc.started || enc.completed) {
        throw PreconditionViolation("whale is not awaiting completion");
    }
    if (enc.client.active) {
        throw PreconditionViolation("whale negotiation still in progress");
    }
    if (!m_state.vpChoice) {
        throw PreconditionViolation("whale completed without a VP choice");
    }
    const SalesConfig::VPOption& option = vpOption(m_config, *m_state.vpChoice);
    m_state.whaleValue = static_cast<int>(std::floor(static_cast<double>(enc.client.dealValue) * option.whaleMultiplier));

    if (m_state.whaleValue > 0) {
        enc.payout = payDeal(m_state.whaleValue, false);
    } else if (option.failurePenalty > 0) {
        if (m_state.modifiers.consumeFirst(ModifierEffect::EscapePenalty)) {
            log("all-in penalty waived");
        } else {
            enc.payout = -applySetback(option.failurePenalty, "all-in failure");
        }
    }
    enc.completed = true;
    log("whale value=" + std::to_string(m_state.whaleValue) + " payout=" + std::to_string(enc.payout));
    return enc.payout;
}

void SalesGame::advancePhase() {
    bool ready = false;
    switch (m_state.phase) {
        case Phase::Assignment:
            ready = m_state.territory.has_value();
            break;
        case Phase::FirstTrip:
            ready = m_state.travel.has_value() &&
                    (*m_state.travel == TravelChoice::Drive ? m_state.driveEvent.has_value()
                                                            : m_state.journeyEvent.has_value());
            break;
        case Phase::FirstClient:
            ready = m_state.firstClient.completed;
            break;
        case Phase::Crossroads:
            ready = m_state.crossroads.has_value();
            break;
        case Phase::QuarterEvent:
            ready = m_state.quarterEvent.has_value();
            break;
        case Phase::VPMeeting:
            ready = m_state.vpChoice.has_value();
            break;
        case Phase::WhalePrep:
            ready = m_state.whaleInvestment.has_value() && m_state.luckyItem.has_value();
            break;
        case Phase::Whale:
            ready = m_state.whale.completed;
            break;
        case Phase::QuarterEnd:
            throw PreconditionViolation("cannot advance past QuarterEnd");
    }
    if (!ready) {
        throw PreconditionViolation(std::string("phase ") + phaseName(m_state.phase) + " is not finished");
    }

    m_state.modifiers.tickPhase();
    m_state.money += elementPhaseIncome(m_state.character.traits.element, m_config);
    m_state.phase = static_cast<Phase>(static_cast<int>(m_state.phase) + 1);
    log("entered phase");
}

Tier SalesGame::computeTier() {
    requirePhase(Phase::QuarterEnd, "computeTier");
    const Tier t = ::computeTier(m_state.money, m_state.startingMoney, m_state.legendaryUnlocked, m_config);
    m_state.tier = t;
    log(std::string("tier ") + tierName(t));
    return t;
}

const char* phaseName(Phase phase) {
    switch (phase) {
        case Phase::Assignment: return "Assignment";
        case Phase::FirstTrip: return "FirstTrip";
        case Phase::FirstClient: return "FirstClient";
        case Phase::Crossroads: return "Crossroads";
        case Phase::QuarterEvent: return "QuarterEvent";
        case Phase::VPMeeting: return "VPMeeting";
        case Phase::WhalePrep: return "WhalePrep";
        case Phase::Whale: return "Whale";
        case Phase::QuarterEnd: return "QuarterEnd";
    }
    return "?";
}

const char* travelChoiceName(TravelChoice choice) {
    switch (choice) {
        case TravelChoice::Fly: return "fly";
        case TravelChoice::Train: return "train";
        case TravelChoice::Drive: return "drive";
    }
    return "?";
}

const char* crossroadsChoiceName(CrossroadsChoice choice) {
    switch (choice) {
        case CrossroadsChoice::Grind: return "grind";
        case CrossroadsChoice::Climb: return "climb";
        case CrossroadsChoice::Hunt: return "hunt";
    }
    return "?";
}

const char* vpChoiceName(VPChoice choice) {
    switch (choice) {
        case VPChoice::Safe: return "safe";
        case VPChoice::Stretch: return "stretch";
        case VPChoice::AllIn: return "allin";
    }
    return "?";
}

const char* whaleInvestmentName(WhaleInvestment investment) {
    switch (investment) {
        case WhaleInvestment::Research: return "research";
        case WhaleInvestment::Gift: return "gift";
        case WhaleInvestment::Dinner: return "dinner";
        case WhaleInvestment::WingIt: return "wingit";
    }
    return "?";
}

const char* rollOutcomeName(RollOutcome outcome) {
    switch (outcome) {
        case RollOutcome::Success: return "success";
        case RollOutcome::Fail: return "fail";
        case RollOutcome::Critical: return "critical";
    }
    return "?";
}
