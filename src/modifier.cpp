#include "modifier.h"

#include <algorithm>

namespace {

bool countsTowardPitch(ModifierEffect effect, bool againstWhale) {
    switch (effect) {
        case ModifierEffect::PitchBonus:
        case ModifierEffect::NextPitchBonus:
            return true;
        case ModifierEffect::WhalePitchBonus:
            return againstWhale;
        case ModifierEffect::ListenBonus:
        case ModifierEffect::DealBonus:
        case ModifierEffect::AutoSucceed:
        case ModifierEffect::BlockObjection:
        case ModifierEffect::EscapePenalty:
        case ModifierEffect::SetbackWard:
        case ModifierEffect::RoundIncome:
        case ModifierEffect::ResistanceReduction:
        case ModifierEffect::PatienceBonus:
            return false;
    }
    return false;
}

} // namespace

void ModifierLedger::add(const ActiveModifier& modifier) {
    m_entries.push_back(modifier);
}

void ModifierLedger::tickPhase() {
    for (ActiveModifier& m : m_entries) {
        m.phasesRemaining -= 1;
    }
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                   [](const ActiveModifier& m) { return m.phasesRemaining <= 0; }),
                    m_entries.end());
}

int ModifierLedger::pitchBonus(bool againstWhale) const {
    int sum = 0;
    for (const ActiveModifier& m : m_entries) {
        if (countsTowardPitch(m.effect, againstWhale)) {
            sum += m.value;
        }
    }
    return sum;
}

int ModifierLedger::total(ModifierEffect effect) const {
    int sum = 0;
    for (const ActiveModifier& m : m_entries) {
        if (m.effect == effect) {
            sum += m.value;
        }
    }
    return sum;
}

bool ModifierLedger::has(ModifierEffect effect) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [effect](const ActiveModifier& m) { return m.effect == effect; });
}

bool ModifierLedger::consumeFirst(ModifierEffect effect, ActiveModifier* consumed) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [effect](const ActiveModifier& m) { return m.effect == effect; });
    if (it == m_entries.end()) {
        return false;
    }
    if (consumed) {
        *consumed = *it;
    }
    m_entries.erase(it);
    return true;
}

int ModifierLedger::consumeAll(ModifierEffect effect) {
    int sum = 0;
    auto it = std::remove_if(m_entries.begin(), m_entries.end(), [&](const ActiveModifier& m) {
        if (m.effect != effect) return false;
        sum += m.value;
        return true;
    });
    m_entries.erase(it, m_entries.end());
    return sum;
}

int ModifierLedger::collectRoundIncome() {
    int paid = 0;
    for (ActiveModifier& m : m_entries) {
        if (m.effect != ModifierEffect::RoundIncome || m.roundsRemaining == 0) continue;
        paid += m.value;
        if (m.roundsRemaining > 0) {
            m.roundsRemaining -= 1;
        }
    }
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                   [](const ActiveModifier& m) {
                                       return m.effect == ModifierEffect::RoundIncome && m.roundsRemaining == 0;
                                   }),
                    m_entries.end());
    return paid;
}

const char* modifierSourceName(ModifierSource source) {
    switch (source) {
        case ModifierSource::Element: return "element";
        case ModifierSource::Travel: return "travel";
        case ModifierSource::Journey: return "journey";
        case ModifierSource::Drive: return "drive";
        case ModifierSource::Market: return "market";
        case ModifierSource::Listen: return "listen";
        case ModifierSource::Spirit: return "spirit";
        case ModifierSource::Hunt: return "hunt";
        case ModifierSource::Research: return "research";
        case ModifierSource::Gift: return "gift";
        case ModifierSource::Dinner: return "dinner";
        case ModifierSource::Lucky: return "lucky";
    }
    return "?";
}

const char* modifierEffectName(ModifierEffect effect) {
    switch (effect) {
        case ModifierEffect::PitchBonus: return "pitch_bonus";
        case ModifierEffect::WhalePitchBonus: return "whale_pitch_bonus";
        case ModifierEffect::ListenBonus: return "listen_bonus";
        case ModifierEffect::NextPitchBonus: return "next_pitch_bonus";
        case ModifierEffect::DealBonus: return "deal_bonus";
        case ModifierEffect::AutoSucceed: return "auto_succeed";
        case ModifierEffect::BlockObjection: return "block_objection";
        case ModifierEffect::EscapePenalty: return "escape_penalty";
        case ModifierEffect::SetbackWard: return "setback_ward";
        case ModifierEffect::RoundIncome: return "round_income";
        case ModifierEffect::ResistanceReduction: return "resistance_reduction";
        case ModifierEffect::PatienceBonus: return "patience_bonus";
    }
    return "?";
}
