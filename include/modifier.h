#pragma once

#include <string>
#include <vector>

enum class ModifierKind { Buff, Debuff };

enum class ModifierSource {
    Element,
    Travel,
    Journey,
    Drive,
    Market,
    Listen,
    Spirit,
    Hunt,
    Research,
    Gift,
    Dinner,
    Lucky
};

// What a modifier does. Consumers match on this, never on descriptions.
enum class ModifierEffect {
    PitchBonus,          // added to every pitch while active
    WhalePitchBonus,     // added to pitches against the whale only
    ListenBonus,         // added to the buff a Listen action grants
    NextPitchBonus,      // added to the next pitch, then consumed
    DealBonus,           // added to the next successful pitch value, then consumed
    AutoSucceed,         // next pitch succeeds regardless of the roll
    BlockObjection,      // next hostile body-language read becomes neutral
    EscapePenalty,       // waives the all-in failure penalty
    SetbackWard,         // absorbs the next setback loss entirely
    RoundIncome,         // pays value to money after each negotiation round
    ResistanceReduction, // lowers the whale's starting resistance
    PatienceBonus        // raises the whale's starting patience
};

constexpr int kPermanentPhases = 99;

struct ActiveModifier {
    std::string description;
    ModifierKind kind = ModifierKind::Buff;
    int value = 0;
    ModifierSource source = ModifierSource::Element;
    ModifierEffect effect = ModifierEffect::PitchBonus;
    int phasesRemaining = 1;
    int roundsRemaining = -1; // -1: not limited by negotiation rounds
};

class ModifierLedger {
public:
    void add(const ActiveModifier& modifier);

    // Decrements every entry by one phase and drops the expired ones.
    void tickPhase();

    int pitchBonus(bool againstWhale) const;
    int total(ModifierEffect effect) const;
    bool has(ModifierEffect effect) const;

    // Removes the oldest entry with this effect; returns false if none.
    bool consumeFirst(ModifierEffect effect, ActiveModifier* consumed = nullptr);
    int consumeAll(ModifierEffect effect);

    // Sums RoundIncome entries, counts their rounds down, drops exhausted ones.
    int collectRoundIncome();

    const std::vector<ActiveModifier>& entries() const { return m_entries; }
    bool empty() const { return m_entries.empty(); }

private:
    std::vector<ActiveModifier> m_entries;
};

const char* modifierSourceName(ModifierSource source);
const char* modifierEffectName(ModifierEffect effect);
