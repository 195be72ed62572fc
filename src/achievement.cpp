#include "achievement.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

std::vector<std::string> actionList(const Encounter& encounter) {
    std::vector<std::string> out;
    out.reserve(encounter.rounds.size());
    for (const RoundResult& r : encounter.rounds) {
        out.push_back(negotiationActionName(r.action));
    }
    return out;
}

void writeStringArray(std::ostringstream& js, const std::vector<std::string>& values) {
    js << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) js << ", ";
        js << "\"" << jsonEscape(values[i]) << "\"";
    }
    js << "]";
}

} // namespace

std::optional<AchievementRecord> buildAchievementRecord(const GameState& state,
                                                        const std::array<EntropyBundle, kEntropySlotCount>& entropy,
                                                        std::int64_t timestamp) {
    if (!state.tier || !isStorableTier(*state.tier)) {
        return std::nullopt;
    }
    const auto it = std::find_if(state.rolls.begin(), state.rolls.end(),
                                 [](const GameRoll& r) { return r.label == "territory"; });
    if (it == state.rolls.end()) {
        return std::nullopt;
    }

    AchievementRecord rec;
    rec.characterName = state.character.name;
    rec.characterRollHeight = state.character.verification.blockHeight;
    rec.startingMoney = state.startingMoney;
    rec.finalMoney = state.money;
    rec.tier = *state.tier;
    std::int64_t lastBlock = it->blockHeight;
    for (std::size_t i = 0; i < entropy.size(); ++i) {
        rec.blocks[i].seed = entropy[i].clientSeed;
        rec.blocks[i].hash = entropy[i].blockHash;
        lastBlock = std::max(lastBlock, entropy[i].blockHeight);
    }
    rec.territoryRoll = *it;
    rec.firstClientActions = actionList(state.firstClient);
    rec.whaleActions = actionList(state.whale);
    rec.choices = state.choices;
    rec.completedAtBlock = lastBlock;
    rec.timestamp = timestamp;
    return rec;
}

bool validateAchievementForStorage(const AchievementRecord& record, std::string* errorMessage) {
    auto fail = [&](const std::string& msg) {
        if (errorMessage) *errorMessage = msg;
        return false;
    };
    if (!isStorableTier(record.tier)) {
        return fail(std::string("tier ") + tierName(record.tier) + " is not storable");
    }
    if (record.characterName.empty()) {
        return fail("character name is empty");
    }
    for (std::size_t i = 0; i < record.blocks.size(); ++i) {
        if (record.blocks[i].seed.empty() || record.blocks[i].hash.empty()) {
            return fail("block " + std::to_string(i + 1) + " seed/hash missing");
        }
    }
    if (record.territoryRoll.label != "territory") {
        return fail("territory roll missing");
    }
    if (record.finalMoney <= 0 || record.startingMoney <= 0) {
        return fail("money totals out of range");
    }
    return true;
}

std::string jsonEscape(const std::string& input) {
    std::ostringstream oss;
    for (const char ch : input) {
        switch (ch) {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(ch)) << std::dec << std::setfill(' ');
                } else {
                    oss << ch;
                }
                break;
        }
    }
    return oss.str();
}

std::string achievementToJson(const AchievementRecord& record) {
    std::ostringstream js;
    js << "{\n";
    js << "  \"characterName\": \"" << jsonEscape(record.characterName) << "\",\n";
    js << "  \"characterRollBlockHeight\": " << record.characterRollHeight << ",\n";
    js << "  \"startingMoney\": " << record.startingMoney << ",\n";
    js << "  \"finalMoney\": " << record.finalMoney << ",\n";
    js << "  \"tier\": \"" << tierName(record.tier) << "\",\n";
    for (std::size_t i = 0; i < record.blocks.size(); ++i) {
        js << "  \"block" << (i + 1) << "Seed\": \"" << jsonEscape(record.blocks[i].seed) << "\",\n";
        js << "  \"block" << (i + 1) << "Hash\": \"" << jsonEscape(record.blocks[i].hash) << "\",\n";
    }
    const GameRoll& t = record.territoryRoll;
    js << "  \"territoryRoll\": {\"label\": \"" << jsonEscape(t.label)
       << "\", \"blockHeight\": " << t.blockHeight
       << ", \"blockHash\": \"" << jsonEscape(t.blockHash)
       << "\", \"rollSeedHash\": \"" << jsonEscape(t.rollSeedHash)
       << "\", \"dieSize\": " << t.dieSize
       << ", \"result\": " << t.result << "},\n";
    js << "  \"firstClientActions\": ";
    writeStringArray(js, record.firstClientActions);
    js << ",\n  \"whaleActions\": ";
    writeStringArray(js, record.whaleActions);
    js << ",\n  \"choices\": ";
    writeStringArray(js, record.choices);
    js << ",\n";
    js << "  \"completedAtBlock\": " << record.completedAtBlock << ",\n";
    js << "  \"timestamp\": " << record.timestamp << "\n";
    js << "}\n";
    return js.str();
}
