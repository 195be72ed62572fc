#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "achievement.h"
#include "character.h"
#include "entropy.h"
#include "game_runner.h"
#include "sales_config.h"
#include "sales_game.h"

namespace {

struct RunOptions {
    std::string seed = "salessim";
    std::string name = "Salesperson";
    std::string configPath = "data/sales_config.toml";
    std::int64_t startHeight = 1000;
    std::string outDir;
    GameScript script;
    int sweep = 0;    // > 0: play this many games with derived seeds and report the tier mix
    int threads = 0;  // 0 keeps the OpenMP default
    bool debug = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "salessim_cli")
              << " [--seed S] [--name N] [--config path] [--height H]\n"
              << "       [--travel fly|train|drive] [--crossroads grind|climb|hunt]\n"
              << "       [--vp safe|stretch|allin] [--invest research|gift|dinner|wingit]\n"
              << "       [--first-actions a,b,...] [--whale-actions a,b,...]\n"
              << "       [--outDir path] [--sweep N] [--threads N] [--debug]\n"
              << "Actions: pitch, listen, concede, ability.\n";
}

bool parseTravel(const std::string& s, TravelChoice& out) {
    if (s == "fly") out = TravelChoice::Fly;
    else if (s == "train") out = TravelChoice::Train;
    else if (s == "drive") out = TravelChoice::Drive;
    else return false;
    return true;
}

bool parseCrossroads(const std::string& s, CrossroadsChoice& out) {
    if (s == "grind") out = CrossroadsChoice::Grind;
    else if (s == "climb") out = CrossroadsChoice::Climb;
    else if (s == "hunt") out = CrossroadsChoice::Hunt;
    else return false;
    return true;
}

bool parseVP(const std::string& s, VPChoice& out) {
    if (s == "safe") out = VPChoice::Safe;
    else if (s == "stretch") out = VPChoice::Stretch;
    else if (s == "allin") out = VPChoice::AllIn;
    else return false;
    return true;
}

bool parseInvestment(const std::string& s, WhaleInvestment& out) {
    if (s == "research") out = WhaleInvestment::Research;
    else if (s == "gift") out = WhaleInvestment::Gift;
    else if (s == "dinner") out = WhaleInvestment::Dinner;
    else if (s == "wingit") out = WhaleInvestment::WingIt;
    else return false;
    return true;
}

bool parseActions(const std::string& s, std::vector<NegotiationAction>& out) {
    out.clear();
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        if (item == "pitch") out.push_back(NegotiationAction::Pitch);
        else if (item == "listen") out.push_back(NegotiationAction::Listen);
        else if (item == "concede") out.push_back(NegotiationAction::Concede);
        else if (item == "ability") out.push_back(NegotiationAction::Ability);
        else return false;
    }
    return true;
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };
        auto parseInt = [](const std::string& s, long long& out) -> bool {
            try {
                size_t pos = 0;
                out = std::stoll(s, &pos);
                return pos == s.size();
            } catch (const std::exception&) {
                return false;
            }
        };

        std::string v;
        long long n = 0;
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            if (!requireValue(opt.seed) || opt.seed.empty()) return false;
        } else if (arg == "--name") {
            if (!requireValue(opt.name) || opt.name.empty()) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg == "--height") {
            if (!requireValue(v) || !parseInt(v, n) || n < 0) return false;
            opt.startHeight = static_cast<std::int64_t>(n);
        } else if (arg == "--outDir") {
            if (!requireValue(opt.outDir)) return false;
        } else if (arg == "--travel") {
            if (!requireValue(v) || !parseTravel(v, opt.script.travel)) return false;
        } else if (arg == "--crossroads") {
            if (!requireValue(v) || !parseCrossroads(v, opt.script.crossroads)) return false;
        } else if (arg == "--vp") {
            if (!requireValue(v) || !parseVP(v, opt.script.vp)) return false;
        } else if (arg == "--invest") {
            if (!requireValue(v) || !parseInvestment(v, opt.script.investment)) return false;
        } else if (arg == "--first-actions") {
            if (!requireValue(v) || !parseActions(v, opt.script.firstClientActions)) return false;
        } else if (arg == "--whale-actions") {
            if (!requireValue(v) || !parseActions(v, opt.script.whaleActions)) return false;
        } else if (arg == "--sweep") {
            if (!requireValue(v) || !parseInt(v, n) || n <= 0) return false;
            opt.sweep = static_cast<int>(n);
        } else if (arg == "--threads") {
            if (!requireValue(v) || !parseInt(v, n) || n <= 0) return false;
            opt.threads = static_cast<int>(n);
        } else if (arg == "--debug") {
            opt.debug = true;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    return true;
}

struct SingleRun {
    Character character;
    EntropySet entropy;
    GameRunResult result;
};

SingleRun playOne(const RunOptions& opt, const std::string& seed, const SalesConfig& config) {
    SyntheticEntropySource source(seed, opt.startHeight);
    SingleRun run;
    run.character = rollCharacterFromSource(opt.name, source, seed, opt.startHeight);
    run.entropy = commitAndReveal(source, seed, opt.startHeight + 1);
    run.result = runScriptedGame(run.character, run.entropy, opt.script, config);
    return run;
}

void printCharacter(const Character& c) {
    std::cout << c.name << " [" << elementName(c.traits.element) << ", "
              << spiritAnimalName(c.traits.spiritAnimal) << ", " << sexName(c.traits.sex) << "]\n";
    for (int s = 0; s < kStatCount; ++s) {
        const StatRoll& r = c.stats[static_cast<std::size_t>(s)];
        std::cout << "  " << statName(static_cast<Stat>(s)) << " " << std::setw(2) << r.total
                  << " (" << (r.modifier >= 0 ? "+" : "") << r.modifier << ")\n";
    }
}

int runSweep(const RunOptions& opt, const SalesConfig& config) {
    std::vector<int> tiers(static_cast<std::size_t>(opt.sweep), -1);
    std::vector<std::string> errors(static_cast<std::size_t>(opt.sweep));

#pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < opt.sweep; ++i) {
        try {
            const SingleRun run = playOne(opt, opt.seed + ":" + std::to_string(i), config);
            tiers[static_cast<std::size_t>(i)] = static_cast<int>(run.result.tier);
        } catch (const std::exception& e) {
            errors[static_cast<std::size_t>(i)] = e.what();
        }
    }

    std::array<int, 5> counts{{0, 0, 0, 0, 0}};
    int failed = 0;
    for (int i = 0; i < opt.sweep; ++i) {
        const int t = tiers[static_cast<std::size_t>(i)];
        if (t < 0) {
            ++failed;
            std::cerr << "Game " << i << " failed: " << errors[static_cast<std::size_t>(i)] << "\n";
            continue;
        }
        counts[static_cast<std::size_t>(t)] += 1;
    }

    std::cout << "Sweep of " << opt.sweep << " games (seed base '" << opt.seed << "')\n";
    for (int t = 0; t < 5; ++t) {
        const double share = 100.0 * counts[static_cast<std::size_t>(t)] / static_cast<double>(opt.sweep);
        std::cout << "  " << std::left << std::setw(12) << tierName(static_cast<Tier>(t)) << std::right
                  << std::setw(6) << counts[static_cast<std::size_t>(t)]
                  << "  " << std::fixed << std::setprecision(1) << share << "%\n";
    }
    return failed == 0 ? 0 : 1;
}

bool writeOutputs(const RunOptions& opt,
                  const std::string& configHash,
                  const SingleRun& run,
                  std::string* error) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(opt.outDir, ec);
    if (ec) {
        *error = "could not create " + opt.outDir + ": " + ec.message();
        return false;
    }
    const GameState& s = run.result.state;
    const fs::path jsonPath = fs::path(opt.outDir) / "run_summary.json";
    {
        std::ofstream js(jsonPath);
        if (!js) {
            *error = "could not open " + jsonPath.string();
            return false;
        }
        js << "{\n";
        js << "  \"seed\": \"" << jsonEscape(opt.seed) << "\",\n";
        js << "  \"configPath\": \"" << jsonEscape(opt.configPath) << "\",\n";
        js << "  \"configHash\": \"" << jsonEscape(configHash) << "\",\n";
        js << "  \"character\": \"" << jsonEscape(s.character.name) << "\",\n";
        js << "  \"element\": \"" << elementName(s.character.traits.element) << "\",\n";
        js << "  \"spiritAnimal\": \"" << spiritAnimalName(s.character.traits.spiritAnimal) << "\",\n";
        js << "  \"territory\": \"" << (s.territory ? territoryName(*s.territory) : "") << "\",\n";
        js << "  \"startingMoney\": " << s.startingMoney << ",\n";
        js << "  \"finalMoney\": " << s.money << ",\n";
        js << "  \"tier\": \"" << tierName(run.result.tier) << "\",\n";
        js << "  \"stateHash\": " << run.result.stateHash << ",\n";
        js << "  \"rolls\": [\n";
        for (std::size_t i = 0; i < s.rolls.size(); ++i) {
            const GameRoll& r = s.rolls[i];
            js << "    {\"label\": \"" << jsonEscape(r.label) << "\", \"die\": " << r.dieSize
               << ", \"result\": " << r.result << ", \"modifier\": " << r.modifier
               << ", \"total\": " << r.total << ", \"blockHeight\": " << r.blockHeight;
            if (r.target) js << ", \"target\": " << *r.target;
            if (r.outcome) js << ", \"outcome\": \"" << rollOutcomeName(*r.outcome) << "\"";
            js << "}" << (i + 1 < s.rolls.size() ? "," : "") << "\n";
        }
        js << "  ],\n";
        js << "  \"choices\": [";
        for (std::size_t i = 0; i < s.choices.size(); ++i) {
            js << (i ? ", " : "") << "\"" << jsonEscape(s.choices[i]) << "\"";
        }
        js << "]\n";
        js << "}\n";
    }

    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::optional<AchievementRecord> record =
        buildAchievementRecord(s, run.entropy, static_cast<std::int64_t>(now));
    if (record) {
        std::string why;
        if (!validateAchievementForStorage(*record, &why)) {
            *error = "achievement rejected: " + why;
            return false;
        }
        const fs::path achPath = fs::path(opt.outDir) / "achievement.json";
        std::ofstream out(achPath);
        if (!out) {
            *error = "could not open " + achPath.string();
            return false;
        }
        out << achievementToJson(*record);
        std::cout << "Wrote " << achPath.string() << "\n";
    }
    std::cout << "Wrote " << jsonPath.string() << "\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

#ifdef _OPENMP
    if (opt.threads > 0) {
        omp_set_num_threads(opt.threads);
    }
#endif

    SalesGame::setDebugMode(opt.debug && opt.sweep == 0);

    SalesConfig config;
    std::string err;
    if (!loadSalesConfig(opt.configPath, config, &err)) {
        std::cerr << "[Config] " << err << " Using built-in defaults.\n";
    }
    const std::string configHash = hashFileFNV1a(opt.configPath);

    try {
        if (opt.sweep > 0) {
            return runSweep(opt, config);
        }

        const SingleRun run = playOne(opt, opt.seed, config);
        printCharacter(run.character);
        const GameState& s = run.result.state;
        std::cout << "Territory: " << (s.territory ? territoryDisplayName(*s.territory) : "-") << "\n"
                  << "First client: " << s.firstClient.client.name << " ("
                  << negotiationOutcomeName(negotiationOutcome(s.firstClient.client)) << ", "
                  << s.firstClient.payout << ")\n"
                  << "Whale: " << s.whale.client.name << " ("
                  << negotiationOutcomeName(negotiationOutcome(s.whale.client)) << ", "
                  << s.whale.payout << ")\n"
                  << "Money: " << s.startingMoney << " -> " << s.money << "\n"
                  << "Tier: " << tierName(run.result.tier) << "\n"
                  << "State hash: " << run.result.stateHash << "\n";

        if (!opt.outDir.empty()) {
            std::string writeError;
            if (!writeOutputs(opt, configHash, run, &writeError)) {
                std::cerr << "Error: " << writeError << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
