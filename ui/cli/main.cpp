#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <limits>
#include <stdexcept>
#include <cmath>
#include <cstdint>

#include "../../engine/config.hpp"
#include "../../engine/forecast.hpp"
#include "../../engine/invariants.hpp"
#include "../../engine/persist.hpp"
#include "../../engine/pile.hpp"
#include "../../engine/weather_driver.hpp"

using namespace compost;

namespace {

struct Session {
    Config        cfg;
    CompostPile   pile{cfg};
    WeatherDriver weather;
    Hours         clock = 0.0;
    bool          hardInvariants = false;
    std::string   savePath = "compost_save.txt";

    explicit Session(uint64_t seed, ClimateParams climate = ClimateParams{})
        : weather(seed, climate) {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

int readInt(const std::string& prompt, int lo, int hi) {
    while (true) {
        std::cout << prompt;
        int v;
        if (std::cin >> v && v >= lo && v <= hi) {
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            return v;
        }
        if (std::cin.eof()) throw std::runtime_error("Input closed.");
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        std::cout << "Enter a number in [" << lo << ", " << hi << "].\n";
    }
}

void enforceInvariants(const Session& s) {
    std::string why;
    if (!checkInvariants(s.pile, &why)) {
        std::cout << "[Invariant] " << why << "\n";
        if (s.hardInvariants) throw std::runtime_error("Pile invariant failed: " + why);
    }
}

void showStatus(const Session& s) {
    const CompostPile& p = s.pile;
    const Weather w = s.weather.sample(s.clock);
    const int hour = static_cast<int>(s.clock);

    std::cout << "\n=== Compost Pile ===\n";
    std::cout << "Time: Day " << hour / DAY_HOURS << ", Hour " << hour % DAY_HOURS
              << " (T+" << hour << "h)\n";
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "Weather: " << w.temperature << " C, "
              << (s.weather.raining() ? "Raining (" + std::to_string(s.weather.rainHoursLeft()) + "h left)"
                                      : std::string("Dry"))
              << (s.weather.params().sheltered ? ", sheltered" : "") << "\n";
    std::cout << "Contents: " << p.itemCount() << " / " << p.config().maxCapacity
              << " (green " << p.materials().green << ", brown " << p.materials().brown
              << ", other " << p.materials().other << ")\n";
    std::cout << "Phase: " << to_string(p.phase()) << "\n";

    if (p.isEmpty()) {
        std::cout << "====================\n\n";
        return;
    }

    std::cout << "Progress: " << p.progressPercent() << "%";
    if (p.isFinished()) {
        std::cout << " (ready, yields " << p.expectedYield() << ")";
    } else if (p.remainingHours() >= kNeverHours) {
        std::cout << " (stalled)";
    } else {
        std::cout << " (~" << p.remainingHours() << "h left)";
    }
    std::cout << "\n";

    std::cout << "C:N ratio: " << p.cnRatio() << ":1 " << p.cnRatioQualityText() << "\n";
    std::cout << std::setprecision(2);
    std::cout << "Moisture: " << p.moistureLevel() * 100.0 << "% (" << p.moisture().state() << ")\n";
    std::cout << "Aeration: " << p.aerationLevel() * 100.0 << "% (" << p.aeration().state() << ")\n";
    std::cout << std::setprecision(1);
    std::cout << "Temperature: " << p.internalTemperature() << " C (" << p.temperature().state() << ")\n";

    const Modifiers m = p.modifiers();
    std::cout << std::setprecision(2);
    std::cout << "Modifiers: cn x" << m.cn << ", moisture x" << m.moisture
              << ", aeration x" << m.aeration << ", temperature x" << m.temperature
              << " = x" << m.product() << "\n";

    if (p.isActive()) {
        if (p.canTurn(s.clock)) std::cout << "Turning: ready\n";
        else std::cout << "Turning: cooldown " << p.turnCooldownRemaining(s.clock) << "h\n";
    }
    std::cout << "====================\n\n";
}

void doAdvance(Session& s, int hours) {
    StepOpts opt; // default: random rain on, console sink
    for (int i = 0; i < hours; ++i) {
        s.weather.advanceHour(opt);
        s.clock += 1.0;
        s.pile.update(s.clock, s.weather.sample(s.clock), opt);
        enforceInvariants(s);
    }
}

void doAdd(Session& s, MaterialKind kind, const char* label) {
    const int room = s.pile.remainingCapacity();
    if (room <= 0) {
        emit(StepOpts{}, LogKind::Warning, "[Compost] The pile is full.");
        return;
    }
    if (s.pile.isFinished()) {
        emit(StepOpts{}, LogKind::Warning, "[Compost] Harvest the finished pile first.");
        return;
    }
    const int n = std::min(room, s.cfg.bulkAddAmount);
    s.pile.addMaterial(kind, n, s.clock);
    emit(StepOpts{}, LogKind::Info, "[Compost] Added " + std::to_string(n) + " " + label + " item(s).");
}

void doTurn(Session& s) {
    if (!s.pile.isActive()) {
        emit(StepOpts{}, LogKind::Warning, "[Compost] Nothing to turn.");
        return;
    }
    if (!s.pile.canTurn(s.clock)) {
        std::ostringstream msg;
        msg << "[Compost] Too soon to turn again (" << std::fixed << std::setprecision(1)
            << s.pile.turnCooldownRemaining(s.clock) << "h).";
        emit(StepOpts{}, LogKind::Warning, msg.str());
        return;
    }
    s.pile.turn(s.clock);
}

void doWater(Session& s, bool wet) {
    if (!s.pile.isActive()) {
        emit(StepOpts{}, LogKind::Warning, "[Compost] The pile is not composting.");
        return;
    }
    if (wet) {
        s.pile.addWater();
        emit(StepOpts{}, LogKind::Info, "[Compost] Watered the pile.");
    } else {
        s.pile.addDryMaterial();
        emit(StepOpts{}, LogKind::Info, "[Compost] Mixed in dry material.");
    }
}

void doForecast(const Session& s, int hours) {
    auto f = runForecast(s.pile, s.clock, s.weather, hours);
    std::cout << "\n--- Compost forecast (" << hours << "h, no rain events) ---\n";
    std::cout << std::left << std::setw(8) << "T+Hr"
              << std::setw(10) << "Ambient"
              << std::setw(10) << "Pile(C)"
              << std::setw(10) << "Moist(%)"
              << std::setw(10) << "Aer(%)"
              << std::setw(12) << "Rate(%/h)"
              << std::setw(10) << "Prog(%)"
              << "\n";

    for (size_t i = 0; i < f.hour.size(); ++i) {
        // 6h samples plus the finish hour.
        if (f.hour[i] % 6 != 0 && f.hour[i] != f.finishHour) continue;
        std::cout << std::left << std::setw(8) << f.hour[i]
                  << std::setw(10) << std::fixed << std::setprecision(1) << f.ambient[i]
                  << std::setw(10) << f.temperature[i]
                  << std::setw(10) << (100.0 * f.moisture[i])
                  << std::setw(10) << (100.0 * f.aeration[i])
                  << std::setw(12) << std::setprecision(3) << (100.0 * f.rate[i])
                  << std::setw(10) << std::setprecision(1) << (100.0 * f.progress[i])
                  << "\n";
    }
    if (f.finishHour >= 0) std::cout << "Finishes in about " << f.finishHour << "h.\n";
    std::cout << "----------------------------------------------\n\n";
}

void doHarvest(Session& s) {
    if (s.pile.isEmpty()) {
        emit(StepOpts{}, LogKind::Warning, "[Compost] The pile is empty.");
        return;
    }
    if (!s.pile.isFinished()) {
        std::cout << "The pile is not finished; emptying it now yields nothing.\n";
        if (readInt("Empty anyway? (1 = yes, 0 = no): ", 0, 1) == 0) return;
    }
    const int yield = s.pile.harvest();
    if (yield > 0) std::cout << "Collected " << yield << " unit(s) of compost.\n";
}

void doSave(const Session& s) {
    if (savePile(s.pile, s.savePath, s.clock)) {
        std::cout << "Saved to " << s.savePath << "\n";
    } else {
        std::cout << "Failed to save.\n";
    }
}

bool doLoad(Session& s, const std::string& path) {
    Hours clock = kNever;
    if (!loadPile(s.pile, path, &clock)) {
        std::cout << "Failed to load " << path << "\n";
        return false;
    }
    if (isSet(clock)) s.clock = clock;
    else if (isSet(s.pile.lastUpdateTime())) s.clock = s.pile.lastUpdateTime();
    std::cout << "Loaded from " << path << "\n";
    enforceInvariants(s);
    return true;
}

void runCLI(Session& s) {
    std::cout << "=== Compost Pile Simulation (CLI) ===\n";
    bool running = true;
    while (running) {
        std::cout << "\nMenu:\n"
                     " 1) Advance 1 hour\n"
                     " 2) Advance 6 hours\n"
                     " 3) Advance 24 hours\n"
                     " 4) Add green material\n"
                     " 5) Add brown material\n"
                     " 6) Add other material\n"
                     " 7) Turn pile\n"
                     " 8) Add water\n"
                     " 9) Add dry material\n"
                     "10) Status\n"
                     "11) Forecast (48h)\n"
                     "12) Harvest\n"
                     "13) Save\n"
                     "14) Load\n"
                     " 0) Quit\n";
        int c = readInt("Choice: ", 0, 14);
        switch (c) {
            case 1:  doAdvance(s, 1); break;
            case 2:  doAdvance(s, 6); break;
            case 3:  doAdvance(s, 24); break;
            case 4:  doAdd(s, MaterialKind::Green, "green"); break;
            case 5:  doAdd(s, MaterialKind::Brown, "brown"); break;
            case 6:  doAdd(s, MaterialKind::Other, "other"); break;
            case 7:  doTurn(s); break;
            case 8:  doWater(s, true); break;
            case 9:  doWater(s, false); break;
            case 10: showStatus(s); break;
            case 11: doForecast(s, 48); break;
            case 12: doHarvest(s); break;
            case 13: doSave(s); break;
            case 14: doLoad(s, s.savePath); break;
            case 0:  running = false; break;
        }
    }
    std::cout << "Goodbye.\n";
}

// Deterministic headless run for CI. Returns 0 on success, non-zero on failure.
int runSelfTest() {
    Session s(123456789u);
    s.hardInvariants = true;

    s.pile.addMaterial(MaterialKind::Green, 8, s.clock);
    s.pile.addMaterial(MaterialKind::Brown, 16, s.clock);
    doAdvance(s, 24);
    if (s.pile.canTurn(s.clock)) s.pile.turn(s.clock, quietOpts());
    doAdvance(s, 24);

    // Forecast must be non-destructive.
    const PileState before = s.pile.toState();
    runForecast(s.pile, s.clock, s.weather, 72);
    const PileState after = s.pile.toState();

    auto feq = [](double a, double b){ return std::fabs(a - b) <= 1e-12; };
    bool same =
        feq(before.decompositionProgress, after.decompositionProgress) &&
        feq(before.moistureLevel,         after.moistureLevel) &&
        feq(before.aerationLevel,         after.aerationLevel) &&
        feq(before.internalTemperature,   after.internalTemperature) &&
        feq(before.lastUpdateTime,        after.lastUpdateTime);
    if (!same) {
        std::cout << "[SelfTest] runForecast mutated the pile.\n";
        return 2;
    }

    // Save/load round-trip, then keep simulating without tripping invariants.
    const char* tmp = "selftest_compost.txt";
    if (!savePile(s.pile, tmp, s.clock)) return 3;

    Session s2(123456789u);
    s2.hardInvariants = true;
    if (!doLoad(s2, tmp)) return 4;
    if (s2.pile.toState().decompositionProgress != before.decompositionProgress) {
        std::cout << "[SelfTest] Progress changed across save/load.\n";
        return 5;
    }
    doAdvance(s2, 24); // throws if invariants fail

    std::cout << "[SelfTest] OK\n";
    return 0;
}

} // namespace

// ----------- Entry point -----------------------------------------------------

int main(int argc, char** argv) {
    uint64_t seed = 42u;
    long long headlessHours = 0;
    bool headless = false;
    double tickHours = 1.0;
    bool sheltered = false;
    std::string configPath, loadPath, savePath;
    bool checkInvariantsFlag = false;
    bool runSelfTestFlag = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--load" && i + 1 < argc) {
                loadPath = argv[++i];
            } else if (arg == "--save" && i + 1 < argc) {
                savePath = argv[++i];
            } else if (arg == "--headless" && i + 1 < argc) {
                headlessHours = std::stoll(argv[++i]);
                headless = true;
            } else if (arg == "--tick" && i + 1 < argc) {
                tickHours = std::stod(argv[++i]);
            } else if (arg == "--sheltered") {
                sheltered = true;
            } else if (arg == "--check-invariants") {
                checkInvariantsFlag = true;
            } else if (arg == "--selftest") {
                runSelfTestFlag = true;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << "\n";
                return 1;
            }
        }

        if (runSelfTestFlag) return runSelfTest();

        ClimateParams climate;
        climate.sheltered = sheltered;
        Session s(seed, climate);
        s.hardInvariants = checkInvariantsFlag;
        if (!savePath.empty()) s.savePath = savePath;

        if (!configPath.empty() && !loadConfig(s.cfg, configPath)) {
            std::cerr << "Could not read config " << configPath << "; using defaults.\n";
        }
        if (!loadPath.empty()) doLoad(s, loadPath);

        if (headless) {
            if (tickHours <= 0.0) throw std::runtime_error("--tick must be positive.");
            if (s.pile.isEmpty()) {
                std::cout << "(Headless) Empty pile; seeding a balanced mix.\n";
                s.pile.addMaterial(MaterialKind::Green, s.cfg.bulkAddAmount * 2, s.clock);
                s.pile.addMaterial(MaterialKind::Brown, s.cfg.bulkAddAmount * 4, s.clock);
            }

            // Advance the clock in tick-sized updates; weather rolls hourly.
            StepOpts opt;
            const Hours end = s.clock + static_cast<double>(headlessHours);
            Hours nextWeatherHour = std::floor(s.clock) + 1.0;
            while (s.clock < end) {
                s.clock = std::min(end, s.clock + tickHours);
                while (nextWeatherHour <= s.clock) {
                    s.weather.advanceHour(opt);
                    nextWeatherHour += 1.0;
                }
                s.pile.update(s.clock, s.weather.sample(s.clock), opt);
                enforceInvariants(s);
            }
            showStatus(s);
            if (!savePath.empty()) doSave(s);
            return 0;
        }

        runCLI(s);

        if (!savePath.empty()) doSave(s);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
