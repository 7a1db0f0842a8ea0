#include "persist.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace compost {

static const char* kSaveTag = "COMPOST_SAVE";

// std::stod also accepts "nan" and "inf"; a save never holds those.
static double parseFinite(const std::string& val) {
    const double v = std::stod(val);
    if (!std::isfinite(v)) throw std::invalid_argument("non-finite value");
    return v;
}

bool writePile(std::ostream& out, const CompostPile& pile, Hours clock) {
    const PileState s = pile.toState();
    const MaterialCounts& m = pile.materials();

    out << kSaveTag << " " << kSaveVersion << "\n";
    out << std::setprecision(17);
    if (isSet(clock)) out << "clock=" << clock << "\n";

    out << "startTime=" << s.startTime << "\n";
    out << "lastUpdateTime=" << s.lastUpdateTime << "\n";
    out << "lastTurnTime=" << s.lastTurnTime << "\n";
    out << "decompositionProgress=" << s.decompositionProgress << "\n";
    out << "isFinished=" << (s.isFinished ? 1 : 0) << "\n";

    out << "moistureLevel=" << s.moistureLevel << "\n";
    out << "moistureLastCheck=" << s.moistureLastCheck << "\n";

    out << "aerationLevel=" << s.aerationLevel << "\n";
    out << "aerationLastUpdate=" << s.aerationLastUpdate << "\n";
    out << "aerationLastTurn=" << s.aerationLastTurn << "\n";

    out << "internalTemperature=" << s.internalTemperature << "\n";
    out << "ambientTemperature=" << s.ambientTemperature << "\n";
    out << "temperatureLastUpdate=" << s.temperatureLastUpdate << "\n";

    out << "green=" << m.green << "\n";
    out << "brown=" << m.brown << "\n";
    out << "other=" << m.other << "\n";
    out << "end\n";
    return static_cast<bool>(out);
}

bool readPile(std::istream& in, CompostPile& pile, Hours* clock, const StepOpts& opt) {
    std::string header;
    if (!std::getline(in, header)) {
        emit(opt, LogKind::Warning, "[Save] Empty save data.");
        return false;
    }

    std::istringstream hs(header);
    std::string tag;
    int version = 0;
    if (!(hs >> tag >> version) || tag != kSaveTag || version < 1 || version > kSaveVersion) {
        emit(opt, LogKind::Warning, "[Save] Unrecognized save header.");
        return false;
    }

    PileState s;           // missing keys keep their documented defaults
    MaterialCounts m;
    Hours savedClock = kNever;
    bool sawModel = false;
    bool sawPile  = false;

    std::string line;
    while (std::getline(in, line)) {
        if (line == "end") break;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);

        try {
            if (key == "clock") savedClock = parseFinite(val);
            else if (key == "startTime") { s.startTime = parseFinite(val); sawPile = true; }
            else if (key == "lastUpdateTime") { s.lastUpdateTime = parseFinite(val); sawPile = true; }
            else if (key == "lastTurnTime") { s.lastTurnTime = parseFinite(val); sawPile = true; }
            else if (key == "decompositionProgress") { s.decompositionProgress = parseFinite(val); sawPile = true; }
            else if (key == "isFinished") { s.isFinished = (std::stoi(val) != 0); sawPile = true; }
            else if (key == "isComposting") sawPile = true; // legacy flag, no longer stored
            else if (key == "moistureLevel") { s.moistureLevel = parseFinite(val); sawModel = true; }
            else if (key == "moistureLastCheck") { s.moistureLastCheck = parseFinite(val); sawModel = true; }
            else if (key == "aerationLevel") { s.aerationLevel = parseFinite(val); sawModel = true; }
            else if (key == "aerationLastUpdate") { s.aerationLastUpdate = parseFinite(val); sawModel = true; }
            else if (key == "aerationLastTurn") { s.aerationLastTurn = parseFinite(val); sawModel = true; }
            else if (key == "internalTemperature") { s.internalTemperature = parseFinite(val); sawModel = true; }
            else if (key == "ambientTemperature") { s.ambientTemperature = parseFinite(val); sawModel = true; }
            else if (key == "temperatureLastUpdate") { s.temperatureLastUpdate = parseFinite(val); sawModel = true; }
            else if (key == "green") m.green = std::stoi(val);
            else if (key == "brown") m.brown = std::stoi(val);
            else if (key == "other") m.other = std::stoi(val);
        } catch (const std::exception&) {
            emit(opt, LogKind::Warning, "[Save] Bad value for '" + key + "'.");
            return false;
        }
    }

    if (clock) *clock = savedClock;

    // Old saves carry no per-model records; which items were in the pile is
    // unrecoverable, so start over rather than guess.
    if (version < kSaveVersion || (sawPile && !sawModel)) {
        pile.reset();
        emit(opt, LogKind::Warning,
             "[Save] Legacy compost save detected; the pile has been reset.");
        return true;
    }

    pile.reset();
    pile.setMaterials(m);
    pile.fromState(s);
    return true;
}

bool savePile(const CompostPile& pile, const std::string& path, Hours clock) {
    std::ofstream f(path);
    if (!f) return false;
    return writePile(f, pile, clock);
}

bool loadPile(CompostPile& pile, const std::string& path, Hours* clock, const StepOpts& opt) {
    std::ifstream f(path);
    if (!f) {
        emit(opt, LogKind::Warning, "[Save] Cannot open '" + path + "'.");
        return false;
    }
    return readPile(f, pile, clock, opt);
}

} // namespace compost
