#include "config.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace compost {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static double parseFinite(const std::string& val) {
    const double v = std::stod(val);
    if (!std::isfinite(v)) throw std::invalid_argument("non-finite value");
    return v;
}

bool sanitizeConfig(Config& cfg) {
    const Config before = cfg;

    cfg.maxCapacity        = std::max(1, cfg.maxCapacity);
    cfg.bulkAddAmount      = std::max(1, cfg.bulkAddAmount);
    cfg.hoursToComplete    = std::max(1, cfg.hoursToComplete);
    cfg.shovelSpeedupHours = std::max(0, cfg.shovelSpeedupHours);
    cfg.turnCooldownHours  = std::max(0, cfg.turnCooldownHours);

    cfg.greenCNRatio      = std::max(0.0, cfg.greenCNRatio);
    cfg.brownCNRatio      = std::max(0.0, cfg.brownCNRatio);
    cfg.optimalCNRatio    = std::max(0.0, cfg.optimalCNRatio);
    cfg.optimalRatioBonus = std::max(0.0, cfg.optimalRatioBonus);
    cfg.poorRatioPenalty  = std::max(0.0, cfg.poorRatioPenalty);
    cfg.outputPerItem     = std::max(0.0, cfg.outputPerItem);
    cfg.waterAmount       = std::clamp(cfg.waterAmount, 0.0, 1.0);
    cfg.dryMaterialAmount = std::clamp(cfg.dryMaterialAmount, 0.0, 1.0);

    return before.maxCapacity        != cfg.maxCapacity ||
           before.bulkAddAmount      != cfg.bulkAddAmount ||
           before.hoursToComplete    != cfg.hoursToComplete ||
           before.shovelSpeedupHours != cfg.shovelSpeedupHours ||
           before.turnCooldownHours  != cfg.turnCooldownHours ||
           before.greenCNRatio       != cfg.greenCNRatio ||
           before.brownCNRatio       != cfg.brownCNRatio ||
           before.optimalCNRatio     != cfg.optimalCNRatio ||
           before.optimalRatioBonus  != cfg.optimalRatioBonus ||
           before.poorRatioPenalty   != cfg.poorRatioPenalty ||
           before.outputPerItem      != cfg.outputPerItem ||
           before.waterAmount        != cfg.waterAmount ||
           before.dryMaterialAmount  != cfg.dryMaterialAmount;
}

bool loadConfig(Config& cfg, const std::string& path, const StepOpts& opt) {
    std::ifstream f(path);
    if (!f) {
        emit(opt, LogKind::Warning, "[Config] Cannot open '" + path + "'.");
        return false;
    }

    Config tmp = cfg; // in case of partial read
    std::string line;
    int lineNo = 0;

    while (std::getline(f, line)) {
        ++lineNo;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            emit(opt, LogKind::Warning, "[Config] " + path + ":" + std::to_string(lineNo) +
                                        ": expected key=value, skipped.");
            continue;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));

        try {
            if (key == "maxCapacity") tmp.maxCapacity = std::stoi(val);
            else if (key == "bulkAddAmount") tmp.bulkAddAmount = std::stoi(val);
            else if (key == "hoursToComplete") tmp.hoursToComplete = std::stoi(val);
            else if (key == "shovelSpeedupHours") tmp.shovelSpeedupHours = std::stoi(val);
            else if (key == "turnCooldownHours") tmp.turnCooldownHours = std::stoi(val);
            else if (key == "greenCNRatio") tmp.greenCNRatio = parseFinite(val);
            else if (key == "brownCNRatio") tmp.brownCNRatio = parseFinite(val);
            else if (key == "optimalCNRatio") tmp.optimalCNRatio = parseFinite(val);
            else if (key == "optimalRatioBonus") tmp.optimalRatioBonus = parseFinite(val);
            else if (key == "poorRatioPenalty") tmp.poorRatioPenalty = parseFinite(val);
            else if (key == "outputPerItem") tmp.outputPerItem = parseFinite(val);
            else if (key == "waterAmount") tmp.waterAmount = parseFinite(val);
            else if (key == "dryMaterialAmount") tmp.dryMaterialAmount = parseFinite(val);
            else {
                emit(opt, LogKind::Warning, "[Config] Unknown key '" + key + "' ignored.");
            }
        } catch (const std::exception&) {
            emit(opt, LogKind::Warning, "[Config] " + path + ":" + std::to_string(lineNo) +
                                        ": bad value for '" + key + "'.");
            return false;
        }
    }

    if (sanitizeConfig(tmp)) {
        emit(opt, LogKind::Warning, "[Config] Out-of-range values were clamped.");
    }
    cfg = tmp;
    emit(opt, LogKind::Info, "[Config] Loaded '" + path + "'.");
    return true;
}

bool saveConfig(const Config& cfg, const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << "maxCapacity=" << cfg.maxCapacity << "\n";
    f << "bulkAddAmount=" << cfg.bulkAddAmount << "\n";
    f << "hoursToComplete=" << cfg.hoursToComplete << "\n";
    f << "shovelSpeedupHours=" << cfg.shovelSpeedupHours << "\n";
    f << "turnCooldownHours=" << cfg.turnCooldownHours << "\n";
    f << "greenCNRatio=" << cfg.greenCNRatio << "\n";
    f << "brownCNRatio=" << cfg.brownCNRatio << "\n";
    f << "optimalCNRatio=" << cfg.optimalCNRatio << "\n";
    f << "optimalRatioBonus=" << cfg.optimalRatioBonus << "\n";
    f << "poorRatioPenalty=" << cfg.poorRatioPenalty << "\n";
    f << "outputPerItem=" << cfg.outputPerItem << "\n";
    f << "waterAmount=" << cfg.waterAmount << "\n";
    f << "dryMaterialAmount=" << cfg.dryMaterialAmount << "\n";
    return static_cast<bool>(f);
}

} // namespace compost
