#include "ratio.hpp"
#include <algorithm>
#include <cmath>

namespace compost {

static bool validRatio(double ratio) { return ratio > 0.0 && ratio <= 100.0; }

double cnRatio(const MaterialCounts& m, const Config& cfg) {
    const int greens = std::max(0, m.green);
    const int browns = std::max(0, m.brown);
    const int total = greens + browns;

    if (total == 0) return 0.0;
    if (greens == 0) return cfg.brownCNRatio;
    if (browns == 0) return cfg.greenCNRatio;

    return (greens * cfg.greenCNRatio + browns * cfg.brownCNRatio) / total;
}

double cnModifier(double ratio, const Config& cfg) {
    if (!validRatio(ratio)) return 1.0;

    const double distance = std::fabs(ratio - cfg.optimalCNRatio);
    if (distance <= 5.0)  return cfg.optimalRatioBonus;
    if (distance <= 10.0) return 1.2;
    if (distance <= 15.0) return 1.0;
    if (distance <= 25.0) return 0.8;
    return cfg.poorRatioPenalty;
}

const char* ratioQualityText(double ratio, const Config& cfg) {
    if (!validRatio(ratio)) return "";

    const double distance = std::fabs(ratio - cfg.optimalCNRatio);
    if (distance <= 5.0)  return "(Excellent!)";
    if (distance <= 10.0) return "(Good)";
    if (distance <= 15.0) return "(Ok)";
    if (distance <= 25.0) return "(Poor)";
    return "(Very Poor)";
}

} // namespace compost
