#include "moisture.hpp"
#include <algorithm>

namespace compost {

static double clamp01(double x) { return std::max(0.0, std::min(1.0, x)); }

void MoistureModel::reset() {
    level_ = kDefaultLevel;
    lastCheckTime_ = kNever;
}

void MoistureModel::restore(double level, Hours lastCheckTime) {
    level_ = clamp01(level);
    lastCheckTime_ = lastCheckTime;
}

double MoistureModel::evaporationRate(double temperature, bool raining, double evapMultiplier) {
    double rate = kBaseEvaporation;
    if (temperature > 0.0) rate += temperature * kTempEvaporation;
    rate *= std::max(0.0, evapMultiplier);
    if (raining) rate *= kRainEvapReduction;
    return rate;
}

void MoistureModel::updateEnvironmental(Hours now, const Weather& weather, double evapMultiplier) {
    if (now - lastCheckTime_ < kHourGate) return;
    lastCheckTime_ = now;

    if (weather.rainingOnPile()) {
        level_ = clamp01(level_ + clamp01(weather.rainfall) * kMaxRainGain);
    }

    level_ = clamp01(level_ - evaporationRate(weather.temperature, weather.rainExposed, evapMultiplier));
}

void MoistureModel::addWater(double amount) {
    if (amount <= 0.0) return;
    level_ = clamp01(level_ + amount);
}

void MoistureModel::addDryMaterial(double amount) {
    if (amount <= 0.0) return;
    level_ = clamp01(level_ - amount);
}

void MoistureModel::setLevel(double level) {
    level_ = clamp01(level);
}

double MoistureModel::decompositionModifier() const {
    if (level_ < kBoneDry)     return 0.1;  // microbes can't function
    if (level_ < kTooDry)      return 0.5;
    if (level_ < kOptimalMin)  return 0.8;
    if (level_ <= kOptimalMax) return 1.0;
    if (level_ <= kTooWet)     return 0.8;
    if (level_ <= kWaterlogged) return 0.4; // going anaerobic
    return 0.2;
}

const char* MoistureModel::state() const {
    if (level_ < kBoneDry)      return "Bone Dry";
    if (level_ < kTooDry)       return "Too Dry";
    if (level_ < kOptimalMin)   return "Slightly Dry";
    if (level_ <= kOptimalMax)  return "Optimal";
    if (level_ <= kTooWet)      return "Slightly Wet";
    if (level_ <= kWaterlogged) return "Too Wet";
    return "Waterlogged";
}

} // namespace compost
