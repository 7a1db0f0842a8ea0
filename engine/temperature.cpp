#include "temperature.hpp"
#include <algorithm>

namespace compost {

static double clamp(double x, double lo, double hi) {
    return std::max(lo, std::min(hi, x));
}

void TemperatureModel::reset() {
    internal_ = ambient_;
    lastUpdateTime_ = kNever;
}

void TemperatureModel::restore(double internal, double ambient, Hours lastUpdateTime) {
    ambient_ = ambient;
    internal_ = std::min(internal, kMaxTemperature);
    lastUpdateTime_ = lastUpdateTime;
}

double TemperatureModel::aboveAmbient() const {
    return std::max(0.0, internal_ - ambient_);
}

double TemperatureModel::heatGeneration(const Inputs& in) {
    double heat = kBaseHeatGeneration * in.activity;
    heat *= 1.0 + in.aeration * 0.5;    // aerobic work runs hotter
    heat *= in.cnModifier;
    heat *= 0.5 + in.pileSize * 0.5;    // big piles hold heat
    return clamp(heat, 0.0, kMaxHeatGeneration);
}

double TemperatureModel::heatLoss(double moisture, double pileSize) const {
    const double diff = internal_ - ambient_;
    double loss = diff * kHeatLossCoefficient * (1.0 - pileSize * 0.3);

    if (moisture > 0.5 && diff > 0.0) {
        loss += (moisture - 0.5) * (diff / 50.0) * kEvaporativeCooling;
    }
    return loss;
}

void TemperatureModel::update(Hours now, const Weather& weather, const Inputs& in) {
    if (!isSet(lastUpdateTime_)) {
        ambient_ = weather.temperature;
        internal_ = ambient_;
        lastUpdateTime_ = now;
        return;
    }

    const double hours = now - lastUpdateTime_;
    if (hours < kHourGate) return;
    lastUpdateTime_ = now;

    ambient_ = weather.temperature;

    const double delta = (heatGeneration(in) - heatLoss(in.moisture, in.pileSize)) * hours;
    const double lo = std::min(ambient_ - kBelowAmbientMargin, kMaxTemperature);
    internal_ = clamp(internal_ + delta, lo, kMaxTemperature);
}

void TemperatureModel::applyTurningCooling() {
    const double above = internal_ - ambient_;
    if (above <= 0.0) return;
    internal_ = std::max(ambient_, internal_ - above * kTurningHeatRelease);
}

void TemperatureModel::setTemperature(double celsius) {
    internal_ = clamp(celsius, -10.0, kMaxTemperature);
}

double TemperatureModel::decompositionModifier() const {
    if (internal_ < 5.0)               return 0.1;  // near freezing
    if (internal_ < 10.0)              return 0.3;
    if (internal_ < kTooCold)          return 0.6;
    if (internal_ < 30.0)              return 0.9;
    if (internal_ < kThermophilicMin)  return 1.1;
    if (internal_ <= 55.0)             return 1.5;  // peak thermophilic
    if (internal_ <= kThermophilicMax) return 1.3;
    if (internal_ <= 70.0)             return 0.7;  // killing beneficial organisms
    return 0.3;
}

double TemperatureModel::evaporationMultiplier() const {
    if (internal_ <= ambient_) return 1.0;
    return 1.0 + (internal_ - ambient_) / 50.0;
}

const char* TemperatureModel::state() const {
    if (internal_ < 10.0)              return "Cold";
    if (internal_ < kTooCold)          return "Cool";
    if (internal_ < 30.0)              return "Warm";
    if (internal_ < kThermophilicMin)  return "Getting Hot";
    if (internal_ <= kThermophilicMax) return "Thermophilic";
    if (internal_ <= 70.0)             return "Too Hot";
    return "Critically Hot";
}

} // namespace compost
