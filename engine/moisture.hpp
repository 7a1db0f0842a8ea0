#pragma once
#include "weather.hpp"
#include <compost/timing.hpp>

namespace compost {

// Wetness of the pile, 0.0 (bone dry) .. 1.0 (waterlogged).
class MoistureModel {
public:
    // ---------- Tuning constants ----------
    static constexpr double kDefaultLevel        = 0.5;   // optimal midpoint
    static constexpr double kBoneDry             = 0.2;
    static constexpr double kTooDry              = 0.3;
    static constexpr double kOptimalMin          = 0.4;
    static constexpr double kOptimalMax          = 0.6;
    static constexpr double kTooWet              = 0.7;
    static constexpr double kWaterlogged         = 0.85;

    static constexpr double kBaseEvaporation     = 0.02;  // per update
    static constexpr double kTempEvaporation     = 0.001; // per °C above zero
    static constexpr double kMaxRainGain         = 0.1;   // at rainfall 1.0
    static constexpr double kRainEvapReduction   = 0.1;

    MoistureModel() = default;

    void reset();

    // Rain gain and evaporation, at most once per elapsed hour.
    // evapMultiplier comes from the pile temperature (hot piles dry faster).
    void updateEnvironmental(Hours now, const Weather& weather, double evapMultiplier = 1.0);

    void addWater(double amount);
    void addDryMaterial(double amount);
    void setLevel(double level);

    double decompositionModifier() const;
    const char* state() const;

    double level() const { return level_; }
    Hours  lastCheckTime() const { return lastCheckTime_; }

    // Restore persisted fields; the level is clamped.
    void restore(double level, Hours lastCheckTime);
    void stamp(Hours now) { lastCheckTime_ = now; }

    bool isOptimal() const     { return level_ >= kOptimalMin && level_ <= kOptimalMax; }
    bool isTooDry() const      { return level_ < kTooDry; }
    bool isTooWet() const      { return level_ > kTooWet; }
    bool isBoneDry() const     { return level_ < kBoneDry; }
    bool isWaterlogged() const { return level_ > kWaterlogged; }

    static double evaporationRate(double temperature, bool raining, double evapMultiplier);

private:
    double level_         = kDefaultLevel;
    Hours  lastCheckTime_ = kNever;
};

} // namespace compost
