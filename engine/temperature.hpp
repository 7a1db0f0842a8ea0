#pragma once
#include "weather.hpp"
#include <compost/timing.hpp>

namespace compost {

// Internal pile temperature (°C), driven by microbial heat and lost to the
// ambient air. Feeds evaporation back into MoistureModel.
class TemperatureModel {
public:
    // ---------- Tuning constants (°C, °C/hour) ----------
    static constexpr double kDefaultAmbient      = 20.0; // before the first sample
    static constexpr double kThermophilicMin     = 40.0;
    static constexpr double kThermophilicMax     = 65.0;
    static constexpr double kTooCold             = 20.0;
    static constexpr double kTooHot              = 65.0;
    static constexpr double kMaxTemperature      = 80.0;
    static constexpr double kBelowAmbientMargin  = 5.0;

    static constexpr double kBaseHeatGeneration  = 2.0;
    static constexpr double kMaxHeatGeneration   = 10.0;
    static constexpr double kHeatLossCoefficient = 0.5;
    static constexpr double kEvaporativeCooling  = 1.5;
    static constexpr double kTurningHeatRelease  = 0.4;  // fraction above ambient

    struct Inputs {
        double activity   = 1.0;  // 0..1, small piles are less active
        double moisture   = 0.5;
        double aeration   = 0.7;
        double cnModifier = 1.0;
        double pileSize   = 0.0;  // fill ratio 0..1
    };

    TemperatureModel() = default;

    // Internal temperature returns to the last known ambient.
    void reset();

    // At most once per elapsed hour. The first call on an unprimed model
    // samples ambient, sets the pile to it and returns.
    void update(Hours now, const Weather& weather, const Inputs& in);

    void applyTurningCooling();
    void setTemperature(double celsius);

    double decompositionModifier() const;
    double evaporationMultiplier() const;
    const char* state() const;

    double temperature() const { return internal_; }
    double ambient() const { return ambient_; }
    double aboveAmbient() const;
    Hours  lastUpdateTime() const { return lastUpdateTime_; }

    void restore(double internal, double ambient, Hours lastUpdateTime);

    bool isThermophilic() const { return internal_ >= kThermophilicMin && internal_ <= kThermophilicMax; }
    bool isTooCold() const      { return internal_ < kTooCold; }
    bool isTooHot() const       { return internal_ > kTooHot; }

    static double heatGeneration(const Inputs& in);
    double heatLoss(double moisture, double pileSize) const;

private:
    double internal_       = kDefaultAmbient;
    double ambient_        = kDefaultAmbient;
    Hours  lastUpdateTime_ = kNever;
};

} // namespace compost
