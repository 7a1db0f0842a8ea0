#pragma once
#include "log.hpp"
#include "rng.hpp"
#include "weather.hpp"
#include <compost/timing.hpp>
#include <cstdint>

namespace compost {

constexpr int    DAY_HOURS = 24;
constexpr double PI        = 3.14159265358979323846;

struct ClimateParams {
    double meanTemperature   = 16.0;  // °C
    double diurnalSwing      = 6.0;   // ± °C around the mean
    double rainChancePerHour = 0.03;
    int    minRainHours      = 2;
    int    maxRainHours      = 12;
    bool   sheltered         = false; // pile under a roof never gets rained on
};

// Seeded demo climate: daily temperature cycle plus random rain spells.
// Stands in for the game world when driving a pile from the CLI or tests.
class WeatherDriver {
public:
    explicit WeatherDriver(uint64_t seed = 42u, ClimateParams params = ClimateParams{});

    // Climate at the pile for the given clock reading.
    Weather sample(Hours now) const;

    // Roll for new rain and count down the current spell. Call once per hour.
    void advanceHour(const StepOpts& opt);

    void startRain(int hours, double rainfall, const StepOpts& opt);
    void clearRain(const StepOpts& opt);

    bool   raining() const { return rainHours_ > 0; }
    int    rainHoursLeft() const { return rainHours_; }
    double rainfall() const { return raining() ? rainfall_ : 0.0; }

    const ClimateParams& params() const { return params_; }
    void setSheltered(bool on) { params_.sheltered = on; }

private:
    ClimateParams params_;
    Rng    rng_;
    int    rainHours_ = 0;
    double rainfall_  = 0.0;
};

// Cosine daily cycle: +1 at mid-afternoon (14:00), -1 twelve hours later.
double diurnalFactor(Hours now);

} // namespace compost
