#include "weather_driver.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace compost {

double diurnalFactor(Hours now) {
    const double hourOfDay = std::fmod(std::max(0.0, now), static_cast<double>(DAY_HOURS));
    const double theta = ((hourOfDay - 14.0) / DAY_HOURS) * 2.0 * PI;
    return std::cos(theta);
}

WeatherDriver::WeatherDriver(uint64_t seed, ClimateParams params)
    : params_(params), rng_(seed) {}

Weather WeatherDriver::sample(Hours now) const {
    Weather w;
    w.temperature = params_.meanTemperature + params_.diurnalSwing * diurnalFactor(now);
    w.rainfall    = rainfall();
    w.rainExposed = !params_.sheltered;
    return w;
}

void WeatherDriver::startRain(int hours, double rainfall, const StepOpts& opt) {
    if (raining()) return;
    rainHours_ = std::max(1, hours);
    rainfall_  = std::clamp(rainfall, 0.0, 1.0);

    std::ostringstream msg;
    msg << "[Weather] Rain sets in (" << static_cast<int>(rainfall_ * 100.0) << "% intensity).";
    emit(opt, LogKind::Weather, msg.str());
}

void WeatherDriver::clearRain(const StepOpts& opt) {
    if (!raining()) return;
    rainHours_ = 0;
    rainfall_  = 0.0;
    emit(opt, LogKind::Weather, "[Weather] The rain has stopped.");
}

void WeatherDriver::advanceHour(const StepOpts& opt) {
    if (raining()) {
        if (rainHours_ == 1) clearRain(opt);
        else rainHours_ -= 1;
        return;
    }

    if (!opt.spawn_random_events) return;
    if (rng_.chance(params_.rainChancePerHour)) {
        const int hrs = rng_.between(params_.minRainHours, std::max(params_.minRainHours, params_.maxRainHours));
        startRain(hrs, rng_.between(0.2, 1.0), opt);
    }
}

} // namespace compost
