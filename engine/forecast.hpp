#pragma once
#include "pile.hpp"
#include "weather_driver.hpp"
#include <compost/timing.hpp>
#include <vector>

namespace compost {

struct PileForecast {
    std::vector<int>    hour;          // hours after `now`
    std::vector<double> progress;      // 0..1
    std::vector<double> moisture;      // 0..1
    std::vector<double> aeration;      // 0..1
    std::vector<double> temperature;   // °C internal
    std::vector<double> ambient;       // °C
    std::vector<double> rate;          // progress per hour
    int finishHour = -1;               // first step the pile finished, -1 if never
};

// Run N silent hours on copies of the pile and weather; random rain is
// disabled and nothing is logged. The arguments are never mutated.
PileForecast runForecast(const CompostPile& pile, Hours now, WeatherDriver weather, int hours);

} // namespace compost
