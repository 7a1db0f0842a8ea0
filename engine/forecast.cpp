#include "forecast.hpp"

namespace compost {

PileForecast runForecast(const CompostPile& pile, Hours now, WeatherDriver weather, int hours) {
    PileForecast f;
    if (hours <= 0) return f;

    const StepOpts quiet = quietOpts();
    CompostPile sim = pile;

    f.hour.reserve(hours);
    f.progress.reserve(hours);
    f.moisture.reserve(hours);
    f.aeration.reserve(hours);
    f.temperature.reserve(hours);
    f.ambient.reserve(hours);
    f.rate.reserve(hours);

    for (int h = 1; h <= hours; ++h) {
        const Hours t = now + h;
        weather.advanceHour(quiet);
        const Weather w = weather.sample(t);
        sim.update(t, w, quiet);

        f.hour.push_back(h);
        f.progress.push_back(sim.progress());
        f.moisture.push_back(sim.moistureLevel());
        f.aeration.push_back(sim.aerationLevel());
        f.temperature.push_back(sim.internalTemperature());
        f.ambient.push_back(w.temperature);
        f.rate.push_back(sim.isActive() ? sim.decompositionRate() : 0.0);

        if (f.finishHour < 0 && sim.isFinished()) f.finishHour = h;
    }
    return f;
}

} // namespace compost
