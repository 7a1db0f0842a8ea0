#include "../engine/weather_driver.hpp"
#include <cassert>
#include <cmath>
#include <vector>

using namespace compost;

static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

int main() {
    // Daily cycle peaks mid-afternoon.
    assert(near(diurnalFactor(14.0), 1.0));
    assert(near(diurnalFactor(2.0), -1.0));
    assert(near(diurnalFactor(38.0), 1.0));
    assert(near(diurnalFactor(8.0), 0.0));

    {
        WeatherDriver w(1);
        Weather s = w.sample(14.0);
        assert(near(s.temperature, 16.0 + 6.0));
        assert(near(w.sample(2.0).temperature, 10.0));
        assert(s.rainExposed);
        assert(!s.rainingOnPile());
    }

    // Rain spells start, count down and stop, with a message each way.
    {
        std::vector<LogMsg> log;
        StepOpts opt;
        opt.spawn_random_events = false;
        opt.sink = [&log](const LogMsg& m){ log.push_back(m); };

        WeatherDriver w(1);
        w.startRain(3, 0.5, opt);
        assert(w.raining());
        assert(near(w.rainfall(), 0.5));
        assert(w.sample(0.0).rainingOnPile());

        w.advanceHour(opt);
        w.advanceHour(opt);
        assert(w.raining());
        assert(w.rainHoursLeft() == 1);
        w.advanceHour(opt);
        assert(!w.raining());
        assert(near(w.rainfall(), 0.0));

        assert(log.size() == 2);
        assert(log[0].kind == LogKind::Weather && log[1].kind == LogKind::Weather);

        // Sheltered piles see the rain fall but stay dry.
        w.setSheltered(true);
        w.startRain(2, 1.0, opt);
        Weather s = w.sample(0.0);
        assert(!s.rainExposed);
        assert(!s.rainingOnPile());
    }

    // Random rain only when events are enabled.
    {
        ClimateParams wet;
        wet.rainChancePerHour = 1.0;

        WeatherDriver quiet(2, wet);
        for (int h = 0; h < 50; ++h) quiet.advanceHour(quietOpts());
        assert(!quiet.raining());

        StepOpts opt = quietOpts();
        opt.spawn_random_events = true;
        WeatherDriver stormy(2, wet);
        stormy.advanceHour(opt);
        assert(stormy.raining());
        assert(stormy.rainHoursLeft() >= wet.minRainHours && stormy.rainHoursLeft() <= wet.maxRainHours);
        assert(stormy.rainfall() >= 0.2 && stormy.rainfall() <= 1.0);
    }

    // Same seed, same weather.
    {
        StepOpts opt = quietOpts();
        opt.spawn_random_events = true;
        WeatherDriver a(99), b(99);
        for (int h = 0; h < 500; ++h) {
            a.advanceHour(opt);
            b.advanceHour(opt);
            assert(a.raining() == b.raining());
            assert(a.rainfall() == b.rainfall());
        }
    }
    return 0;
}
