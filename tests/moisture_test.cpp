#include "../engine/moisture.hpp"
#include <cassert>
#include <cmath>
#include <cstring>

using namespace compost;

static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

static Weather dry(double temp) {
    Weather w;
    w.temperature = temp;
    return w;
}

int main() {
    // Defaults
    {
        MoistureModel m;
        assert(near(m.level(), 0.5));
        assert(m.isOptimal());
        assert(std::strcmp(m.state(), "Optimal") == 0);
        assert(near(m.decompositionModifier(), 1.0));
        assert(!isSet(m.lastCheckTime()));
    }

    // Hourly gate: nothing happens until a full hour has elapsed.
    {
        MoistureModel m;
        m.stamp(10.0);
        m.updateEnvironmental(10.5, dry(20.0));
        assert(near(m.level(), 0.5));
        assert(near(m.lastCheckTime(), 10.0));

        m.updateEnvironmental(11.0, dry(20.0));
        assert(near(m.level(), 0.5 - (0.02 + 20.0 * 0.001)));
        assert(near(m.lastCheckTime(), 11.0));

        const double after = m.level();
        m.updateEnvironmental(11.0, dry(20.0));
        assert(m.level() == after);
    }

    // Rain on an exposed pile adds water and damps evaporation.
    {
        MoistureModel m;
        m.stamp(0.0);
        Weather w = dry(20.0);
        w.rainfall = 1.0;
        w.rainExposed = true;
        m.updateEnvironmental(1.0, w);
        assert(near(m.level(), 0.5 + 0.1 - 0.04 * 0.1));
    }

    // Sheltered pile ignores rainfall.
    {
        MoistureModel m;
        m.stamp(0.0);
        Weather w = dry(20.0);
        w.rainfall = 1.0;
        w.rainExposed = false;
        m.updateEnvironmental(1.0, w);
        assert(near(m.level(), 0.46));
    }

    // Open to the sky with no rain falling: no gain, but evaporation stays damped.
    {
        MoistureModel m;
        m.stamp(0.0);
        Weather w = dry(20.0);
        w.rainExposed = true;
        assert(!w.rainingOnPile());
        m.updateEnvironmental(1.0, w);
        assert(near(m.level(), 0.5 - 0.04 * 0.1));
    }

    // Sub-zero temperatures only use the base evaporation; hot piles dry faster.
    {
        assert(near(MoistureModel::evaporationRate(-5.0, false, 1.0), 0.02));
        assert(near(MoistureModel::evaporationRate(20.0, false, 2.0), 0.08));
        assert(near(MoistureModel::evaporationRate(20.0, true, 1.0), 0.004));

        MoistureModel m;
        m.stamp(0.0);
        m.updateEnvironmental(1.0, dry(20.0), 2.0);
        assert(near(m.level(), 0.42));
    }

    // Manual adjustments clamp and ignore negative amounts.
    {
        MoistureModel m;
        m.addWater(-0.3);
        m.addDryMaterial(-0.3);
        assert(near(m.level(), 0.5));

        m.addWater(0.9);
        assert(near(m.level(), 1.0));
        assert(m.isWaterlogged());
        assert(std::strcmp(m.state(), "Waterlogged") == 0);
        assert(near(m.decompositionModifier(), 0.2));

        m.addDryMaterial(2.0);
        assert(near(m.level(), 0.0));
        assert(m.isBoneDry());
    }

    // Modifier and state bands.
    {
        struct Band { double level; double mod; const char* state; };
        const Band bands[] = {
            {0.10, 0.1, "Bone Dry"},
            {0.25, 0.5, "Too Dry"},
            {0.35, 0.8, "Slightly Dry"},
            {0.50, 1.0, "Optimal"},
            {0.65, 0.8, "Slightly Wet"},
            {0.80, 0.4, "Too Wet"},
            {0.90, 0.2, "Waterlogged"},
        };
        MoistureModel m;
        for (const Band& b : bands) {
            m.setLevel(b.level);
            assert(near(m.decompositionModifier(), b.mod));
            assert(std::strcmp(m.state(), b.state) == 0);
        }
    }

    // Reset restores defaults.
    {
        MoistureModel m;
        m.restore(0.9, 42.0);
        m.reset();
        assert(near(m.level(), 0.5));
        assert(!isSet(m.lastCheckTime()));
    }
    return 0;
}
