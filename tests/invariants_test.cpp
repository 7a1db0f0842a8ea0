#include "../engine/invariants.hpp"
#include "../engine/weather_driver.hpp"
#include <cassert>
#include <limits>
#include <string>

using namespace compost;

int main() {
    const Config cfg;
    std::string why;

    {
        CompostPile p(cfg);
        assert(checkInvariants(p, &why));

        WeatherDriver weather(3);
        p.addMaterial(MaterialKind::Green, 10, 0.0);
        for (int h = 1; h <= 100; ++h) {
            weather.advanceHour(quietOpts());
            p.update(h, weather.sample(h), quietOpts());
            assert(checkInvariants(p, &why));
        }
    }

    auto broken = [&](PileState s) {
        CompostPile p(cfg);
        p.addMaterial(MaterialKind::Green, 4, 0.0);
        p.fromState(s);
        why.clear();
        const bool ok = checkInvariants(p, &why);
        assert(ok || !why.empty());
        return !ok;
    };

    PileState s;
    s.startTime = 0.0;
    s.lastUpdateTime = 1.0;

    PileState finishedEarly = s;
    finishedEarly.isFinished = true;
    finishedEarly.decompositionProgress = 0.5;
    assert(broken(finishedEarly));

    PileState unflagged = s;
    unflagged.decompositionProgress = 1.0;
    assert(broken(unflagged));

    PileState backwards = s;
    backwards.startTime = 10.0;
    backwards.lastUpdateTime = 4.0;
    assert(broken(backwards));

    PileState notStarted;
    notStarted.decompositionProgress = 0.2;
    assert(broken(notStarted));

    // Restoring drops non-finite values, so they never reach the pile.
    PileState hot = s;
    hot.internalTemperature = std::numeric_limits<double>::quiet_NaN();
    assert(!broken(hot));

    assert(!broken(s));

    // Without a reason buffer the check still works.
    CompostPile p(cfg);
    assert(checkInvariants(p));
    return 0;
}
