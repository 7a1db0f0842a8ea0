#include "../engine/pile.hpp"
#include "../engine/state_hash.hpp"
#include "../engine/weather_driver.hpp"
#include <cassert>

using namespace compost;

static uint64_t run(uint64_t seed) {
    Config cfg;
    CompostPile pile(cfg);
    WeatherDriver weather(seed);
    StepOpts opt = quietOpts();
    opt.spawn_random_events = true; // rain on, but silent

    pile.addMaterial(MaterialKind::Green, 12, 0.0);
    pile.addMaterial(MaterialKind::Brown, 6, 0.0);
    for (int h = 1; h <= 2'000; ++h) {
        weather.advanceHour(opt);
        pile.update(h, weather.sample(h), opt);
        if (h % 48 == 0 && pile.canTurn(h)) pile.turn(h, opt);
    }
    return det::checksum(pile);
}

int main() {
    assert(run(12345) == run(12345));
    assert(run(777) == run(777));
    return 0;
}
