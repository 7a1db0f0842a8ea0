#pragma once

namespace compost {

// Climate sample at the pile, supplied by the caller on every update.
struct Weather {
    double temperature = 20.0;   // ambient, °C
    double rainfall    = 0.0;    // 0..1
    bool   rainExposed = false;  // open to the sky at the pile's position

    // Exposure alone damps evaporation; only actual rainfall adds water.
    bool rainingOnPile() const { return rainExposed && rainfall > 0.0; }
};

} // namespace compost
