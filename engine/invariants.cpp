#include "invariants.hpp"
#include <cmath>

namespace compost {

bool checkInvariants(const CompostPile& pile, std::string* why) {
    auto finite = [](double v){ return std::isfinite(v); };
    auto unit   = [&](double v){ return finite(v) && v >= -1e-9 && v <= 1.0 + 1e-9; };
    auto bad = [&](const char* msg){
        if (why) *why = msg;
        return false;
    };

    const MaterialCounts& m = pile.materials();
    if (m.green < 0 || m.brown < 0 || m.other < 0) return bad("material counts >= 0");

    if (!unit(pile.progress()))      return bad("progress in [0,1]");
    if (!unit(pile.moistureLevel())) return bad("moisture in [0,1]");
    if (!unit(pile.aerationLevel())) return bad("aeration in [0,1]");

    const double temp = pile.internalTemperature();
    if (!finite(temp) || temp > TemperatureModel::kMaxTemperature + 1e-9)
        return bad("internal temperature finite & <= max");

    if (pile.isFinished() && pile.progress() < 1.0 - kProgressEpsilon)
        return bad("finished pile has full progress");
    if (!pile.isFinished() && pile.progress() >= 1.0)
        return bad("full progress marks the pile finished");

    const Hours start = pile.startTime();
    if (isSet(start)) {
        if (isSet(pile.lastUpdateTime()) && pile.lastUpdateTime() < start)
            return bad("lastUpdateTime >= startTime");
        if (isSet(pile.lastTurnTime()) && pile.lastTurnTime() < start)
            return bad("lastTurnTime >= startTime");
    } else if (pile.progress() > 0.0) {
        return bad("progress only after start");
    }

    return true;
}

} // namespace compost
