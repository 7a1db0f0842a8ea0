#include "../engine/aeration.hpp"
#include <cassert>
#include <cmath>
#include <cstring>

using namespace compost;

static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

int main() {
    // First update primes the clock without applying loss.
    {
        AerationModel a;
        assert(near(a.level(), 0.7));
        a.update(5.0, 0.5);
        assert(near(a.level(), 0.7));
        assert(near(a.lastUpdateTime(), 5.0));
        assert(near(a.lastTurnTime(), 5.0));

        a.update(5.5, 0.5);
        assert(near(a.level(), 0.7));

        // Within the first day after a turn, compaction runs at 1.5x.
        a.update(6.0, 0.5);
        assert(near(a.level(), 0.7 - 0.015));
    }

    // Compaction tiers and the wet-pile penalty.
    {
        assert(near(AerationModel::compactionLoss(10.0, 0.0), 0.15));
        assert(near(AerationModel::compactionLoss(10.0, 30.0), 0.10));
        assert(near(AerationModel::compactionLoss(10.0, 100.0), 0.05));

        assert(near(AerationModel::moistureLoss(0.6), 0.0));
        assert(near(AerationModel::moistureLoss(0.8), 0.001));
    }

    // A soggy, long-unturned pile compacts slowly but steadily.
    {
        AerationModel a;
        a.restore(0.7, 100.0, 0.0);
        a.update(110.0, 0.8);
        assert(near(a.level(), 0.7 - 0.05 - 0.001));
    }

    // Turning fluffs the pile and records the time.
    {
        AerationModel a;
        a.setLevel(0.3);
        a.turn(20.0);
        assert(near(a.level(), 0.7));
        assert(near(a.lastTurnTime(), 20.0));
        assert(near(a.hoursSinceLastTurn(26.0), 6.0));

        a.setLevel(0.8);
        a.turn(21.0);
        assert(near(a.level(), 1.0));
        assert(a.isOverAerated());
        assert(std::strcmp(a.state(), "Over Aerated") == 0);
        assert(near(a.decompositionModifier(), 0.9));
    }

    // Never turned: no time since last turn.
    {
        AerationModel a;
        assert(near(a.hoursSinceLastTurn(50.0), 0.0));
        a.aerate(-1.0);
        assert(near(a.level(), 0.7));
    }

    // Bands.
    {
        struct Band { double level; double mod; const char* state; };
        const Band bands[] = {
            {0.10, 0.1, "Completely Anaerobic"},
            {0.25, 0.3, "Anaerobic"},
            {0.40, 0.7, "Low Oxygen"},
            {0.70, 1.0, "Well Aerated"},
            {0.92, 0.9, "Highly Aerated"},
            {0.97, 0.9, "Over Aerated"},
        };
        AerationModel a;
        for (const Band& b : bands) {
            a.setLevel(b.level);
            assert(near(a.decompositionModifier(), b.mod));
            assert(std::strcmp(a.state(), b.state) == 0);
        }
        a.setLevel(0.1);
        assert(a.isAnaerobic());
    }
    return 0;
}
