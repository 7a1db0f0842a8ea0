#include "../engine/ratio.hpp"
#include <cassert>
#include <cmath>
#include <cstring>

using namespace compost;

static bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

static MaterialCounts mix(int green, int brown, int other = 0) {
    MaterialCounts m;
    m.green = green;
    m.brown = brown;
    m.other = other;
    return m;
}

int main() {
    const Config cfg;

    // Empty or unclassified contents have no ratio and a neutral modifier.
    assert(near(cnRatio(mix(0, 0), cfg), 0.0));
    assert(near(cnRatio(mix(0, 0, 5), cfg), 0.0));
    assert(near(cnModifier(0.0, cfg), 1.0));
    assert(std::strcmp(ratioQualityText(0.0, cfg), "") == 0);
    assert(near(cnModifier(150.0, cfg), 1.0));

    // Single-kind piles take that kind's ratio.
    assert(near(cnRatio(mix(4, 0), cfg), 15.0));
    assert(near(cnRatio(mix(0, 4), cfg), 60.0));

    // Weighted mixes.
    assert(near(cnRatio(mix(3, 1), cfg), 26.25));
    assert(near(cnRatio(mix(1, 1), cfg), 37.5));
    assert(near(cnRatio(mix(1, 3), cfg), 48.75));

    struct Case { MaterialCounts m; double mod; const char* text; };
    const Case cases[] = {
        {mix(3, 1), 1.5, "(Excellent!)"},
        {mix(1, 1), 1.2, "(Good)"},
        {mix(4, 0), 1.0, "(Ok)"},
        {mix(1, 3), 0.8, "(Poor)"},
        {mix(0, 4), 0.5, "(Very Poor)"},
    };
    for (const Case& c : cases) {
        const double r = cnRatio(c.m, cfg);
        assert(near(cnModifier(r, cfg), c.mod));
        assert(std::strcmp(ratioQualityText(r, cfg), c.text) == 0);
    }

    // Tunables flow through.
    Config custom;
    custom.optimalRatioBonus = 2.0;
    custom.poorRatioPenalty = 0.25;
    assert(near(cnModifier(27.5, custom), 2.0));
    assert(near(cnModifier(90.0, custom), 0.25));

    MaterialCounts m = mix(2, 3, 1);
    assert(m.total() == 6);
    assert(!m.empty());
    return 0;
}
