#pragma once
#include "config.hpp"

namespace compost {

enum class MaterialKind { Green, Brown, Other };

// Aggregate item counts, as reported by whatever inventory holds the pile.
struct MaterialCounts {
    int green = 0;   // nitrogen-rich
    int brown = 0;   // carbon-rich
    int other = 0;   // compostable but neutral for C:N

    int total() const { return green + brown + other; }
    bool empty() const { return total() <= 0; }
};

// Weighted C:N ratio of the pile; 0 when there is neither green nor brown.
double cnRatio(const MaterialCounts& m, const Config& cfg);

// Decomposition speed multiplier for a ratio. Invalid ratios (<= 0 or > 100)
// are neutral.
double cnModifier(double ratio, const Config& cfg);

// "(Excellent!)" .. "(Very Poor)", or "" for an invalid ratio.
const char* ratioQualityText(double ratio, const Config& cfg);

} // namespace compost
