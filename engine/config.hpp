#pragma once
#include "log.hpp"
#include <string>

namespace compost {

// Tunables shared by every pile built from this config. Passed by reference
// into CompostPile; piles never copy or mutate it.
struct Config {
    // Capacity
    int    maxCapacity        = 64;
    int    bulkAddAmount      = 4;     // items added per bulk deposit (CLI)

    // Timing (hours)
    int    hoursToComplete    = 240;   // at modifier product 1.0
    int    shovelSpeedupHours = 5;
    int    turnCooldownHours  = 5;

    // Carbon:nitrogen
    double greenCNRatio       = 15.0;
    double brownCNRatio       = 60.0;
    double optimalCNRatio     = 27.5;
    double optimalRatioBonus  = 1.5;
    double poorRatioPenalty   = 0.5;

    // Output
    double outputPerItem      = 0.5;

    // Manual moisture control
    double waterAmount        = 0.2;
    double dryMaterialAmount  = 0.15;
};

// Clamp nonsensical values to usable minimums (no division by zero, no
// negative ratios). Returns true if anything changed.
bool sanitizeConfig(Config& cfg);

// Read "key=value" lines ('#' starts a comment) over the current contents of
// cfg. Unknown keys are reported and skipped; a malformed value fails the load
// and leaves cfg untouched.
bool loadConfig(Config& cfg, const std::string& path, const StepOpts& opt = StepOpts{});
bool saveConfig(const Config& cfg, const std::string& path);

} // namespace compost
