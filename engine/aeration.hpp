#pragma once
#include <compost/timing.hpp>

namespace compost {

// Oxygen availability in the pile, 0.0 (anaerobic) .. 1.0 (fully aerated).
// Settles over time, loses pore space when wet, recovers when turned.
class AerationModel {
public:
    static constexpr double kDefaultLevel      = 0.7;   // freshly loaded
    static constexpr double kCompletelyAnaerobic = 0.2;
    static constexpr double kAnaerobic         = 0.3;
    static constexpr double kOptimalMin        = 0.5;
    static constexpr double kOptimalMax        = 0.9;
    static constexpr double kOverAerated       = 0.95;

    static constexpr double kCompactionPerHour = 0.01;
    static constexpr double kTurnBoost         = 0.4;
    static constexpr double kMoistureFactor    = 0.5;
    static constexpr double kWetThreshold      = 0.6;

    AerationModel() = default;

    void reset();

    // Compaction and moisture loss, at most once per elapsed hour. The first
    // call on an unprimed model only stamps the clocks.
    void update(Hours now, double moistureLevel);

    void aerate(double amount);
    void turn(Hours now);
    void setLevel(double level);

    double decompositionModifier() const;
    const char* state() const;

    double level() const { return level_; }
    Hours  lastUpdateTime() const { return lastUpdateTime_; }
    Hours  lastTurnTime() const { return lastTurnTime_; }
    Hours  hoursSinceLastTurn(Hours now) const;

    void restore(double level, Hours lastUpdateTime, Hours lastTurnTime);
    void stamp(Hours now) { lastUpdateTime_ = now; lastTurnTime_ = now; }

    bool isOptimal() const     { return level_ >= kOptimalMin && level_ <= kOptimalMax; }
    bool isAnaerobic() const   { return level_ < kAnaerobic; }
    bool isOverAerated() const { return level_ > kOverAerated; }

    // Settling slows down the longer the pile sits unturned.
    static double compactionLoss(double hours, double hoursSinceTurn);
    static double moistureLoss(double moistureLevel);

private:
    double level_          = kDefaultLevel;
    Hours  lastUpdateTime_ = kNever;
    Hours  lastTurnTime_   = kNever;
};

} // namespace compost
