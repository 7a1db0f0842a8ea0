#include "aeration.hpp"
#include <algorithm>

namespace compost {

static double clamp01(double x) { return std::max(0.0, std::min(1.0, x)); }

void AerationModel::reset() {
    level_ = kDefaultLevel;
    lastUpdateTime_ = kNever;
    lastTurnTime_ = kNever;
}

void AerationModel::restore(double level, Hours lastUpdateTime, Hours lastTurnTime) {
    level_ = clamp01(level);
    lastUpdateTime_ = lastUpdateTime;
    lastTurnTime_ = lastTurnTime;
}

Hours AerationModel::hoursSinceLastTurn(Hours now) const {
    if (!isSet(lastTurnTime_)) return 0.0;
    return std::max(0.0, now - lastTurnTime_);
}

double AerationModel::compactionLoss(double hours, double hoursSinceTurn) {
    if (hoursSinceTurn < 24.0) return kCompactionPerHour * hours * 1.5; // first day: rapid settling
    if (hoursSinceTurn < 72.0) return kCompactionPerHour * hours;
    return kCompactionPerHour * hours * 0.5;                            // already compacted
}

double AerationModel::moistureLoss(double moistureLevel) {
    if (moistureLevel <= kWetThreshold) return 0.0;
    return (moistureLevel - kWetThreshold) * kMoistureFactor * 0.01;
}

void AerationModel::update(Hours now, double moistureLevel) {
    if (!isSet(lastUpdateTime_)) {
        lastUpdateTime_ = now;
        if (!isSet(lastTurnTime_)) lastTurnTime_ = now;
        return;
    }

    const double hours = now - lastUpdateTime_;
    if (hours < kHourGate) return;
    lastUpdateTime_ = now;

    const double loss = compactionLoss(hours, hoursSinceLastTurn(now)) + moistureLoss(moistureLevel);
    level_ = clamp01(level_ - loss);
}

void AerationModel::aerate(double amount) {
    if (amount <= 0.0) return;
    level_ = clamp01(level_ + amount);
}

void AerationModel::turn(Hours now) {
    aerate(kTurnBoost);
    lastTurnTime_ = now;
}

void AerationModel::setLevel(double level) {
    level_ = clamp01(level);
}

double AerationModel::decompositionModifier() const {
    if (level_ < kCompletelyAnaerobic) return 0.1; // may putrefy instead
    if (level_ < kAnaerobic)           return 0.3;
    if (level_ < kOptimalMin)          return 0.7;
    if (level_ <= kOptimalMax)         return 1.0;
    return 0.9;                                    // dries out, loses heat
}

const char* AerationModel::state() const {
    if (level_ < kCompletelyAnaerobic) return "Completely Anaerobic";
    if (level_ < kAnaerobic)           return "Anaerobic";
    if (level_ < kOptimalMin)          return "Low Oxygen";
    if (level_ <= kOptimalMax)         return "Well Aerated";
    if (level_ <= kOverAerated)        return "Highly Aerated";
    return "Over Aerated";
}

} // namespace compost
