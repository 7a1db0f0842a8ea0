#include "pile.hpp"
#include <algorithm>
#include <cmath>

namespace compost {

const char* to_string(PilePhase p) {
    switch (p) {
        case PilePhase::Inactive: return "Inactive";
        case PilePhase::Active:   return "Active";
        case PilePhase::Finished: return "Finished";
    }
    return "Unknown";
}

double decompositionRate(const Modifiers& m, const Config& cfg) {
    const double baseRate = 1.0 / std::max(1, cfg.hoursToComplete);
    return baseRate * std::max(0.0, m.product());
}

CompostPile::CompostPile(const Config& cfg) : cfg_(&cfg) {}

// ---------- Materials ----------

void CompostPile::setMaterials(const MaterialCounts& m) {
    materials_.green = std::max(0, m.green);
    materials_.brown = std::max(0, m.brown);
    materials_.other = std::max(0, m.other);
}

void CompostPile::addMaterial(MaterialKind kind, int count, Hours now) {
    if (count <= 0) return;
    switch (kind) {
        case MaterialKind::Green: materials_.green += count; break;
        case MaterialKind::Brown: materials_.brown += count; break;
        case MaterialKind::Other: materials_.other += count; break;
    }
    start(now);
}

double CompostPile::fillRatio() const {
    if (cfg_->maxCapacity <= 0) return 0.0;
    return std::min(1.0, static_cast<double>(itemCount()) / cfg_->maxCapacity);
}

bool CompostPile::isFull() const {
    return itemCount() >= cfg_->maxCapacity;
}

int CompostPile::remainingCapacity() const {
    return std::max(0, cfg_->maxCapacity - itemCount());
}

// ---------- Lifecycle ----------

void CompostPile::start(Hours now) {
    if (isSet(startTime_) || materials_.empty()) return;

    startTime_      = now;
    lastUpdateTime_ = now;
    lastTurnTime_   = now;
    moisture_.stamp(now);
    aeration_.stamp(now);
    // Temperature primes itself from the first climate sample.
}

void CompostPile::update(Hours now, const Weather& weather, const StepOpts& opt) {
    if (phase() != PilePhase::Active || materials_.empty()) return;

    if (!isSet(lastUpdateTime_)) {
        lastUpdateTime_ = now;
        return;
    }
    const double hours = now - lastUpdateTime_;
    if (hours <= 0.0) return;

    // Evaporation uses the multiplier from the previous temperature update,
    // then moisture -> aeration -> temperature, in that order.
    const double evapMultiplier = temperature_.evaporationMultiplier();
    moisture_.updateEnvironmental(now, weather, evapMultiplier);
    aeration_.update(now, moisture_.level());

    TemperatureModel::Inputs in;
    in.activity   = activityLevel();
    in.moisture   = moisture_.level();
    in.aeration   = aeration_.level();
    in.cnModifier = cnModifier();
    in.pileSize   = fillRatio();
    temperature_.update(now, weather, in);

    progress_ += decompositionRate() * hours;
    lastUpdateTime_ = now;

    checkFinished(opt);
}

void CompostPile::checkFinished(const StepOpts& opt) {
    if (finished_) return;
    if (progress_ < 1.0 - kProgressEpsilon) return;

    progress_ = 1.0;
    finished_ = true;
    emit(opt, LogKind::Event, "[Compost] The pile has finished composting.");
}

void CompostPile::turn(Hours now, int speedupHours, const StepOpts& opt) {
    if (!isActive() || materials_.empty()) return;

    const int speedup = std::max(0, speedupHours);
    progress_ += speedup / static_cast<double>(std::max(1, cfg_->hoursToComplete));
    lastTurnTime_ = now;

    aeration_.turn(now);

    if (moisture_.isTooWet()) {
        moisture_.addDryMaterial(0.1);
    } else if (moisture_.level() > 0.5) {
        moisture_.addDryMaterial(0.05);
    }

    temperature_.applyTurningCooling();

    emit(opt, LogKind::Info, "[Compost] Pile turned (+" + std::to_string(speedup) + "h).");
    checkFinished(opt);
}

void CompostPile::turn(Hours now, const StepOpts& opt) {
    turn(now, cfg_->shovelSpeedupHours, opt);
}

bool CompostPile::canTurn(Hours now) const {
    if (!isActive() || materials_.empty()) return false;
    return now - lastTurnTime_ >= cfg_->turnCooldownHours;
}

double CompostPile::turnCooldownRemaining(Hours now) const {
    if (!isSet(lastTurnTime_)) return 0.0;
    return std::max(0.0, cfg_->turnCooldownHours - (now - lastTurnTime_));
}

void CompostPile::addWater(double amount) {
    if (!isActive()) return;
    moisture_.addWater(amount);
}

void CompostPile::addDryMaterial(double amount) {
    if (!isActive()) return;
    moisture_.addDryMaterial(amount);
}

int CompostPile::harvest(const StepOpts& opt) {
    const int yield = finished_ ? expectedYield() : 0;
    if (finished_) {
        emit(opt, LogKind::Event, "[Compost] Harvested " + std::to_string(yield) + " unit(s) of compost.");
    } else if (!materials_.empty()) {
        emit(opt, LogKind::Warning, "[Compost] Pile emptied before it finished; nothing gained.");
    }
    reset();
    return yield;
}

void CompostPile::reset() {
    materials_      = MaterialCounts{};
    startTime_      = kNever;
    lastUpdateTime_ = kNever;
    lastTurnTime_   = kNever;
    progress_       = 0.0;
    finished_       = false;
    moisture_.reset();
    aeration_.reset();
    temperature_.reset();
}

// ---------- Telemetry ----------

PilePhase CompostPile::phase() const {
    if (finished_) return PilePhase::Finished;
    if (isSet(startTime_)) return PilePhase::Active;
    return PilePhase::Inactive;
}

int CompostPile::progressPercent() const {
    return static_cast<int>(std::clamp(progress_ * 100.0, 0.0, 100.0));
}

int CompostPile::elapsedHours(Hours now) const {
    if (!isSet(startTime_)) return 0;
    return static_cast<int>(std::max(0.0, now - startTime_));
}

int CompostPile::remainingHours() const {
    if (materials_.empty() || finished_) return 0;

    const double rate = decompositionRate();
    if (rate <= 0.0) return kNeverHours;

    const double hours = (1.0 - progress_) / rate;
    return static_cast<int>(std::clamp(hours, 0.0, static_cast<double>(kNeverHours)));
}

int CompostPile::expectedYield() const {
    return static_cast<int>(std::floor(itemCount() * cfg_->outputPerItem));
}

Modifiers CompostPile::modifiers() const {
    Modifiers m;
    m.cn          = cnModifier();
    m.moisture    = moisture_.decompositionModifier();
    m.aeration    = aeration_.decompositionModifier();
    m.temperature = temperature_.decompositionModifier();
    return m;
}

double CompostPile::decompositionRate() const {
    return compost::decompositionRate(modifiers(), *cfg_);
}

double CompostPile::activityLevel() const {
    // Small piles lack the critical mass to heat up.
    const double size = fillRatio();
    if (size < 0.3) return size / 0.3;
    return 1.0;
}

double CompostPile::cnRatio() const {
    return compost::cnRatio(materials_, *cfg_);
}

double CompostPile::cnModifier() const {
    return compost::cnModifier(cnRatio(), *cfg_);
}

const char* CompostPile::cnRatioQualityText() const {
    return ratioQualityText(cnRatio(), *cfg_);
}

// ---------- Serialization ----------

PileState CompostPile::toState() const {
    PileState s;
    s.startTime             = startTime_;
    s.lastUpdateTime        = lastUpdateTime_;
    s.lastTurnTime          = lastTurnTime_;
    s.decompositionProgress = progress_;
    s.isFinished            = finished_;

    s.moistureLevel         = moisture_.level();
    s.moistureLastCheck     = moisture_.lastCheckTime();

    s.aerationLevel         = aeration_.level();
    s.aerationLastUpdate    = aeration_.lastUpdateTime();
    s.aerationLastTurn      = aeration_.lastTurnTime();

    s.internalTemperature   = temperature_.temperature();
    s.ambientTemperature    = temperature_.ambient();
    s.temperatureLastUpdate = temperature_.lastUpdateTime();
    return s;
}

// Non-finite fields fall back to the documented defaults.
static double finiteOr(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

void CompostPile::fromState(const PileState& s) {
    const PileState d;

    startTime_      = finiteOr(s.startTime, d.startTime);
    lastUpdateTime_ = finiteOr(s.lastUpdateTime, d.lastUpdateTime);
    lastTurnTime_   = finiteOr(s.lastTurnTime, d.lastTurnTime);
    progress_       = std::clamp(finiteOr(s.decompositionProgress, d.decompositionProgress), 0.0, 1.0);
    finished_       = s.isFinished;

    moisture_.restore(finiteOr(s.moistureLevel, d.moistureLevel),
                      finiteOr(s.moistureLastCheck, d.moistureLastCheck));
    aeration_.restore(finiteOr(s.aerationLevel, d.aerationLevel),
                      finiteOr(s.aerationLastUpdate, d.aerationLastUpdate),
                      finiteOr(s.aerationLastTurn, d.aerationLastTurn));
    temperature_.restore(finiteOr(s.internalTemperature, d.internalTemperature),
                         finiteOr(s.ambientTemperature, d.ambientTemperature),
                         finiteOr(s.temperatureLastUpdate, d.temperatureLastUpdate));
}

} // namespace compost
