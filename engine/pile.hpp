#pragma once
#include "aeration.hpp"
#include "config.hpp"
#include "log.hpp"
#include "moisture.hpp"
#include "ratio.hpp"
#include "temperature.hpp"
#include "weather.hpp"
#include <compost/timing.hpp>

namespace compost {

enum class PilePhase { Inactive, Active, Finished };

const char* to_string(PilePhase p);

// Returned by remainingHours() when the pile is not decomposing at all.
inline constexpr int kNeverHours = 9999;

// Absorbs summation error when progress is integrated hour by hour.
inline constexpr double kProgressEpsilon = 1e-9;

// Flat record of everything a pile persists. Defaults are the documented
// defaults of each model, so a record with missing fields is still valid.
struct PileState {
    Hours  startTime             = kNever;
    Hours  lastUpdateTime        = kNever;
    Hours  lastTurnTime          = kNever;
    double decompositionProgress = 0.0;
    bool   isFinished            = false;

    double moistureLevel         = MoistureModel::kDefaultLevel;
    Hours  moistureLastCheck     = kNever;

    double aerationLevel         = AerationModel::kDefaultLevel;
    Hours  aerationLastUpdate    = kNever;
    Hours  aerationLastTurn      = kNever;

    double internalTemperature   = TemperatureModel::kDefaultAmbient;
    double ambientTemperature    = TemperatureModel::kDefaultAmbient;
    Hours  temperatureLastUpdate = kNever;
};

// Per-factor decomposition multipliers; 1.0 is neutral.
struct Modifiers {
    double cn          = 1.0;
    double moisture    = 1.0;
    double aeration    = 1.0;
    double temperature = 1.0;

    double product() const { return cn * moisture * aeration * temperature; }
};

// Progress per hour. A product of 1.0 completes in cfg.hoursToComplete hours.
double decompositionRate(const Modifiers& m, const Config& cfg);

// One compost pile: moisture, aeration and temperature models plus the C:N
// balance of its contents, integrated into decomposition progress.
//
// Not thread-safe; callers serialize access per pile. The turn cooldown is a
// caller policy: check canTurn() before turn().
class CompostPile {
public:
    explicit CompostPile(const Config& cfg);
    CompostPile(Config&&) = delete; // the pile keeps a pointer to cfg

    // ---------- Materials (snapshot of the inventory collaborator) ----------
    void setMaterials(const MaterialCounts& m);
    void addMaterial(MaterialKind kind, int count, Hours now);
    const MaterialCounts& materials() const { return materials_; }

    int    itemCount() const { return materials_.total(); }
    bool   isEmpty() const { return materials_.empty(); }
    double fillRatio() const;
    bool   isFull() const;
    int    remainingCapacity() const;

    // ---------- Lifecycle ----------
    void start(Hours now);
    void update(Hours now, const Weather& weather, const StepOpts& opt = StepOpts{});

    void   turn(Hours now, int speedupHours, const StepOpts& opt = StepOpts{});
    void   turn(Hours now, const StepOpts& opt = StepOpts{});
    bool   canTurn(Hours now) const;
    double turnCooldownRemaining(Hours now) const;

    void addWater(double amount);
    void addWater() { addWater(cfg_->waterAmount); }
    void addDryMaterial(double amount);
    void addDryMaterial() { addDryMaterial(cfg_->dryMaterialAmount); }

    // Returns finished output units (0 if the pile was not finished) and
    // empties the pile.
    int  harvest(const StepOpts& opt = StepOpts{});
    void reset();

    // ---------- Telemetry ----------
    PilePhase phase() const;
    bool   isActive() const { return phase() == PilePhase::Active; }
    bool   isFinished() const { return finished_; }
    double progress() const { return progress_; }
    int    progressPercent() const;
    int    elapsedHours(Hours now) const;
    int    remainingHours() const;
    int    expectedYield() const;

    Modifiers modifiers() const;
    double decompositionRate() const;
    double activityLevel() const;

    double cnRatio() const;
    double cnModifier() const;
    const char* cnRatioQualityText() const;
    double speedMultiplier() const { return cnModifier(); }

    const MoistureModel&    moisture() const { return moisture_; }
    const AerationModel&    aeration() const { return aeration_; }
    const TemperatureModel& temperature() const { return temperature_; }

    double moistureLevel() const { return moisture_.level(); }
    double aerationLevel() const { return aeration_.level(); }
    double internalTemperature() const { return temperature_.temperature(); }

    Hours startTime() const { return startTime_; }
    Hours lastUpdateTime() const { return lastUpdateTime_; }
    Hours lastTurnTime() const { return lastTurnTime_; }

    // ---------- Serialization ----------
    PileState toState() const;
    void fromState(const PileState& s);

    const Config& config() const { return *cfg_; }

private:
    const Config* cfg_;

    MaterialCounts   materials_;
    MoistureModel    moisture_;
    AerationModel    aeration_;
    TemperatureModel temperature_;

    Hours  startTime_      = kNever;
    Hours  lastUpdateTime_ = kNever;
    Hours  lastTurnTime_   = kNever;
    double progress_       = 0.0;
    bool   finished_       = false;

    void checkFinished(const StepOpts& opt);
};

} // namespace compost
