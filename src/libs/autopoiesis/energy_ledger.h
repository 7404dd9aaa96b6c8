#ifndef AUTOPOIESIS_ENERGY_LEDGER_H
#define AUTOPOIESIS_ENERGY_LEDGER_H

#include "simulation_config.h"

namespace autopoiesis {

// Owns the agent's energy budget. Every cost and gain goes through here.
// Energy may drop to or below zero; that is the death signal, not an error.
class EnergyLedger {
public:
    explicit EnergyLedger(const EnergyConfig& config);

    void deduct(float cost);
    // Clamped to max_energy.
    void add(float gain);
    void ambient_decay();

    bool is_depleted() const { return energy_ <= 0.0f; }
    // energy / max_energy, floored at zero so observations stay in [0, 1].
    float normalized() const;

    float get_energy() const { return energy_; }
    float get_max_energy() const { return config_.max_energy; }
    const EnergyConfig& get_config() const { return config_; }

    // Costs charged through deduct() since the last begin_tick().
    void begin_tick() { charged_this_tick_ = 0.0f; }
    float get_charged_this_tick() const { return charged_this_tick_; }

private:
    EnergyConfig config_;
    float energy_;
    float charged_this_tick_;
};

} // namespace autopoiesis

#endif // AUTOPOIESIS_ENERGY_LEDGER_H
