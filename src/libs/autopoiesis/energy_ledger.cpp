#include "energy_ledger.h"
#include <algorithm>

namespace autopoiesis {

EnergyLedger::EnergyLedger(const EnergyConfig& config)
    : config_(config),
      energy_(std::min(config.initial_energy, config.max_energy)),
      charged_this_tick_(0.0f) {}

void EnergyLedger::deduct(float cost) {
    energy_ -= cost;
    charged_this_tick_ += cost;
}

void EnergyLedger::add(float gain) {
    energy_ = std::min(energy_ + gain, config_.max_energy);
}

void EnergyLedger::ambient_decay() {
    energy_ -= config_.ambient_decay;
}

float EnergyLedger::normalized() const {
    return std::max(0.0f, energy_) / config_.max_energy;
}

} // namespace autopoiesis
