#pragma once
#include <optional>

namespace pitstrat {

// Split view of one stop's cost; circuits often publish it this way.
struct PitParams {
  double stationary = 0.0; // seconds at box
  double lane = 0.0;       // pit-lane delta vs racing line
};

// Per-stop loss from its parts; negative parts clamp to zero.
double pit_stop_loss(const PitParams& p);

// Total time cost of `stops` stops at a fixed per-stop loss.
// nullopt on negative loss or negative stop count.
std::optional<double> pit_loss_cost(double pit_loss_seconds, int stops);

} // namespace pitstrat
