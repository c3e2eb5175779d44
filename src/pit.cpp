#include <pitstrat/pit.hpp>
#include <algorithm>
#include <cmath>

namespace pitstrat {

double pit_stop_loss(const PitParams& p) {
  const double stat = std::max(0.0, p.stationary);
  const double lane = std::max(0.0, p.lane);
  return stat + lane;
}

std::optional<double> pit_loss_cost(double pit_loss_seconds, int stops) {
  if (!(pit_loss_seconds >= 0.0) || !std::isfinite(pit_loss_seconds)) return std::nullopt;
  if (stops < 0) return std::nullopt;
  return pit_loss_seconds * static_cast<double>(stops);
}

} // namespace pitstrat
