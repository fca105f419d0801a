#pragma once
#include "scpi-driver/export.h"

#include <string>

namespace scpidrv {

/// Tolerances for readback verification. The defaults match the firmware of
/// the supported instruments.
struct VerifierLimits {
  double relative_tolerance{0.01};
  /// Floor for the tolerance of setpoints at or near zero
  double absolute_tolerance{1e-12};
  /// Range accepted when upper_factor * actual >= requested ...
  double range_upper_factor{1.05};
  /// ... and actual <= lower_factor * requested
  double range_lower_factor{9.6};
};

/// Compares a requested setting with the value read back from the device
class SCPI_DRIVER_API ReadbackVerifier {
public:
  ReadbackVerifier() = default;
  explicit ReadbackVerifier(const VerifierLimits &limits) : limits_(limits) {}

  /// |actual - requested| <= relative_tolerance * |requested|, NaN never
  /// matches
  bool numeric_matches(double requested, double actual) const;

  /// Asymmetric band that models discrete hardware range steps
  bool range_matches(double requested, double actual) const;

  static bool flag_matches(bool requested, bool actual) {
    return requested == actual;
  }

  /// Case-insensitive exact comparison
  static bool token_matches(const std::string &requested,
                            const std::string &actual);

  const VerifierLimits &limits() const { return limits_; }

private:
  VerifierLimits limits_;
};

} // namespace scpidrv
