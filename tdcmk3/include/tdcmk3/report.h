#pragma once

// c++ headers ------------------------------------------
#include <string>

// project headers --------------------------------------
#include "tdcmk3/firing_solution.h"
#include "tdcmk3/verification.h"

namespace tdcmk3 {

/// Format a run time as "m:ss".
std::string FormatMinutesSeconds(float seconds);

/// Plain-text report of `problem` and its `solution`: inputs, firing solution, geometry and, when the
/// solution carries one, the trajectory phases. An invalid solution reports its message instead.
std::string FormatSolutionReport(
  FiringProblem const& problem,
  FiringSolution const& solution
);

/// Plain-text comparison of `solution` against the recorded `attack`.
std::string FormatAttackComparison(
  RecordedAttack const& attack,
  FiringSolution const& solution
);

} // namespace tdcmk3
