#pragma once

namespace optexec {
namespace domain {

// -----------------------------------------------------------------------------
// ExitReason
// -----------------------------------------------------------------------------
// Why a position was closed. Exactly one reason applies per position.
// -----------------------------------------------------------------------------
enum class ExitReason {
  StopLoss,    // SL
  Target,      // TP
  Squareoff,   // SQUAREOFF — end-of-session forced exit
  Shutdown,    // SYSTEM_SHUTDOWN — engine stopping with positions open
  Manual,      // MANUAL — operator command
};

inline const char* exitReasonToString(ExitReason reason) {
  switch (reason) {
    case ExitReason::StopLoss:  return "SL";
    case ExitReason::Target:    return "TP";
    case ExitReason::Squareoff: return "SQUAREOFF";
    case ExitReason::Shutdown:  return "SYSTEM_SHUTDOWN";
    case ExitReason::Manual:    return "MANUAL";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace optexec
