#ifndef PRIVAGG_PRIVAGG_COMMON_MACROS_H_
#define PRIVAGG_PRIVAGG_COMMON_MACROS_H_

#include <stdexcept>
#include <string>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

#define VALIDATE(value)                                            \
  do {                                                             \
    if (value == false) {                                          \
      throw std::runtime_error("Unable to load proto from text."); \
    }                                                              \
  } while (0)

// Run a command that returns an absl::Status.  If the called code returns an
// error status, return that status up out of this method too.
//
// Example:
//   RETURN_IF_ERROR(DoThings(4));
#define RETURN_IF_ERROR(expr)                                                \
  do {                                                                       \
    /* Using _status below to avoid capture problems if expr is "status". */ \
    ::absl::Status _status = (expr);                                         \
    if (ABSL_PREDICT_FALSE(!_status.ok())) return _status;                   \
  } while (0)

#define PRIVAGG_CONCAT_INNER_(x, y) x##y
#define PRIVAGG_CONCAT_(x, y) PRIVAGG_CONCAT_INNER_(x, y)

// Evaluate an expression that returns an absl::StatusOr<T>. On error, return
// the status; otherwise move the value into `lhs`.
//
// Example:
//   ASSIGN_OR_RETURN(auto shares, Split(secret, 3, 5));
#define ASSIGN_OR_RETURN(lhs, rexpr) \
  ASSIGN_OR_RETURN_IMPL_(PRIVAGG_CONCAT_(_status_or_, __LINE__), lhs, rexpr)

#define ASSIGN_OR_RETURN_IMPL_(statusor, lhs, rexpr)          \
  auto statusor = (rexpr);                                    \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                   \
    return statusor.status();                                 \
  }                                                           \
  lhs = std::move(statusor).value()

#endif  // PRIVAGG_PRIVAGG_COMMON_MACROS_H_
