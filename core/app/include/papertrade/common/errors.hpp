#pragma once

#include <stdexcept>
#include <string>

namespace papertrade {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types thrown across component boundaries.
//
// @details
// Per-item failures (one instrument, one order, one strategy) are caught by
// the job that owns the batch and recorded; they never escape a tick. Only
// StorageUnavailableError is allowed to abort a whole tick, and the
// JobScheduler turns that into a failed JobRun with backoff.
//
//   ConfigError             → invalid configuration, raised at load time.
//   ValidationError         → rejected input at an API boundary.
//   StorageUnavailableError → the ledger could not be reached.
//   ProviderError           → market-data provider call failed.
// -----------------------------------------------------------------------------

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class StorageUnavailableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Transient failures (Timeout, RateLimited, Unavailable) are retried on the
// job's next natural tick. BadResponse and NotFound are data errors for the
// instrument concerned.
enum class ProviderErrorKind {
  Timeout,
  RateLimited,
  Unavailable,
  BadResponse,
  NotFound,
};

class ProviderError : public std::runtime_error {
 public:
  ProviderError(ProviderErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ProviderErrorKind kind() const noexcept { return kind_; }

 private:
  ProviderErrorKind kind_;
};

inline const char* providerErrorKindToString(ProviderErrorKind kind) {
  switch (kind) {
    case ProviderErrorKind::Timeout:     return "timeout";
    case ProviderErrorKind::RateLimited: return "rate_limited";
    case ProviderErrorKind::Unavailable: return "unavailable";
    case ProviderErrorKind::BadResponse: return "bad_response";
    case ProviderErrorKind::NotFound:    return "not_found";
  }
  return "unknown";
}

}  // namespace papertrade
