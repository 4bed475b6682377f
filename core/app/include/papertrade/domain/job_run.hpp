#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace papertrade {
namespace domain {

enum class JobResult {
  Success,
  Failure,
  Skipped,
};

enum class JobTrigger {
  Scheduled,
  Manual,
};

// -----------------------------------------------------------------------------
// JobRun — audit record of one job tick
// -----------------------------------------------------------------------------
// Written by the JobScheduler for every dispatch, including skipped ones
// (market closed, previous tick still running). error holds the failure
// message or the skip reason.
// -----------------------------------------------------------------------------
struct JobRun {
  std::string job_name;
  JobTrigger trigger{JobTrigger::Scheduled};
  std::int64_t started_at_ms{0};
  std::optional<std::int64_t> finished_at_ms;
  JobResult outcome{JobResult::Success};
  std::optional<std::string> error;
  std::size_t items_processed{0};
  std::size_t items_failed{0};
  std::string summary;
};

inline const char* jobResultToString(JobResult result) {
  switch (result) {
    case JobResult::Success: return "SUCCESS";
    case JobResult::Failure: return "FAILURE";
    case JobResult::Skipped: return "SKIPPED";
  }
  return "UNKNOWN";
}

inline const char* jobTriggerToString(JobTrigger trigger) {
  return trigger == JobTrigger::Manual ? "MANUAL" : "SCHEDULED";
}

}  // namespace domain
}  // namespace papertrade
