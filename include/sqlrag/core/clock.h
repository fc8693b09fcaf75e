#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace sqlrag::core {

// IClock is the single source of wall-clock time for audit events and example
// provenance. Injected so that tests and recorded demos produce stable output.
class IClock {
 public:
  virtual ~IClock() = default;

  // ISO 8601 UTC timestamp, e.g. "2026-01-01T00:00:00Z". Never empty.
  virtual std::string now_iso8601() = 0;

  // Milliseconds since the Unix epoch. Used for stage durations in audit payloads.
  virtual std::int64_t now_unix_ms() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
  std::int64_t now_unix_ms() override;
};

// FixedClock never advances: every call returns the configured instant.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time, std::int64_t fixed_unix_ms = 0)
      : fixed_time_(std::move(fixed_time)), fixed_unix_ms_(fixed_unix_ms) {}

  std::string now_iso8601() override { return fixed_time_; }
  std::int64_t now_unix_ms() override { return fixed_unix_ms_; }

 private:
  std::string fixed_time_;
  std::int64_t fixed_unix_ms_;
};

}  // namespace sqlrag::core
