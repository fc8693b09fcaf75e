#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace sqlrag::core {

// IIdGenerator mints trace, event and run identifiers.
// Contract: next(prefix) is non-empty and starts with "<prefix>-".
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<epoch micros>-<counter>". Unique for the process lifetime and roughly
// sortable by creation time. Thread-safe.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// "<prefix>-<counter>", counter shared across prefixes. Same call sequence, same ids.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace sqlrag::core
