#include "sqlrag/core/id_generator.h"

#include <chrono>

namespace sqlrag::core {

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const auto seq = counter_.fetch_add(1, std::memory_order_relaxed);
  std::string id(prefix);
  id += "-" + std::to_string(micros) + "-" + std::to_string(seq);
  return id;
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto seq = counter_.fetch_add(1, std::memory_order_relaxed);
  std::string id(prefix);
  id += "-" + std::to_string(seq);
  return id;
}

}  // namespace sqlrag::core
