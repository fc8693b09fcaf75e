#pragma once

#include <string>
#include <vector>

namespace sqlrag::storage {

// AuditEvent is one structured record in a request's trail.
// payload is a JSON object serialized to text; refs lists related ids (example ids,
// trace ids of the request that produced a learned example, ...).
struct AuditEvent {
  std::string event_id;           // NOLINT(readability-identifier-naming)
  std::string trace_id;           // NOLINT(readability-identifier-naming)
  std::string event_type;         // NOLINT(readability-identifier-naming)
  std::string payload;            // NOLINT(readability-identifier-naming)
  std::string created_at;         // NOLINT(readability-identifier-naming)
  std::vector<std::string> refs;  // NOLINT(readability-identifier-naming)
};

}  // namespace sqlrag::storage
