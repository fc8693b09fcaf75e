#pragma once

namespace sqlrag::core {

// kBuildVersion is the current software version string.
// Reported by the CLI banner and recorded in WorkflowStarted audit payloads.
constexpr const char* kBuildVersion = "0.3";

}  // namespace sqlrag::core
