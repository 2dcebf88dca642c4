#pragma once

namespace chatsan::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.1";

// kOutputSchemaVersion is stamped into document metadata. Bump it whenever the
// canonical field order or any field's encoding changes.
constexpr const char* kOutputSchemaVersion = "1";

}  // namespace chatsan::core
