#pragma once

#include <string>
#include <vector>

namespace pinsim::wiring
{
/// Lookup of a coil, switch, wire destination or device by an unknown name.
struct InvalidReference
{
    std::string kind;
    std::string requested;
    std::vector<std::string> validNames;

    /// e.g. Unknown coil "Foo". Valid names are [ "Pull", "Fire" ].
    [[nodiscard]] std::string Message() const;
};

/// Fill the optional out-record and log the failure under the given subsystem prefix.
void ReportInvalidReference(
    const char* subsystem,
    std::string kind,
    std::string requested,
    std::vector<std::string> validNames,
    InvalidReference* outError
);
} // namespace pinsim::wiring
