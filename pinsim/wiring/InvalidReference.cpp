#include "pinsim/wiring/InvalidReference.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace pinsim::wiring
{
std::string InvalidReference::Message() const
{
    std::ostringstream stream;
    stream << "Unknown " << kind << " \"" << requested << "\". Valid names are [";
    for (std::size_t i = 0; i < validNames.size(); ++i)
    {
        stream << (i == 0 ? " " : ", ") << '"' << validNames[i] << '"';
    }
    stream << (validNames.empty() ? "]." : " ].");
    return stream.str();
}

void ReportInvalidReference(
    const char* subsystem,
    std::string kind,
    std::string requested,
    std::vector<std::string> validNames,
    InvalidReference* outError)
{
    InvalidReference error{std::move(kind), std::move(requested), std::move(validNames)};
    std::cout << subsystem << ": ERROR - " << error.Message() << "\n";
    if (outError != nullptr)
    {
        *outError = std::move(error);
    }
}
} // namespace pinsim::wiring
