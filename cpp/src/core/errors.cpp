#include "xid/core/errors.hpp"

namespace xid::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NullInput: return "NullInput";
            case StatusCode::InvalidFormat: return "InvalidFormat";
            case StatusCode::InvalidArgument: return "InvalidArgument";
            case StatusCode::InsufficientData: return "InsufficientData";
            case StatusCode::Io: return "Io";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Gen: return "Gen";
            case StatusDomain::Io: return "Io";
            case StatusDomain::Platform: return "Platform";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }
} // namespace xid::core
