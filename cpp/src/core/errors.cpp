#include "shardsim/core/errors.hpp"

#include <cstdio>
#include <cstring>

namespace shardsim::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::PermissionDenied: return "PermissionDenied";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Encode: return "Encode";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Input: return "Input";
            case StatusDomain::Erasure: return "Erasure";
            case StatusDomain::Storage: return "Storage";
            case StatusDomain::Placement: return "Placement";
            case StatusDomain::Meta: return "Meta";
            case StatusDomain::Pipeline: return "Pipeline";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    std::string status_describe(Status s) {
        char buf[256];
        const bool errno_aux = (s.code == StatusCode::Io || s.code == StatusCode::NotFound ||
                                s.code == StatusCode::PermissionDenied) &&
                               s.aux != 0;
        if (errno_aux) {
            std::snprintf(buf, sizeof(buf), "%s in %s (errno %u: %s)",
                          status_code_name(s.code),
                          status_domain_name(s.domain),
                          static_cast<unsigned>(s.aux),
                          std::strerror(static_cast<int>(s.aux)));
        } else if (s.aux != 0) {
            std::snprintf(buf, sizeof(buf), "%s in %s (aux=%u)",
                          status_code_name(s.code),
                          status_domain_name(s.domain),
                          static_cast<unsigned>(s.aux));
        } else {
            std::snprintf(buf, sizeof(buf), "%s in %s",
                          status_code_name(s.code),
                          status_domain_name(s.domain));
        }
        return std::string(buf);
    }
} // namespace shardsim::core
