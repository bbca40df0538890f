#include "xid/platform/host.hpp"

#include <climits>
#include <cstdlib>

#include <unistd.h>

namespace xid::platform {
    namespace {
        [[nodiscard]] std::string env_or_empty(const char* name) {
            const char* v = std::getenv(name);
            if (v == nullptr) {
                return std::string();
            }
            return std::string(v);
        }
    } // namespace

    std::string SystemHostEnv::machine_name_env() const {
        return env_or_empty("COMPUTERNAME");
    }

    std::string SystemHostEnv::host_name_env() const {
        return env_or_empty("HOSTNAME");
    }

    std::string SystemHostEnv::dns_host_name() const {
#if defined(HOST_NAME_MAX)
        char buf[HOST_NAME_MAX + 1]{};
#else
        char buf[256]{};
#endif
        if (::gethostname(buf, sizeof(buf) - 1) != 0) {
            return std::string();
        }
        buf[sizeof(buf) - 1] = '\0';
        return std::string(buf);
    }

    u32 SystemHostEnv::process_id() const noexcept {
        return static_cast<u32>(::getpid());
    }

    std::chrono::system_clock::time_point SystemHostEnv::now() const noexcept {
        return std::chrono::system_clock::now();
    }

    std::string resolve_host_name(const HostEnv& env) {
        std::string name = env.machine_name_env();
        if (!name.empty()) {
            return name;
        }
        name = env.host_name_env();
        if (!name.empty()) {
            return name;
        }
        return env.dns_host_name();
    }

    const HostEnv& system_host_env() noexcept {
        static const SystemHostEnv env;
        return env;
    }
} // namespace xid::platform
