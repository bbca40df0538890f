#pragma once

#include <chrono>
#include <string>

#include "xid/core/types.hpp"

namespace xid::platform {
    using u32 = xid::core::u32;

    // Everything the generator reads from the operating system.
    class HostEnv {
    public:
        virtual ~HostEnv() = default;

        // COMPUTERNAME
        [[nodiscard]] virtual std::string machine_name_env() const = 0;
        // HOSTNAME
        [[nodiscard]] virtual std::string host_name_env() const = 0;
        // gethostname(2)
        [[nodiscard]] virtual std::string dns_host_name() const = 0;

        [[nodiscard]] virtual u32 process_id() const noexcept = 0;
        [[nodiscard]] virtual std::chrono::system_clock::time_point now() const noexcept = 0;
    };

    class SystemHostEnv final : public HostEnv {
    public:
        [[nodiscard]] std::string machine_name_env() const override;
        [[nodiscard]] std::string host_name_env() const override;
        [[nodiscard]] std::string dns_host_name() const override;
        [[nodiscard]] u32 process_id() const noexcept override;
        [[nodiscard]] std::chrono::system_clock::time_point now() const noexcept override;
    };

    // First non-empty of machine_name_env, host_name_env, dns_host_name; empty if none.
    [[nodiscard]] std::string resolve_host_name(const HostEnv& env);

    [[nodiscard]] const HostEnv& system_host_env() noexcept;

} // namespace xid::platform
