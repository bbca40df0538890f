#pragma once

#include <chrono>
#include <string>

#include "xid/platform/host.hpp"

namespace xid::testing {
    class FakeHostEnv final : public xid::platform::HostEnv {
    public:
        std::string machine_name;
        std::string host_name;
        std::string dns_name;
        xid::core::u32 pid{0};
        std::chrono::system_clock::time_point clock{};

        std::string machine_name_env() const override { return machine_name; }
        std::string host_name_env() const override { return host_name; }
        std::string dns_host_name() const override { return dns_name; }
        xid::core::u32 process_id() const noexcept override { return pid; }
        std::chrono::system_clock::time_point now() const noexcept override { return clock; }
    };
} // namespace xid::testing
