#pragma once

#include <atomic>
#include <type_traits>

#include "xid/core/errors.hpp"
#include "xid/core/types.hpp"
#include "xid/core/xid.hpp"
#include "xid/platform/host.hpp"

namespace xid::gen {
    using u16 = xid::core::u16;
    using u32 = xid::core::u32;

    // The counter seed is drawn from half of the 24-bit range so a burst within
    // one second is unlikely to wrap.
    inline constexpr u32 kCounterSeedBound = 1u << 23;

    struct GeneratorState {
        MachineFingerprint machine{};
        u16 process{0};
        u32 counter_seed{0};
    };

    // Fingerprints from env plus a random counter seed. *out is untouched on failure.
    xid::core::Status derive_generator_state(const xid::platform::HostEnv& env, GeneratorState* out);

    // Owns the per-process generation state: two fixed fingerprints and an atomic counter.
    // The clock source must outlive the generator.
    class Generator {
    public:
        explicit Generator(const GeneratorState& state,
            const xid::platform::HostEnv& clock = xid::platform::system_host_env()) noexcept;

        Generator(const Generator&) = delete;
        Generator& operator=(const Generator&) = delete;

        // Safe to call concurrently.
        [[nodiscard]] Xid next() noexcept;

        // Same as next() with a caller-supplied timestamp.
        [[nodiscard]] Xid next_at(u32 unix_seconds) noexcept;

        [[nodiscard]] const MachineFingerprint& machine_fingerprint() const noexcept { return machine_; }
        [[nodiscard]] u16 process_fingerprint() const noexcept { return process_; }

    private:
        const xid::platform::HostEnv& clock_;
        const MachineFingerprint machine_;
        const u16 process_;
        std::atomic<u32> counter_;
    };

    // Unix seconds truncated to 32 bits. Clocks before 1970 wrap modulo 2^32.
    [[nodiscard]] u32 unix_seconds_u32(std::chrono::system_clock::time_point tp) noexcept;

    // Lazily constructed from the system host environment on first use.
    [[nodiscard]] Generator& default_generator() noexcept;

    static_assert(std::is_trivially_copyable_v<GeneratorState>);

} // namespace xid::gen

namespace xid {
    // Next identifier from the process-wide default generator.
    [[nodiscard]] Xid generate() noexcept;
} // namespace xid
