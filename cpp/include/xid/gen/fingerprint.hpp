#pragma once

#include <array>
#include <string_view>

#include "xid/core/errors.hpp"
#include "xid/core/types.hpp"
#include "xid/core/xid.hpp"
#include "xid/platform/host.hpp"

namespace xid::gen {
    using u8 = xid::core::u8;
    using u16 = xid::core::u16;
    using u32 = xid::core::u32;
    using i32 = xid::core::i32;

    struct Md5Digest {
        std::array<u8, 16> b{};
    };

    xid::core::Status md5_compute(xid::core::BufferView data, Md5Digest* out) noexcept;

    // Sum of the digest bytes as unsigned values.
    [[nodiscard]] i32 digest_byte_sum(const Md5Digest& d) noexcept;

    // Bytes 0, 2 and 3 of the little-endian representation of v. This is the
    // historical xid.net selection and is kept so existing fingerprints stay stable.
    [[nodiscard]] constexpr MachineFingerprint machine_fingerprint_from_sum(i32 v) noexcept {
        const u32 u = static_cast<u32>(v);
        return MachineFingerprint{
            static_cast<u8>((u >> 0) & 0xffu),
            static_cast<u8>((u >> 16) & 0xffu),
            static_cast<u8>((u >> 24) & 0xffu),
        };
    }

    // md5(name) summed bytewise. Weak: most of the digest entropy is discarded.
    xid::core::Status machine_fingerprint_from_name(std::string_view name, MachineFingerprint* out) noexcept;

    // Uses the host name of env, or a random value in [0, 65535) when none is available.
    xid::core::Status derive_machine_fingerprint(const xid::platform::HostEnv& env, MachineFingerprint* out);

    [[nodiscard]] constexpr u16 process_fingerprint(u32 pid) noexcept {
        return static_cast<u16>(pid & 0xffffu);
    }

    // Uniform value in [0, bound) from the OpenSSL CSPRNG. bound must be non-zero.
    xid::core::Status random_below(u32 bound, u32* out) noexcept;

} // namespace xid::gen
