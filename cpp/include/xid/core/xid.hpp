#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <type_traits>

#include "xid/core/errors.hpp"
#include "xid/core/types.hpp"

namespace xid {
    using u8 = xid::core::u8;
    using u16 = xid::core::u16;
    using u32 = xid::core::u32;

    // Layout (big-endian within each field):
    // 0..3 unix seconds(u32), 4..6 machine fingerprint, 7..8 process fingerprint(u16),
    // 9..11 counter(u24).
    inline constexpr u32 kRawLen = 12;
    inline constexpr u32 kEncodedLen = 20;
    inline constexpr u32 kMachineLen = 3;
    inline constexpr u32 kCounterMask = 0x00ffffffu;

    using MachineFingerprint = std::array<u8, kMachineLen>;

    class Xid {
    public:
        using Raw = std::array<u8, kRawLen>;

        constexpr Xid() noexcept = default;

        [[nodiscard]] static constexpr Xid empty() noexcept { return Xid{}; }

        [[nodiscard]] static constexpr Xid from_raw(const Raw& raw) noexcept {
            Xid x;
            x.b_ = raw;
            return x;
        }

        [[nodiscard]] static constexpr Xid compose(u32 unix_seconds,
            const MachineFingerprint& machine,
            u16 process,
            u32 counter) noexcept {
            Xid x;
            x.b_[0] = static_cast<u8>((unix_seconds >> 24) & 0xffu);
            x.b_[1] = static_cast<u8>((unix_seconds >> 16) & 0xffu);
            x.b_[2] = static_cast<u8>((unix_seconds >> 8) & 0xffu);
            x.b_[3] = static_cast<u8>((unix_seconds >> 0) & 0xffu);
            x.b_[4] = machine[0];
            x.b_[5] = machine[1];
            x.b_[6] = machine[2];
            x.b_[7] = static_cast<u8>((process >> 8) & 0xffu);
            x.b_[8] = static_cast<u8>((process >> 0) & 0xffu);
            x.b_[9] = static_cast<u8>((counter >> 16) & 0xffu);
            x.b_[10] = static_cast<u8>((counter >> 8) & 0xffu);
            x.b_[11] = static_cast<u8>((counter >> 0) & 0xffu);
            return x;
        }

        // Reads kRawLen bytes from src starting at offset. *out is untouched on failure.
        static xid::core::Status from_bytes(xid::core::BufferView src, u32 offset, Xid* out) noexcept;

        [[nodiscard]] constexpr const Raw& raw() const noexcept { return b_; }
        [[nodiscard]] constexpr Raw to_bytes() const noexcept { return b_; }

        // Copies the 12 raw bytes into dest at offset. Nothing is written on failure.
        xid::core::Status write_bytes(xid::core::BufferMut dest, u32 offset) const noexcept;

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] constexpr u32 unix_seconds() const noexcept {
            return (static_cast<u32>(b_[0]) << 24) |
                   (static_cast<u32>(b_[1]) << 16) |
                   (static_cast<u32>(b_[2]) << 8) |
                   (static_cast<u32>(b_[3]) << 0);
        }

        [[nodiscard]] constexpr std::chrono::sys_seconds timestamp() const noexcept {
            return std::chrono::sys_seconds{std::chrono::seconds{unix_seconds()}};
        }

        [[nodiscard]] constexpr MachineFingerprint machine_fingerprint() const noexcept {
            return MachineFingerprint{b_[4], b_[5], b_[6]};
        }

        [[nodiscard]] constexpr u16 process_fingerprint() const noexcept {
            return static_cast<u16>((static_cast<u16>(b_[7]) << 8) | static_cast<u16>(b_[8]));
        }

        [[nodiscard]] constexpr u32 counter() const noexcept {
            return (static_cast<u32>(b_[9]) << 16) |
                   (static_cast<u32>(b_[10]) << 8) |
                   (static_cast<u32>(b_[11]) << 0);
        }

        [[nodiscard]] constexpr bool is_empty() const noexcept {
            for (u8 b : b_) {
                if (b != 0) {
                    return false;
                }
            }
            return true;
        }

        // h = h * 486187739 + b over the 12 bytes, seed 17, wrapping mod 2^32.
        [[nodiscard]] constexpr u32 hash() const noexcept {
            u32 h = 17u;
            for (u8 b : b_) {
                h = h * 486187739u + static_cast<u32>(b);
            }
            return h;
        }

        friend constexpr bool operator==(const Xid&, const Xid&) noexcept = default;
        friend constexpr std::strong_ordering operator<=>(const Xid&, const Xid&) noexcept = default;

    private:
        Raw b_{};
    };

    // -1, 0 or 1 by the first differing byte (unsigned, byte 0 most significant).
    [[nodiscard]] constexpr int compare(const Xid& a, const Xid& b) noexcept {
        const Xid::Raw& ra = a.raw();
        const Xid::Raw& rb = b.raw();
        for (std::size_t i = 0; i < ra.size(); ++i) {
            if (ra[i] != rb[i]) {
                return ra[i] < rb[i] ? -1 : 1;
            }
        }
        return 0;
    }

    std::ostream& operator<<(std::ostream& os, const Xid& x);

    static_assert(sizeof(Xid) == kRawLen);
    static_assert(std::is_trivially_copyable_v<Xid>);
    static_assert(std::is_standard_layout_v<Xid>);

} // namespace xid

template <>
struct std::hash<xid::Xid> {
    std::size_t operator()(const xid::Xid& x) const noexcept {
        return static_cast<std::size_t>(x.hash());
    }
};
