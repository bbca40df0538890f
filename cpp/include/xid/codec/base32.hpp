#pragma once

#include <array>
#include <string>
#include <string_view>

#include "xid/core/errors.hpp"
#include "xid/core/types.hpp"
#include "xid/core/xid.hpp"

namespace xid::codec {
    using u8 = xid::core::u8;
    using u32 = xid::core::u32;

    // base32hex, lowercase, no padding. Sort order of the alphabet matches byte order.
    inline constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuv";
    inline constexpr u8 kInvalidSymbol = 0xff;

    namespace detail {
        [[nodiscard]] constexpr std::array<u8, 256> make_decode_map() noexcept {
            std::array<u8, 256> m{};
            for (auto& v : m) {
                v = kInvalidSymbol;
            }
            for (u32 i = 0; i < 32; ++i) {
                m[static_cast<u8>(kAlphabet[i])] = static_cast<u8>(i);
            }
            return m;
        }
    } // namespace detail

    inline constexpr std::array<u8, 256> kDecodeMap = detail::make_decode_map();

    // Writes exactly kEncodedLen characters to dst (not NUL-terminated).
    void encode(const Xid& x, char* dst) noexcept;

    [[nodiscard]] std::string to_string(const Xid& x);

    [[nodiscard]] bool is_valid_encoded(std::string_view s) noexcept;

    // NullInput when out or s.data() is null; InvalidFormat on wrong length or
    // a symbol outside kAlphabet. *out is untouched on failure.
    xid::core::Status parse(std::string_view s, Xid* out) noexcept;

    // Same validation as parse; stores Xid::empty() and returns false on failure.
    [[nodiscard]] bool try_parse(std::string_view s, Xid* out) noexcept;

} // namespace xid::codec
