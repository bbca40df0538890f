#include "xid/codec/base32.hpp"

namespace xid::codec {
    namespace {
        [[nodiscard]] xid::core::Status validate(std::string_view s) noexcept {
            if (s.data() == nullptr) {
                return xid::core::make_status(xid::core::StatusDomain::Codec, xid::core::StatusCode::NullInput);
            }
            if (s.size() != kEncodedLen) {
                return xid::core::make_status(xid::core::StatusDomain::Codec,
                    xid::core::StatusCode::InvalidFormat,
                    static_cast<u32>(s.size()));
            }
            for (u32 i = 0; i < kEncodedLen; ++i) {
                if (kDecodeMap[static_cast<u8>(s[i])] == kInvalidSymbol) {
                    // aux carries the offending position
                    return xid::core::make_status(xid::core::StatusDomain::Codec, xid::core::StatusCode::InvalidFormat, i);
                }
            }
            return xid::core::ok_status();
        }

        // Input must already be validated.
        [[nodiscard]] Xid decode(std::string_view s) noexcept {
            u8 d[kEncodedLen];
            for (u32 i = 0; i < kEncodedLen; ++i) {
                d[i] = kDecodeMap[static_cast<u8>(s[i])];
            }

            Xid::Raw b{};
            b[0] = static_cast<u8>(d[0] << 3 | d[1] >> 2);
            b[1] = static_cast<u8>(d[1] << 6 | d[2] << 1 | d[3] >> 4);
            b[2] = static_cast<u8>(d[3] << 4 | d[4] >> 1);
            b[3] = static_cast<u8>(d[4] << 7 | d[5] << 2 | d[6] >> 3);
            b[4] = static_cast<u8>(d[6] << 5 | d[7]);
            b[5] = static_cast<u8>(d[8] << 3 | d[9] >> 2);
            b[6] = static_cast<u8>(d[9] << 6 | d[10] << 1 | d[11] >> 4);
            b[7] = static_cast<u8>(d[11] << 4 | d[12] >> 1);
            b[8] = static_cast<u8>(d[12] << 7 | d[13] << 2 | d[14] >> 3);
            b[9] = static_cast<u8>(d[14] << 5 | d[15]);
            b[10] = static_cast<u8>(d[16] << 3 | d[17] >> 2);
            b[11] = static_cast<u8>(d[17] << 6 | d[18] << 1 | d[19] >> 4);
            return Xid::from_raw(b);
        }
    } // namespace

    void encode(const Xid& x, char* dst) noexcept {
        const Xid::Raw& b = x.raw();

        dst[0] = kAlphabet[b[0] >> 3];
        dst[1] = kAlphabet[((b[1] >> 6) & 0x1f) | ((b[0] << 2) & 0x1f)];
        dst[2] = kAlphabet[(b[1] >> 1) & 0x1f];
        dst[3] = kAlphabet[((b[2] >> 4) & 0x1f) | ((b[1] << 4) & 0x1f)];
        dst[4] = kAlphabet[(b[3] >> 7) | ((b[2] << 1) & 0x1f)];
        dst[5] = kAlphabet[(b[3] >> 2) & 0x1f];
        dst[6] = kAlphabet[(b[4] >> 5) | ((b[3] << 3) & 0x1f)];
        dst[7] = kAlphabet[b[4] & 0x1f];
        dst[8] = kAlphabet[b[5] >> 3];
        dst[9] = kAlphabet[((b[6] >> 6) & 0x1f) | ((b[5] << 2) & 0x1f)];
        dst[10] = kAlphabet[(b[6] >> 1) & 0x1f];
        dst[11] = kAlphabet[((b[7] >> 4) & 0x1f) | ((b[6] << 4) & 0x1f)];
        dst[12] = kAlphabet[(b[8] >> 7) | ((b[7] << 1) & 0x1f)];
        dst[13] = kAlphabet[(b[8] >> 2) & 0x1f];
        dst[14] = kAlphabet[(b[9] >> 5) | ((b[8] << 3) & 0x1f)];
        dst[15] = kAlphabet[b[9] & 0x1f];
        dst[16] = kAlphabet[b[10] >> 3];
        dst[17] = kAlphabet[((b[11] >> 6) & 0x1f) | ((b[10] << 2) & 0x1f)];
        dst[18] = kAlphabet[(b[11] >> 1) & 0x1f];
        dst[19] = kAlphabet[(b[11] << 4) & 0x1f];
    }

    std::string to_string(const Xid& x) {
        std::string out(kEncodedLen, '0');
        encode(x, out.data());
        return out;
    }

    bool is_valid_encoded(std::string_view s) noexcept {
        return xid::core::is_ok(validate(s));
    }

    xid::core::Status parse(std::string_view s, Xid* out) noexcept {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Codec, xid::core::StatusCode::NullInput);
        }
        const xid::core::Status st = validate(s);
        if (!xid::core::is_ok(st)) {
            return st;
        }
        *out = decode(s);
        return xid::core::ok_status();
    }

    bool try_parse(std::string_view s, Xid* out) noexcept {
        if (out == nullptr) {
            return false;
        }
        if (!is_valid_encoded(s)) {
            *out = Xid::empty();
            return false;
        }
        *out = decode(s);
        return true;
    }
} // namespace xid::codec
