#include "xid/gen/fingerprint.hpp"

#include <limits>
#include <string>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace xid::gen {
    xid::core::Status md5_compute(xid::core::BufferView data, Md5Digest* out) noexcept {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::NullInput);
        }
        if (data.len > 0 && data.data == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::NullInput);
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            return xid::core::make_status(xid::core::StatusDomain::External, xid::core::StatusCode::Unavailable);
        }

        Md5Digest d{};
        unsigned int d_len = 0;
        int ok = 1;
        ok &= EVP_DigestInit_ex(ctx, EVP_md5(), nullptr);
        if (data.len > 0) {
            ok &= EVP_DigestUpdate(ctx, data.data, static_cast<size_t>(data.len));
        }
        ok &= EVP_DigestFinal_ex(ctx, d.b.data(), &d_len);
        EVP_MD_CTX_free(ctx);

        if (!ok || d_len != d.b.size()) {
            return xid::core::make_status(xid::core::StatusDomain::External, xid::core::StatusCode::Unavailable);
        }
        *out = d;
        return xid::core::ok_status();
    }

    i32 digest_byte_sum(const Md5Digest& d) noexcept {
        i32 sum = 0;
        for (u8 b : d.b) {
            sum += static_cast<i32>(b);
        }
        return sum;
    }

    xid::core::Status machine_fingerprint_from_name(std::string_view name, MachineFingerprint* out) noexcept {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::NullInput);
        }
        if (name.empty()) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::InvalidArgument);
        }
        if (name.size() > std::numeric_limits<u32>::max()) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::InvalidArgument);
        }

        Md5Digest d{};
        const xid::core::BufferView bytes{reinterpret_cast<const u8*>(name.data()), static_cast<u32>(name.size())};
        const xid::core::Status s = md5_compute(bytes, &d);
        if (!xid::core::is_ok(s)) {
            return s;
        }
        *out = machine_fingerprint_from_sum(digest_byte_sum(d));
        return xid::core::ok_status();
    }

    xid::core::Status derive_machine_fingerprint(const xid::platform::HostEnv& env, MachineFingerprint* out) {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::NullInput);
        }

        const std::string name = xid::platform::resolve_host_name(env);
        if (!name.empty()) {
            return machine_fingerprint_from_name(name, out);
        }

        u32 r = 0;
        const xid::core::Status s = random_below(0xffffu, &r);
        if (!xid::core::is_ok(s)) {
            return s;
        }
        *out = machine_fingerprint_from_sum(static_cast<i32>(r));
        return xid::core::ok_status();
    }

    xid::core::Status random_below(u32 bound, u32* out) noexcept {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::NullInput);
        }
        if (bound == 0) {
            return xid::core::make_status(xid::core::StatusDomain::Gen, xid::core::StatusCode::InvalidArgument);
        }

        // Reject the tail of the u32 range so every residue is equally likely.
        const u32 limit = std::numeric_limits<u32>::max() - (std::numeric_limits<u32>::max() % bound);
        for (;;) {
            unsigned char buf[4]{};
            if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
                return xid::core::make_status(xid::core::StatusDomain::External, xid::core::StatusCode::Unavailable);
            }
            const u32 v = (static_cast<u32>(buf[0]) << 24) |
                          (static_cast<u32>(buf[1]) << 16) |
                          (static_cast<u32>(buf[2]) << 8) |
                          (static_cast<u32>(buf[3]) << 0);
            if (v < limit) {
                *out = v % bound;
                return xid::core::ok_status();
            }
        }
    }
} // namespace xid::gen
