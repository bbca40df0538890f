#include "xid/core/xid.hpp"

#include <cstring>
#include <limits>
#include <ostream>

#include "xid/codec/base32.hpp"

namespace xid {
    namespace {
        [[nodiscard]] xid::core::Status check_span(const void* data, u32 len, u32 offset) noexcept {
            if (data == nullptr) {
                return xid::core::make_status(xid::core::StatusDomain::Core, xid::core::StatusCode::NullInput);
            }
            if (offset > std::numeric_limits<u32>::max() - kRawLen) {
                return xid::core::make_status(xid::core::StatusDomain::Core, xid::core::StatusCode::InvalidArgument, offset);
            }
            if (len < offset + kRawLen) {
                return xid::core::make_status(xid::core::StatusDomain::Core, xid::core::StatusCode::InvalidArgument, len);
            }
            return xid::core::ok_status();
        }
    } // namespace

    xid::core::Status Xid::from_bytes(xid::core::BufferView src, u32 offset, Xid* out) noexcept {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Core, xid::core::StatusCode::NullInput);
        }
        const xid::core::Status s = check_span(src.data, src.len, offset);
        if (!xid::core::is_ok(s)) {
            return s;
        }

        Xid x;
        std::memcpy(x.b_.data(), src.data + offset, kRawLen);
        *out = x;
        return xid::core::ok_status();
    }

    xid::core::Status Xid::write_bytes(xid::core::BufferMut dest, u32 offset) const noexcept {
        const xid::core::Status s = check_span(dest.data, dest.len, offset);
        if (!xid::core::is_ok(s)) {
            return s;
        }
        std::memcpy(dest.data + offset, b_.data(), kRawLen);
        return xid::core::ok_status();
    }

    std::string Xid::to_string() const {
        return xid::codec::to_string(*this);
    }

    std::ostream& operator<<(std::ostream& os, const Xid& x) {
        char buf[kEncodedLen];
        xid::codec::encode(x, buf);
        return os.write(buf, kEncodedLen);
    }
} // namespace xid
