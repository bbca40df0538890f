#include "xid/io/stream.hpp"

#include <istream>
#include <ostream>

namespace xid::io {
    xid::core::Status write_xid(std::ostream& os, const Xid& x) {
        const Xid::Raw b = x.to_bytes();
        os.write(reinterpret_cast<const char*>(b.data()), static_cast<std::streamsize>(b.size()));
        if (!os) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::Io);
        }
        return xid::core::ok_status();
    }

    xid::core::Status read_xid(std::istream& is, Xid* out) {
        if (out == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::NullInput);
        }

        Xid::Raw b{};
        is.read(reinterpret_cast<char*>(b.data()), static_cast<std::streamsize>(b.size()));
        const std::streamsize got = is.gcount();
        if (got != static_cast<std::streamsize>(b.size())) {
            return xid::core::make_status(xid::core::StatusDomain::Io,
                xid::core::StatusCode::InsufficientData,
                static_cast<u32>(got));
        }

        *out = Xid::from_raw(b);
        return xid::core::ok_status();
    }

    xid::core::Status write_xid(xid::core::BufferMut out, const Xid& x, u32* written) noexcept {
        if (written == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::NullInput);
        }
        *written = 0;
        if (out.data == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::NullInput);
        }
        if (out.len < kRawLen) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::InvalidArgument, out.len);
        }

        const xid::core::Status s = x.write_bytes(out, 0);
        if (!xid::core::is_ok(s)) {
            return s;
        }
        *written = kRawLen;
        return xid::core::ok_status();
    }

    xid::core::Status read_xid(xid::core::BufferView in, Xid* out, u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::NullInput);
        }
        *consumed = 0;
        if (in.data == nullptr && in.len > 0) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::NullInput);
        }
        if (in.len < kRawLen) {
            return xid::core::make_status(xid::core::StatusDomain::Io, xid::core::StatusCode::InsufficientData, in.len);
        }

        const xid::core::Status s = Xid::from_bytes(in, 0, out);
        if (!xid::core::is_ok(s)) {
            return s;
        }
        *consumed = kRawLen;
        return xid::core::ok_status();
    }
} // namespace xid::io
