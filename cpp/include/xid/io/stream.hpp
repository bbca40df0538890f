#pragma once

#include <iosfwd>

#include "xid/core/errors.hpp"
#include "xid/core/types.hpp"
#include "xid/core/xid.hpp"

namespace xid::io {
    using u32 = xid::core::u32;

    // Writes the kRawLen raw bytes. Io when the stream fails.
    xid::core::Status write_xid(std::ostream& os, const Xid& x);

    // Reads exactly kRawLen bytes. InsufficientData (aux = bytes read) when the
    // stream ends early; *out is untouched on failure.
    xid::core::Status read_xid(std::istream& is, Xid* out);

    // Span variants. Consume/produce exactly kRawLen bytes from the front of the span.
    xid::core::Status write_xid(xid::core::BufferMut out, const Xid& x, u32* written) noexcept;
    xid::core::Status read_xid(xid::core::BufferView in, Xid* out, u32* consumed) noexcept;

} // namespace xid::io
