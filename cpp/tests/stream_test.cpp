#include <array>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "xid/gen/generator.hpp"
#include "xid/io/stream.hpp"

namespace {
    constexpr xid::Xid::Raw kSample = {0x4d, 0x88, 0xe1, 0x5b, 0x60, 0xf4, 0x86, 0xe4, 0x28, 0x41, 0x2d, 0xc9};
} // namespace

TEST(IoStream, WriteEmitsRawBytes) {
    std::ostringstream os;
    ASSERT_EQ(xid::io::write_xid(os, xid::Xid::from_raw(kSample)).code, xid::core::StatusCode::Ok);
    const std::string s = os.str();
    ASSERT_EQ(s.size(), 12u);
    for (size_t i = 0; i < s.size(); ++i) {
        EXPECT_EQ(static_cast<xid::u8>(s[i]), kSample[i]) << "byte " << i;
    }
}

TEST(IoStream, WriteThenReadSequentially) {
    const xid::Xid a = xid::generate();
    const xid::Xid b = xid::generate();

    std::stringstream ss;
    ASSERT_EQ(xid::io::write_xid(ss, a).code, xid::core::StatusCode::Ok);
    ASSERT_EQ(xid::io::write_xid(ss, b).code, xid::core::StatusCode::Ok);

    xid::Xid ra;
    xid::Xid rb;
    ASSERT_EQ(xid::io::read_xid(ss, &ra).code, xid::core::StatusCode::Ok);
    ASSERT_EQ(xid::io::read_xid(ss, &rb).code, xid::core::StatusCode::Ok);
    EXPECT_EQ(ra, a);
    EXPECT_EQ(rb, b);
    EXPECT_EQ(ss.tellg(), std::streampos(24));
}

TEST(IoStream, ReadReportsInsufficientData) {
    std::istringstream is(std::string("\x01\x02\x03\x04\x05", 5));
    xid::Xid out = xid::Xid::from_raw(kSample);
    const xid::core::Status s = xid::io::read_xid(is, &out);
    EXPECT_EQ(s.code, xid::core::StatusCode::InsufficientData);
    EXPECT_EQ(s.domain, xid::core::StatusDomain::Io);
    EXPECT_EQ(s.aux, 5u);
    EXPECT_EQ(out, xid::Xid::from_raw(kSample));
}

TEST(IoStream, ReadFromEmptyStream) {
    std::istringstream is;
    xid::Xid out;
    const xid::core::Status s = xid::io::read_xid(is, &out);
    EXPECT_EQ(s.code, xid::core::StatusCode::InsufficientData);
    EXPECT_EQ(s.aux, 0u);
}

TEST(IoStream, ReadRejectsNullOut) {
    std::istringstream is(std::string(12, '\0'));
    EXPECT_EQ(xid::io::read_xid(is, nullptr).code, xid::core::StatusCode::NullInput);
}

TEST(IoStream, WriteReportsFailedStream) {
    std::ostringstream os;
    os.setstate(std::ios::badbit);
    EXPECT_EQ(xid::io::write_xid(os, xid::Xid::from_raw(kSample)).code, xid::core::StatusCode::Io);
}

TEST(IoSpan, RoundTrip) {
    std::array<xid::u8, 16> buf{};
    xid::u32 written = 0;
    ASSERT_EQ(xid::io::write_xid({buf.data(), static_cast<xid::u32>(buf.size())}, xid::Xid::from_raw(kSample), &written).code,
              xid::core::StatusCode::Ok);
    EXPECT_EQ(written, 12u);

    xid::Xid out;
    xid::u32 consumed = 0;
    ASSERT_EQ(xid::io::read_xid({buf.data(), static_cast<xid::u32>(buf.size())}, &out, &consumed).code,
              xid::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 12u);
    EXPECT_EQ(out.raw(), kSample);
}

TEST(IoSpan, ShortSpans) {
    std::array<xid::u8, 11> buf{};
    xid::u32 n = 99;
    xid::core::Status s = xid::io::write_xid({buf.data(), 11}, xid::Xid::from_raw(kSample), &n);
    EXPECT_EQ(s.code, xid::core::StatusCode::InvalidArgument);
    EXPECT_EQ(n, 0u);

    xid::Xid out;
    s = xid::io::read_xid({buf.data(), 11}, &out, &n);
    EXPECT_EQ(s.code, xid::core::StatusCode::InsufficientData);
    EXPECT_EQ(s.aux, 11u);
    EXPECT_EQ(n, 0u);
}

TEST(IoSpan, NullArguments) {
    std::array<xid::u8, 12> buf{};
    xid::Xid out;
    xid::u32 n = 0;
    EXPECT_EQ(xid::io::write_xid({nullptr, 12}, out, &n).code, xid::core::StatusCode::NullInput);
    EXPECT_EQ(xid::io::write_xid({buf.data(), 12}, out, nullptr).code, xid::core::StatusCode::NullInput);
    EXPECT_EQ(xid::io::read_xid({nullptr, 12}, &out, &n).code, xid::core::StatusCode::NullInput);
    EXPECT_EQ(xid::io::read_xid({buf.data(), 12}, nullptr, &n).code, xid::core::StatusCode::NullInput);
}
