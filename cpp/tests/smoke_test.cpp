#include <gtest/gtest.h>

#include "xid/codec/base32.hpp"
#include "xid/core/errors.hpp"
#include "xid/core/xid.hpp"

TEST(Status, DefaultIsOk){
    xid::core::Status s{};
    EXPECT_EQ(s.code, xid::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, xid::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(xid::core::is_ok(s));
}

TEST(Status, MakeStatusCarriesFields){
    const xid::core::Status s =
        xid::core::make_status(xid::core::StatusDomain::Codec, xid::core::StatusCode::InvalidFormat, 7);
    EXPECT_FALSE(xid::core::is_ok(s));
    EXPECT_EQ(s.domain, xid::core::StatusDomain::Codec);
    EXPECT_EQ(s.aux, 7u);
    EXPECT_STREQ(xid::core::status_code_name(s.code), "InvalidFormat");
    EXPECT_STREQ(xid::core::status_domain_name(s.domain), "Codec");
    EXPECT_STREQ(xid::core::status_code_name(xid::core::StatusCode::InsufficientData), "InsufficientData");
}

TEST(Smoke, EmptyIsTwentyZeros){
    EXPECT_EQ(xid::Xid::empty().to_string(), "00000000000000000000");
    EXPECT_EQ(xid::Xid::empty(), xid::Xid{});
}

TEST(Smoke, ConstexprCompose){
    constexpr xid::Xid x = xid::Xid::compose(1, {2, 3, 4}, 5, 6);
    static_assert(x.unix_seconds() == 1);
    static_assert(x.process_fingerprint() == 5);
    static_assert(x.counter() == 6);
    static_assert(xid::compare(x, xid::Xid::empty()) == 1);
    EXPECT_EQ(x.machine_fingerprint(), (xid::MachineFingerprint{2, 3, 4}));
}
