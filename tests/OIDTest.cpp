//
//  OIDTest.cpp
//  dertool
//
//  Created by tihmstar on 22.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#include <gtest/gtest.h>

#include <dertool/DERException.hpp>
#include <dertool/OID.hpp>

#include <string.h>

using namespace tihmstar::dertool;
using Bytes = std::vector<uint8_t>;

namespace {

TEST(OIDTest, EncodesCommonName) {
  EXPECT_EQ(Bytes({0x55, 0x04, 0x03}), oidToBytes("2.5.4.3"));
}

TEST(OIDTest, EncodesMultiByteArcs) {
  EXPECT_EQ(Bytes({0x2a, 0x86, 0x48, 0x86, 0xf7, 0x0d, 0x01, 0x01, 0x0b}),
            oidToBytes("1.2.840.113549.1.1.11"));
  EXPECT_EQ(Bytes({0x2b, 0x06, 0x01, 0x05, 0x05, 0x07, 0x03, 0x01}),
            oidToBytes("1.3.6.1.5.5.7.3.1"));
}

TEST(OIDTest, EncodesLargeSecondArcUnderJointIsoItuT) {
  // 40 * 2 + 999 = 1079 spans two subidentifier octets
  EXPECT_EQ(Bytes({0x88, 0x37}), oidToBytes("2.999"));
  EXPECT_EQ(Bytes({0x88, 0x37, 0x03}), oidToBytes("2.999.3"));
  EXPECT_EQ("2.999", bytesToOid(Bytes({0x88, 0x37})));
}

TEST(OIDTest, EncodesBoundaryArcs) {
  EXPECT_EQ(Bytes({0x00}), oidToBytes("0.0"));
  EXPECT_EQ(Bytes({0x27}), oidToBytes("0.39"));
  EXPECT_EQ(Bytes({0x4f}), oidToBytes("1.39"));
  EXPECT_EQ(Bytes({0x50}), oidToBytes("2.0"));
  EXPECT_EQ(Bytes({0x55, 0x7f, 0x81, 0x00}), oidToBytes("2.5.127.128"));
}

TEST(OIDTest, DecodesKnownEncodings) {
  EXPECT_EQ("2.5.4.3", bytesToOid(Bytes({0x55, 0x04, 0x03})));
  EXPECT_EQ("1.2.840.113549.1.1.11",
            bytesToOid(Bytes({0x2a, 0x86, 0x48, 0x86, 0xf7, 0x0d, 0x01, 0x01,
                              0x0b})));
  EXPECT_EQ("0.0", bytesToOid(Bytes({0x00})));
  EXPECT_EQ("1.39", bytesToOid(Bytes({0x4f})));
  EXPECT_EQ("2.0", bytesToOid(Bytes({0x50})));
}

TEST(OIDTest, RoundTripsThroughBytes) {
  const char *oids[] = {"1.2.840.10045.4.3.2", "2.16.840.1.101.3.4.2.1",
                        "1.3.6.1.4.1.311.60.2.1.3", "0.9.2342.19200300.100.1.25",
                        "2.25.18446744073709551615"};
  for (const char *oid : oids) {
    EXPECT_EQ(oid, bytesToOid(oidToBytes(oid))) << oid;
  }
}

TEST(OIDTest, RawBufferOverload) {
  const uint8_t raw[] = {0x55, 0x1d, 0x13};
  EXPECT_EQ("2.5.29.19", bytesToOid(raw, sizeof(raw)));
}

TEST(OIDTest, RejectsInvalidFirstArc) {
  EXPECT_THROW(oidToBytes("3.1"), OIDValidationError);
  EXPECT_THROW(oidToBytes("10.1"), OIDValidationError);
}

TEST(OIDTest, RejectsTooFewArcs) {
  EXPECT_THROW(oidToBytes("1"), OIDValidationError);
  EXPECT_THROW(oidToBytes(""), OIDValidationError);
}

TEST(OIDTest, RejectsMalformedComponents) {
  EXPECT_THROW(oidToBytes("1.a"), OIDValidationError);
  EXPECT_THROW(oidToBytes("1..2"), OIDValidationError);
  EXPECT_THROW(oidToBytes("-1.2"), OIDValidationError);
  EXPECT_THROW(oidToBytes("1.2."), OIDValidationError);
  EXPECT_THROW(oidToBytes(".1.2"), OIDValidationError);
  EXPECT_THROW(oidToBytes("1.2 "), OIDValidationError);
}

TEST(OIDTest, RejectsSecondArcAbove39UnderIsoOrItuT) {
  EXPECT_THROW(oidToBytes("0.40"), OIDValidationError);
  EXPECT_THROW(oidToBytes("1.40"), OIDValidationError);
  EXPECT_NO_THROW(oidToBytes("2.40"));
}

TEST(OIDTest, RejectsArcOverflow) {
  EXPECT_THROW(oidToBytes("1.2.18446744073709551616"), OIDValidationError);
  EXPECT_THROW(oidToBytes("2.18446744073709551615"), OIDValidationError);
}

TEST(OIDTest, RejectsEmptyBytes) {
  EXPECT_THROW(bytesToOid(Bytes()), OIDValidationError);
  EXPECT_THROW(bytesToOid(NULL, 0), OIDValidationError);
}

TEST(OIDTest, RejectsTruncatedSubidentifier) {
  EXPECT_THROW(bytesToOid(Bytes({0x2a, 0x86})), OIDValidationError);
  EXPECT_THROW(bytesToOid(Bytes({0x81})), OIDValidationError);
}

TEST(OIDTest, RejectsPaddedSubidentifier) {
  EXPECT_THROW(bytesToOid(Bytes({0x2a, 0x80, 0x01})), OIDValidationError);
  EXPECT_THROW(bytesToOid(Bytes({0x80, 0x01})), OIDValidationError);
}

TEST(OIDTest, RejectsSubidentifierOverflow) {
  Bytes huge = {0x2a, 0x82, 0xff, 0xff, 0xff, 0xff,
                0xff, 0xff, 0xff, 0xff, 0x7f};
  EXPECT_THROW(bytesToOid(huge), OIDValidationError);
}

TEST(OIDTest, NamesWellKnownOIDs) {
  ASSERT_NE(nullptr, oidName("2.5.4.3"));
  EXPECT_STREQ("commonName", oidName("2.5.4.3"));
  EXPECT_STREQ("sha256WithRSAEncryption", oidName("1.2.840.113549.1.1.11"));
  EXPECT_EQ(nullptr, oidName("1.2.3.4.5"));
}

TEST(OIDTest, ErrorsAreDERExceptions) {
  EXPECT_THROW(oidToBytes("9.9"), DERException);
}

}  // namespace
