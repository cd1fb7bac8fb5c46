//
//  ASN1DERDecoderTest.cpp
//  dertool
//
//  Created by tihmstar on 22.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#include <gtest/gtest.h>

#include <dertool/ASN1DERElement.hpp>
#include <dertool/DERException.hpp>

using namespace tihmstar::dertool;
using Bytes = ASN1DERElement::Bytes;

namespace {

ASN1DERElement decodeBytes(const Bytes &bytes, size_t *outConsumed = NULL) {
  return ASN1DERElement::decode(bytes, outConsumed);
}

TEST(ASN1DERDecoderTest, DecodesNull) {
  ASN1DERElement elem = decodeBytes({0x05, 0x00});
  EXPECT_EQ(ASN1DERElement::Universal, elem.tagClass());
  EXPECT_EQ(5u, elem.tagNumber());
  EXPECT_FALSE(elem.isConstructed());
  EXPECT_TRUE(elem.payload().empty());
}

TEST(ASN1DERDecoderTest, DecodesPrimitivePayload) {
  ASN1DERElement elem = decodeBytes({0x02, 0x01, 0x7f});
  EXPECT_EQ(2u, elem.tagNumber());
  EXPECT_EQ(Bytes({0x7f}), elem.payload());

  elem = decodeBytes({0x01, 0x01, 0xff});
  EXPECT_EQ(1u, elem.tagNumber());
  EXPECT_EQ(Bytes({0xff}), elem.payload());
}

TEST(ASN1DERDecoderTest, DecodesSequenceChildren) {
  ASN1DERElement elem =
      decodeBytes({0x30, 0x06, 0x02, 0x01, 0x01, 0x01, 0x01, 0xff});
  EXPECT_EQ(ASN1DERElement::Universal, elem.tagClass());
  EXPECT_EQ(16u, elem.tagNumber());
  ASSERT_TRUE(elem.isConstructed());
  ASSERT_EQ(2u, elem.childCount());
  EXPECT_EQ(2u, elem[0].tagNumber());
  EXPECT_EQ(Bytes({0x01}), elem[0].payload());
  EXPECT_EQ(1u, elem[1].tagNumber());
  EXPECT_EQ(Bytes({0xff}), elem[1].payload());
}

TEST(ASN1DERDecoderTest, DecodesEmptyConstructed) {
  ASN1DERElement elem = decodeBytes({0x30, 0x00});
  ASSERT_TRUE(elem.isConstructed());
  EXPECT_EQ(0u, elem.childCount());
}

TEST(ASN1DERDecoderTest, DecodesTagClasses) {
  ASN1DERElement context = decodeBytes({0xa0, 0x03, 0x02, 0x01, 0x2a});
  EXPECT_EQ(ASN1DERElement::ContextSpecific, context.tagClass());
  EXPECT_EQ(0u, context.tagNumber());
  EXPECT_TRUE(context.isConstructed());
  EXPECT_EQ(Bytes({0x2a}), context[0].payload());

  ASN1DERElement application = decodeBytes({0x43, 0x01, 0x00});
  EXPECT_EQ(ASN1DERElement::Application, application.tagClass());
  EXPECT_EQ(3u, application.tagNumber());
  EXPECT_FALSE(application.isConstructed());

  ASN1DERElement priv = decodeBytes({0xc1, 0x00});
  EXPECT_EQ(ASN1DERElement::Private, priv.tagClass());
  EXPECT_EQ(1u, priv.tagNumber());
}

TEST(ASN1DERDecoderTest, DecodesLongFormTag) {
  ASN1DERElement elem = decodeBytes({0x9f, 0x1f, 0x01, 0xaa});
  EXPECT_EQ(ASN1DERElement::ContextSpecific, elem.tagClass());
  EXPECT_EQ(31u, elem.tagNumber());
  EXPECT_EQ(Bytes({0xaa}), elem.payload());

  // 0x81 0x00 -> 128
  elem = decodeBytes({0x5f, 0x81, 0x00, 0x00});
  EXPECT_EQ(ASN1DERElement::Application, elem.tagClass());
  EXPECT_EQ(128u, elem.tagNumber());
}

TEST(ASN1DERDecoderTest, DecodesLongFormLength) {
  Bytes input = {0x04, 0x81, 0xc8};
  input.insert(input.end(), 200, 0x41);
  ASN1DERElement elem = decodeBytes(input);
  EXPECT_EQ(200u, elem.payload().size());

  input = {0x04, 0x82, 0x01, 0x00};
  input.insert(input.end(), 256, 0x00);
  EXPECT_EQ(256u, decodeBytes(input).payload().size());
}

TEST(ASN1DERDecoderTest, IgnoresTrailingBytes) {
  size_t consumed = 0;
  ASN1DERElement elem = decodeBytes({0x02, 0x01, 0x05, 0xde, 0xad}, &consumed);
  EXPECT_EQ(3u, consumed);
  EXPECT_EQ(Bytes({0x05}), elem.payload());
}

TEST(ASN1DERDecoderTest, ConstructorDecodes) {
  const uint8_t good[] = {0x30, 0x02, 0x05, 0x00};
  ASN1DERElement elem(good, sizeof(good));
  EXPECT_TRUE(elem.isConstructed());
  EXPECT_EQ(ASN1DERElement::makeASN1Null(), elem[0]);

  // the NULL's length octet lies outside the SEQUENCE
  const uint8_t bad[] = {0x30, 0x01, 0x05, 0x00};
  EXPECT_THROW(ASN1DERElement(bad, sizeof(bad)), DERInvalidEncoding);
}

TEST(ASN1DERDecoderTest, PayloadIsCopied) {
  Bytes input = {0x04, 0x02, 0x11, 0x22};
  ASN1DERElement elem = decodeBytes(input);
  input[2] = 0x00;
  EXPECT_EQ(Bytes({0x11, 0x22}), elem.payload());
}

TEST(ASN1DERDecoderTest, RejectsEmptyInput) {
  EXPECT_THROW(decodeBytes({}), DERTruncated);
  EXPECT_THROW(ASN1DERElement::decode(NULL, 0), DERTruncated);
}

TEST(ASN1DERDecoderTest, RejectsTruncatedValue) {
  EXPECT_THROW(decodeBytes({0x02, 0x05, 0x01}), DERTruncated);
}

TEST(ASN1DERDecoderTest, RejectsMissingLength) {
  EXPECT_THROW(decodeBytes({0x02}), DERTruncated);
}

TEST(ASN1DERDecoderTest, RejectsTruncatedLongFormLength) {
  EXPECT_THROW(decodeBytes({0x04, 0x82, 0x01}), DERTruncated);
}

TEST(ASN1DERDecoderTest, RejectsTruncatedLongFormTag) {
  EXPECT_THROW(decodeBytes({0x1f}), DERTruncated);
  EXPECT_THROW(decodeBytes({0x1f, 0x81, 0x82}), DERTruncated);
}

TEST(ASN1DERDecoderTest, RejectsIndefiniteLength) {
  EXPECT_THROW(decodeBytes({0x30, 0x80, 0x00, 0x00}), DERInvalidEncoding);
}

TEST(ASN1DERDecoderTest, RejectsZeroCountLongFormLength) {
  // 0x80 alone is indefinite, 0x80 | 0 can't be anything else
  EXPECT_THROW(decodeBytes({0x04, 0x80}), DERInvalidEncoding);
}

TEST(ASN1DERDecoderTest, RejectsOversizedLength) {
  Bytes input = {0x04, 0x89, 0x01, 0x00, 0x00, 0x00, 0x00,
                 0x00, 0x00, 0x00, 0x00, 0x00};
  EXPECT_THROW(decodeBytes(input), DERInvalidEncoding);
}

TEST(ASN1DERDecoderTest, RejectsOversizedTagNumber) {
  EXPECT_THROW(decodeBytes({0x1f, 0xff, 0xff, 0xff, 0xff, 0x7f, 0x00}),
               DERInvalidEncoding);
}

TEST(ASN1DERDecoderTest, RejectsChildOverrunningParent) {
  // SEQUENCE claims 3 bytes, the INTEGER inside claims 5
  EXPECT_THROW(decodeBytes({0x30, 0x03, 0x02, 0x05, 0x01, 0x00, 0x00, 0x00,
                            0x00}),
               DERInvalidEncoding);
  // child header cut by the parent boundary
  EXPECT_THROW(decodeBytes({0x30, 0x01, 0x02, 0x01, 0x00}), DERInvalidEncoding);
}

TEST(ASN1DERDecoderTest, RejectsTruncatedChild) {
  EXPECT_THROW(decodeBytes({0x30, 0x03, 0x02, 0x05, 0x01}), DERTruncated);
}

TEST(ASN1DERDecoderTest, EnforcesMaxDepth) {
  Bytes nested = {0x30, 0x04, 0x30, 0x02, 0x30, 0x00};
  EXPECT_NO_THROW(ASN1DERElement::decode(nested, NULL, 3));
  EXPECT_THROW(ASN1DERElement::decode(nested, NULL, 2), DERNestingTooDeep);

  Bytes flat = {0x30, 0x03, 0x02, 0x01, 0x01};
  EXPECT_NO_THROW(ASN1DERElement::decode(flat, NULL, 1));
  EXPECT_THROW(ASN1DERElement::decode(flat, NULL, 0), DERNestingTooDeep);
}

TEST(ASN1DERDecoderTest, DefaultDepthRejectsPathologicalNesting) {
  // 100 levels of SEQUENCE around an empty one
  Bytes input = {0x30, 0x00};
  for (int i = 0; i < 100; i++) {
    Bytes outer = {0x30, (uint8_t)input.size()};
    if (input.size() >= 0x80)
      outer = {0x30, 0x81, (uint8_t)input.size()};
    outer.insert(outer.end(), input.begin(), input.end());
    input = outer;
  }
  EXPECT_THROW(decodeBytes(input), DERNestingTooDeep);
}

TEST(ASN1DERDecoderTest, ErrorsAreDERExceptions) {
  EXPECT_THROW(decodeBytes({0x02, 0x05, 0x01}), DERException);
  EXPECT_THROW(decodeBytes({0x02, 0x05, 0x01}), tihmstar::exception);
}

}  // namespace
