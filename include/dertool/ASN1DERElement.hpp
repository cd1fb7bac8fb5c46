//
//  ASN1DERElement.hpp
//  dertool
//
//  Created by tihmstar on 04.10.19.
//  Copyright © 2019 tihmstar. All rights reserved.
//

#ifndef ASN1DERElement_hpp
#define ASN1DERElement_hpp

#include <stdint.h>
#include <time.h>
#include <string>
#include <vector>
#include <variant>
#include <openssl/bn.h>

namespace tihmstar {
    namespace dertool {

        constexpr const uint32_t kASN1DERDefaultMaxDepth = 64;

        class ASN1DERElement {
        public:

            enum TagClass{
                Universal      = 0,
                Application    = 1,
                ContextSpecific= 2,
                Private        = 3
            };

            enum TagNumber{
                TagEnd_of_Content  = 0,
                TagBOOLEAN         = 1,
                TagINTEGER         = 2,
                TagBIT             = 3,
                TagOCTET           = 4,
                TagNULL            = 5,
                TagOBJECT          = 6,
                TagObject          = 7,
                TagEXTERNAL        = 8,
                TagREAL            = 9,
                TagENUMERATED      = 10, //0x0A
                TagEMBEDDED        = 11, //0x0B
                TagUTF8String      = 12, //0x0C
                TagRELATIVE_OID    = 13, //0x0D
                TagSEQUENCE        = 16, //0x10
                TagSET             = 17, //0x11
                TagNumericString   = 18, //0x12
                TagPrintableString = 19, //0x13
                TagT61String       = 20, //0x14
                TagVideotexString  = 21, //0x15
                TagIA5String       = 22, //0x16
                TagUTCTime         = 23, //0x17
                TagGeneralizedTime = 24, //0x18
                TagGraphicString   = 25, //0x19
                TagVisibleString   = 26, //0x1A
                TagGeneralString   = 27, //0x1B
                TagUniversalString = 28, //0x1C
                TagCHARACTER       = 29, //0x1D
                TagBMPString       = 30, //0x1E
                TagLongForm        = 31  //0x1F
            };

            using Bytes = std::vector<uint8_t>;
            using Children = std::vector<ASN1DERElement>;

        private:
            TagClass _tagClass;
            uint32_t _tagNumber;
            /*
                Index 0 holds the raw payload of a primitive element,
                index 1 the children of a constructed element.
             */
            std::variant<Bytes, Children> _value;

            static ASN1DERElement decodeTLV(const uint8_t *buf, size_t bufSize, size_t pos, size_t limit, uint32_t depth, uint32_t maxDepth, size_t *outEnd);
            void encodeInto(Bytes &out) const;

        public:
            ASN1DERElement();
            ASN1DERElement(TagClass tagClass, uint32_t tagNumber, Bytes payload);
            ASN1DERElement(TagClass tagClass, uint32_t tagNumber, Children children);
            ASN1DERElement(const void *buf, size_t bufSize);

            TagClass tagClass() const;
            uint32_t tagNumber() const;
            bool isConstructed() const;
            bool isUniversal(uint32_t tagNumber) const;

            const Bytes &payload() const;
            const Children &children() const;
            size_t childCount() const;

            const ASN1DERElement &operator[](uint32_t i) const;
            Children::const_iterator begin() const;
            Children::const_iterator end() const;

            bool operator==(const ASN1DERElement &other) const;
            bool operator!=(const ASN1DERElement &other) const;

#pragma mark decoding
            /*
                Parses exactly one TLV from the start of buf. Bytes following
                that TLV are not looked at, outConsumed receives its size.
             */
            static ASN1DERElement decode(const void *buf, size_t bufSize, size_t *outConsumed = NULL, uint32_t maxDepth = kASN1DERDefaultMaxDepth);
            static ASN1DERElement decode(const Bytes &buf, size_t *outConsumed = NULL, uint32_t maxDepth = kASN1DERDefaultMaxDepth);

#pragma mark encoding
            Bytes encode() const;
            size_t size() const;
            size_t payloadSize() const;

            static Bytes makeASN1Size(size_t size);
            static Bytes makeASN1Identifier(TagClass tagClass, bool isConstructed, uint32_t tagNumber);

#pragma mark values
            std::string getStringValue() const;
            int64_t getIntegerValue() const;
            BIGNUM *getBigIntegerValue() const;
            bool getBoolValue() const;
            std::string getOIDValue() const;
            Bytes getBitStringValue(uint8_t *outUnusedBits = NULL) const;
            time_t getTimeValue() const;

#pragma mark builders
            static ASN1DERElement makeASN1Sequence(Children children);
            static ASN1DERElement makeASN1Set(Children children);
            static ASN1DERElement makeASN1Integer(int64_t num);
            static ASN1DERElement makeASN1BigInteger(const BIGNUM *num);
            static ASN1DERElement makeASN1OID(const std::string &dotString);
            static ASN1DERElement makeASN1OctetString(const void *buf, size_t size);
            static ASN1DERElement makeASN1BitString(const void *buf, size_t size, uint8_t unusedBits = 0);
            static ASN1DERElement makeASN1UTF8String(const std::string &str);
            static ASN1DERElement makeASN1IA5String(const std::string &str);
            static ASN1DERElement makeASN1PrintableString(const std::string &str);
            static ASN1DERElement makeASN1Boolean(bool val);
            static ASN1DERElement makeASN1Null();
            static ASN1DERElement makeASN1UTCTime(time_t date);
            static ASN1DERElement makeASN1GeneralizedTime(time_t date);
            static ASN1DERElement makeASN1ContextTag(uint32_t tagNumber, Children children, bool isExplicit = true);
        };

    };
};

#endif /* ASN1DERElement_hpp */
