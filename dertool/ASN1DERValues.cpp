//
//  ASN1DERValues.cpp
//  dertool
//
//  Created by tihmstar on 21.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#include "../include/dertool/ASN1DERElement.hpp"
#include "../include/dertool/DERException.hpp"
#include "../include/dertool/OID.hpp"
#include <libgeneral/macros.h>
#include <string.h>

using namespace tihmstar;
using namespace tihmstar::dertool;

#pragma mark helper

namespace {
    int parseDigits(const uint8_t *p, int cnt){
        int ret = 0;
        for (int i=0; i<cnt; i++) {
            retcustomassure(dertool::DERInvalidEncoding, p[i] >= '0' && p[i] <= '9', "unexpected character 0x%02x in time value",p[i]);
            ret = ret*10 + (p[i]-'0');
        }
        return ret;
    }
};

#pragma mark values

std::string ASN1DERElement::getStringValue() const{
    retcustomassure(dertool::DERTypeMismatch, _tagClass == Universal && !isConstructed(), "element with tag %u is not a universal primitive",_tagNumber);
    switch (_tagNumber) {
        case TagOCTET:
        case TagUTF8String:
        case TagNumericString:
        case TagPrintableString:
        case TagT61String:
        case TagVideotexString:
        case TagIA5String:
        case TagUTCTime:
        case TagGeneralizedTime:
        case TagGraphicString:
        case TagVisibleString:
        case TagGeneralString:
        case TagUniversalString:
        case TagBMPString:
            break;
        default:
            retcustomerror(dertool::DERTypeMismatch, "element with tag %u is not a string",_tagNumber);
    }
    const Bytes &data = payload();
    return {(const char*)data.data(), data.size()};
}

int64_t ASN1DERElement::getIntegerValue() const{
    retcustomassure(dertool::DERTypeMismatch, isUniversal(TagINTEGER) || isUniversal(TagENUMERATED), "element with tag %u is not an INTEGER",_tagNumber);
    const Bytes &data = payload();
    retcustomassure(dertool::DERInvalidEncoding, data.size(), "INTEGER has empty payload");
    retcustomassure(dertool::DERInvalidEncoding, data.size() <= sizeof(int64_t), "INTEGER with %zu bytes doesn't fit into 64 bits",data.size());

    uint64_t rt = (data[0] & 0x80) ? UINT64_MAX : 0;
    for (uint8_t b : data) {
        rt <<= 8;
        rt |= b;
    }
    return (int64_t)rt;
}

BIGNUM *ASN1DERElement::getBigIntegerValue() const{
    BIGNUM *ret = NULL;
    cleanup([&]{
        safeFreeCustom(ret, BN_free);
    });
    retcustomassure(dertool::DERTypeMismatch, isUniversal(TagINTEGER), "element with tag %u is not an INTEGER",_tagNumber);
    Bytes data = payload();
    retcustomassure(dertool::DERInvalidEncoding, data.size(), "INTEGER has empty payload");

    bool isNegative = data[0] & 0x80;
    if (isNegative) {
        //magnitude of a negative value is the inverted bytes plus one
        for (auto &b : data) b = ~b;
        for (size_t i = data.size(); i-- > 0;) {
            if (++data[i]) break;
        }
    }
    assure(ret = BN_bin2bn(data.data(), (int)data.size(), NULL));
    BN_set_negative(ret, isNegative);

    BIGNUM *rt = ret; ret = NULL;
    return rt;
}

bool ASN1DERElement::getBoolValue() const{
    retcustomassure(dertool::DERTypeMismatch, isUniversal(TagBOOLEAN), "element with tag %u is not a BOOLEAN",_tagNumber);
    const Bytes &data = payload();
    retcustomassure(dertool::DERInvalidEncoding, data.size() == 1, "BOOLEAN must have exactly one byte, got %zu",data.size());
    retcustomassure(dertool::DERInvalidEncoding, data[0] == 0x00 || data[0] == 0xff, "BOOLEAN byte 0x%02x is neither 0x00 nor 0xff",data[0]);
    return data[0] == 0xff;
}

std::string ASN1DERElement::getOIDValue() const{
    retcustomassure(dertool::DERTypeMismatch, isUniversal(TagOBJECT), "element with tag %u is not an OBJECT IDENTIFIER",_tagNumber);
    return bytesToOid(payload());
}

ASN1DERElement::Bytes ASN1DERElement::getBitStringValue(uint8_t *outUnusedBits) const{
    retcustomassure(dertool::DERTypeMismatch, isUniversal(TagBIT), "element with tag %u is not a BIT STRING",_tagNumber);
    const Bytes &data = payload();
    retcustomassure(dertool::DERInvalidEncoding, data.size(), "BIT STRING is missing the unused bits byte");
    retcustomassure(dertool::DERInvalidEncoding, data[0] <= 7, "BIT STRING claims %u unused bits",data[0]);
    retcustomassure(dertool::DERInvalidEncoding, data.size() > 1 || data[0] == 0, "empty BIT STRING can't have unused bits");
    if (outUnusedBits) *outUnusedBits = data[0];
    return {data.begin()+1, data.end()};
}

time_t ASN1DERElement::getTimeValue() const{
    bool isUTC = isUniversal(TagUTCTime);
    retcustomassure(dertool::DERTypeMismatch, isUTC || isUniversal(TagGeneralizedTime), "element with tag %u is not a time",_tagNumber);
    const Bytes &data = payload();
    size_t yearDigits = isUTC ? 2 : 4;
    retcustomassure(dertool::DERInvalidEncoding, data.size() == yearDigits + 11 && data.back() == 'Z', "unsupported time format, expected %zu digits followed by 'Z'",yearDigits+10);

    const uint8_t *p = data.data();
    struct tm t = {};
    int year = parseDigits(p, (int)yearDigits); p += yearDigits;
    if (isUTC) {
        year += (year < 50) ? 2000 : 1900;
    }
    t.tm_year = year - 1900;
    t.tm_mon  = parseDigits(p, 2) - 1; p += 2;
    t.tm_mday = parseDigits(p, 2); p += 2;
    t.tm_hour = parseDigits(p, 2); p += 2;
    t.tm_min  = parseDigits(p, 2); p += 2;
    t.tm_sec  = parseDigits(p, 2);

    retcustomassure(dertool::DERInvalidEncoding, t.tm_mon >= 0 && t.tm_mon < 12 && t.tm_mday >= 1 && t.tm_mday <= 31
                    && t.tm_hour < 24 && t.tm_min < 60 && t.tm_sec < 60, "time value out of range");
    return timegm(&t);
}
