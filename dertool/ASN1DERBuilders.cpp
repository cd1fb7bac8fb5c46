//
//  ASN1DERBuilders.cpp
//  dertool
//
//  Created by tihmstar on 20.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#include "../include/dertool/ASN1DERElement.hpp"
#include "../include/dertool/DERException.hpp"
#include "../include/dertool/OID.hpp"
#include <libgeneral/macros.h>
#include <stdio.h>
#include <string.h>

using namespace tihmstar;
using namespace tihmstar::dertool;

#pragma mark helper

namespace {
    struct tm utcTime(time_t date){
        struct tm t = {};
        retassure(gmtime_r(&date, &t), "failed to convert time %lld to UTC",(long long)date);
        return t;
    }

    std::string formatTime(const struct tm &t, int year, int yearDigits){
        char buf[32] = {};
        snprintf(buf, sizeof(buf), "%0*d%02d%02d%02d%02d%02dZ",yearDigits,year,t.tm_mon+1,t.tm_mday,t.tm_hour,t.tm_min,t.tm_sec);
        return buf;
    }

    //drop sign extension octets that don't change the value
    void trimTwosComplement(ASN1DERElement::Bytes &bytes){
        size_t skip = 0;
        while (skip+1 < bytes.size()) {
            if (bytes[skip] == 0x00 && (bytes[skip+1] & 0x80) == 0) skip++;
            else if (bytes[skip] == 0xff && (bytes[skip+1] & 0x80) != 0) skip++;
            else break;
        }
        bytes.erase(bytes.begin(), bytes.begin()+skip);
    }
};

#pragma mark constructed

ASN1DERElement ASN1DERElement::makeASN1Sequence(Children children){
    return {Universal, TagSEQUENCE, std::move(children)};
}

ASN1DERElement ASN1DERElement::makeASN1Set(Children children){
    return {Universal, TagSET, std::move(children)};
}

ASN1DERElement ASN1DERElement::makeASN1ContextTag(uint32_t tagNumber, Children children, bool isExplicit){
    if (isExplicit) {
        return {ContextSpecific, tagNumber, std::move(children)};
    }

    retcustomassure(dertool::DERInvalidEncoding, children.size() == 1, "implicit context tag [%u] requires exactly one child, got %zu",tagNumber,children.size());
    const ASN1DERElement &child = children.front();
    if (child.isConstructed()) {
        return {ContextSpecific, tagNumber, child.children()};
    }
    return {ContextSpecific, tagNumber, child.payload()};
}

#pragma mark primitive

ASN1DERElement ASN1DERElement::makeASN1Integer(int64_t num){
    Bytes bytes(8);
    uint64_t val = (uint64_t)num;
    for (int i = 7; i >= 0; i--) {
        bytes[i] = val & 0xff;
        val >>= 8;
    }
    trimTwosComplement(bytes);
    return {Universal, TagINTEGER, std::move(bytes)};
}

ASN1DERElement ASN1DERElement::makeASN1BigInteger(const BIGNUM *num){
    BIGNUM *mag = NULL;
    BN_CTX *ctx = NULL;
    cleanup([&]{
        safeFreeCustom(mag, BN_free);
        safeFreeCustom(ctx, BN_CTX_free);
    });
    assure(num);

    if (BN_is_zero(num)) {
        return {Universal, TagINTEGER, Bytes{0x00}};
    }

    if (!BN_is_negative(num)) {
        Bytes bytes(BN_num_bytes(num)+1);
        BN_bn2bin(num, bytes.data()+1);
        trimTwosComplement(bytes);
        return {Universal, TagINTEGER, std::move(bytes)};
    }

    /*
        two's complement of a negative value -v on n octets is 2^(8n) - v,
        with n large enough that 2^(8n-1) >= v
     */
    int nbytes = BN_num_bytes(num)+1;
    assure(mag = BN_new());
    assure(ctx = BN_CTX_new());
    assure(BN_set_bit(mag, nbytes*8));
    assure(BN_add(mag, mag, num));

    Bytes bytes(nbytes);
    int magBytes = BN_num_bytes(mag);
    assure(magBytes <= nbytes);
    memset(bytes.data(), 0xff, nbytes-magBytes);
    BN_bn2bin(mag, bytes.data()+(nbytes-magBytes));
    trimTwosComplement(bytes);
    return {Universal, TagINTEGER, std::move(bytes)};
}

ASN1DERElement ASN1DERElement::makeASN1OID(const std::string &dotString){
    return {Universal, TagOBJECT, oidToBytes(dotString)};
}

ASN1DERElement ASN1DERElement::makeASN1OctetString(const void *buf, size_t size){
    const uint8_t *p = (const uint8_t *)buf;
    return {Universal, TagOCTET, Bytes(p, p+size)};
}

ASN1DERElement ASN1DERElement::makeASN1BitString(const void *buf, size_t size, uint8_t unusedBits){
    const uint8_t *p = (const uint8_t *)buf;
    retcustomassure(dertool::DERInvalidEncoding, unusedBits <= 7, "BIT STRING can't have %u unused bits",unusedBits);
    retcustomassure(dertool::DERInvalidEncoding, size || !unusedBits, "empty BIT STRING can't have unused bits");
    Bytes bytes{unusedBits};
    bytes.insert(bytes.end(), p, p+size);
    return {Universal, TagBIT, std::move(bytes)};
}

ASN1DERElement ASN1DERElement::makeASN1UTF8String(const std::string &str){
    return {Universal, TagUTF8String, Bytes(str.begin(), str.end())};
}

ASN1DERElement ASN1DERElement::makeASN1IA5String(const std::string &str){
    return {Universal, TagIA5String, Bytes(str.begin(), str.end())};
}

ASN1DERElement ASN1DERElement::makeASN1PrintableString(const std::string &str){
    return {Universal, TagPrintableString, Bytes(str.begin(), str.end())};
}

ASN1DERElement ASN1DERElement::makeASN1Boolean(bool val){
    return {Universal, TagBOOLEAN, Bytes{(uint8_t)(val ? 0xff : 0x00)}};
}

ASN1DERElement ASN1DERElement::makeASN1Null(){
    return {};
}

ASN1DERElement ASN1DERElement::makeASN1UTCTime(time_t date){
    struct tm t = utcTime(date);
    int year = t.tm_year + 1900;
    std::string str = formatTime(t, ((year % 100) + 100) % 100, 2);
    return {Universal, TagUTCTime, Bytes(str.begin(), str.end())};
}

ASN1DERElement ASN1DERElement::makeASN1GeneralizedTime(time_t date){
    struct tm t = utcTime(date);
    int year = t.tm_year + 1900;
    retcustomassure(dertool::DERInvalidEncoding, year >= 0 && year <= 9999, "year %d doesn't fit into GeneralizedTime",year);
    std::string str = formatTime(t, year, 4);
    return {Universal, TagGeneralizedTime, Bytes(str.begin(), str.end())};
}
