//
//  ASN1DERDecoder.cpp
//  dertool
//
//  Created by tihmstar on 19.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#include "../include/dertool/ASN1DERElement.hpp"
#include "../include/dertool/DERException.hpp"
#include <libgeneral/macros.h>

using namespace tihmstar;
using namespace tihmstar::dertool;

#pragma mark helper

namespace {
    /*
        Running past limit is only truncation if limit is the end of the
        input. Otherwise a child TLV tried to leave its parent's value.
     */
    void checkAvailable(size_t pos, size_t need, size_t limit, size_t bufSize, const char *what){
        if (need <= limit - pos) return;
        if (limit < bufSize) {
            retcustomerror(dertool::DERInvalidEncoding, "%s at offset %zu overruns enclosing value ending at offset %zu",what,pos,limit);
        }
        retcustomerror(dertool::DERTruncated, "truncated %s at offset %zu: expected %zu bytes but only %zu available",what,pos,need,limit-pos);
    }
};

#pragma mark decoding

ASN1DERElement ASN1DERElement::decodeTLV(const uint8_t *buf, size_t bufSize, size_t pos, size_t limit, uint32_t depth, uint32_t maxDepth, size_t *outEnd){
    size_t tagPos = pos;

    checkAvailable(pos, 1, limit, bufSize, "tag");
    uint8_t ident = buf[pos++];

    TagClass tagClass = (TagClass)(ident >> 6);
    bool isConstructed = (ident & 0x20) != 0;
    uint32_t tagNumber = ident & 0x1f;

    if (tagNumber == TagLongForm) {
        uint8_t b = 0;
        tagNumber = 0;
        do {
            checkAvailable(pos, 1, limit, bufSize, "long form tag");
            b = buf[pos++];
            retcustomassure(dertool::DERInvalidEncoding, (tagNumber >> 25) == 0, "long form tag at offset %zu does not fit into 32 bits",tagPos);
            tagNumber = (tagNumber << 7) | (b & 0x7f);
        } while (b & 0x80);
    }

    checkAvailable(pos, 1, limit, bufSize, "length");
    size_t lenPos = pos;
    uint8_t lenByte = buf[pos++];
    size_t length = 0;

    if (lenByte == 0x80) {
        retcustomerror(dertool::DERInvalidEncoding, "indefinite length at offset %zu is not allowed in DER",lenPos);
    } else if (lenByte < 0x80) {
        length = lenByte;
    } else {
        uint8_t lenBytes = lenByte & 0x7f;
        retcustomassure(dertool::DERInvalidEncoding, lenBytes != 0, "long form length at offset %zu has zero length octets",lenPos);
        retcustomassure(dertool::DERInvalidEncoding, lenBytes <= sizeof(size_t), "long form length at offset %zu uses %u octets, can't hold more than size_t",lenPos,lenBytes);
        checkAvailable(pos, lenBytes, limit, bufSize, "long form length");
        for (uint8_t i = 0; i < lenBytes; i++) {
            length <<= 8;
            length |= buf[pos++];
        }
    }

    checkAvailable(pos, length, limit, bufSize, "value");
    size_t end = pos + length;
    if (outEnd) *outEnd = end;

    if (!isConstructed) {
        return {tagClass, tagNumber, Bytes(buf+pos, buf+end)};
    }

    if (depth >= maxDepth) {
        debug("giving up on constructed element at offset %zu (depth %u)",tagPos,depth);
        retcustomerror(dertool::DERNestingTooDeep, "constructed element at offset %zu exceeds maximum nesting depth of %u",tagPos,maxDepth);
    }

    Children children;
    while (pos < end) {
        size_t childEnd = 0;
        children.push_back(decodeTLV(buf, bufSize, pos, end, depth+1, maxDepth, &childEnd));
        pos = childEnd;
    }
    return {tagClass, tagNumber, std::move(children)};
}

ASN1DERElement ASN1DERElement::decode(const void *buf, size_t bufSize, size_t *outConsumed, uint32_t maxDepth){
    retcustomassure(dertool::DERTruncated, buf && bufSize, "can't decode empty buffer");
    size_t end = 0;
    ASN1DERElement ret = decodeTLV((const uint8_t*)buf, bufSize, 0, bufSize, 0, maxDepth, &end);
    if (outConsumed) *outConsumed = end;
    return ret;
}

ASN1DERElement ASN1DERElement::decode(const Bytes &buf, size_t *outConsumed, uint32_t maxDepth){
    return decode(buf.data(), buf.size(), outConsumed, maxDepth);
}
