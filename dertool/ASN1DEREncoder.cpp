//
//  ASN1DEREncoder.cpp
//  dertool
//
//  Created by tihmstar on 19.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#include <algorithm>
#include "../include/dertool/ASN1DERElement.hpp"

using namespace tihmstar::dertool;

#pragma mark helper

ASN1DERElement::Bytes ASN1DERElement::makeASN1Size(size_t size){
    if (size < 0x80) {
        // 1 byte length
        return {(uint8_t)size};
    }
    Bytes ret;
    for (size_t s = size; s; s >>= 8) {
        ret.insert(ret.begin(), (uint8_t)(s & 0xff));
    }
    // 1+n bytes length
    ret.insert(ret.begin(), (uint8_t)(0x80 | ret.size()));
    return ret;
}

ASN1DERElement::Bytes ASN1DERElement::makeASN1Identifier(TagClass tagClass, bool isConstructed, uint32_t tagNumber){
    uint8_t ident = (uint8_t)(tagClass << 6) | (isConstructed ? 0x20 : 0x00);
    if (tagNumber < TagLongForm) {
        return {(uint8_t)(ident | tagNumber)};
    }

    Bytes ret;
    for (uint32_t n = tagNumber; n; n >>= 7) {
        //every octet but the last one has the continuation bit set
        ret.insert(ret.begin(), (uint8_t)((n & 0x7f) | (ret.size() ? 0x80 : 0x00)));
    }
    ret.insert(ret.begin(), (uint8_t)(ident | TagLongForm));
    return ret;
}

#pragma mark encoding

void ASN1DERElement::encodeInto(Bytes &out) const{
    Bytes ident = makeASN1Identifier(_tagClass, isConstructed(), _tagNumber);
    out.insert(out.end(), ident.begin(), ident.end());

    if (!isConstructed()) {
        const Bytes &data = std::get<0>(_value);
        Bytes size = makeASN1Size(data.size());
        out.insert(out.end(), size.begin(), size.end());
        out.insert(out.end(), data.begin(), data.end());
        return;
    }

    const Children &elems = std::get<1>(_value);
    Bytes content;
    if (isUniversal(TagSET)) {
        //DER wants SET OF sorted by the encoding of each element
        std::vector<Bytes> encodedElems;
        encodedElems.reserve(elems.size());
        for (auto &elem : elems) {
            encodedElems.push_back(elem.encode());
        }
        std::sort(encodedElems.begin(), encodedElems.end());
        for (auto &e : encodedElems) {
            content.insert(content.end(), e.begin(), e.end());
        }
    }else{
        for (auto &elem : elems) {
            elem.encodeInto(content);
        }
    }

    Bytes size = makeASN1Size(content.size());
    out.insert(out.end(), size.begin(), size.end());
    out.insert(out.end(), content.begin(), content.end());
}

ASN1DERElement::Bytes ASN1DERElement::encode() const{
    Bytes ret;
    encodeInto(ret);
    return ret;
}

size_t ASN1DERElement::payloadSize() const{
    if (!isConstructed()) {
        return std::get<0>(_value).size();
    }
    size_t ret = 0;
    for (auto &elem : std::get<1>(_value)) {
        ret += elem.size();
    }
    return ret;
}

size_t ASN1DERElement::size() const{
    size_t psize = payloadSize();
    return makeASN1Identifier(_tagClass, isConstructed(), _tagNumber).size() + makeASN1Size(psize).size() + psize;
}
