//
//  ASN1DERElement.cpp
//  dertool
//
//  Created by tihmstar on 04.10.19.
//  Copyright © 2019 tihmstar. All rights reserved.
//

#include "../include/dertool/ASN1DERElement.hpp"
#include "../include/dertool/DERException.hpp"
#include <libgeneral/macros.h>

using namespace tihmstar;
using namespace tihmstar::dertool;

#pragma mark ASN1DERElement

ASN1DERElement::ASN1DERElement() :
    _tagClass(Universal),
    _tagNumber(TagNULL),
    _value(Bytes{})
{
    //
}

ASN1DERElement::ASN1DERElement(TagClass tagClass, uint32_t tagNumber, Bytes payload) :
    _tagClass(tagClass),
    _tagNumber(tagNumber),
    _value(std::in_place_index<0>, std::move(payload))
{
    //
}

ASN1DERElement::ASN1DERElement(TagClass tagClass, uint32_t tagNumber, Children children) :
    _tagClass(tagClass),
    _tagNumber(tagNumber),
    _value(std::in_place_index<1>, std::move(children))
{
    //
}

ASN1DERElement::ASN1DERElement(const void *buf, size_t bufSize) :
    ASN1DERElement(decode(buf, bufSize))
{
    //
}

ASN1DERElement::TagClass ASN1DERElement::tagClass() const{
    return _tagClass;
}

uint32_t ASN1DERElement::tagNumber() const{
    return _tagNumber;
}

bool ASN1DERElement::isConstructed() const{
    return _value.index() == 1;
}

bool ASN1DERElement::isUniversal(uint32_t tagNumber) const{
    return _tagClass == Universal && _tagNumber == tagNumber;
}

const ASN1DERElement::Bytes &ASN1DERElement::payload() const{
    retcustomassure(dertool::DERTypeMismatch, !isConstructed(), "payload() called on constructed element with tag %u",_tagNumber);
    return std::get<0>(_value);
}

const ASN1DERElement::Children &ASN1DERElement::children() const{
    retcustomassure(dertool::DERTypeMismatch, isConstructed(), "children() called on primitive element with tag %u",_tagNumber);
    return std::get<1>(_value);
}

size_t ASN1DERElement::childCount() const{
    return children().size();
}

const ASN1DERElement &ASN1DERElement::operator[](uint32_t i) const{
    const Children &elems = children();
    retcustomassure(dertool::DERTypeMismatch, i < elems.size(), "index %u out of range, element has %zu children",i,elems.size());
    return elems[i];
}

ASN1DERElement::Children::const_iterator ASN1DERElement::begin() const{
    return children().begin();
}

ASN1DERElement::Children::const_iterator ASN1DERElement::end() const{
    return children().end();
}

bool ASN1DERElement::operator==(const ASN1DERElement &other) const{
    return _tagClass == other._tagClass
        && _tagNumber == other._tagNumber
        && _value == other._value;
}

bool ASN1DERElement::operator!=(const ASN1DERElement &other) const{
    return !(*this == other);
}
