//
//  dertool.cpp
//  dertool
//
//  Created by tihmstar on 04.10.19.
//  Copyright © 2019 tihmstar. All rights reserved.
//

#include "../include/dertool/dertool.hpp"

#include <libgeneral/macros.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <openssl/evp.h>

using namespace tihmstar;
using namespace tihmstar::dertool;

#define INDENTVALUE 3
#define PEM_LINE_LEN 64

#pragma mark private

namespace {
    const char *universalTagName(uint32_t tagNumber){
        switch (tagNumber) {
            case ASN1DERElement::TagEnd_of_Content:  return "END OF CONTENT";
            case ASN1DERElement::TagBOOLEAN:         return "BOOLEAN";
            case ASN1DERElement::TagINTEGER:         return "INTEGER";
            case ASN1DERElement::TagBIT:             return "BIT STRING";
            case ASN1DERElement::TagOCTET:           return "OCTET STRING";
            case ASN1DERElement::TagNULL:            return "NULL";
            case ASN1DERElement::TagOBJECT:          return "OBJECT IDENTIFIER";
            case ASN1DERElement::TagObject:          return "ObjectDescriptor";
            case ASN1DERElement::TagEXTERNAL:        return "EXTERNAL";
            case ASN1DERElement::TagREAL:            return "REAL";
            case ASN1DERElement::TagENUMERATED:      return "ENUMERATED";
            case ASN1DERElement::TagEMBEDDED:        return "EMBEDDED PDV";
            case ASN1DERElement::TagUTF8String:      return "UTF8String";
            case ASN1DERElement::TagRELATIVE_OID:    return "RELATIVE-OID";
            case ASN1DERElement::TagSEQUENCE:        return "SEQUENCE";
            case ASN1DERElement::TagSET:             return "SET";
            case ASN1DERElement::TagNumericString:   return "NumericString";
            case ASN1DERElement::TagPrintableString: return "PrintableString";
            case ASN1DERElement::TagT61String:       return "T61String";
            case ASN1DERElement::TagVideotexString:  return "VideotexString";
            case ASN1DERElement::TagIA5String:       return "IA5String";
            case ASN1DERElement::TagUTCTime:         return "UTCTime";
            case ASN1DERElement::TagGeneralizedTime: return "GeneralizedTime";
            case ASN1DERElement::TagGraphicString:   return "GraphicString";
            case ASN1DERElement::TagVisibleString:   return "VisibleString";
            case ASN1DERElement::TagGeneralString:   return "GeneralString";
            case ASN1DERElement::TagUniversalString: return "UniversalString";
            case ASN1DERElement::TagCHARACTER:       return "CHARACTER STRING";
            case ASN1DERElement::TagBMPString:       return "BMPString";
            default:
                return NULL;
        }
    }

    std::string hexString(const uint8_t *buf, size_t size){
        std::string ret;
        char tmp[3] = {};
        for (size_t i=0; i<size; i++) {
            snprintf(tmp, sizeof(tmp), "%02x",buf[i]);
            ret += tmp;
        }
        return ret;
    }

    bool isPrintable(const ASN1DERElement::Bytes &data){
        for (uint8_t c : data) {
            if (!isprint(c)) return false;
        }
        return true;
    }

    /*
        OCTET STRINGs and BIT STRINGs frequently wrap a complete DER value
        (extensions, public keys). Returns true if data is exactly one
        constructed element no deeper than maxDepth.
     */
    bool tryDecodeEncapsulated(const uint8_t *buf, size_t size, uint32_t maxDepth, ASN1DERElement &outElem){
        if (!size || !maxDepth) return false;
        size_t consumed = 0;
        try {
            ASN1DERElement elem = ASN1DERElement::decode(buf, size, &consumed, maxDepth);
            if (consumed != size || !elem.isConstructed()) return false;
            outElem = std::move(elem);
            return true;
        } catch (dertool::DERException &) {
            return false;
        }
    }

    void printValue(std::string &out, const ASN1DERElement &elem){
        const ASN1DERElement::Bytes &data = elem.payload();
        if (elem.tagClass() != ASN1DERElement::Universal) {
            out += hexString(data.data(), data.size());
            return;
        }

        switch (elem.tagNumber()) {
            case ASN1DERElement::TagBOOLEAN:
                out += elem.getBoolValue() ? "true" : "false";
                break;
            case ASN1DERElement::TagINTEGER:
            case ASN1DERElement::TagENUMERATED:
                if (data.size() && data.size() <= sizeof(int64_t)) {
                    out += std::to_string(elem.getIntegerValue());
                }else{
                    out += "0x" + hexString(data.data(), data.size());
                }
                break;
            case ASN1DERElement::TagNULL:
                break;
            case ASN1DERElement::TagOBJECT:
            {
                std::string oid = elem.getOIDValue();
                out += oid;
                if (const char *name = oidName(oid)) {
                    out += " (";
                    out += name;
                    out += ")";
                }
                break;
            }
            case ASN1DERElement::TagOCTET:
                if (isPrintable(data)) {
                    out += elem.getStringValue();
                }else{
                    out += hexString(data.data(), data.size());
                }
                break;
            case ASN1DERElement::TagBIT:
            {
                uint8_t unused = 0;
                ASN1DERElement::Bytes bits = elem.getBitStringValue(&unused);
                out += hexString(bits.data(), bits.size());
                if (unused) {
                    out += " (" + std::to_string(unused) + " unused bits)";
                }
                break;
            }
            case ASN1DERElement::TagUTF8String:
            case ASN1DERElement::TagNumericString:
            case ASN1DERElement::TagPrintableString:
            case ASN1DERElement::TagT61String:
            case ASN1DERElement::TagIA5String:
            case ASN1DERElement::TagVisibleString:
            case ASN1DERElement::TagUTCTime:
            case ASN1DERElement::TagGeneralizedTime:
                out += elem.getStringValue();
                break;
            default:
                out += hexString(data.data(), data.size());
                break;
        }
    }

    /*
        depthLeft is the number of nesting levels still allowed below elem.
        Encapsulated values are only decoded while it is non-zero, so the
        printed tree never nests deeper than the caller's maxDepth.
     */
    void printRecSequence(std::string &out, const ASN1DERElement &elem, int indent, uint32_t depthLeft){
        uint32_t childDepth = depthLeft ? depthLeft-1 : 0;
        out.append(indent*INDENTVALUE, ' ');
        out += tagName(elem);

        if (elem.isConstructed()) {
            out += "\n";
            for (auto &child : elem) {
                printRecSequence(out, child, indent+1, childDepth);
            }
            return;
        }

        const ASN1DERElement::Bytes &data = elem.payload();
        const uint8_t *inner = NULL;
        size_t innerSize = 0;
        if (elem.isUniversal(ASN1DERElement::TagOCTET)) {
            inner = data.data();
            innerSize = data.size();
        } else if (elem.isUniversal(ASN1DERElement::TagBIT) && data.size() > 1 && data[0] == 0) {
            inner = data.data()+1;
            innerSize = data.size()-1;
        }
        if (inner) {
            ASN1DERElement subelem;
            if (tryDecodeEncapsulated(inner, innerSize, depthLeft, subelem)) {
                out += " (encapsulates)\n";
                printRecSequence(out, subelem, indent+1, childDepth);
                return;
            }
        }

        if (data.size() || !elem.isUniversal(ASN1DERElement::TagNULL)) {
            out += ": ";
            printValue(out, elem);
        }
        out += "\n";
    }

    std::string base64Encode(const uint8_t *buf, size_t size){
        std::string ret;
        if (!size) return ret;
        ret.resize(4*((size+2)/3)+1);
        int len = EVP_EncodeBlock((unsigned char*)&ret[0], buf, (int)size);
        retassure(len >= 0, "base64 encoding failed");
        ret.resize(len);
        return ret;
    }

    std::vector<uint8_t> base64Decode(const std::string &str){
        std::vector<uint8_t> ret;
        if (!str.size()) return ret;
        retassure(str.size() % 4 == 0, "base64 body has invalid length %zu",str.size());
        ret.resize(3*(str.size()/4));
        int len = EVP_DecodeBlock(ret.data(), (const unsigned char*)str.data(), (int)str.size());
        retassure(len >= 0, "invalid base64 body");

        //EVP_DecodeBlock keeps the zero bytes produced by '=' padding
        size_t padding = 0;
        for (size_t i = str.size(); i-- > 0 && str[i] == '=';) padding++;
        retassure(padding <= 2 && (size_t)len >= padding, "invalid base64 padding");
        ret.resize(len - padding);
        return ret;
    }
};

#pragma mark public

const char *tihmstar::dertool::version(){
    return VERSION_STRING;
}

std::string tihmstar::dertool::tagName(const ASN1DERElement &elem){
    uint32_t num = elem.tagNumber();
    switch (elem.tagClass()) {
        case ASN1DERElement::Universal:
            if (const char *name = universalTagName(num)) return name;
            return "[UNIVERSAL " + std::to_string(num) + "]";
        case ASN1DERElement::Application:
            return "[APPLICATION " + std::to_string(num) + "]";
        case ASN1DERElement::ContextSpecific:
            return "[" + std::to_string(num) + "]";
        case ASN1DERElement::Private:
            return "[PRIVATE " + std::to_string(num) + "]";
    }
    reterror("unknown tag class %d",elem.tagClass());
}

void tihmstar::dertool::printDERTree(const ASN1DERElement &elem, int indent, uint32_t maxDepth){
    std::string str = printDERTreeString(elem, indent, maxDepth);
    printf("%s",str.c_str());
}

std::string tihmstar::dertool::printDERTreeString(const ASN1DERElement &elem, int indent, uint32_t maxDepth){
    std::string ret;
    printRecSequence(ret, elem, indent, maxDepth);
    return ret;
}

bool tihmstar::dertool::isPEM(const void *buf, size_t size){
    const char *p = (const char *)buf;
    size_t i = 0;
    while (i < size && isspace((unsigned char)p[i])) i++;
    return size - i >= 11 && strncmp(&p[i], "-----BEGIN ", 11) == 0;
}

std::vector<uint8_t> tihmstar::dertool::pemToDER(const std::string &pem, std::string *outLabel){
    size_t begin = pem.find("-----BEGIN ");
    retassure(begin != std::string::npos, "no PEM header found");
    size_t labelStart = begin + 11;
    size_t labelEnd = pem.find("-----", labelStart);
    retassure(labelEnd != std::string::npos, "unterminated PEM header");
    std::string label = pem.substr(labelStart, labelEnd-labelStart);

    std::string footer = "-----END " + label + "-----";
    size_t bodyStart = labelEnd + 5;
    size_t bodyEnd = pem.find(footer, bodyStart);
    retassure(bodyEnd != std::string::npos, "missing PEM footer '%s'",footer.c_str());

    std::string body;
    for (size_t i = bodyStart; i < bodyEnd; i++) {
        if (!isspace((unsigned char)pem[i])) body += pem[i];
    }
    debug("decoding PEM block '%s' with %zu base64 characters",label.c_str(),body.size());

    if (outLabel) *outLabel = label;
    return base64Decode(body);
}

std::string tihmstar::dertool::derToPEM(const void *buf, size_t size, const std::string &label){
    std::string b64 = base64Encode((const uint8_t *)buf, size);
    std::string ret = "-----BEGIN " + label + "-----\n";
    for (size_t i = 0; i < b64.size(); i += PEM_LINE_LEN) {
        ret += b64.substr(i, PEM_LINE_LEN);
        ret += "\n";
    }
    ret += "-----END " + label + "-----\n";
    return ret;
}

std::vector<uint8_t> tihmstar::dertool::parseHex(const char *hex){
    std::vector<uint8_t> ret;
    size_t len = strlen(hex);
    retassure((len & 1) == 0, "hex string has odd length");
    for (size_t i=0; i<len; i+=2) {
        retassure(isxdigit((unsigned char)hex[i]) && isxdigit((unsigned char)hex[i+1]), "invalid hex byte at offset %zu",i);
        char byte[3] = {hex[i], hex[i+1], '\0'};
        ret.push_back((uint8_t)strtoul(byte, NULL, 16));
    }
    return ret;
}

#ifdef HAVE_PLIST
namespace {
    const char *tagClassName(ASN1DERElement::TagClass tagClass){
        switch (tagClass) {
            case ASN1DERElement::Universal:       return "universal";
            case ASN1DERElement::Application:     return "application";
            case ASN1DERElement::ContextSpecific: return "context";
            case ASN1DERElement::Private:         return "private";
        }
        reterror("unknown tag class %d",tagClass);
    }
};

plist_t tihmstar::dertool::derToPlist(const ASN1DERElement &elem){
    plist_t ret = NULL;
    plist_t children = NULL;
    cleanup([&]{
        safeFreeCustom(children, plist_free);
        safeFreeCustom(ret, plist_free);
    });

    assure(ret = plist_new_dict());
    plist_dict_set_item(ret, "class", plist_new_string(tagClassName(elem.tagClass())));
    plist_dict_set_item(ret, "tag", plist_new_uint(elem.tagNumber()));
    plist_dict_set_item(ret, "constructed", plist_new_bool(elem.isConstructed()));

    if (elem.isConstructed()) {
        assure(children = plist_new_array());
        for (auto &child : elem) {
            plist_array_append_item(children, derToPlist(child));
        }
        plist_dict_set_item(ret, "children", children); children = NULL;
    }else{
        const ASN1DERElement::Bytes &data = elem.payload();
        plist_dict_set_item(ret, "value", plist_new_data((const char*)data.data(), data.size()));
    }

    plist_t rt = ret; ret = NULL;
    return rt;
}

namespace {
    ASN1DERElement elementFromPlist(plist_t node, uint32_t depth, uint32_t maxDepth){
        char *className = NULL;
        char *data = NULL;
        cleanup([&]{
            safeFree(className);
            safeFree(data);
        });
        plist_t pClass = NULL;
        plist_t pTag = NULL;
        plist_t pConstructed = NULL;
        uint64_t tagNumber = 0;
        uint8_t isConstructed = 0;
        ASN1DERElement::TagClass tagClass = ASN1DERElement::Universal;

        retassure(node && plist_get_node_type(node) == PLIST_DICT, "element node is not a dict");
        retassure(pClass = plist_dict_get_item(node, "class"), "element is missing 'class'");
        retassure(pTag = plist_dict_get_item(node, "tag"), "element is missing 'tag'");
        retassure(pConstructed = plist_dict_get_item(node, "constructed"), "element is missing 'constructed'");
        retassure(plist_get_node_type(pClass) == PLIST_STRING, "'class' is not a string");
        retassure(plist_get_node_type(pTag) == PLIST_UINT, "'tag' is not an integer");
        retassure(plist_get_node_type(pConstructed) == PLIST_BOOLEAN, "'constructed' is not a bool");

        plist_get_string_val(pClass, &className);
        plist_get_uint_val(pTag, &tagNumber);
        plist_get_bool_val(pConstructed, &isConstructed);
        retassure(className, "failed to read 'class'");
        retassure(tagNumber <= UINT32_MAX, "tag %llu doesn't fit into 32 bits",(unsigned long long)tagNumber);

        if (strcmp(className, "universal") == 0) {
            tagClass = ASN1DERElement::Universal;
        } else if (strcmp(className, "application") == 0) {
            tagClass = ASN1DERElement::Application;
        } else if (strcmp(className, "context") == 0) {
            tagClass = ASN1DERElement::ContextSpecific;
        } else if (strcmp(className, "private") == 0) {
            tagClass = ASN1DERElement::Private;
        } else {
            reterror("unknown tag class '%s'",className);
        }

        if (isConstructed) {
            retcustomassure(dertool::DERNestingTooDeep, depth < maxDepth, "constructed plist element exceeds maximum nesting depth of %u",maxDepth);
            plist_t pChildren = NULL;
            retassure(pChildren = plist_dict_get_item(node, "children"), "constructed element is missing 'children'");
            retassure(plist_get_node_type(pChildren) == PLIST_ARRAY, "'children' is not an array");
            ASN1DERElement::Children children;
            uint32_t cnt = plist_array_get_size(pChildren);
            for (uint32_t i=0; i<cnt; i++) {
                children.push_back(elementFromPlist(plist_array_get_item(pChildren, i), depth+1, maxDepth));
            }
            return {tagClass, (uint32_t)tagNumber, std::move(children)};
        }

        plist_t pValue = NULL;
        uint64_t dataLen = 0;
        retassure(pValue = plist_dict_get_item(node, "value"), "primitive element is missing 'value'");
        retassure(plist_get_node_type(pValue) == PLIST_DATA, "'value' is not data");
        plist_get_data_val(pValue, &data, &dataLen);
        const uint8_t *p = (const uint8_t *)data;
        return {tagClass, (uint32_t)tagNumber, ASN1DERElement::Bytes(p, p+dataLen)};
    }
};

ASN1DERElement tihmstar::dertool::derFromPlist(plist_t node, uint32_t maxDepth){
    return elementFromPlist(node, 0, maxDepth);
}
#endif //HAVE_PLIST
