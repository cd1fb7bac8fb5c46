//
//  OID.cpp
//  dertool
//
//  Created by tihmstar on 20.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#include "../include/dertool/OID.hpp"
#include "../include/dertool/DERException.hpp"
#include <libgeneral/macros.h>
#include <string.h>

using namespace tihmstar;
using namespace tihmstar::dertool;

#pragma mark helper

namespace {
    struct KnownOID{
        const char *oid;
        const char *name;
    };

    const KnownOID gKnownOIDs[] = {
        //X.500 attribute types
        {"2.5.4.3",                 "commonName"},
        {"2.5.4.4",                 "surname"},
        {"2.5.4.5",                 "serialNumber"},
        {"2.5.4.6",                 "countryName"},
        {"2.5.4.7",                 "localityName"},
        {"2.5.4.8",                 "stateOrProvinceName"},
        {"2.5.4.10",                "organizationName"},
        {"2.5.4.11",                "organizationalUnitName"},
        {"2.5.4.12",                "title"},
        {"2.5.4.42",                "givenName"},

        //X.509 extensions
        {"2.5.29.14",               "subjectKeyIdentifier"},
        {"2.5.29.15",               "keyUsage"},
        {"2.5.29.17",               "subjectAltName"},
        {"2.5.29.19",               "basicConstraints"},
        {"2.5.29.31",               "cRLDistributionPoints"},
        {"2.5.29.32",               "certificatePolicies"},
        {"2.5.29.35",               "authorityKeyIdentifier"},
        {"2.5.29.37",               "extKeyUsage"},
        {"1.3.6.1.5.5.7.1.1",       "authorityInfoAccess"},
        {"1.3.6.1.5.5.7.3.1",       "serverAuth"},
        {"1.3.6.1.5.5.7.3.2",       "clientAuth"},
        {"1.3.6.1.5.5.7.3.4",       "emailProtection"},
        {"1.3.6.1.5.5.7.3.8",       "timeStamping"},

        //PKCS#1
        {"1.2.840.113549.1.1.1",    "rsaEncryption"},
        {"1.2.840.113549.1.1.5",    "sha1WithRSAEncryption"},
        {"1.2.840.113549.1.1.10",   "rsassa-pss"},
        {"1.2.840.113549.1.1.11",   "sha256WithRSAEncryption"},
        {"1.2.840.113549.1.1.12",   "sha384WithRSAEncryption"},
        {"1.2.840.113549.1.1.13",   "sha512WithRSAEncryption"},

        //PKCS#7 / CMS
        {"1.2.840.113549.1.7.1",    "data"},
        {"1.2.840.113549.1.7.2",    "signedData"},
        {"1.2.840.113549.1.7.3",    "envelopedData"},
        {"1.2.840.113549.1.7.6",    "encryptedData"},

        //PKCS#9
        {"1.2.840.113549.1.9.1",    "emailAddress"},
        {"1.2.840.113549.1.9.3",    "contentType"},
        {"1.2.840.113549.1.9.4",    "messageDigest"},
        {"1.2.840.113549.1.9.5",    "signingTime"},
        {"1.2.840.113549.1.9.20",   "friendlyName"},
        {"1.2.840.113549.1.9.21",   "localKeyID"},
        {"1.2.840.113549.1.9.16.2.12", "signingCertificate"},
        {"1.2.840.113549.1.9.16.2.47", "signingCertificateV2"},
        {"1.2.840.113549.1.9.16.2.14", "signatureTimeStampToken"},

        //PKCS#12
        {"1.2.840.113549.1.12.10.1.1", "keyBag"},
        {"1.2.840.113549.1.12.10.1.2", "pkcs8ShroudedKeyBag"},
        {"1.2.840.113549.1.12.10.1.3", "certBag"},

        //EC
        {"1.2.840.10045.2.1",       "ecPublicKey"},
        {"1.2.840.10045.3.1.7",     "prime256v1"},
        {"1.2.840.10045.4.3.2",     "ecdsa-with-SHA256"},
        {"1.2.840.10045.4.3.3",     "ecdsa-with-SHA384"},
        {"1.3.132.0.34",            "secp384r1"},

        //hashes
        {"1.3.14.3.2.26",           "sha1"},
        {"2.16.840.1.101.3.4.2.1",  "sha256"},
        {"2.16.840.1.101.3.4.2.2",  "sha384"},
        {"2.16.840.1.101.3.4.2.3",  "sha512"},
    };

    uint64_t parseArc(const std::string &arc, const std::string &dotString){
        retcustomassure(dertool::OIDValidationError, arc.size(), "Invalid OID '%s': empty component",dotString.c_str());
        uint64_t ret = 0;
        for (char c : arc) {
            retcustomassure(dertool::OIDValidationError, c >= '0' && c <= '9', "Invalid OID component '%s' in '%s'",arc.c_str(),dotString.c_str());
            uint64_t digit = c - '0';
            retcustomassure(dertool::OIDValidationError, ret <= (UINT64_MAX - digit) / 10, "OID component '%s' in '%s' doesn't fit into 64 bits",arc.c_str(),dotString.c_str());
            ret = ret * 10 + digit;
        }
        return ret;
    }

    void appendVLQ(std::vector<uint8_t> &out, uint64_t val){
        uint8_t tmp[10] = {};
        int cnt = 0;
        do {
            tmp[cnt++] = val & 0x7f;
            val >>= 7;
        } while (val);
        while (cnt--) {
            out.push_back(tmp[cnt] | (cnt ? 0x80 : 0x00));
        }
    }

    uint64_t readVLQ(const uint8_t *buf, size_t size, size_t &pos){
        size_t start = pos;
        retcustomassure(dertool::OIDValidationError, buf[pos] != 0x80, "OID subidentifier at offset %zu is not minimally encoded",start);
        uint64_t ret = 0;
        uint8_t b = 0;
        do {
            retcustomassure(dertool::OIDValidationError, pos < size, "truncated OID subidentifier at offset %zu",start);
            b = buf[pos++];
            retcustomassure(dertool::OIDValidationError, (ret >> 57) == 0, "OID subidentifier at offset %zu doesn't fit into 64 bits",start);
            ret = (ret << 7) | (b & 0x7f);
        } while (b & 0x80);
        return ret;
    }
};

#pragma mark public

std::vector<uint8_t> tihmstar::dertool::oidToBytes(const std::string &dotString){
    std::vector<uint64_t> arcs;
    size_t start = 0;
    while (true) {
        size_t dot = dotString.find('.', start);
        arcs.push_back(parseArc(dotString.substr(start, dot == std::string::npos ? std::string::npos : dot-start), dotString));
        if (dot == std::string::npos) break;
        start = dot+1;
    }

    retcustomassure(dertool::OIDValidationError, arcs.size() >= 2, "OID '%s' needs at least 2 components",dotString.c_str());
    retcustomassure(dertool::OIDValidationError, arcs[0] <= 2, "Invalid first OID arc %llu in '%s' (must be 0, 1 or 2)",(unsigned long long)arcs[0],dotString.c_str());
    if (arcs[0] < 2) {
        retcustomassure(dertool::OIDValidationError, arcs[1] <= 39, "Invalid second OID arc %llu in '%s' (must be <= 39 under arc %llu)",(unsigned long long)arcs[1],dotString.c_str(),(unsigned long long)arcs[0]);
    } else {
        retcustomassure(dertool::OIDValidationError, arcs[1] <= UINT64_MAX - 80, "second OID arc in '%s' is too large",dotString.c_str());
    }

    std::vector<uint8_t> ret;
    appendVLQ(ret, 40 * arcs[0] + arcs[1]);
    for (size_t i = 2; i < arcs.size(); i++) {
        appendVLQ(ret, arcs[i]);
    }
    return ret;
}

std::string tihmstar::dertool::bytesToOid(const void *buf_, size_t size){
    const uint8_t *buf = (const uint8_t *)buf_;
    retcustomassure(dertool::OIDValidationError, buf && size, "Empty OID data");

    size_t pos = 0;
    uint64_t first = readVLQ(buf, size, pos);
    std::string ret;
    if (first < 80) {
        ret = std::to_string(first / 40) + "." + std::to_string(first % 40);
    } else {
        ret = "2." + std::to_string(first - 80);
    }

    while (pos < size) {
        ret += "." + std::to_string(readVLQ(buf, size, pos));
    }
    return ret;
}

std::string tihmstar::dertool::bytesToOid(const std::vector<uint8_t> &buf){
    return bytesToOid(buf.data(), buf.size());
}

const char *tihmstar::dertool::oidName(const std::string &dotString){
    for (auto &known : gKnownOIDs) {
        if (dotString == known.oid) return known.name;
    }
    return NULL;
}
