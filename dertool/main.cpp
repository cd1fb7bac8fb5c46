//
//  main.c
//  dertool
//
//  Created by tihmstar on 02.10.19.
//  Copyright © 2019 tihmstar. All rights reserved.
//

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <getopt.h>
#include <string.h>

#include <libgeneral/macros.h>
#include <libgeneral/Mem.hpp>
#include <libgeneral/Utils.hpp>
#include "../include/dertool/dertool.hpp"

using namespace tihmstar::dertool;
using namespace std;

#define FLAG_REENCODE   (1 << 0)
#define FLAG_PEM        (1 << 1)
#define FLAG_PLIST      (1 << 2)
#define FLAG_CREATE     (1 << 3)

static struct option longopts[] = {
    { "help",           no_argument,        NULL, 'h' },
    { "max-depth",      required_argument,  NULL, 'd' },
    { "outfile",        required_argument,  NULL, 'o' },
    { "pem",            required_argument,  NULL, 'P' },
    { "reencode",       no_argument,        NULL, 'r' },

    { "oid-encode",     required_argument,  NULL,  0  },
    { "oid-decode",     required_argument,  NULL,  0  },

#ifdef HAVE_PLIST
    { "create",         no_argument,        NULL, 'c' },
    { "plist",          no_argument,        NULL, 'x' },
#endif //HAVE_PLIST
    { NULL, 0, NULL, 0 }
};

void saveToFile(const char *filePath, const void *buf, size_t bufSize){
    FILE *f = NULL;
    cleanup([&]{
        if (f) {
            fclose(f);
        }
    });

    if (strcmp(filePath, "-") == 0) {
        retassure(fwrite(buf, 1, bufSize, stdout) == bufSize, "failed to write to stdout");
    }else{
        retassure(f = fopen(filePath, "wb"), "failed to create file");
        retassure(fwrite(buf, 1, bufSize, f) == bufSize, "failed to write to file");
    }
}

ASN1DERElement readDERFile(const char *filePath, uint32_t maxDepth){
    tihmstar::Mem file = tihmstar::readFile(filePath);
    size_t consumed = 0;
    ASN1DERElement ret;

    if (isPEM(file.data(), file.size())) {
        std::string label;
        std::vector<uint8_t> der = pemToDER({(const char*)file.data(), file.size()}, &label);
        info("Reading PEM block '%s'",label.c_str());
        ret = ASN1DERElement::decode(der.data(), der.size(), &consumed, maxDepth);
        if (consumed != der.size()) {
            info("Ignoring %zu trailing bytes",der.size()-consumed);
        }
    }else{
        ret = ASN1DERElement::decode(file.data(), file.size(), &consumed, maxDepth);
        if (consumed != file.size()) {
            info("Ignoring %zu trailing bytes",file.size()-consumed);
        }
    }
    return ret;
}

void cmd_help(){
    printf(
           "Usage: dertool [OPTIONS] FILE\n"
           "Parses, prints and converts ASN.1 DER files (DER or PEM)\n\n"
           "  -h, --help\t\t\tprints usage information\n"
           "  -d, --max-depth\t<NUM>\tmaximum nesting depth when decoding (default %u)\n"
           "  -o, --outfile\t\t<PATH>\toutput path (- for stdout)\n"
           "  -r, --reencode\t\twrite canonical DER encoding of FILE to outfile\n"
           "  -P, --pem\t\t<LABEL>\twrite FILE as PEM with LABEL to outfile\n"
           "      --oid-encode\t<OID>\tprint DER payload of OID as hex\n"
           "      --oid-decode\t<HEX>\tprint dot notation of DER OID payload\n"
#ifdef HAVE_PLIST
           "[plist]\n"
#else
           "[plist] (UNAVAILABLE)\n"
#endif //HAVE_PLIST
           "  -x, --plist\t\t\twrite FILE as XML plist to outfile\n"
           "  -c, --create\t\t\tread FILE as plist and write DER to outfile\n"
           "\n"

           "Features:\n"
#ifdef HAVE_PLIST
           "plist: yes\n"
#else
           "plist: no\n"
#endif //HAVE_PLIST
           "\n",
           kASN1DERDefaultMaxDepth
           );
}

MAINFUNCTION
int main_r(int argc, const char * argv[]) {
    info("%s",version());

    const char *lastArg = NULL;
    const char *outFile = NULL;
    const char *pemLabel = NULL;
    const char *oidEncode = NULL;
    const char *oidDecode = NULL;
    uint32_t maxDepth = kASN1DERDefaultMaxDepth;

    int optindex = 0;
    int opt = 0;
    long flags = 0;

    while ((opt = getopt_long(argc, (char* const *)argv, "hd:o:P:rcx", longopts, &optindex)) >= 0) {
        switch (opt) {
            case 0: //long opts
            {
                std::string curopt = longopts[optindex].name;

                if (curopt == "oid-encode") {
                    oidEncode = optarg;
                }else if (curopt == "oid-decode") {
                    oidDecode = optarg;
                }
                break;
            }
            case 'h':
                cmd_help();
                return 0;
            case 'd':
            {
                char *end = NULL;
                unsigned long v = strtoul(optarg, &end, 0);
                retassure(*optarg && end && !*end && v <= UINT32_MAX, "invalid max-depth '%s'",optarg);
                maxDepth = (uint32_t)v;
                break;
            }
            case 'o':
                outFile = optarg;
                break;
            case 'P':
                flags |= FLAG_PEM;
                pemLabel = optarg;
                break;
            case 'r':
                flags |= FLAG_REENCODE;
                break;
#ifdef HAVE_PLIST
            case 'c':
                flags |= FLAG_CREATE;
                break;
            case 'x':
                flags |= FLAG_PLIST;
                break;
#endif //HAVE_PLIST
            default:
                cmd_help();
                return -1;
        }
    }

    if (oidEncode) {
        std::vector<uint8_t> bytes = oidToBytes(oidEncode);
        for (uint8_t b : bytes) printf("%02x",b);
        printf("\n");
        return 0;
    }

    if (oidDecode) {
        std::vector<uint8_t> bytes = parseHex(oidDecode);
        std::string oid = bytesToOid(bytes);
        const char *name = oidName(oid);
        printf("%s%s%s%s\n",oid.c_str(),name ? " (" : "",name ? name : "",name ? ")" : "");
        return 0;
    }

    if (argc-optind == 1) {
        argc -= optind;
        argv += optind;
        lastArg = argv[0];
    }else{
        if (argc == 1) {
            cmd_help();
            return -2;
        }
    }
    retassure(lastArg, "No input file");

    if (flags & (FLAG_REENCODE | FLAG_PEM | FLAG_PLIST | FLAG_CREATE)) {
        retassure(outFile, "Outfile required for this operation");
    }

#ifdef HAVE_PLIST
    if (flags & FLAG_CREATE) {
        plist_t plist = NULL;
        cleanup([&]{
            safeFreeCustom(plist, plist_free);
        });
        tihmstar::Mem file = tihmstar::readFile(lastArg);
        plist_from_memory((const char*)file.data(), (uint32_t)file.size(), &plist, NULL);
        retassure(plist, "failed to parse plist from '%s'",lastArg);

        ASN1DERElement elem = derFromPlist(plist, maxDepth);
        std::vector<uint8_t> der = elem.encode();
        saveToFile(outFile, der.data(), der.size());
        info("Created DER file with %zu bytes at %s",der.size(),outFile);
        return 0;
    }
#endif //HAVE_PLIST

    ASN1DERElement elem = readDERFile(lastArg, maxDepth);

    if (flags & FLAG_REENCODE) {
        std::vector<uint8_t> der = elem.encode();
        saveToFile(outFile, der.data(), der.size());
        info("Wrote %zu bytes of canonical DER to %s",der.size(),outFile);
    }else if (flags & FLAG_PEM) {
        std::vector<uint8_t> der = elem.encode();
        std::string pem = derToPEM(der.data(), der.size(), pemLabel);
        saveToFile(outFile, pem.data(), pem.size());
        info("Wrote PEM '%s' to %s",pemLabel,outFile);
    }
#ifdef HAVE_PLIST
    else if (flags & FLAG_PLIST) {
        plist_t plist = NULL;
        char *xml = NULL;
        uint32_t xmlSize = 0;
        cleanup([&]{
            safeFreeCustom(plist, plist_free);
            safeFree(xml);
        });
        plist = derToPlist(elem);
        plist_to_xml(plist, &xml, &xmlSize);
        retassure(xml, "failed to serialize plist");
        saveToFile(outFile, xml, xmlSize);
        info("Wrote plist to %s",outFile);
    }
#endif //HAVE_PLIST
    else {
        //printing only
        printDERTree(elem, 0, maxDepth);
    }

    return 0;
}
