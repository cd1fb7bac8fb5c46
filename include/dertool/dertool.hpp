//
//  dertool.hpp
//  dertool
//
//  Created by tihmstar on 04.10.19.
//  Copyright © 2019 tihmstar. All rights reserved.
//

#ifndef dertool_hpp
#define dertool_hpp

#include <unistd.h>
#include <string>
#include <vector>

#ifdef HAVE_PLIST
#include <plist/plist.h>
#endif //HAVE_PLIST

#include <dertool/ASN1DERElement.hpp>
#include <dertool/OID.hpp>
#include <dertool/DERException.hpp>

namespace tihmstar {
    namespace dertool {
        const char *version();

        std::string tagName(const ASN1DERElement &elem);

        /*
            OCTET STRINGs and BIT STRINGs holding a complete DER value are
            printed as a subtree as long as the nesting stays within maxDepth.
         */
        void printDERTree(const ASN1DERElement &elem, int indent = 0, uint32_t maxDepth = kASN1DERDefaultMaxDepth);
        std::string printDERTreeString(const ASN1DERElement &elem, int indent = 0, uint32_t maxDepth = kASN1DERDefaultMaxDepth);

        bool isPEM(const void *buf, size_t size);
        std::vector<uint8_t> pemToDER(const std::string &pem, std::string *outLabel = NULL);
        std::string derToPEM(const void *buf, size_t size, const std::string &label);

        std::vector<uint8_t> parseHex(const char *hex);

#ifdef HAVE_PLIST
        plist_t derToPlist(const ASN1DERElement &elem);
        ASN1DERElement derFromPlist(plist_t node, uint32_t maxDepth = kASN1DERDefaultMaxDepth);
#endif //HAVE_PLIST
    };
};
#endif /* dertool_hpp */
