//
//  OID.hpp
//  dertool
//
//  Created by tihmstar on 20.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#ifndef OID_hpp
#define OID_hpp

#include <stdint.h>
#include <string>
#include <vector>

namespace tihmstar {
    namespace dertool {
        std::vector<uint8_t> oidToBytes(const std::string &dotString);

        std::string bytesToOid(const void *buf, size_t size);
        std::string bytesToOid(const std::vector<uint8_t> &buf);

        /*
            Short name of a well known OID, or NULL if we don't know it
         */
        const char *oidName(const std::string &dotString);
    };
};

#endif /* OID_hpp */
