//
//  DERException.hpp
//  dertool
//
//  Created by tihmstar on 19.10.26.
//  Copyright © 2026 tihmstar. All rights reserved.
//

#ifndef DERException_hpp
#define DERException_hpp

#include <libgeneral/exception.hpp>

namespace tihmstar {
    namespace dertool {
        class DERException : public tihmstar::exception{
            using tihmstar::exception::exception;
        };

        //input ended before tag, length or value was complete
        class DERTruncated : public DERException{
            using DERException::DERException;
        };

        class DERInvalidEncoding : public DERException{
            using DERException::DERException;
        };

        class DERNestingTooDeep : public DERException{
            using DERException::DERException;
        };

        class DERTypeMismatch : public DERException{
            using DERException::DERException;
        };

        class OIDValidationError : public DERException{
            using DERException::DERException;
        };
    };
};

#endif /* DERException_hpp */
