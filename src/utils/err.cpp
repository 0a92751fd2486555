/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/err.hpp"
#include "utils/macros.hpp"

#include "../include/bchain.h"

const char *bchain::errno_to_string (int errno_)
{
    switch (errno_) {
        case EBCHAINPREFIX:
            return "Prefix contains a byte outside 0x00..0x7f";
        case EBCHAINMARKER:
            return "Invalid marker byte";
        case EBCHAINPREFIXLEN:
            return "Prefix too long";
        case EBCHAINPARTLEN:
            return "Part too large";
        case EBCHAINPARTCOUNT:
            return "Too many parts in chain";
        case EBCHAINSIZE:
            return "Chain too large";
        case EBCHAINEOS:
            return "Unexpected end of stream inside a chain";
#if ENOBUFS == BCHAIN_HAUSNUMERO + 1
        case ENOBUFS:
            return "No buffer space available";
#endif
#if EBUSY == BCHAIN_HAUSNUMERO + 2
        case EBUSY:
            return "Device or resource busy";
#endif
        default:
#if defined _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
            return strerror (errno_);
#if defined _MSC_VER
#pragma warning(pop)
#endif
    }
}

void bchain::bchain_abort (const char *errmsg_)
{
    LIBBCHAIN_UNUSED (errmsg_);
    abort ();
}
