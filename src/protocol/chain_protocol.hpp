/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_CHAIN_PROTOCOL_HPP_INCLUDED__
#define __BCHAIN_CHAIN_PROTOCOL_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "../include/bchain.h"

namespace bchain
{
//  Prefix bytes are 0x00..chain_prefix_max.
const unsigned char chain_prefix_max = 0x7f;

//  Start-of-part markers. sop - chain_sop_base is the width of the
//  big-endian length field that follows.
const unsigned char chain_sop_base = 0x80;
const unsigned char chain_sop_max = 0x88;
const size_t chain_max_length_width = chain_sop_max - chain_sop_base;

//  End-of-chain marker.
const unsigned char chain_eoc = 0xff;

const uint64_t chain_max_part_length = 0xffffffffffffffffULL;

inline bool chain_is_prefix_byte (unsigned char byte_)
{
    return byte_ <= chain_prefix_max;
}

inline bool chain_is_sop (unsigned char byte_)
{
    return byte_ >= chain_sop_base && byte_ <= chain_sop_max;
}

//  Protocol error codes
const uint8_t chain_error_none = 0x00;
const uint8_t chain_error_invalid_prefix_byte = 0x01;
const uint8_t chain_error_invalid_marker = 0x02;
const uint8_t chain_error_prefix_too_long = 0x03;
const uint8_t chain_error_part_too_large = 0x04;
const uint8_t chain_error_part_count = 0x05;
const uint8_t chain_error_chain_too_large = 0x06;
const uint8_t chain_error_unexpected_eos = 0x07;

inline const char *chain_error_reason (uint8_t code_)
{
    switch (code_) {
        case chain_error_none:
            return "no error";
        case chain_error_invalid_prefix_byte:
            return "invalid prefix byte";
        case chain_error_invalid_marker:
            return "invalid marker byte";
        case chain_error_prefix_too_long:
            return "prefix too long";
        case chain_error_part_too_large:
            return "part too large";
        case chain_error_part_count:
            return "part count exceeded";
        case chain_error_chain_too_large:
            return "chain too large";
        case chain_error_unexpected_eos:
            return "unexpected end of stream";
        default:
            return "unknown error";
    }
}

//  errno value reported for a protocol error code.
inline int chain_error_errno (uint8_t code_)
{
    switch (code_) {
        case chain_error_invalid_prefix_byte:
            return EBCHAINPREFIX;
        case chain_error_invalid_marker:
            return EBCHAINMARKER;
        case chain_error_prefix_too_long:
            return EBCHAINPREFIXLEN;
        case chain_error_part_too_large:
            return EBCHAINPARTLEN;
        case chain_error_part_count:
            return EBCHAINPARTCOUNT;
        case chain_error_chain_too_large:
            return EBCHAINSIZE;
        case chain_error_unexpected_eos:
            return EBCHAINEOS;
        default:
            return EINVAL;
    }
}

} // namespace bchain

#endif
