/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_OPTIONS_HPP_INCLUDED__
#define __BCHAIN_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "../include/bchain.h"

namespace bchain
{
class chain_t;

//  Limits shared by the encoder and the decoder. A value of -1 means
//  unlimited; max_prefix_length is always bounded.
struct options_t
{
    options_t ();

    //  Copies and validates a public limits structure.
    int init (const bchain_limits_t &limits_);
    void to_limits (bchain_limits_t &limits_) const;

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    bool prefix_too_long (uint64_t size_) const;
    bool part_too_large (uint64_t length_) const;
    bool part_count_exceeded (uint64_t count_) const;
    bool chain_too_large (uint64_t size_) const;

    //  Checks a whole chain against the limits. Returns one of the
    //  chain_error_* codes, chain_error_none if the chain fits.
    uint8_t check (const chain_t &chain_) const;

    int64_t max_prefix_length;
    int64_t max_part_length;
    int64_t max_part_count;
    int64_t max_chain_size;
};
}

#endif
