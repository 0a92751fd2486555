/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_CHAIN_EVENT_HPP_INCLUDED__
#define __BCHAIN_CHAIN_EVENT_HPP_INCLUDED__

#include <stddef.h>
#include <memory>
#include <vector>

#include "../include/bchain.h"
#include "core/chain.hpp"

namespace bchain
{
//  One decoder output. Events refer to the chain they belong to instead of
//  copying its bytes; the chain may still be growing while its prefix and
//  part events are handed out.
struct chain_event_t
{
    enum type_t
    {
        prefix_complete = BCHAIN_EVENT_PREFIX,
        part_complete = BCHAIN_EVENT_PART,
        chain_complete = BCHAIN_EVENT_CHAIN,
        error = BCHAIN_EVENT_ERROR
    };

    chain_event_t (type_t type_,
                   const std::shared_ptr<const chain_t> &chain_,
                   size_t index_) :
        type (type_),
        chain (chain_),
        index (index_),
        errnum (0)
    {
    }

    explicit chain_event_t (int errnum_) :
        type (error),
        index (0),
        errnum (errnum_)
    {
    }

    //  Prefix for prefix and chain events, the part for part events,
    //  nothing for errors.
    const void *data () const
    {
        if (type == part_complete) {
            const chain_t::part_t &part = chain->part (index);
            return part.empty () ? NULL : &part[0];
        }
        if (type == error)
            return NULL;
        return chain->prefix ().data ();
    }

    size_t size () const
    {
        if (type == part_complete)
            return chain->part (index).size ();
        if (type == error)
            return 0;
        return chain->prefix ().size ();
    }

    type_t type;
    std::shared_ptr<const chain_t> chain;

    //  Part index for part events, part count for chain events.
    size_t index;

    int errnum;
};

typedef std::vector<chain_event_t> chain_events_t;
}

#endif
