/* SPDX-License-Identifier: MPL-2.0 */

#include <string.h>
#include <stdlib.h>
#include <new>

#include "../include/bchain.h"
#include "core/chain.hpp"
#include "core/options.hpp"
#include "protocol/chain_decoder.hpp"
#include "protocol/chain_encoder.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/likely.hpp"
#include "utils/macros.hpp"

namespace
{
const uint32_t decoder_tag_value_good = 0xbadec0de;
const uint32_t decoder_tag_value_bad = 0xdeadbeef;

//  What a bchain_decoder_new () handle points to: the decoder plus the
//  events of the last feed, which the caller reads back by index.
class decoder_handle_t
{
  public:
    explicit decoder_handle_t (const bchain::options_t &options_) :
        _tag (decoder_tag_value_good),
        decoder (options_)
    {
    }

    ~decoder_handle_t () { _tag = decoder_tag_value_bad; }

    bool check_tag () const { return _tag == decoder_tag_value_good; }

  private:
    uint32_t _tag;

  public:
    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;

    BCHAIN_NON_COPYABLE_NOR_MOVABLE (decoder_handle_t)
};

decoder_handle_t *as_decoder (void *decoder_)
{
    decoder_handle_t *handle = static_cast<decoder_handle_t *> (decoder_);
    if (!handle || !handle->check_tag ()) {
        BCHAIN_DBG_API ("invalid decoder handle %p", decoder_);
        errno = EFAULT;
        return NULL;
    }
    return handle;
}

const bchain::chain_event_t *event_at (decoder_handle_t *handle_,
                                       size_t index_)
{
    if (index_ >= handle_->events.size ()) {
        errno = ERANGE;
        return NULL;
    }
    return &handle_->events[index_];
}
}

void bchain_version (int *major_, int *minor_, int *patch_)
{
    *major_ = BCHAIN_VERSION_MAJOR;
    *minor_ = BCHAIN_VERSION_MINOR;
    *patch_ = BCHAIN_VERSION_PATCH;
}

const char *bchain_strerror (int errnum_)
{
    return bchain::errno_to_string (errnum_);
}

int bchain_errno (void)
{
    return errno;
}

void bchain_limits_init (bchain_limits_t *limits_)
{
    if (limits_)
        bchain::options_t ().to_limits (*limits_);
}

//  Encoding

int bchain_encode (const char *prefix_,
                   size_t prefix_size_,
                   const bchain_part_t *parts_,
                   size_t part_count_,
                   const bchain_limits_t *limits_,
                   void *buf_,
                   size_t *size_)
{
    if (unlikely (!size_ || (!prefix_ && prefix_size_ > 0)
                  || (!parts_ && part_count_ > 0))) {
        errno = EINVAL;
        return -1;
    }

    bchain::options_t options;
    if (limits_ && options.init (*limits_) == -1)
        return -1;

    bchain::chain_t::parts_t parts (part_count_);
    for (size_t i = 0; i < part_count_; ++i) {
        if (parts_[i].size == 0)
            continue;
        if (unlikely (!parts_[i].data)) {
            errno = EINVAL;
            return -1;
        }
        const unsigned char *data =
          static_cast<const unsigned char *> (parts_[i].data);
        parts[i].assign (data, data + parts_[i].size);
    }

    bchain::chain_t chain;
    if (chain.init (prefix_, prefix_size_, parts) == -1)
        return -1;

    uint64_t required = 0;
    if (bchain::encoded_size (chain, options, required) == -1)
        return -1;
    if (unlikely (required != static_cast<size_t> (required))) {
        errno = ENOBUFS;
        return -1;
    }

    if (!buf_ || *size_ < required) {
        *size_ = static_cast<size_t> (required);
        errno = ENOBUFS;
        return -1;
    }

    *size_ = bchain::encode (chain, static_cast<unsigned char *> (buf_),
                             static_cast<size_t> (required));
    bchain_assert (*size_ == required);
    return 0;
}

//  Stream decoding

void *bchain_decoder_new (const bchain_limits_t *limits_)
{
    bchain::options_t options;
    if (limits_ && options.init (*limits_) == -1)
        return NULL;

    decoder_handle_t *handle = new (std::nothrow) decoder_handle_t (options);
    if (!handle) {
        errno = ENOMEM;
        return NULL;
    }
    return handle;
}

int bchain_decoder_close (void *decoder_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    delete handle;
    return 0;
}

int bchain_decoder_feed (void *decoder_, const void *data_, size_t size_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;

    handle->events.clear ();
    return handle->decoder.feed (data_, size_, handle->events);
}

int bchain_decoder_event_count (void *decoder_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    return static_cast<int> (handle->events.size ());
}

int bchain_decoder_event (void *decoder_,
                          size_t index_,
                          bchain_event_t *event_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    if (unlikely (!event_)) {
        errno = EINVAL;
        return -1;
    }
    const bchain::chain_event_t *event = event_at (handle, index_);
    if (!event)
        return -1;

    event_->type = event->type;
    event_->data = event->data ();
    event_->size = event->size ();
    event_->index = event->index;
    event_->error = event->errnum;
    return 0;
}

int bchain_decoder_event_part (void *decoder_,
                               size_t index_,
                               size_t part_,
                               const void **data_,
                               size_t *size_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    if (unlikely (!data_ || !size_)) {
        errno = EINVAL;
        return -1;
    }
    const bchain::chain_event_t *event = event_at (handle, index_);
    if (!event)
        return -1;
    if (event->type != bchain::chain_event_t::chain_complete) {
        errno = EINVAL;
        return -1;
    }
    if (part_ >= event->chain->part_count ()) {
        errno = ERANGE;
        return -1;
    }

    const bchain::chain_t::part_t &part = event->chain->part (part_);
    *data_ = part.empty () ? NULL : &part[0];
    *size_ = part.size ();
    return 0;
}

int bchain_decoder_finish (void *decoder_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    return handle->decoder.finish ();
}

int bchain_decoder_idle (void *decoder_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    return handle->decoder.idle () ? 1 : 0;
}

int bchain_decoder_setopt (void *decoder_,
                           int option_,
                           const void *optval_,
                           size_t optvallen_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    return handle->decoder.setopt (option_, optval_, optvallen_);
}

int bchain_decoder_getopt (void *decoder_,
                           int option_,
                           void *optval_,
                           size_t *optvallen_)
{
    decoder_handle_t *handle = as_decoder (decoder_);
    if (!handle)
        return -1;
    return handle->decoder.getopt (option_, optval_, optvallen_);
}
