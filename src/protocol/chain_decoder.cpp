/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/chain_decoder.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <algorithm>

bchain::chain_decoder_t::chain_decoder_t (const options_t &options_,
                                          size_t bufsize_) :
    decoder_base_t<chain_decoder_t> (bufsize_),
    _options (options_),
    _length_width (0),
    _part_remaining (0),
    _chain_size (0),
    _in_chain (false),
    _error_code (chain_error_none),
    _in_progress (std::make_shared<chain_t> ()),
    _sink (NULL)
{
    bchain_assert (bufsize_ > 0);
    next_step (_tmpbuf, 1, &chain_decoder_t::prefix_byte_ready);
}

bchain::chain_decoder_t::~chain_decoder_t ()
{
}

int bchain::chain_decoder_t::feed (const void *data_,
                                   size_t size_,
                                   chain_events_t &events_)
{
    if (unlikely ((data_ == NULL && size_ > 0)
                  || size_ > BCHAIN_MAX_FEED_SIZE)) {
        errno = EINVAL;
        return -1;
    }

    const unsigned char *data = static_cast<const unsigned char *> (data_);
    const size_t before = events_.size ();
    _sink = &events_;

    size_t pos = 0;
    do {
        size_t processed = 0;
        const int rc = decode (data + pos, size_ - pos, processed);
        pos += processed;
        if (unlikely (rc == -1)) {
            const int err = errno;
            events_.push_back (chain_event_t (err));
            _sink = NULL;
            errno = err;
            return -1;
        }
    } while (pos < size_);

    _sink = NULL;
    return static_cast<int> (events_.size () - before);
}

int bchain::chain_decoder_t::finish () const
{
    if (failed ()) {
        errno = last_errno ();
        return -1;
    }
    if (_in_chain) {
        BCHAIN_DBG_DECODER ("stream ended inside a chain (%zu parts)",
                            _in_progress->part_count ());
        errno = chain_error_errno (chain_error_unexpected_eos);
        return -1;
    }
    return 0;
}

int bchain::chain_decoder_t::set_options (const options_t &options_)
{
    if (_in_chain) {
        errno = EBUSY;
        return -1;
    }
    _options = options_;
    return 0;
}

int bchain::chain_decoder_t::setopt (int option_,
                                     const void *optval_,
                                     size_t optvallen_)
{
    if (_in_chain) {
        errno = EBUSY;
        return -1;
    }
    return _options.setopt (option_, optval_, optvallen_);
}

int bchain::chain_decoder_t::getopt (int option_,
                                     void *optval_,
                                     size_t *optvallen_) const
{
    return _options.getopt (option_, optval_, optvallen_);
}

int bchain::chain_decoder_t::prefix_byte_ready (unsigned char const *read_from_)
{
    const unsigned char byte = _tmpbuf[0];
    _in_chain = true;

    if (!chain_is_prefix_byte (byte)) {
        if (unlikely (!chain_is_sop (byte) && byte != chain_eoc))
            return protocol_error (chain_error_invalid_marker);
        emit (chain_event_t::prefix_complete, 0);
        return marker_ready (read_from_);
    }

    std::string &prefix = _in_progress->_prefix;
    if (unlikely (_options.prefix_too_long (prefix.size () + 1)))
        return protocol_error (chain_error_prefix_too_long);
    if (unlikely (_options.chain_too_large (_chain_size + 1)))
        return protocol_error (chain_error_chain_too_large);

    prefix += static_cast<char> (byte);
    ++_chain_size;
    next_step (_tmpbuf, 1, &chain_decoder_t::prefix_byte_ready);
    return 0;
}

int bchain::chain_decoder_t::marker_ready (unsigned char const *)
{
    const unsigned char marker = _tmpbuf[0];
    if (marker == chain_eoc)
        return chain_ready ();

    if (unlikely (!chain_is_sop (marker)))
        return protocol_error (chain_error_invalid_marker);

    chain_t::parts_t &parts = _in_progress->_parts;
    if (unlikely (_options.part_count_exceeded (parts.size () + 1)))
        return protocol_error (chain_error_part_count);

    parts.push_back (chain_t::part_t ());

    //  A zero width header is complete right away.
    _length_width = marker - chain_sop_base;
    next_step (_tmpbuf, _length_width, &chain_decoder_t::length_ready);
    return 0;
}

int bchain::chain_decoder_t::length_ready (unsigned char const *read_from_)
{
    const uint64_t length = get_uint_be (_tmpbuf, _length_width);

    //  Checked before a single byte of the part is buffered.
    if (unlikely (_options.part_too_large (length)))
        return protocol_error (chain_error_part_too_large);
    if (unlikely (length != static_cast<size_t> (length)))
        return protocol_error (chain_error_part_too_large);

    const uint64_t total = length > chain_max_part_length - _chain_size
                             ? chain_max_part_length
                             : _chain_size + length;
    if (unlikely (_options.chain_too_large (total)))
        return protocol_error (chain_error_chain_too_large);

    BCHAIN_DBG_DECODER ("part %zu: %llu bytes in %zu length bytes",
                        _in_progress->part_count () - 1,
                        static_cast<unsigned long long> (length),
                        _length_width);

    _chain_size = total;
    _part_remaining = length;
    return part_data_ready (read_from_);
}

int bchain::chain_decoder_t::part_data_ready (unsigned char const *)
{
    chain_t::part_t &part = _in_progress->_parts.back ();

    if (_part_remaining == 0) {
        emit (chain_event_t::part_complete, _in_progress->part_count () - 1);
        next_step (_tmpbuf, 1, &chain_decoder_t::marker_ready);
        return 0;
    }

    //  Reserve room for the next batch only; the declared length is not
    //  trusted until the bytes are there.
    const size_t grow = static_cast<size_t> (
      std::min (_part_remaining, static_cast<uint64_t> (buf_size ())));
    const size_t offset = part.size ();
    part.resize (offset + grow);
    _part_remaining -= grow;

    next_step (&part[offset], grow, &chain_decoder_t::part_data_ready);
    return 0;
}

int bchain::chain_decoder_t::chain_ready ()
{
    _completed = _in_progress;
    emit (chain_event_t::chain_complete, _completed->part_count ());

    BCHAIN_DBG_DECODER ("chain complete: %zu prefix bytes, %zu parts",
                        _completed->prefix ().size (),
                        _completed->part_count ());

    _in_progress = std::make_shared<chain_t> ();
    _chain_size = 0;
    _in_chain = false;
    next_step (_tmpbuf, 1, &chain_decoder_t::prefix_byte_ready);
    return 1;
}

int bchain::chain_decoder_t::protocol_error (uint8_t code_)
{
    BCHAIN_DBG_DECODER ("protocol error: %s", chain_error_reason (code_));
    _error_code = code_;
    errno = chain_error_errno (code_);
    return -1;
}

void bchain::chain_decoder_t::emit (chain_event_t::type_t type_,
                                    size_t index_)
{
    if (_sink)
        _sink->push_back (chain_event_t (type_, _in_progress, index_));
}
