/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/chain_encoder.hpp"
#include "core/chain.hpp"
#include "core/options.hpp"
#include "protocol/wire.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

bchain::chain_encoder_t::chain_encoder_t (size_t bufsize_) :
    encoder_base_t<chain_encoder_t> (bufsize_),
    _part (0)
{
    next_step (NULL, 0, &chain_encoder_t::prefix_ready, true);
}

bchain::chain_encoder_t::~chain_encoder_t ()
{
}

void bchain::chain_encoder_t::prefix_ready ()
{
    const std::string &prefix = in_progress ()->prefix ();
    _part = 0;
    next_step (prefix.data (), prefix.size (),
               &chain_encoder_t::part_header_ready, false);
}

void bchain::chain_encoder_t::part_header_ready ()
{
    const chain_t *chain = in_progress ();

    if (_part == chain->part_count ()) {
        _tmp_buf[0] = chain_eoc;
        next_step (_tmp_buf, 1, &chain_encoder_t::prefix_ready, true);
        return;
    }

    const uint64_t length = chain->part (_part).size ();
    const size_t width = uint_be_width (length);
    _tmp_buf[0] = static_cast<unsigned char> (chain_sop_base + width);
    put_uint_be (_tmp_buf + 1, length, width);

    next_step (_tmp_buf, 1 + width, &chain_encoder_t::part_body_ready, false);
}

void bchain::chain_encoder_t::part_body_ready ()
{
    const chain_t::part_t &part = in_progress ()->part (_part++);
    if (part.empty ())
        next_step (_tmp_buf, 0, &chain_encoder_t::part_header_ready, false);
    else
        next_step (&part[0], part.size (),
                   &chain_encoder_t::part_header_ready, false);
}

int bchain::encoded_size (const chain_t &chain_,
                          const options_t &options_,
                          uint64_t &size_)
{
    const uint8_t code = options_.check (chain_);
    if (unlikely (code != chain_error_none)) {
        BCHAIN_DBG_ENCODER ("chain rejected: %s", chain_error_reason (code));
        errno = chain_error_errno (code);
        return -1;
    }

    uint64_t size = chain_.prefix ().size () + 1;
    for (size_t i = 0; i < chain_.part_count (); ++i) {
        const uint64_t length = chain_.part (i).size ();
        size += 1 + uint_be_width (length) + length;
    }
    size_ = size;
    return 0;
}

size_t bchain::encode (const chain_t &chain_, unsigned char *buf_, size_t size_)
{
    chain_encoder_t encoder;
    encoder.load_chain (&chain_);

    size_t pos = 0;
    while (pos < size_) {
        unsigned char *data = buf_ + pos;
        const size_t n = encoder.encode (&data, size_ - pos);
        if (n == 0)
            break;
        pos += n;
    }
    return pos;
}

int bchain::encode (const chain_t &chain_,
                    const options_t &options_,
                    std::vector<unsigned char> &out_)
{
    uint64_t size = 0;
    if (encoded_size (chain_, options_, size) == -1)
        return -1;
    if (unlikely (size != static_cast<size_t> (size))) {
        errno = ENOBUFS;
        return -1;
    }

    out_.resize (static_cast<size_t> (size));
    const size_t written = encode (chain_, &out_[0], out_.size ());
    bchain_assert (written == out_.size ());
    return 0;
}
