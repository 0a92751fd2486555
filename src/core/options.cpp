/* SPDX-License-Identifier: MPL-2.0 */

#include <string.h>

#include "core/options.hpp"
#include "core/chain.hpp"
#include "protocol/chain_protocol.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

static int option_invalid ()
{
#if defined(BCHAIN_ACT_MILITANT)
    bchain_assert (false);
#endif
    errno = EINVAL;
    return -1;
}

template <typename T>
static int do_setopt (const void *const optval_,
                      const size_t optvallen_,
                      T *const out_value_)
{
    if (optvallen_ == sizeof (T) && optval_ != NULL) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return option_invalid ();
}

static bool valid_limit (int64_t value_)
{
    return value_ >= -1;
}

static bool exceeds (int64_t limit_, uint64_t value_)
{
    return limit_ >= 0 && value_ > static_cast<uint64_t> (limit_);
}

bchain::options_t::options_t () :
    max_prefix_length (BCHAIN_DEFAULT_MAX_PREFIX_LENGTH),
    max_part_length (-1),
    max_part_count (-1),
    max_chain_size (-1)
{
}

int bchain::options_t::init (const bchain_limits_t &limits_)
{
    if (limits_.max_prefix_length < 0 || !valid_limit (limits_.max_part_length)
        || !valid_limit (limits_.max_part_count)
        || !valid_limit (limits_.max_chain_size))
        return option_invalid ();

    max_prefix_length = limits_.max_prefix_length;
    max_part_length = limits_.max_part_length;
    max_part_count = limits_.max_part_count;
    max_chain_size = limits_.max_chain_size;
    return 0;
}

void bchain::options_t::to_limits (bchain_limits_t &limits_) const
{
    limits_.max_prefix_length = max_prefix_length;
    limits_.max_part_length = max_part_length;
    limits_.max_part_count = max_part_count;
    limits_.max_chain_size = max_chain_size;
}

int bchain::options_t::setopt (int option_,
                               const void *optval_,
                               size_t optvallen_)
{
    int64_t value = 0;
    if (do_setopt (optval_, optvallen_, &value) == -1)
        return -1;

    switch (option_) {
        case BCHAIN_MAX_PREFIX_LENGTH:
            //  The prefix has no length field, so it can't be unbounded.
            if (value >= 0) {
                max_prefix_length = value;
                return 0;
            }
            break;

        case BCHAIN_MAX_PART_LENGTH:
            if (valid_limit (value)) {
                max_part_length = value;
                return 0;
            }
            break;

        case BCHAIN_MAX_PART_COUNT:
            if (valid_limit (value)) {
                max_part_count = value;
                return 0;
            }
            break;

        case BCHAIN_MAX_CHAIN_SIZE:
            if (valid_limit (value)) {
                max_chain_size = value;
                return 0;
            }
            break;

        default:
            break;
    }
    return option_invalid ();
}

int bchain::options_t::getopt (int option_,
                               void *optval_,
                               size_t *optvallen_) const
{
    if (optval_ == NULL || optvallen_ == NULL
        || *optvallen_ != sizeof (int64_t)) {
        errno = EINVAL;
        return -1;
    }
    int64_t *value = static_cast<int64_t *> (optval_);

    switch (option_) {
        case BCHAIN_MAX_PREFIX_LENGTH:
            *value = max_prefix_length;
            return 0;

        case BCHAIN_MAX_PART_LENGTH:
            *value = max_part_length;
            return 0;

        case BCHAIN_MAX_PART_COUNT:
            *value = max_part_count;
            return 0;

        case BCHAIN_MAX_CHAIN_SIZE:
            *value = max_chain_size;
            return 0;

        default:
            break;
    }
    errno = EINVAL;
    return -1;
}

bool bchain::options_t::prefix_too_long (uint64_t size_) const
{
    return exceeds (max_prefix_length, size_);
}

bool bchain::options_t::part_too_large (uint64_t length_) const
{
    return exceeds (max_part_length, length_);
}

bool bchain::options_t::part_count_exceeded (uint64_t count_) const
{
    return exceeds (max_part_count, count_);
}

bool bchain::options_t::chain_too_large (uint64_t size_) const
{
    return exceeds (max_chain_size, size_);
}

uint8_t bchain::options_t::check (const chain_t &chain_) const
{
    if (!chain_t::valid_prefix (chain_.prefix ().data (),
                                chain_.prefix ().size ()))
        return chain_error_invalid_prefix_byte;
    if (prefix_too_long (chain_.prefix ().size ()))
        return chain_error_prefix_too_long;
    if (part_count_exceeded (chain_.part_count ()))
        return chain_error_part_count;

    uint64_t total = chain_.prefix ().size ();
    for (size_t i = 0; i < chain_.part_count (); ++i) {
        const uint64_t length = chain_.part (i).size ();
        if (part_too_large (length))
            return chain_error_part_too_large;
        total += length;
    }
    if (chain_too_large (total))
        return chain_error_chain_too_large;
    return chain_error_none;
}
