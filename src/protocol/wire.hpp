/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_WIRE_HPP_INCLUDED__
#define __BCHAIN_WIRE_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace bchain
{
//  Big-endian integers of 0 to 8 bytes, as used by part length fields.

inline void
put_uint_be (unsigned char *buffer_, uint64_t value_, size_t width_)
{
    for (size_t i = width_; i > 0; --i) {
        buffer_[i - 1] = static_cast<unsigned char> (value_ & 0xff);
        value_ >>= 8;
    }
}

inline uint64_t get_uint_be (const unsigned char *buffer_, size_t width_)
{
    uint64_t value = 0;
    for (size_t i = 0; i < width_; ++i)
        value = (value << 8) | static_cast<uint64_t> (buffer_[i]);
    return value;
}

//  Smallest number of bytes able to hold value_ (0 for 0).
inline size_t uint_be_width (uint64_t value_)
{
    size_t width = 0;
    while (value_ != 0) {
        ++width;
        value_ >>= 8;
    }
    return width;
}
}

#endif
