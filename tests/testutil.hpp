/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "../include/bchain.h"

#include <errno.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include <string>
#include <vector>

typedef std::vector<unsigned char> bytes_t;

//  Bytes of a string literal, without the terminating zero.
inline bytes_t to_bytes (const std::string &s_)
{
    return bytes_t (s_.begin (), s_.end ());
}

//  Appends one part on the wire: the SOP marker for width_ length bytes,
//  the big-endian length and the data. width_ need not be minimal.
inline void append_wire_part (bytes_t &buf_,
                              size_t width_,
                              const std::string &data_)
{
    buf_.push_back (static_cast<unsigned char> (0x80 + width_));
    const uint64_t length = data_.size ();
    for (size_t i = width_; i > 0; --i)
        buf_.push_back (
          static_cast<unsigned char> ((length >> (8 * (i - 1))) & 0xff));
    buf_.insert (buf_.end (), data_.begin (), data_.end ());
}

//  Arms a watchdog so that a hanging test fails instead of blocking the
//  test run.
void setup_test_environment (int timeout_seconds_ = 60);

#endif
