/* SPDX-License-Identifier: MPL-2.0 */

#include "core/chain.hpp"
#include "protocol/chain_protocol.hpp"
#include "utils/err.hpp"

#include <stdio.h>

namespace
{
const size_t summary_prefix_chars = 100;
const size_t summary_parts = 10;
const size_t summary_part_bytes = 10;

void append_escaped (std::string &out_,
                     const unsigned char *data_,
                     size_t size_)
{
    for (size_t i = 0; i < size_; ++i) {
        const unsigned char c = data_[i];
        if (c == '"' || c == '\\') {
            out_ += '\\';
            out_ += static_cast<char> (c);
        } else if (c >= 0x20 && c < 0x7f) {
            out_ += static_cast<char> (c);
        } else {
            char hex[5];
            snprintf (hex, sizeof hex, "\\x%02x", c);
            out_ += hex;
        }
    }
}
}

bchain::chain_t::chain_t ()
{
}

int bchain::chain_t::init (const void *prefix_,
                           size_t prefix_size_,
                           const parts_t &parts_)
{
    if (!valid_prefix (prefix_, prefix_size_)) {
        errno = EBCHAINPREFIX;
        return -1;
    }
    if (prefix_size_ > 0)
        _prefix.assign (static_cast<const char *> (prefix_), prefix_size_);
    else
        _prefix.clear ();
    _parts = parts_;
    return 0;
}

int bchain::chain_t::init (const std::string &prefix_, const parts_t &parts_)
{
    return init (prefix_.data (), prefix_.size (), parts_);
}

uint64_t bchain::chain_t::payload_size () const
{
    uint64_t size = _prefix.size ();
    for (parts_t::const_iterator it = _parts.begin (); it != _parts.end ();
         ++it)
        size += it->size ();
    return size;
}

std::string bchain::chain_t::summary () const
{
    std::string out ("chain<\"");
    const unsigned char *prefix =
      reinterpret_cast<const unsigned char *> (_prefix.data ());
    if (_prefix.size () <= summary_prefix_chars)
        append_escaped (out, prefix, _prefix.size ());
    else {
        append_escaped (out, prefix, summary_prefix_chars);
        out += "...";
    }
    out += "\", [";

    const size_t shown =
      _parts.size () < summary_parts ? _parts.size () : summary_parts;
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0)
            out += ", ";
        out += '"';
        const part_t &part = _parts[i];
        if (part.size () <= summary_part_bytes)
            append_escaped (out, part.empty () ? NULL : &part[0], part.size ());
        else {
            append_escaped (out, &part[0], summary_part_bytes);
            out += "...";
        }
        out += '"';
    }
    if (_parts.size () > summary_parts)
        out += ", \".....\"";
    out += "]>";
    return out;
}

bool bchain::chain_t::operator== (const chain_t &other_) const
{
    return _prefix == other_._prefix && _parts == other_._parts;
}

bool bchain::chain_t::operator!= (const chain_t &other_) const
{
    return !(*this == other_);
}

bool bchain::chain_t::valid_prefix (const void *prefix_, size_t size_)
{
    if (size_ == 0)
        return true;
    if (prefix_ == NULL)
        return false;
    const unsigned char *bytes = static_cast<const unsigned char *> (prefix_);
    for (size_t i = 0; i < size_; ++i)
        if (!chain_is_prefix_byte (bytes[i]))
            return false;
    return true;
}
