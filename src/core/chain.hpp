/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_CHAIN_HPP_INCLUDED__
#define __BCHAIN_CHAIN_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace bchain
{
class chain_decoder_t;

//  A binary chain: an ASCII prefix followed by an ordered list of
//  binary-safe parts. Once initialised a chain is only read; init () is
//  the single entry point that sets its content.
class chain_t
{
  public:
    typedef std::vector<unsigned char> part_t;
    typedef std::vector<part_t> parts_t;

    chain_t ();

    //  Fails with EBCHAINPREFIX if the prefix holds a byte above 0x7f.
    //  Part lengths are not checked here.
    int init (const void *prefix_, size_t prefix_size_, const parts_t &parts_);
    int init (const std::string &prefix_, const parts_t &parts_);

    const std::string &prefix () const { return _prefix; }
    const parts_t &parts () const { return _parts; }
    size_t part_count () const { return _parts.size (); }
    const part_t &part (size_t index_) const { return _parts[index_]; }

    //  Prefix length plus the length of every part.
    uint64_t payload_size () const;

    //  Short human-readable rendering, truncated for long prefixes, long
    //  parts and long part lists.
    std::string summary () const;

    bool operator== (const chain_t &other_) const;
    bool operator!= (const chain_t &other_) const;

    static bool valid_prefix (const void *prefix_, size_t size_);

  private:
    //  The decoder builds prefix and parts in place as bytes arrive and
    //  validates them on the way.
    friend class chain_decoder_t;

    std::string _prefix;
    parts_t _parts;
};
}

#endif
