/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_CHAIN_ENCODER_HPP_INCLUDED__
#define __BCHAIN_CHAIN_ENCODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "protocol/chain_protocol.hpp"
#include "protocol/encoder.hpp"

namespace bchain
{
class chain_t;
struct options_t;

const size_t chain_encoder_batch_size = 8192;

//  Streaming encoder for binary chains. Length fields always use the
//  smallest width able to hold the part length.
class chain_encoder_t BCHAIN_FINAL : public encoder_base_t<chain_encoder_t>
{
  public:
    explicit chain_encoder_t (size_t bufsize_ = chain_encoder_batch_size);
    ~chain_encoder_t () BCHAIN_OVERRIDE;

  private:
    void prefix_ready ();
    void part_header_ready ();
    void part_body_ready ();

    //  SOP marker followed by up to eight length bytes.
    unsigned char _tmp_buf[1 + chain_max_length_width];
    size_t _part;

    BCHAIN_NON_COPYABLE_NOR_MOVABLE (chain_encoder_t)
};

//  Exact serialized length of chain_. Fails with the errno of the first
//  limit the chain violates.
int encoded_size (const chain_t &chain_,
                  const options_t &options_,
                  uint64_t &size_);

//  Writes the serialization of chain_ into buf_, which must hold at least
//  the encoded size. No limits are checked. Returns the bytes written.
size_t encode (const chain_t &chain_, unsigned char *buf_, size_t size_);

//  Serialises chain_ into out_ (replacing its content). Nothing is written
//  if the chain violates the limits.
int encode (const chain_t &chain_,
            const options_t &options_,
            std::vector<unsigned char> &out_);
}

#endif
