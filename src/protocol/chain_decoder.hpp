/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_CHAIN_DECODER_HPP_INCLUDED__
#define __BCHAIN_CHAIN_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <memory>

#include "core/chain.hpp"
#include "core/options.hpp"
#include "protocol/chain_event.hpp"
#include "protocol/chain_protocol.hpp"
#include "protocol/decoder.hpp"

namespace bchain
{
//  Part buffers never grow more than this far ahead of the bytes that
//  have actually arrived.
const size_t chain_decoder_batch_size = 8192;

//  Streaming decoder for binary chains. One instance per byte stream.
class chain_decoder_t BCHAIN_FINAL : public decoder_base_t<chain_decoder_t>
{
  public:
    explicit chain_decoder_t (const options_t &options_ = options_t (),
                              size_t bufsize_ = chain_decoder_batch_size);
    ~chain_decoder_t () BCHAIN_OVERRIDE;

    //  Pushes a chunk of any size and appends the resulting events to
    //  events_. Returns the number of events appended. On a broken stream
    //  an error event is appended as well and -1 is returned with errno
    //  set; nothing is consumed from then on.
    int feed (const void *data_, size_t size_, chain_events_t &events_);

    //  Reports the end of the stream: fails with EBCHAINEOS when the
    //  stream stopped inside a chain, or with the stream's own error.
    int finish () const;

    //  True on a chain boundary of a healthy stream.
    bool idle () const { return !failed () && !_in_chain; }

    //  Most recently completed chain, NULL before the first one.
    std::shared_ptr<const chain_t> chain () const { return _completed; }

    uint8_t error_code () const { return _error_code; }

    const options_t &options () const { return _options; }

    //  Limits change only on a chain boundary, EBUSY otherwise.
    int set_options (const options_t &options_);
    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

  private:
    int prefix_byte_ready (unsigned char const *read_from_);
    int marker_ready (unsigned char const *read_from_);
    int length_ready (unsigned char const *read_from_);
    int part_data_ready (unsigned char const *read_from_);

    int chain_ready ();
    int protocol_error (uint8_t code_);
    void emit (chain_event_t::type_t type_, size_t index_);

    options_t _options;

    unsigned char _tmpbuf[chain_max_length_width];
    size_t _length_width;

    //  Bytes of the current part not yet reserved in its buffer.
    uint64_t _part_remaining;

    //  Prefix length plus declared part lengths of the current chain.
    uint64_t _chain_size;

    bool _in_chain;
    uint8_t _error_code;

    std::shared_ptr<chain_t> _in_progress;
    std::shared_ptr<const chain_t> _completed;

    //  Where events go while feed () runs; decode () alone records none.
    chain_events_t *_sink;

    BCHAIN_NON_COPYABLE_NOR_MOVABLE (chain_decoder_t)
};
}

#endif
