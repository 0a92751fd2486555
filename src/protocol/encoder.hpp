/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_ENCODER_HPP_INCLUDED__
#define __BCHAIN_ENCODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>

#include "utils/err.hpp"
#include "utils/macros.hpp"

namespace bchain
{
class chain_t;

//  Helper base class for encoders. It implements the state machine that
//  fills the outgoing buffer. Derived classes should implement individual
//  state machine actions.
//
//  encode () may return a pointer directly into the chain being encoded
//  (zero-copy path). That pointer is valid only until the next call to
//  encode () or load_chain (), and only while the chain itself is alive.

template <typename T> class encoder_base_t
{
  public:
    explicit encoder_base_t (size_t bufsize_) :
        _write_pos (NULL),
        _to_write (0),
        _next (NULL),
        _new_msg_flag (false),
        _buf_size (bufsize_),
        _buf (static_cast<unsigned char *> (malloc (bufsize_))),
        _in_progress (NULL)
    {
        alloc_assert (_buf);
    }

    virtual ~encoder_base_t () { free (_buf); }

    //  The function returns a batch of binary data. The data
    //  are filled to a supplied buffer. If no buffer is supplied (data_
    //  points to NULL) encoder object will provide buffer of its own.
    //  Returns 0 once the loaded chain has been written completely.
    size_t encode (unsigned char **data_, size_t size_)
    {
        unsigned char *buffer = !*data_ ? _buf : *data_;
        const size_t buffersize = !*data_ ? _buf_size : size_;

        if (in_progress () == NULL)
            return 0;

        size_t pos = 0;
        while (pos < buffersize) {
            //  If there are no more data to return, run the state machine.
            //  If there are still no data, return what we already have
            //  in the buffer.
            if (!_to_write) {
                if (_new_msg_flag) {
                    _in_progress = NULL;
                    _new_msg_flag = false;
                    break;
                }
                (static_cast<T *> (this)->*_next) ();
            }

            //  If there are no data in the buffer yet and we are able to
            //  fill whole buffer in a single go, let's use zero-copy.
            //  Large parts are then handed out without going through
            //  the internal buffer at all.
            if (!pos && !*data_ && _to_write >= buffersize) {
                *data_ = const_cast<unsigned char *> (_write_pos);
                pos = _to_write;
                _write_pos = NULL;
                _to_write = 0;
                return pos;
            }

            //  Copy data to the buffer. If the buffer is full, return.
            const size_t to_copy = std::min (_to_write, buffersize - pos);
            memcpy (buffer + pos, _write_pos, to_copy);
            pos += to_copy;
            _write_pos += to_copy;
            _to_write -= to_copy;
        }

        *data_ = buffer;
        return pos;
    }

    void load_chain (const chain_t *chain_)
    {
        bchain_assert (in_progress () == NULL);
        _in_progress = chain_;
        (static_cast<T *> (this)->*_next) ();
    }

    //  True while a loaded chain has not been written out completely.
    bool busy () const { return _in_progress != NULL; }

  protected:
    //  Prototype of state machine action.
    typedef void (T::*step_t) ();

    //  This function should be called from derived class to write the data
    //  to the buffer and schedule next state machine action.
    void next_step (const void *write_pos_,
                    size_t to_write_,
                    step_t next_,
                    bool new_msg_flag_)
    {
        _write_pos = static_cast<const unsigned char *> (write_pos_);
        _to_write = to_write_;
        _next = next_;
        _new_msg_flag = new_msg_flag_;
    }

    const chain_t *in_progress () const { return _in_progress; }

  private:
    //  Where to get the data to write from.
    const unsigned char *_write_pos;

    //  How much data to write before next step should be executed.
    size_t _to_write;

    //  Next step. If set to NULL, it means that associated data stream
    //  is dead.
    step_t _next;

    bool _new_msg_flag;

    //  The buffer for encoded data.
    const size_t _buf_size;
    unsigned char *const _buf;

    const chain_t *_in_progress;

    BCHAIN_NON_COPYABLE_NOR_MOVABLE (encoder_base_t)
};
}

#endif
