/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_DECODER_HPP_INCLUDED__
#define __BCHAIN_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <string.h>
#include <algorithm>

#include "utils/err.hpp"
#include "utils/macros.hpp"

namespace bchain
{
//  Helper base class for decoders that know the amount of data to read
//  in advance at any moment. Knowing the amount in advance is a property
//  of the protocol used. The decoder resumes exactly where the previous
//  call stopped, so input may be split at any byte boundary.
//
//  This class implements the state machine that parses the incoming buffer.
//  Derived class should implement individual state machine actions.
//
//  Once a step fails, the decoder is broken: every later call to decode ()
//  fails with the same errno without consuming anything.

template <typename T> class decoder_base_t
{
  public:
    explicit decoder_base_t (size_t bufsize_) :
        _next (NULL),
        _read_pos (NULL),
        _to_read (0),
        _errno (0),
        _buf_size (bufsize_)
    {
    }

    virtual ~decoder_base_t () BCHAIN_DEFAULT

    //  Processes size_ bytes of input. Function returns 1 when a whole
    //  message was decoded (the rest of the input has not been looked at
    //  yet) or 0 when all input was consumed and more data is required.
    //  On error, -1 is returned and errno set accordingly.
    //  Number of bytes processed is returned in bytes_used_.
    int decode (const unsigned char *data_, size_t size_, size_t &bytes_used_)
    {
        bytes_used_ = 0;

        if (unlikely (_errno != 0)) {
            errno = _errno;
            return -1;
        }

        while (bytes_used_ < size_) {
            //  Copy the data from buffer to the message.
            const size_t to_copy = std::min (_to_read, size_ - bytes_used_);
            if (to_copy > 0) {
                memcpy (_read_pos, data_ + bytes_used_, to_copy);
                _read_pos += to_copy;
                _to_read -= to_copy;
                bytes_used_ += to_copy;
            }

            //  Try to get more space in the message to fill in.
            //  If none is available, return.
            while (_to_read == 0) {
                //  pass current address in the buffer
                const int rc =
                  (static_cast<T *> (this)->*_next) (data_ + bytes_used_);
                if (rc != 0) {
                    if (rc == -1)
                        _errno = errno;
                    return rc;
                }
            }
        }

        return 0;
    }

    bool failed () const { return _errno != 0; }
    int last_errno () const { return _errno; }

  protected:
    //  Prototype of state machine action. Action returns 0 to continue,
    //  1 when a message is complete and -1 with errno set on error.
    typedef int (T::*step_t) (unsigned char const *);

    //  This function should be called from derived class to read data
    //  from the buffer and schedule next state machine action.
    void next_step (void *read_pos_, size_t to_read_, step_t next_)
    {
        _read_pos = static_cast<unsigned char *> (read_pos_);
        _to_read = to_read_;
        _next = next_;
    }

    //  Largest amount of storage a step may reserve ahead of the data
    //  that has actually arrived.
    size_t buf_size () const { return _buf_size; }

  private:
    //  Next step. If set to NULL, it means that associated data stream
    //  is dead. Note that there can be still data in the process in such
    //  case.
    step_t _next;

    //  Where to store the read data.
    unsigned char *_read_pos;

    //  How much data to read before taking next step.
    size_t _to_read;

    //  errno of the step that broke the stream, 0 while healthy.
    int _errno;

    const size_t _buf_size;

    BCHAIN_NON_COPYABLE_NOR_MOVABLE (decoder_base_t)
};
}

#endif
