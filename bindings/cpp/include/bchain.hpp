/* SPDX-License-Identifier: MPL-2.0 */
#ifndef BCHAIN_CPP_HPP_INCLUDED
#define BCHAIN_CPP_HPP_INCLUDED

#include <bchain.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#if defined(BCHAIN_CPP_EXCEPTIONS)
#include <stdexcept>
#include <exception>
#endif

namespace bchain
{

#if __cplusplus >= 201703L
#define BCHAIN_CPP_NODISCARD [[nodiscard]]
#else
#define BCHAIN_CPP_NODISCARD
#endif

class error_t
#if defined(BCHAIN_CPP_EXCEPTIONS)
  : public std::exception
#endif
{
  public:
    explicit error_t (int code_) : _code (code_) {}
    int code () const noexcept { return _code; }
    const char *what () const noexcept
#if defined(BCHAIN_CPP_EXCEPTIONS)
      override
#endif
    {
        return bchain_strerror (_code);
    }

  private:
    int _code;
};

inline error_t last_error () { return error_t (bchain_errno ()); }

#if defined(BCHAIN_CPP_EXCEPTIONS)
inline void throw_on_error (int rc)
{
    if (rc < 0)
        throw error_t (bchain_errno ());
}
#endif

enum class event_type : int
{
    prefix = BCHAIN_EVENT_PREFIX,
    part = BCHAIN_EVENT_PART,
    chain = BCHAIN_EVENT_CHAIN,
    error = BCHAIN_EVENT_ERROR
};

enum class limit_option : int
{
    max_prefix_length = BCHAIN_MAX_PREFIX_LENGTH,
    max_part_length = BCHAIN_MAX_PART_LENGTH,
    max_part_count = BCHAIN_MAX_PART_COUNT,
    max_chain_size = BCHAIN_MAX_CHAIN_SIZE
};

//  Decoder and encoder limits. -1 means unlimited, except for the prefix
//  which is always bounded.
class limits_t
{
  public:
    limits_t () { bchain_limits_init (&_limits); }

    int64_t get (limit_option option_) const
    {
        switch (option_) {
            case limit_option::max_prefix_length:
                return _limits.max_prefix_length;
            case limit_option::max_part_length:
                return _limits.max_part_length;
            case limit_option::max_part_count:
                return _limits.max_part_count;
            case limit_option::max_chain_size:
                return _limits.max_chain_size;
        }
        return -1;
    }

    limits_t &set (limit_option option_, int64_t value_)
    {
        switch (option_) {
            case limit_option::max_prefix_length:
                _limits.max_prefix_length = value_;
                break;
            case limit_option::max_part_length:
                _limits.max_part_length = value_;
                break;
            case limit_option::max_part_count:
                _limits.max_part_count = value_;
                break;
            case limit_option::max_chain_size:
                _limits.max_chain_size = value_;
                break;
        }
        return *this;
    }

    const bchain_limits_t *handle () const noexcept { return &_limits; }

  private:
    bchain_limits_t _limits;
};

typedef std::vector<unsigned char> part_t;

//  Serialises one chain. On failure out_ is left untouched and the error
//  is available through last_error ().
BCHAIN_CPP_NODISCARD inline int encode (const std::string &prefix_,
                                        const std::vector<part_t> &parts_,
                                        std::vector<unsigned char> &out_,
                                        const limits_t &limits_ = limits_t ())
{
    std::vector<bchain_part_t> parts (parts_.size ());
    for (size_t i = 0; i < parts_.size (); ++i) {
        parts[i].data = parts_[i].empty () ? NULL : &parts_[i][0];
        parts[i].size = parts_[i].size ();
    }
    const bchain_part_t *parts_ptr = parts.empty () ? NULL : &parts[0];

    size_t size = 0;
    int rc = bchain_encode (prefix_.data (), prefix_.size (), parts_ptr,
                            parts.size (), limits_.handle (), NULL, &size);
    if (rc == 0 || bchain_errno () != ENOBUFS)
        return -1;

    std::vector<unsigned char> buf (size);
    rc = bchain_encode (prefix_.data (), prefix_.size (), parts_ptr,
                        parts.size (), limits_.handle (), &buf[0], &size);
    if (rc != 0)
        return -1;
    out_.swap (buf);
    return 0;
}

//  Returns the encoded chain, an empty vector on failure (a valid chain
//  is never empty: it ends with the EOC byte).
inline std::vector<unsigned char> encode (const std::string &prefix_,
                                          const std::vector<part_t> &parts_,
                                          const limits_t &limits_ = limits_t ())
{
    std::vector<unsigned char> out;
    const int rc = encode (prefix_, parts_, out, limits_);
#if defined(BCHAIN_CPP_EXCEPTIONS)
    throw_on_error (rc);
#else
    (void) rc;
#endif
    return out;
}

//  One decoder output, owning copies of its bytes.
struct event_t
{
    event_type type;

    //  Prefix for prefix and chain events, part bytes for part events.
    std::string prefix;
    part_t data;

    //  Part index for part events, part count for chain events.
    size_t index;

    //  The parts of a chain event.
    std::vector<part_t> parts;

    //  errno value of an error event.
    int error;
};

class stream_decoder_t
{
  public:
    stream_decoder_t () : _decoder (bchain_decoder_new (NULL)) {}

    explicit stream_decoder_t (const limits_t &limits_) :
        _decoder (bchain_decoder_new (limits_.handle ()))
    {
    }

    ~stream_decoder_t () { close (); }

    stream_decoder_t (stream_decoder_t &&other) noexcept :
        _decoder (other._decoder)
    {
        other._decoder = NULL;
    }

    stream_decoder_t &operator= (stream_decoder_t &&other) noexcept
    {
        if (this == &other)
            return *this;
        close ();
        _decoder = other._decoder;
        other._decoder = NULL;
        return *this;
    }

    stream_decoder_t (const stream_decoder_t &) = delete;
    stream_decoder_t &operator= (const stream_decoder_t &) = delete;

    bool valid () const noexcept { return _decoder != NULL; }
    void *handle () noexcept { return _decoder; }

    //  Appends the events of one chunk to events_. Returns the number of
    //  events appended, -1 if the stream is broken (the last appended
    //  event is then the error).
    int feed (const void *data_, size_t size_, std::vector<event_t> &events_)
    {
        const int rc = bchain_decoder_feed (_decoder, data_, size_);
        const int err = bchain_errno ();
        const int count = bchain_decoder_event_count (_decoder);
        if (count < 0)
            return -1;

        for (int i = 0; i < count; ++i) {
            bchain_event_t raw;
            if (bchain_decoder_event (_decoder, static_cast<size_t> (i), &raw)
                != 0)
                return -1;
            events_.push_back (convert (raw, static_cast<size_t> (i)));
        }
        if (rc < 0) {
            errno = err;
            return -1;
        }
        return count;
    }

    std::vector<event_t> feed (const void *data_, size_t size_)
    {
        std::vector<event_t> events;
        const int rc = feed (data_, size_, events);
#if defined(BCHAIN_CPP_EXCEPTIONS)
        throw_on_error (rc);
#else
        (void) rc;
#endif
        return events;
    }

    std::vector<event_t> feed (const std::string &chunk_)
    {
        return feed (chunk_.data (), chunk_.size ());
    }

    int finish () { return bchain_decoder_finish (_decoder); }

    bool idle () { return bchain_decoder_idle (_decoder) == 1; }

    int set (limit_option option_, int64_t value_)
    {
        return bchain_decoder_setopt (_decoder, static_cast<int> (option_),
                                      &value_, sizeof (value_));
    }

    int get (limit_option option_, int64_t *value_)
    {
        size_t size = sizeof (int64_t);
        return bchain_decoder_getopt (_decoder, static_cast<int> (option_),
                                      value_, &size);
    }

    int close () noexcept
    {
        int rc = 0;
        if (_decoder)
            rc = bchain_decoder_close (_decoder);
        _decoder = NULL;
        return rc;
    }

  private:
    event_t convert (const bchain_event_t &raw_, size_t position_)
    {
        event_t event;
        event.type = static_cast<event_type> (raw_.type);
        event.index = raw_.index;
        event.error = raw_.error;

        const unsigned char *data =
          static_cast<const unsigned char *> (raw_.data);
        switch (event.type) {
            case event_type::prefix:
                event.prefix.assign (static_cast<const char *> (raw_.data),
                                     raw_.size);
                break;
            case event_type::part:
                event.data.assign (data, data + raw_.size);
                break;
            case event_type::chain:
                event.prefix.assign (static_cast<const char *> (raw_.data),
                                     raw_.size);
                event.parts.resize (raw_.index);
                for (size_t i = 0; i < raw_.index; ++i) {
                    const void *part = NULL;
                    size_t size = 0;
                    if (bchain_decoder_event_part (_decoder, position_, i,
                                                   &part, &size)
                          == 0
                        && size > 0) {
                        const unsigned char *bytes =
                          static_cast<const unsigned char *> (part);
                        event.parts[i].assign (bytes, bytes + size);
                    }
                }
                break;
            case event_type::error:
                break;
        }
        return event;
    }

    void *_decoder;
};

inline void version (int *major_, int *minor_, int *patch_)
{
    bchain_version (major_, minor_, patch_);
}

}

#endif
