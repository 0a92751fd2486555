/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/chain.hpp"
#include "core/options.hpp"
#include "protocol/chain_decoder.hpp"
#include "protocol/chain_encoder.hpp"
#include "protocol/chain_event.hpp"
#include "protocol/chain_protocol.hpp"

#include <unity.h>
#include <stdio.h>
#include <algorithm>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static bchain::chain_t make_chain (const std::string &prefix_,
                                   const std::vector<std::string> &parts_)
{
    bchain::chain_t::parts_t parts;
    for (size_t i = 0; i < parts_.size (); ++i)
        parts.push_back (
          bchain::chain_t::part_t (parts_[i].begin (), parts_[i].end ()));
    bchain::chain_t chain;
    TEST_ASSERT_EQUAL_INT (0, chain.init (prefix_, parts));
    return chain;
}

static void append_chain (bytes_t &buf_, const bchain::chain_t &chain_)
{
    bytes_t encoded;
    TEST_ASSERT_EQUAL_INT (
      0, bchain::encode (chain_, bchain::options_t (), encoded));
    buf_.insert (buf_.end (), encoded.begin (), encoded.end ());
}

//  Renders events as text so that event sequences can be compared.
static std::string describe (const bchain::chain_events_t &events_)
{
    std::string out;
    char line[64];
    for (size_t i = 0; i < events_.size (); ++i) {
        const bchain::chain_event_t &event = events_[i];
        switch (event.type) {
            case bchain::chain_event_t::prefix_complete:
                out += "prefix ";
                out.append (static_cast<const char *> (event.data ()),
                            event.size ());
                break;
            case bchain::chain_event_t::part_complete:
                snprintf (line, sizeof line, "part %zu (%zu):", event.index,
                          event.size ());
                out += line;
                for (size_t j = 0; j < event.size (); ++j) {
                    snprintf (
                      line, sizeof line, "%02x",
                      static_cast<const unsigned char *> (event.data ())[j]);
                    out += line;
                }
                break;
            case bchain::chain_event_t::chain_complete:
                snprintf (line, sizeof line, "chain %zu: ", event.index);
                out += line;
                out += event.chain->summary ();
                break;
            case bchain::chain_event_t::error:
                snprintf (line, sizeof line, "error %d", event.errnum);
                out += line;
                break;
        }
        out += "\n";
    }
    return out;
}

//  Feeds buf_ in chunks of chunk_size_ bytes, stopping at the first error.
static int feed_chunked (bchain::chain_decoder_t &decoder_,
                         const bytes_t &buf_,
                         size_t chunk_size_,
                         bchain::chain_events_t &events_)
{
    for (size_t pos = 0; pos < buf_.size (); pos += chunk_size_) {
        const size_t n = std::min (chunk_size_, buf_.size () - pos);
        if (decoder_.feed (&buf_[pos], n, events_) == -1)
            return -1;
    }
    return 0;
}

static bytes_t sample_stream ()
{
    std::vector<std::string> parts;
    parts.push_back ("ab");
    parts.push_back ("");
    std::string binary;
    for (int i = 0; i < 300; ++i)
        binary += static_cast<char> (i & 0xff);
    parts.push_back (binary);

    bytes_t buf;
    append_chain (buf, make_chain ("first", parts));
    append_chain (buf, bchain::chain_t ());
    append_chain (buf, make_chain ("", std::vector<std::string> (2)));
    append_chain (buf, make_chain ("last", std::vector<std::string> (1, "z")));
    return buf;
}

void test_decode_empty_chain ()
{
    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    const unsigned char eoc = 0xff;

    TEST_ASSERT_EQUAL_INT (2, decoder.feed (&eoc, 1, events));
    TEST_ASSERT_EQUAL_INT (bchain::chain_event_t::prefix_complete,
                           events[0].type);
    TEST_ASSERT_EQUAL_UINT (0, events[0].size ());
    TEST_ASSERT_EQUAL_INT (bchain::chain_event_t::chain_complete,
                           events[1].type);
    TEST_ASSERT_EQUAL_UINT (0, events[1].index);
    TEST_ASSERT_TRUE (*decoder.chain () == bchain::chain_t ());
    TEST_ASSERT_TRUE (decoder.idle ());
}

void test_decode_prefix_only ()
{
    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    const bytes_t buf = to_bytes ("foo\xff");

    TEST_ASSERT_EQUAL_INT (2, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_STRING ("prefix foo\nchain 0: chain<\"foo\", []>\n",
                              describe (events).c_str ());
    TEST_ASSERT_EQUAL_STRING ("foo", decoder.chain ()->prefix ().c_str ());
    TEST_ASSERT_EQUAL_UINT (0, decoder.chain ()->part_count ());
}

void test_decode_parts ()
{
    std::vector<std::string> parts;
    parts.push_back ("ab");
    parts.push_back ("");
    parts.push_back (std::string (300, '\x90'));
    const bchain::chain_t expected = make_chain ("cmd", parts);

    bytes_t buf;
    append_chain (buf, expected);

    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (5, decoder.feed (&buf[0], buf.size (), events));

    TEST_ASSERT_EQUAL_INT (bchain::chain_event_t::prefix_complete,
                           events[0].type);
    TEST_ASSERT_EQUAL_INT (bchain::chain_event_t::part_complete,
                           events[1].type);
    TEST_ASSERT_EQUAL_UINT (0, events[1].index);
    TEST_ASSERT_EQUAL_MEMORY ("ab", events[1].data (), 2);
    TEST_ASSERT_EQUAL_UINT (1, events[2].index);
    TEST_ASSERT_EQUAL_UINT (0, events[2].size ());
    TEST_ASSERT_EQUAL_UINT (2, events[3].index);
    TEST_ASSERT_EQUAL_UINT (300, events[3].size ());
    TEST_ASSERT_EQUAL_INT (bchain::chain_event_t::chain_complete,
                           events[4].type);
    TEST_ASSERT_EQUAL_UINT (3, events[4].index);

    TEST_ASSERT_TRUE (*events[4].chain == expected);
    TEST_ASSERT_TRUE (*decoder.chain () == expected);
}

void test_decode_returns_one_per_chain ()
{
    const bchain::chain_t first =
      make_chain ("one", std::vector<std::string> (1, "1"));
    const bchain::chain_t second =
      make_chain ("two", std::vector<std::string> (2, "22"));
    bytes_t buf;
    append_chain (buf, first);
    const size_t first_size = buf.size ();
    append_chain (buf, second);

    bchain::chain_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&buf[0], buf.size (), processed));
    TEST_ASSERT_EQUAL_UINT (first_size, processed);
    TEST_ASSERT_TRUE (*decoder.chain () == first);

    size_t processed2 = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&buf[0] + processed,
                                              buf.size () - processed,
                                              processed2));
    TEST_ASSERT_EQUAL_UINT (buf.size (), processed + processed2);
    TEST_ASSERT_TRUE (*decoder.chain () == second);

    //  A completed chain is unaffected by the next one starting.
    const std::shared_ptr<const bchain::chain_t> kept = decoder.chain ();
    TEST_ASSERT_EQUAL_INT (0, decoder.decode (&buf[0], 2, processed));
    TEST_ASSERT_EQUAL_UINT (2, processed);
    TEST_ASSERT_TRUE (*kept == second);
    TEST_ASSERT_FALSE (decoder.idle ());
}

void test_chunk_boundary_invariance ()
{
    const bytes_t buf = sample_stream ();

    bchain::chain_decoder_t reference;
    bchain::chain_events_t whole;
    TEST_ASSERT_EQUAL_INT (0, feed_chunked (reference, buf, buf.size (), whole));
    const std::string expected = describe (whole);

    //  One byte at a time and a few odd sizes.
    const size_t chunk_sizes[] = {1, 2, 3, 7, 64, 255, 256, 4096};
    for (size_t i = 0; i < sizeof chunk_sizes / sizeof chunk_sizes[0]; ++i) {
        bchain::chain_decoder_t decoder;
        bchain::chain_events_t events;
        TEST_ASSERT_EQUAL_INT (
          0, feed_chunked (decoder, buf, chunk_sizes[i], events));
        TEST_ASSERT_EQUAL_STRING (expected.c_str (),
                                  describe (events).c_str ());
        TEST_ASSERT_TRUE (decoder.idle ());
    }

    //  Every two-chunk split, including empty first and last chunks.
    for (size_t split = 0; split <= buf.size (); ++split) {
        bchain::chain_decoder_t decoder;
        bchain::chain_events_t events;
        TEST_ASSERT_TRUE (decoder.feed (&buf[0], split, events) >= 0);
        TEST_ASSERT_TRUE (
          decoder.feed (&buf[0] + split, buf.size () - split, events) >= 0);
        TEST_ASSERT_EQUAL_STRING (expected.c_str (),
                                  describe (events).c_str ());
    }
}

void test_split_inside_length_field ()
{
    //  A 3 byte length field split after each of its bytes.
    const std::string data (70000, 'd');
    bytes_t buf;
    append_chain (buf, make_chain ("x", std::vector<std::string> (1, data)));
    TEST_ASSERT_EQUAL_HEX8 (0x83, buf[1]);

    for (size_t split = 2; split <= 5; ++split) {
        bchain::chain_decoder_t decoder;
        bchain::chain_events_t events;
        TEST_ASSERT_EQUAL_INT (1, decoder.feed (&buf[0], split, events));
        TEST_ASSERT_EQUAL_INT (
          2, decoder.feed (&buf[0] + split, buf.size () - split, events));
        TEST_ASSERT_EQUAL_UINT (70000, events[1].size ());
        TEST_ASSERT_EQUAL_UINT (1, decoder.chain ()->part_count ());
    }
}

void test_small_growth_quantum ()
{
    std::string data;
    for (int i = 0; i < 1000; ++i)
        data += static_cast<char> ((i * 7) & 0xff);
    const bchain::chain_t expected =
      make_chain ("q", std::vector<std::string> (1, data));
    bytes_t buf;
    append_chain (buf, expected);

    bchain::chain_decoder_t decoder (bchain::options_t (), 16);
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (0, feed_chunked (decoder, buf, 7, events));
    TEST_ASSERT_TRUE (*decoder.chain () == expected);
}

void test_pipelining ()
{
    bytes_t buf;
    append_chain (buf, make_chain ("a", std::vector<std::string> (1, "A")));
    append_chain (buf, make_chain ("b", std::vector<std::string> (1, "B")));

    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (6, decoder.feed (&buf[0], buf.size (), events));

    TEST_ASSERT_EQUAL_STRING ("prefix a\n"
                              "part 0 (1):41\n"
                              "chain 1: chain<\"a\", [\"A\"]>\n"
                              "prefix b\n"
                              "part 0 (1):42\n"
                              "chain 1: chain<\"b\", [\"B\"]>\n",
                              describe (events).c_str ());
    TEST_ASSERT_TRUE (events[2].chain != events[5].chain);
}

void test_non_minimal_length ()
{
    bytes_t buf = to_bytes ("n");
    append_wire_part (buf, 2, "hello");
    append_wire_part (buf, 8, "");
    buf.push_back (0xff);

    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (4, decoder.feed (&buf[0], buf.size (), events));

    std::vector<std::string> parts;
    parts.push_back ("hello");
    parts.push_back ("");
    TEST_ASSERT_TRUE (*decoder.chain () == make_chain ("n", parts));
}

void test_invalid_marker_is_terminal ()
{
    bytes_t buf = to_bytes ("a");
    append_wire_part (buf, 0, "");
    buf.push_back (0x90);
    buf.push_back (0xff);

    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (-1, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_INT (EBCHAINMARKER, errno);
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_invalid_marker,
                             decoder.error_code ());
    TEST_ASSERT_EQUAL_UINT (3, events.size ());
    TEST_ASSERT_EQUAL_INT (bchain::chain_event_t::error, events[2].type);
    TEST_ASSERT_EQUAL_INT (EBCHAINMARKER, events[2].errnum);

    //  Nothing is consumed any more, whatever comes next.
    const unsigned char eoc = 0xff;
    for (int i = 0; i < 3; ++i) {
        bchain::chain_events_t later;
        TEST_ASSERT_EQUAL_INT (-1, decoder.feed (&eoc, 1, later));
        TEST_ASSERT_EQUAL_INT (EBCHAINMARKER, errno);
        TEST_ASSERT_EQUAL_UINT (1, later.size ());
        TEST_ASSERT_EQUAL_INT (EBCHAINMARKER, later[0].errnum);
    }

    size_t processed = 1;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (&eoc, 1, processed));
    TEST_ASSERT_EQUAL_UINT (0, processed);

    TEST_ASSERT_EQUAL_INT (-1, decoder.finish ());
    TEST_ASSERT_EQUAL_INT (EBCHAINMARKER, errno);
    TEST_ASSERT_FALSE (decoder.idle ());
}

void test_invalid_marker_after_prefix ()
{
    const unsigned char bad_markers[] = {0x89, 0x90, 0xc0, 0xfe};
    for (size_t i = 0; i < sizeof bad_markers; ++i) {
        bytes_t buf = to_bytes ("abc");
        buf.push_back (bad_markers[i]);

        bchain::chain_decoder_t decoder;
        bchain::chain_events_t events;
        TEST_ASSERT_EQUAL_INT (-1, decoder.feed (&buf[0], buf.size (), events));
        TEST_ASSERT_EQUAL_INT (EBCHAINMARKER, errno);

        //  No prefix event for a prefix ended by garbage.
        TEST_ASSERT_EQUAL_UINT (1, events.size ());
        TEST_ASSERT_EQUAL_INT (bchain::chain_event_t::error, events[0].type);
    }
}

void test_part_too_large_before_data ()
{
    bchain::options_t options;
    options.max_part_length = 10;

    bytes_t buf = to_bytes ("x");
    buf.push_back (0x81);
    buf.push_back (11);
    buf.insert (buf.end (), 11, 'd');
    buf.push_back (0xff);

    bchain::chain_decoder_t decoder (options);
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (&buf[0], buf.size (), processed));
    TEST_ASSERT_EQUAL_INT (EBCHAINPARTLEN, errno);
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_part_too_large,
                             decoder.error_code ());

    //  Stopped right after the length field.
    TEST_ASSERT_EQUAL_UINT (3, processed);

    //  A length at the limit is fine.
    buf[2] = 10;
    buf.erase (buf.begin () + 3);
    bchain::chain_decoder_t ok (options);
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (3, ok.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_UINT (10, ok.chain ()->part (0).size ());
}

void test_huge_declared_length_waits_for_data ()
{
    bytes_t buf = to_bytes ("big");
    buf.push_back (0x88);
    for (int i = 0; i < 8; ++i)
        buf.push_back (0xff);
    buf.insert (buf.end (), 100, 'b');

    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (1, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_FALSE (decoder.idle ());

    TEST_ASSERT_EQUAL_INT (-1, decoder.finish ());
    TEST_ASSERT_EQUAL_INT (EBCHAINEOS, errno);

    //  With a part limit the same header fails at once.
    bchain::options_t options;
    options.max_part_length = 1 << 20;
    bchain::chain_decoder_t limited (options);
    events.clear ();
    TEST_ASSERT_EQUAL_INT (-1, limited.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_INT (EBCHAINPARTLEN, errno);
}

void test_prefix_too_long ()
{
    bchain::options_t options;
    options.max_prefix_length = 3;

    const bytes_t fits = to_bytes ("abc\xff");
    bchain::chain_decoder_t ok (options);
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (2, ok.feed (&fits[0], fits.size (), events));

    const bytes_t too_long = to_bytes ("abcd\xff");
    bchain::chain_decoder_t decoder (options);
    events.clear ();
    TEST_ASSERT_EQUAL_INT (
      -1, decoder.feed (&too_long[0], too_long.size (), events));
    TEST_ASSERT_EQUAL_INT (EBCHAINPREFIXLEN, errno);
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_prefix_too_long,
                             decoder.error_code ());
}

void test_default_prefix_bound ()
{
    bytes_t buf (BCHAIN_DEFAULT_MAX_PREFIX_LENGTH + 1, 'p');

    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (-1, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_INT (EBCHAINPREFIXLEN, errno);
}

void test_part_count_exceeded ()
{
    bchain::options_t options;
    options.max_part_count = 2;

    bytes_t buf;
    append_chain (buf, make_chain ("c", std::vector<std::string> (3, "x")));

    bchain::chain_decoder_t decoder (options);
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (-1, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_INT (EBCHAINPARTCOUNT, errno);
    TEST_ASSERT_EQUAL_STRING ("prefix c\n"
                              "part 0 (1):78\n"
                              "part 1 (1):78\n"
                              "error 156384967\n",
                              describe (events).c_str ());
}

void test_chain_size_exceeded ()
{
    bchain::options_t options;
    options.max_chain_size = 5;

    bytes_t buf;
    append_chain (buf, make_chain ("abc", std::vector<std::string> (1, "xy")));
    bchain::chain_decoder_t ok (options);
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (3, ok.feed (&buf[0], buf.size (), events));

    buf.clear ();
    append_chain (buf, make_chain ("abc", std::vector<std::string> (1, "xyz")));
    bchain::chain_decoder_t decoder (options);
    events.clear ();
    TEST_ASSERT_EQUAL_INT (-1, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_INT (EBCHAINSIZE, errno);
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_chain_too_large,
                             decoder.error_code ());

    //  Each chain is measured on its own.
    buf.clear ();
    append_chain (buf, make_chain ("abc", std::vector<std::string> (1, "xy")));
    append_chain (buf, make_chain ("abc", std::vector<std::string> (1, "xy")));
    bchain::chain_decoder_t repeated (options);
    events.clear ();
    TEST_ASSERT_EQUAL_INT (6, repeated.feed (&buf[0], buf.size (), events));
}

void test_finish ()
{
    bchain::chain_decoder_t decoder;
    TEST_ASSERT_EQUAL_INT (0, decoder.finish ());
    TEST_ASSERT_TRUE (decoder.idle ());

    const bytes_t buf = to_bytes ("ab");
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_INT (-1, decoder.finish ());
    TEST_ASSERT_EQUAL_INT (EBCHAINEOS, errno);

    //  finish () does not break the stream.
    const unsigned char eoc = 0xff;
    TEST_ASSERT_EQUAL_INT (2, decoder.feed (&eoc, 1, events));
    TEST_ASSERT_EQUAL_INT (0, decoder.finish ());
    TEST_ASSERT_EQUAL_STRING ("ab", decoder.chain ()->prefix ().c_str ());
}

void test_zero_length_feed ()
{
    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (NULL, 0, events));
    TEST_ASSERT_TRUE (events.empty ());
    TEST_ASSERT_TRUE (decoder.idle ());
    TEST_ASSERT_TRUE (!decoder.chain ());

    TEST_ASSERT_EQUAL_INT (-1, decoder.feed (NULL, 1, events));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_oversized_feed ()
{
    bchain::chain_decoder_t decoder;
    bchain::chain_events_t events;
    const unsigned char eoc = 0xff;

    TEST_ASSERT_EQUAL_INT (
      -1, decoder.feed (&eoc, BCHAIN_MAX_FEED_SIZE + 1, events));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_TRUE (events.empty ());
    TEST_ASSERT_TRUE (decoder.idle ());

    TEST_ASSERT_EQUAL_INT (2, decoder.feed (&eoc, 1, events));
}

void test_setopt_only_between_chains ()
{
    bchain::chain_decoder_t decoder;
    const int64_t limit = 1;

    const bytes_t buf = to_bytes ("ab");
    bchain::chain_events_t events;
    TEST_ASSERT_EQUAL_INT (0, decoder.feed (&buf[0], buf.size (), events));
    TEST_ASSERT_EQUAL_INT (
      -1, decoder.setopt (BCHAIN_MAX_PART_COUNT, &limit, sizeof (limit)));
    TEST_ASSERT_EQUAL_INT (EBUSY, errno);
    TEST_ASSERT_EQUAL_INT (-1, decoder.set_options (bchain::options_t ()));
    TEST_ASSERT_EQUAL_INT (EBUSY, errno);

    const unsigned char eoc = 0xff;
    TEST_ASSERT_EQUAL_INT (2, decoder.feed (&eoc, 1, events));
    TEST_ASSERT_EQUAL_INT (
      0, decoder.setopt (BCHAIN_MAX_PART_COUNT, &limit, sizeof (limit)));

    int64_t value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_EQUAL_INT (
      0, decoder.getopt (BCHAIN_MAX_PART_COUNT, &value, &size));
    TEST_ASSERT_TRUE (value == 1);
    TEST_ASSERT_TRUE (decoder.options ().max_part_count == 1);
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_decode_empty_chain);
    RUN_TEST (test_decode_prefix_only);
    RUN_TEST (test_decode_parts);
    RUN_TEST (test_decode_returns_one_per_chain);
    RUN_TEST (test_chunk_boundary_invariance);
    RUN_TEST (test_split_inside_length_field);
    RUN_TEST (test_small_growth_quantum);
    RUN_TEST (test_pipelining);
    RUN_TEST (test_non_minimal_length);
    RUN_TEST (test_invalid_marker_is_terminal);
    RUN_TEST (test_invalid_marker_after_prefix);
    RUN_TEST (test_part_too_large_before_data);
    RUN_TEST (test_huge_declared_length_waits_for_data);
    RUN_TEST (test_prefix_too_long);
    RUN_TEST (test_default_prefix_bound);
    RUN_TEST (test_part_count_exceeded);
    RUN_TEST (test_chain_size_exceeded);
    RUN_TEST (test_finish);
    RUN_TEST (test_zero_length_feed);
    RUN_TEST (test_oversized_feed);
    RUN_TEST (test_setopt_only_between_chains);
    return UNITY_END ();
}
