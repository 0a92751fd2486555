/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <stdio.h>
#include <string.h>

static void *decoder;

void setUp ()
{
    decoder = bchain_decoder_new (NULL);
    TEST_ASSERT_NOT_NULL (decoder);
}

void tearDown ()
{
    if (decoder)
        TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_close (decoder));
    decoder = NULL;
}

static bytes_t sample_stream ()
{
    std::vector<std::string> parts;
    parts.push_back ("ab");
    parts.push_back ("");
    parts.push_back (std::string (300, '\x7f'));

    bytes_t buf = encode_chain ("first", parts);
    const bytes_t empty = encode_chain ("", std::vector<std::string> ());
    buf.insert (buf.end (), empty.begin (), empty.end ());
    const bytes_t last =
      encode_chain ("last", std::vector<std::string> (1, "\x01\xff"));
    buf.insert (buf.end (), last.begin (), last.end ());
    return buf;
}

void test_feed_events ()
{
    std::vector<std::string> parts;
    parts.push_back ("ab");
    parts.push_back ("");
    const bytes_t buf = encode_chain ("cmd", parts);

    TEST_ASSERT_EQUAL_INT (
      4, bchain_decoder_feed (decoder, &buf[0], buf.size ()));
    TEST_ASSERT_EQUAL_INT (4, bchain_decoder_event_count (decoder));

    bchain_event_t event;
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_event (decoder, 0, &event));
    TEST_ASSERT_EQUAL_INT (BCHAIN_EVENT_PREFIX, event.type);
    TEST_ASSERT_EQUAL_UINT (3, event.size);
    TEST_ASSERT_EQUAL_MEMORY ("cmd", event.data, 3);

    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_event (decoder, 1, &event));
    TEST_ASSERT_EQUAL_INT (BCHAIN_EVENT_PART, event.type);
    TEST_ASSERT_EQUAL_UINT (0, event.index);
    TEST_ASSERT_EQUAL_UINT (2, event.size);
    TEST_ASSERT_EQUAL_MEMORY ("ab", event.data, 2);

    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_event (decoder, 2, &event));
    TEST_ASSERT_EQUAL_INT (BCHAIN_EVENT_PART, event.type);
    TEST_ASSERT_EQUAL_UINT (1, event.index);
    TEST_ASSERT_EQUAL_UINT (0, event.size);

    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_event (decoder, 3, &event));
    TEST_ASSERT_EQUAL_INT (BCHAIN_EVENT_CHAIN, event.type);
    TEST_ASSERT_EQUAL_UINT (2, event.index);
    TEST_ASSERT_EQUAL_MEMORY ("cmd", event.data, 3);

    const void *data = NULL;
    size_t size = 0;
    TEST_ASSERT_SUCCESS_ERRNO (
      bchain_decoder_event_part (decoder, 3, 0, &data, &size));
    TEST_ASSERT_EQUAL_UINT (2, size);
    TEST_ASSERT_EQUAL_MEMORY ("ab", data, 2);
    TEST_ASSERT_SUCCESS_ERRNO (
      bchain_decoder_event_part (decoder, 3, 1, &data, &size));
    TEST_ASSERT_EQUAL_UINT (0, size);

    TEST_ASSERT_EQUAL_INT (1, bchain_decoder_idle (decoder));
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_finish (decoder));
}

void test_events_replaced_by_next_feed ()
{
    const bytes_t buf = encode_chain ("x", std::vector<std::string> ());
    TEST_ASSERT_EQUAL_INT (
      2, bchain_decoder_feed (decoder, &buf[0], buf.size ()));

    const unsigned char prefix_byte = 'y';
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_feed (decoder, &prefix_byte, 1));
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_event_count (decoder));

    bchain_event_t event;
    TEST_ASSERT_FAILURE_ERRNO (ERANGE,
                               bchain_decoder_event (decoder, 0, &event));
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_idle (decoder));
}

void test_event_lookup_errors ()
{
    const bytes_t buf = encode_chain ("x", std::vector<std::string> (1, "p"));
    TEST_ASSERT_EQUAL_INT (
      3, bchain_decoder_feed (decoder, &buf[0], buf.size ()));

    bchain_event_t event;
    TEST_ASSERT_FAILURE_ERRNO (ERANGE,
                               bchain_decoder_event (decoder, 3, &event));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, bchain_decoder_event (decoder, 0, NULL));

    const void *data = NULL;
    size_t size = 0;

    //  Parts are only looked up through chain events.
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_decoder_event_part (decoder, 1, 0, &data, &size));
    TEST_ASSERT_FAILURE_ERRNO (
      ERANGE, bchain_decoder_event_part (decoder, 2, 1, &data, &size));
    TEST_ASSERT_FAILURE_ERRNO (
      ERANGE, bchain_decoder_event_part (decoder, 9, 0, &data, &size));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_decoder_event_part (decoder, 2, 0, NULL, &size));
}

void test_bad_handle ()
{
    int dummy = 0;
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, bchain_decoder_feed (NULL, "a", 1));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, bchain_decoder_feed (&dummy, "a", 1));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, bchain_decoder_event_count (NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, bchain_decoder_finish (NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, bchain_decoder_idle (NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, bchain_decoder_close (NULL));

    bchain_event_t event;
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, bchain_decoder_event (NULL, 0, &event));
}

void test_new_with_invalid_limits ()
{
    bchain_limits_t limits;
    bchain_limits_init (&limits);
    limits.max_part_count = -3;
    errno = 0;
    TEST_ASSERT_NULL (bchain_decoder_new (&limits));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_chunk_invariance ()
{
    const bytes_t buf = sample_stream ();
    const std::string expected =
      feed_and_describe (decoder, buf, buf.size ());
    TEST_ASSERT_EQUAL_STRING ("prefix first\n"
                              "part 0:6162\n"
                              "part 1:\n",
                              expected.substr (0, 33).c_str ());

    const size_t chunk_sizes[] = {1, 2, 5, 13, 100};
    for (size_t i = 0; i < sizeof chunk_sizes / sizeof chunk_sizes[0]; ++i) {
        void *other = bchain_decoder_new (NULL);
        TEST_ASSERT_NOT_NULL (other);
        TEST_ASSERT_EQUAL_STRING (
          expected.c_str (),
          feed_and_describe (other, buf, chunk_sizes[i]).c_str ());
        TEST_ASSERT_EQUAL_INT (1, bchain_decoder_idle (other));
        TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_close (other));
    }
}

void test_protocol_error_is_sticky ()
{
    bytes_t buf = encode_chain ("ok", std::vector<std::string> (1, "a"));
    buf.push_back (0xa0);

    const std::string described = feed_and_describe (decoder, buf, buf.size ());
    char expected[128];
    snprintf (expected, sizeof expected,
              "prefix ok\npart 0:61\nchain 1 parts, prefix ok\nerror %d\n",
              EBCHAINMARKER);
    TEST_ASSERT_EQUAL_STRING (expected, described.c_str ());

    //  The error event is readable after the failed feed.
    bchain_event_t event;
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_event (decoder, 3, &event));
    TEST_ASSERT_EQUAL_INT (BCHAIN_EVENT_ERROR, event.type);
    TEST_ASSERT_EQUAL_INT (EBCHAINMARKER, event.error);

    const unsigned char eoc = 0xff;
    TEST_ASSERT_FAILURE_ERRNO (EBCHAINMARKER,
                               bchain_decoder_feed (decoder, &eoc, 1));
    TEST_ASSERT_EQUAL_INT (1, bchain_decoder_event_count (decoder));
    TEST_ASSERT_FAILURE_ERRNO (EBCHAINMARKER, bchain_decoder_finish (decoder));
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_idle (decoder));
}

void test_finish_inside_chain ()
{
    bytes_t buf = to_bytes ("pre");
    append_wire_part (buf, 1, "partial");
    buf.resize (buf.size () - 2);

    TEST_ASSERT_EQUAL_INT (
      1, bchain_decoder_feed (decoder, &buf[0], buf.size ()));
    TEST_ASSERT_FAILURE_ERRNO (EBCHAINEOS, bchain_decoder_finish (decoder));

    const unsigned char rest[] = {'a', 'l', 0xff};
    TEST_ASSERT_EQUAL_INT (2, bchain_decoder_feed (decoder, rest, sizeof rest));
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_finish (decoder));
}

void test_zero_length_feed ()
{
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_feed (decoder, NULL, 0));
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_event_count (decoder));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, bchain_decoder_feed (decoder, NULL, 4));
}

void test_oversized_feed_rejected ()
{
    //  The size is refused before any byte is read.
    const unsigned char eoc = 0xff;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_decoder_feed (decoder, &eoc, BCHAIN_MAX_FEED_SIZE + 1));
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_event_count (decoder));
    TEST_ASSERT_EQUAL_INT (1, bchain_decoder_idle (decoder));

    TEST_ASSERT_EQUAL_INT (2, bchain_decoder_feed (decoder, &eoc, 1));
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_finish (decoder));
}

void test_setopt_getopt ()
{
    int64_t value = 2;
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_setopt (
      decoder, BCHAIN_MAX_PART_COUNT, &value, sizeof (value)));

    value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (
      bchain_decoder_getopt (decoder, BCHAIN_MAX_PART_COUNT, &value, &size));
    TEST_ASSERT_TRUE (value == 2);
    TEST_ASSERT_EQUAL_UINT (sizeof (value), size);

    size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (
      bchain_decoder_getopt (decoder, BCHAIN_MAX_PREFIX_LENGTH, &value, &size));
    TEST_ASSERT_TRUE (value == BCHAIN_DEFAULT_MAX_PREFIX_LENGTH);

    value = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_decoder_setopt (decoder, 77, &value, sizeof (value)));

    //  The new limit applies to the next chain.
    const bytes_t buf = encode_chain ("", std::vector<std::string> (3, "z"));
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINPARTCOUNT, bchain_decoder_feed (decoder, &buf[0], buf.size ()));
}

void test_setopt_busy_inside_chain ()
{
    const unsigned char prefix_byte = 'q';
    TEST_ASSERT_EQUAL_INT (0, bchain_decoder_feed (decoder, &prefix_byte, 1));

    int64_t value = 10;
    TEST_ASSERT_FAILURE_ERRNO (
      EBUSY, bchain_decoder_setopt (decoder, BCHAIN_MAX_PART_LENGTH, &value,
                                    sizeof (value)));

    const unsigned char eoc = 0xff;
    TEST_ASSERT_EQUAL_INT (2, bchain_decoder_feed (decoder, &eoc, 1));
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_setopt (
      decoder, BCHAIN_MAX_PART_LENGTH, &value, sizeof (value)));
}

void test_limits_from_new ()
{
    bchain_limits_t limits;
    bchain_limits_init (&limits);
    limits.max_part_length = 4;
    void *limited = bchain_decoder_new (&limits);
    TEST_ASSERT_NOT_NULL (limited);

    const unsigned char header[] = {'h', 0x81, 0x05};
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINPARTLEN, bchain_decoder_feed (limited, header, sizeof header));

    bchain_event_t event;
    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_event (limited, 1, &event));
    TEST_ASSERT_EQUAL_INT (BCHAIN_EVENT_ERROR, event.type);
    TEST_ASSERT_EQUAL_INT (EBCHAINPARTLEN, event.error);

    TEST_ASSERT_SUCCESS_ERRNO (bchain_decoder_close (limited));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_feed_events);
    RUN_TEST (test_events_replaced_by_next_feed);
    RUN_TEST (test_event_lookup_errors);
    RUN_TEST (test_bad_handle);
    RUN_TEST (test_new_with_invalid_limits);
    RUN_TEST (test_chunk_invariance);
    RUN_TEST (test_protocol_error_is_sticky);
    RUN_TEST (test_finish_inside_chain);
    RUN_TEST (test_zero_length_feed);
    RUN_TEST (test_oversized_feed_rejected);
    RUN_TEST (test_setopt_getopt);
    RUN_TEST (test_setopt_busy_inside_chain);
    RUN_TEST (test_limits_from_new);
    return UNITY_END ();
}
