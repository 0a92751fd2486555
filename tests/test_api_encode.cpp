/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <string.h>

void setUp ()
{
}

void tearDown ()
{
}

static bchain_part_t make_part (const char *data_, size_t size_)
{
    bchain_part_t part;
    part.data = data_;
    part.size = size_;
    return part;
}

void test_encode_known_bytes ()
{
    std::vector<std::string> parts;
    parts.push_back ("ab");
    parts.push_back ("");
    const bytes_t out = encode_chain ("cmd", parts);

    const unsigned char expected[] = {'c', 'm', 'd', 0x81, 0x02,
                                      'a', 'b', 0x80, 0xff};
    TEST_ASSERT_EQUAL_UINT (sizeof expected, out.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, &out[0], sizeof expected);
}

void test_encode_empty_chain ()
{
    size_t size = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      ENOBUFS, bchain_encode (NULL, 0, NULL, 0, NULL, NULL, &size));
    TEST_ASSERT_EQUAL_UINT (1, size);

    unsigned char buf[4] = {0, 0, 0, 0};
    size = sizeof buf;
    TEST_ASSERT_SUCCESS_ERRNO (
      bchain_encode (NULL, 0, NULL, 0, NULL, buf, &size));
    TEST_ASSERT_EQUAL_UINT (1, size);
    TEST_ASSERT_EQUAL_HEX8 (0xff, buf[0]);
}

void test_encode_buffer_too_small ()
{
    const bchain_part_t part = make_part ("hello", 5);
    unsigned char buf[8];
    memset (buf, 0xaa, sizeof buf);

    //  "x" + 0x81 0x05 "hello" + eoc needs 9 bytes.
    size_t size = sizeof buf;
    TEST_ASSERT_FAILURE_ERRNO (
      ENOBUFS, bchain_encode ("x", 1, &part, 1, NULL, buf, &size));
    TEST_ASSERT_EQUAL_UINT (9, size);
    for (size_t i = 0; i < sizeof buf; ++i)
        TEST_ASSERT_EQUAL_HEX8 (0xaa, buf[i]);
}

void test_encode_rejects_high_prefix_byte ()
{
    size_t size = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINPREFIX, bchain_encode ("a\x80", 2, NULL, 0, NULL, NULL, &size));
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINPREFIX, bchain_encode ("\xff", 1, NULL, 0, NULL, NULL, &size));
}

void test_encode_limits ()
{
    const bchain_part_t parts[] = {make_part ("one", 3), make_part ("two", 3)};

    bchain_limits_t limits;
    bchain_limits_init (&limits);
    limits.max_part_count = 1;
    size_t size = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINPARTCOUNT, bchain_encode ("p", 1, parts, 2, &limits, NULL, &size));

    bchain_limits_init (&limits);
    limits.max_part_length = 2;
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINPARTLEN, bchain_encode ("p", 1, parts, 2, &limits, NULL, &size));

    bchain_limits_init (&limits);
    limits.max_prefix_length = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINPREFIXLEN,
      bchain_encode ("p", 1, parts, 2, &limits, NULL, &size));

    bchain_limits_init (&limits);
    limits.max_chain_size = 6;
    TEST_ASSERT_FAILURE_ERRNO (
      EBCHAINSIZE, bchain_encode ("p", 1, parts, 2, &limits, NULL, &size));

    limits.max_chain_size = 7;
    std::vector<std::string> strings;
    strings.push_back ("one");
    strings.push_back ("two");
    TEST_ASSERT_EQUAL_UINT (1 + 5 + 5 + 1,
                            encode_chain ("p", strings, &limits).size ());
}

void test_encode_invalid_arguments ()
{
    const bchain_part_t part = make_part ("x", 1);
    unsigned char buf[16];

    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_encode ("a", 1, &part, 1, NULL, buf, NULL));
    size_t size = sizeof buf;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_encode (NULL, 3, &part, 1, NULL, buf, &size));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_encode ("a", 1, NULL, 1, NULL, buf, &size));

    const bchain_part_t missing = make_part (NULL, 4);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_encode ("a", 1, &missing, 1, NULL, buf, &size));

    //  A NULL part of size zero is just an empty part.
    const bchain_part_t empty = make_part (NULL, 0);
    size = sizeof buf;
    TEST_ASSERT_SUCCESS_ERRNO (
      bchain_encode ("a", 1, &empty, 1, NULL, buf, &size));
    TEST_ASSERT_EQUAL_UINT (3, size);
    TEST_ASSERT_EQUAL_HEX8 (0x80, buf[1]);

    bchain_limits_t limits;
    bchain_limits_init (&limits);
    limits.max_prefix_length = -1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, bchain_encode ("a", 1, &part, 1, &limits, buf, &size));
}

void test_limits_init ()
{
    bchain_limits_t limits;
    memset (&limits, 0, sizeof limits);
    bchain_limits_init (&limits);
    TEST_ASSERT_TRUE (limits.max_prefix_length
                      == BCHAIN_DEFAULT_MAX_PREFIX_LENGTH);
    TEST_ASSERT_TRUE (limits.max_part_length == -1);
    TEST_ASSERT_TRUE (limits.max_part_count == -1);
    TEST_ASSERT_TRUE (limits.max_chain_size == -1);
}

void test_strerror ()
{
    const int codes[] = {EBCHAINPREFIX,    EBCHAINMARKER,  EBCHAINPREFIXLEN,
                         EBCHAINPARTLEN,   EBCHAINPARTCOUNT, EBCHAINSIZE,
                         EBCHAINEOS};
    for (size_t i = 0; i < sizeof codes / sizeof codes[0]; ++i) {
        const char *text = bchain_strerror (codes[i]);
        TEST_ASSERT_NOT_NULL (text);
        TEST_ASSERT_TRUE (strlen (text) > 0);
        for (size_t j = 0; j < i; ++j)
            TEST_ASSERT_TRUE (strcmp (text, bchain_strerror (codes[j])) != 0);
    }
    TEST_ASSERT_EQUAL_STRING ("Too many parts in chain",
                              bchain_strerror (EBCHAINPARTCOUNT));
}

void test_version ()
{
    int major = -1, minor = -1, patch = -1;
    bchain_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (BCHAIN_VERSION_MAJOR, major);
    TEST_ASSERT_EQUAL_INT (BCHAIN_VERSION_MINOR, minor);
    TEST_ASSERT_EQUAL_INT (BCHAIN_VERSION_PATCH, patch);
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_encode_known_bytes);
    RUN_TEST (test_encode_empty_chain);
    RUN_TEST (test_encode_buffer_too_small);
    RUN_TEST (test_encode_rejects_high_prefix_byte);
    RUN_TEST (test_encode_limits);
    RUN_TEST (test_encode_invalid_arguments);
    RUN_TEST (test_limits_init);
    RUN_TEST (test_strerror);
    RUN_TEST (test_version);
    return UNITY_END ();
}
