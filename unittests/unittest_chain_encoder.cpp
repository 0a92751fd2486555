/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/chain.hpp"
#include "core/options.hpp"
#include "protocol/chain_encoder.hpp"
#include "protocol/chain_protocol.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
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

static bytes_t encode_ok (const bchain::chain_t &chain_)
{
    bytes_t out;
    TEST_ASSERT_EQUAL_INT (0,
                           bchain::encode (chain_, bchain::options_t (), out));
    return out;
}

void test_encode_empty_chain ()
{
    const bytes_t out = encode_ok (bchain::chain_t ());
    TEST_ASSERT_EQUAL_UINT (1, out.size ());
    TEST_ASSERT_EQUAL_HEX8 (0xff, out[0]);
}

void test_encode_prefix_only ()
{
    const bytes_t out = encode_ok (make_chain ("foo", std::vector<std::string> ()));
    const unsigned char expected[] = {'f', 'o', 'o', 0xff};
    TEST_ASSERT_EQUAL_UINT (sizeof expected, out.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, &out[0], sizeof expected);
}

void test_encode_empty_part ()
{
    const bytes_t out =
      encode_ok (make_chain ("", std::vector<std::string> (1)));
    const unsigned char expected[] = {0x80, 0xff};
    TEST_ASSERT_EQUAL_UINT (sizeof expected, out.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, &out[0], sizeof expected);
}

void test_encode_minimal_length_width ()
{
    const size_t lengths[] = {1, 255, 256, 65535, 65536};
    const size_t widths[] = {1, 1, 2, 2, 3};

    for (size_t i = 0; i < sizeof lengths / sizeof lengths[0]; ++i) {
        const std::string data (lengths[i], 'z');
        const bytes_t out =
          encode_ok (make_chain ("", std::vector<std::string> (1, data)));

        TEST_ASSERT_EQUAL_UINT (1 + widths[i] + lengths[i] + 1, out.size ());
        TEST_ASSERT_EQUAL_HEX8 (0x80 + widths[i], out[0]);
        TEST_ASSERT_EQUAL_UINT64 (lengths[i],
                                  bchain::get_uint_be (&out[1], widths[i]));
        TEST_ASSERT_EQUAL_HEX8 ('z', out[1 + widths[i]]);
        TEST_ASSERT_EQUAL_HEX8 (0xff, out.back ());
    }
}

void test_encode_part_of_256 ()
{
    std::string data;
    for (int i = 0; i < 256; ++i)
        data += static_cast<char> (i);
    const bytes_t out =
      encode_ok (make_chain ("", std::vector<std::string> (1, data)));

    TEST_ASSERT_EQUAL_UINT (260, out.size ());
    TEST_ASSERT_EQUAL_HEX8 (0x82, out[0]);
    TEST_ASSERT_EQUAL_HEX8 (0x01, out[1]);
    TEST_ASSERT_EQUAL_HEX8 (0x00, out[2]);
    TEST_ASSERT_EQUAL_MEMORY (data.data (), &out[3], 256);
    TEST_ASSERT_EQUAL_HEX8 (0xff, out[259]);
}

void test_encoded_size_matches ()
{
    std::vector<std::string> parts;
    parts.push_back ("");
    parts.push_back ("x");
    parts.push_back (std::string (300, 'y'));
    const bchain::chain_t chain = make_chain ("HEAD", parts);

    uint64_t size = 0;
    TEST_ASSERT_EQUAL_INT (
      0, bchain::encoded_size (chain, bchain::options_t (), size));
    //  prefix + {0x80} + {0x81 len x} + {0x82 len len 300} + eoc
    TEST_ASSERT_EQUAL_UINT64 (4 + 1 + 3 + 303 + 1, size);
    TEST_ASSERT_EQUAL_UINT64 (size, encode_ok (chain).size ());
}

void test_encode_fails_fast_on_limits ()
{
    std::vector<std::string> parts;
    parts.push_back ("abc");
    parts.push_back ("def");
    const bchain::chain_t chain = make_chain ("pre", parts);

    bytes_t out;
    out.push_back (1);
    out.push_back (2);

    bchain::options_t options;
    options.max_part_count = 1;
    TEST_ASSERT_EQUAL_INT (-1, bchain::encode (chain, options, out));
    TEST_ASSERT_EQUAL_INT (EBCHAINPARTCOUNT, errno);

    options = bchain::options_t ();
    options.max_prefix_length = 2;
    TEST_ASSERT_EQUAL_INT (-1, bchain::encode (chain, options, out));
    TEST_ASSERT_EQUAL_INT (EBCHAINPREFIXLEN, errno);

    options = bchain::options_t ();
    options.max_part_length = 2;
    TEST_ASSERT_EQUAL_INT (-1, bchain::encode (chain, options, out));
    TEST_ASSERT_EQUAL_INT (EBCHAINPARTLEN, errno);

    options = bchain::options_t ();
    options.max_chain_size = 8;
    TEST_ASSERT_EQUAL_INT (-1, bchain::encode (chain, options, out));
    TEST_ASSERT_EQUAL_INT (EBCHAINSIZE, errno);

    uint64_t size = 0;
    TEST_ASSERT_EQUAL_INT (-1, bchain::encoded_size (chain, options, size));
    TEST_ASSERT_EQUAL_INT (EBCHAINSIZE, errno);

    //  No partial output.
    TEST_ASSERT_EQUAL_UINT (2, out.size ());
    TEST_ASSERT_EQUAL_HEX8 (1, out[0]);
    TEST_ASSERT_EQUAL_HEX8 (2, out[1]);

    options.max_chain_size = 9;
    TEST_ASSERT_EQUAL_INT (0, bchain::encode (chain, options, out));
}

void test_streaming_batches ()
{
    const std::string big (20000, 'q');
    std::vector<std::string> parts;
    parts.push_back (big);
    parts.push_back ("");
    const bchain::chain_t chain = make_chain ("hdr", parts);
    const bytes_t expected = encode_ok (chain);

    bchain::chain_encoder_t encoder (64);
    TEST_ASSERT_FALSE (encoder.busy ());
    encoder.load_chain (&chain);
    TEST_ASSERT_TRUE (encoder.busy ());

    const unsigned char *part_begin = &chain.part (0)[0];
    const unsigned char *part_end = part_begin + chain.part (0).size ();
    bool zero_copy = false;

    bytes_t out;
    while (true) {
        unsigned char *data = NULL;
        const size_t n = encoder.encode (&data, 0);
        if (n == 0)
            break;
        TEST_ASSERT_TRUE (n <= 64 || (data >= part_begin && data < part_end));
        if (data >= part_begin && data < part_end)
            zero_copy = true;
        out.insert (out.end (), data, data + n);
    }

    TEST_ASSERT_FALSE (encoder.busy ());
    TEST_ASSERT_TRUE (zero_copy);
    TEST_ASSERT_TRUE (out == expected);
}

void test_streaming_into_caller_buffer ()
{
    std::vector<std::string> parts;
    parts.push_back ("0123456789");
    parts.push_back ("");
    parts.push_back ("abc");
    const bchain::chain_t chain = make_chain ("p", parts);
    const bytes_t expected = encode_ok (chain);

    //  Several chains back to back through one encoder, 3 bytes at a time.
    bchain::chain_encoder_t encoder (16);
    bytes_t out;
    for (int round = 0; round < 2; ++round) {
        encoder.load_chain (&chain);
        unsigned char buf[3];
        while (true) {
            unsigned char *data = buf;
            const size_t n = encoder.encode (&data, sizeof buf);
            if (n == 0)
                break;
            TEST_ASSERT_TRUE (data == buf);
            out.insert (out.end (), buf, buf + n);
        }
    }

    TEST_ASSERT_EQUAL_UINT (2 * expected.size (), out.size ());
    TEST_ASSERT_TRUE (bytes_t (out.begin (), out.begin () + expected.size ())
                      == expected);
    TEST_ASSERT_TRUE (bytes_t (out.begin () + expected.size (), out.end ())
                      == expected);
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_encode_empty_chain);
    RUN_TEST (test_encode_prefix_only);
    RUN_TEST (test_encode_empty_part);
    RUN_TEST (test_encode_minimal_length_width);
    RUN_TEST (test_encode_part_of_256);
    RUN_TEST (test_encoded_size_matches);
    RUN_TEST (test_encode_fails_fast_on_limits);
    RUN_TEST (test_streaming_batches);
    RUN_TEST (test_streaming_into_caller_buffer);
    return UNITY_END ();
}
