/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/chain.hpp"

#include <unity.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static bchain::chain_t::part_t make_part (const std::string &s_)
{
    return bchain::chain_t::part_t (s_.begin (), s_.end ());
}

void test_init_ascii_prefix ()
{
    bchain::chain_t::parts_t parts;
    parts.push_back (make_part ("ab"));
    parts.push_back (make_part (""));

    bchain::chain_t chain;
    TEST_ASSERT_EQUAL_INT (0, chain.init ("cmd", parts));
    TEST_ASSERT_EQUAL_STRING ("cmd", chain.prefix ().c_str ());
    TEST_ASSERT_EQUAL_UINT (2, chain.part_count ());
    TEST_ASSERT_EQUAL_UINT (2, chain.part (0).size ());
    TEST_ASSERT_EQUAL_UINT (0, chain.part (1).size ());
    TEST_ASSERT_EQUAL_UINT64 (5, chain.payload_size ());
}

void test_init_empty ()
{
    bchain::chain_t chain;
    TEST_ASSERT_EQUAL_INT (0, chain.init (NULL, 0, bchain::chain_t::parts_t ()));
    TEST_ASSERT_TRUE (chain.prefix ().empty ());
    TEST_ASSERT_EQUAL_UINT (0, chain.part_count ());
    TEST_ASSERT_EQUAL_UINT64 (0, chain.payload_size ());
}

void test_init_rejects_high_prefix_byte ()
{
    bchain::chain_t chain;
    const std::string prefix ("ok\x80");
    TEST_ASSERT_EQUAL_INT (-1, chain.init (prefix, bchain::chain_t::parts_t ()));
    TEST_ASSERT_EQUAL_INT (EBCHAINPREFIX, errno);
    TEST_ASSERT_TRUE (chain.prefix ().empty ());

    //  Every byte up to 0x7f is allowed, control characters included.
    std::string all;
    for (int c = 0; c <= 0x7f; ++c)
        all += static_cast<char> (c);
    TEST_ASSERT_EQUAL_INT (0, chain.init (all, bchain::chain_t::parts_t ()));
    TEST_ASSERT_EQUAL_UINT (0x80, chain.prefix ().size ());
}

void test_parts_are_binary_safe ()
{
    bchain::chain_t::part_t part;
    part.push_back (0x00);
    part.push_back (0xff);
    part.push_back (0x80);
    bchain::chain_t::parts_t parts (1, part);

    bchain::chain_t chain;
    TEST_ASSERT_EQUAL_INT (0, chain.init ("", parts));
    TEST_ASSERT_EQUAL_UINT8 (0xff, chain.part (0)[1]);
}

void test_equality ()
{
    bchain::chain_t::parts_t parts;
    parts.push_back (make_part ("one"));
    parts.push_back (make_part ("two"));
    bchain::chain_t::parts_t reversed;
    reversed.push_back (make_part ("two"));
    reversed.push_back (make_part ("one"));

    bchain::chain_t a, b, c, d;
    TEST_ASSERT_EQUAL_INT (0, a.init ("x", parts));
    TEST_ASSERT_EQUAL_INT (0, b.init ("x", parts));
    TEST_ASSERT_EQUAL_INT (0, c.init ("x", reversed));
    TEST_ASSERT_EQUAL_INT (0, d.init ("y", parts));

    TEST_ASSERT_TRUE (a == b);
    TEST_ASSERT_TRUE (a != c);
    TEST_ASSERT_TRUE (a != d);
}

void test_summary ()
{
    bchain::chain_t::parts_t parts;
    parts.push_back (make_part ("ab"));
    parts.push_back (make_part (""));
    bchain::chain_t chain;
    TEST_ASSERT_EQUAL_INT (0, chain.init ("cmd", parts));
    TEST_ASSERT_EQUAL_STRING ("chain<\"cmd\", [\"ab\", \"\"]>",
                              chain.summary ().c_str ());

    bchain::chain_t empty;
    TEST_ASSERT_EQUAL_STRING ("chain<\"\", []>", empty.summary ().c_str ());
}

void test_summary_escapes ()
{
    bchain::chain_t::part_t part;
    part.push_back (0x00);
    part.push_back (0xff);
    bchain::chain_t chain;
    TEST_ASSERT_EQUAL_INT (
      0, chain.init ("a\"b\\", bchain::chain_t::parts_t (1, part)));
    TEST_ASSERT_EQUAL_STRING ("chain<\"a\\\"b\\\\\", [\"\\x00\\xff\"]>",
                              chain.summary ().c_str ());
}

void test_summary_truncates ()
{
    const std::string prefix (150, 'a');
    bchain::chain_t::parts_t parts (12, make_part ("p"));
    parts[0] = make_part (std::string (20, 'x'));

    bchain::chain_t chain;
    TEST_ASSERT_EQUAL_INT (0, chain.init (prefix, parts));

    std::string expected = "chain<\"" + std::string (100, 'a') + "...\", [\""
                           + std::string (10, 'x') + "...\"";
    for (int i = 1; i < 10; ++i)
        expected += ", \"p\"";
    expected += ", \".....\"]>";
    TEST_ASSERT_EQUAL_STRING (expected.c_str (), chain.summary ().c_str ());
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_init_ascii_prefix);
    RUN_TEST (test_init_empty);
    RUN_TEST (test_init_rejects_high_prefix_byte);
    RUN_TEST (test_parts_are_binary_safe);
    RUN_TEST (test_equality);
    RUN_TEST (test_summary);
    RUN_TEST (test_summary_escapes);
    RUN_TEST (test_summary_truncates);
    return UNITY_END ();
}
