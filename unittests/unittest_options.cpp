/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/chain.hpp"
#include "core/options.hpp"
#include "protocol/chain_protocol.hpp"

#include <unity.h>
#include <string>

void setUp ()
{
}

void tearDown ()
{
}

static int set_int64 (bchain::options_t &options_, int option_, int64_t value_)
{
    return options_.setopt (option_, &value_, sizeof (value_));
}

static int64_t get_int64 (const bchain::options_t &options_, int option_)
{
    int64_t value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_EQUAL_INT (0, options_.getopt (option_, &value, &size));
    return value;
}

void test_defaults ()
{
    bchain::options_t options;
    TEST_ASSERT_TRUE (options.max_prefix_length
                      == BCHAIN_DEFAULT_MAX_PREFIX_LENGTH);
    TEST_ASSERT_TRUE (options.max_part_length == -1);
    TEST_ASSERT_TRUE (options.max_part_count == -1);
    TEST_ASSERT_TRUE (options.max_chain_size == -1);

    bchain_limits_t limits;
    options.to_limits (limits);
    TEST_ASSERT_TRUE (limits.max_prefix_length
                      == BCHAIN_DEFAULT_MAX_PREFIX_LENGTH);
    TEST_ASSERT_TRUE (limits.max_chain_size == -1);
}

void test_setopt_getopt ()
{
    bchain::options_t options;
    TEST_ASSERT_EQUAL_INT (0, set_int64 (options, BCHAIN_MAX_PREFIX_LENGTH, 8));
    TEST_ASSERT_EQUAL_INT (0, set_int64 (options, BCHAIN_MAX_PART_LENGTH, 100));
    TEST_ASSERT_EQUAL_INT (0, set_int64 (options, BCHAIN_MAX_PART_COUNT, 3));
    TEST_ASSERT_EQUAL_INT (0, set_int64 (options, BCHAIN_MAX_CHAIN_SIZE, 0));

    TEST_ASSERT_TRUE (get_int64 (options, BCHAIN_MAX_PREFIX_LENGTH) == 8);
    TEST_ASSERT_TRUE (get_int64 (options, BCHAIN_MAX_PART_LENGTH) == 100);
    TEST_ASSERT_TRUE (get_int64 (options, BCHAIN_MAX_PART_COUNT) == 3);
    TEST_ASSERT_TRUE (get_int64 (options, BCHAIN_MAX_CHAIN_SIZE) == 0);

    //  Back to unlimited.
    TEST_ASSERT_EQUAL_INT (0, set_int64 (options, BCHAIN_MAX_PART_LENGTH, -1));
    TEST_ASSERT_TRUE (get_int64 (options, BCHAIN_MAX_PART_LENGTH) == -1);
}

void test_setopt_invalid ()
{
    bchain::options_t options;

    //  The prefix bound can't be lifted.
    TEST_ASSERT_EQUAL_INT (-1,
                           set_int64 (options, BCHAIN_MAX_PREFIX_LENGTH, -1));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_EQUAL_INT (-1, set_int64 (options, BCHAIN_MAX_PART_LENGTH, -2));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_EQUAL_INT (-1, set_int64 (options, 99, 1));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    const int small = 5;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (BCHAIN_MAX_PART_COUNT, &small, sizeof (small)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_EQUAL_INT (
      -1, options.setopt (BCHAIN_MAX_PART_COUNT, NULL, sizeof (int64_t)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_TRUE (options.max_prefix_length
                      == BCHAIN_DEFAULT_MAX_PREFIX_LENGTH);
    TEST_ASSERT_TRUE (options.max_part_length == -1);
    TEST_ASSERT_TRUE (options.max_part_count == -1);
}

void test_getopt_invalid ()
{
    bchain::options_t options;
    int value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_EQUAL_INT (
      -1, options.getopt (BCHAIN_MAX_PART_LENGTH, &value, &size));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    int64_t value64 = 0;
    size = sizeof (value64);
    TEST_ASSERT_EQUAL_INT (-1, options.getopt (42, &value64, &size));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_init_from_limits ()
{
    bchain_limits_t limits;
    limits.max_prefix_length = 16;
    limits.max_part_length = 1024;
    limits.max_part_count = -1;
    limits.max_chain_size = 4096;

    bchain::options_t options;
    TEST_ASSERT_EQUAL_INT (0, options.init (limits));
    TEST_ASSERT_TRUE (options.max_prefix_length == 16);
    TEST_ASSERT_TRUE (options.max_part_length == 1024);
    TEST_ASSERT_TRUE (options.max_chain_size == 4096);

    bchain_limits_t bad = limits;
    bad.max_prefix_length = -1;
    TEST_ASSERT_EQUAL_INT (-1, options.init (bad));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    bad = limits;
    bad.max_part_count = -7;
    TEST_ASSERT_EQUAL_INT (-1, options.init (bad));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    //  A rejected structure leaves the previous limits in place.
    TEST_ASSERT_TRUE (options.max_prefix_length == 16);
    TEST_ASSERT_TRUE (options.max_part_count == -1);
}

void test_limit_predicates ()
{
    bchain::options_t options;
    TEST_ASSERT_FALSE (options.part_too_large (0xffffffffffffffffULL));
    TEST_ASSERT_FALSE (options.part_count_exceeded (1000000));
    TEST_ASSERT_FALSE (options.chain_too_large (0xffffffffffffffffULL));
    TEST_ASSERT_FALSE (
      options.prefix_too_long (BCHAIN_DEFAULT_MAX_PREFIX_LENGTH));
    TEST_ASSERT_TRUE (
      options.prefix_too_long (BCHAIN_DEFAULT_MAX_PREFIX_LENGTH + 1));

    options.max_part_length = 10;
    TEST_ASSERT_FALSE (options.part_too_large (10));
    TEST_ASSERT_TRUE (options.part_too_large (11));

    options.max_part_count = 0;
    TEST_ASSERT_FALSE (options.part_count_exceeded (0));
    TEST_ASSERT_TRUE (options.part_count_exceeded (1));
}

static bchain::chain_t make_chain (const std::string &prefix_,
                                   size_t parts_,
                                   size_t part_size_)
{
    bchain::chain_t chain;
    const int rc = chain.init (
      prefix_, bchain::chain_t::parts_t (
                 parts_, bchain::chain_t::part_t (part_size_, 0x42)));
    TEST_ASSERT_EQUAL_INT (0, rc);
    return chain;
}

void test_check_chain ()
{
    bchain::options_t options;
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_none,
                             options.check (make_chain ("abc", 3, 10)));

    options.max_prefix_length = 2;
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_prefix_too_long,
                             options.check (make_chain ("abc", 0, 0)));

    options = bchain::options_t ();
    options.max_part_count = 2;
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_part_count,
                             options.check (make_chain ("", 3, 0)));

    options = bchain::options_t ();
    options.max_part_length = 9;
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_part_too_large,
                             options.check (make_chain ("", 1, 10)));

    //  Prefix and parts count towards the chain size.
    options = bchain::options_t ();
    options.max_chain_size = 12;
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_none,
                             options.check (make_chain ("ab", 1, 10)));
    TEST_ASSERT_EQUAL_UINT8 (bchain::chain_error_chain_too_large,
                             options.check (make_chain ("abc", 1, 10)));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_setopt_getopt);
    RUN_TEST (test_setopt_invalid);
    RUN_TEST (test_getopt_invalid);
    RUN_TEST (test_init_from_limits);
    RUN_TEST (test_limit_predicates);
    RUN_TEST (test_check_chain);
    return UNITY_END ();
}
