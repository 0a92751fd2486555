/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_UNITY_HPP_INCLUDED__
#define __TESTUTIL_UNITY_HPP_INCLUDED__

#include "../include/bchain.h"

#include "testutil.hpp"

#include <unity.h>

#include <string>

int test_assert_success_message_errno_helper (int rc_,
                                              const char *msg_,
                                              const char *expr_,
                                              int line_);

#define TEST_ASSERT_SUCCESS_MESSAGE_ERRNO(expr, msg)                          \
    test_assert_success_message_errno_helper (expr, msg, #expr, __LINE__)

#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_message_errno_helper (expr, NULL, #expr, __LINE__)

#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    {                                                                          \
        int _rc = (expr);                                                      \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    }

//  Encodes a chain through the C API, failing the test on error.
bytes_t encode_chain (const std::string &prefix_,
                      const std::vector<std::string> &parts_,
                      const bchain_limits_t *limits_ = NULL);

//  Feeds data_ to decoder_ in chunks of chunk_size_ bytes and renders
//  every event produced as text, one event per line. Feeding stops at the
//  first failed chunk.
std::string feed_and_describe (void *decoder_,
                               const bytes_t &data_,
                               size_t chunk_size_);

#endif
