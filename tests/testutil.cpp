/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

void setup_test_environment (int timeout_seconds_)
{
    //  abort test after timeout_seconds_ seconds
    alarm (timeout_seconds_);

    //  Unity prints to stdout; keep it in order with stderr traces.
    setvbuf (stdout, NULL, _IONBF, 0);
}
