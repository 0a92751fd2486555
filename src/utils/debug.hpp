/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_DEBUG_HPP_INCLUDED__
#define __BCHAIN_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Trace macros for the codec and API layers.
//  Enable with -DBCHAIN_DEBUG=1 during compilation
//
//  Usage:
//    BCHAIN_DBG_DECODER ("length ready: %zu bytes", len);
//    BCHAIN_DBG_ENCODER ("chain rejected");
//    BCHAIN_DBG_API ("bad handle %p", handle);

#ifdef BCHAIN_DEBUG

#define BCHAIN_DBG(category, fmt, ...)                                         \
    do {                                                                       \
        fprintf (stderr, "[BCHAIN:" category "] " fmt "\n", ##__VA_ARGS__);    \
    } while (0)

#define BCHAIN_DBG_THIS(category, fmt, ...)                                    \
    do {                                                                       \
        fprintf (stderr, "[BCHAIN:" category ":%p] " fmt "\n",                 \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define BCHAIN_DBG(category, fmt, ...) ((void) 0)
#define BCHAIN_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define BCHAIN_DBG_DECODER(fmt, ...)                                           \
    BCHAIN_DBG_THIS ("DECODER", fmt, ##__VA_ARGS__)
#define BCHAIN_DBG_ENCODER(fmt, ...) BCHAIN_DBG ("ENCODER", fmt, ##__VA_ARGS__)
#define BCHAIN_DBG_API(fmt, ...) BCHAIN_DBG ("API", fmt, ##__VA_ARGS__)

#endif
