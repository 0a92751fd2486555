/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_H_INCLUDED__
#define __BCHAIN_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define BCHAIN_VERSION_MAJOR 1
#define BCHAIN_VERSION_MINOR 0
#define BCHAIN_VERSION_PATCH 0

#define BCHAIN_MAKE_VERSION(major, minor, patch)                               \
    ((major) *10000 + (minor) *100 + (patch))
#define BCHAIN_VERSION                                                         \
    BCHAIN_MAKE_VERSION (BCHAIN_VERSION_MAJOR, BCHAIN_VERSION_MINOR,           \
                         BCHAIN_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined BCHAIN_NO_EXPORT
#define BCHAIN_EXPORT
#else
#if defined _WIN32
#if defined BCHAIN_STATIC
#define BCHAIN_EXPORT
#elif defined DLL_EXPORT
#define BCHAIN_EXPORT __declspec(dllexport)
#else
#define BCHAIN_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define BCHAIN_EXPORT __attribute__ ((visibility ("default")))
#else
#define BCHAIN_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  Binary chain errors.                                                      */
/******************************************************************************/

/*  A number random enough not to collide with different errno ranges on      */
/*  different OSes. The assumption is that error_t is at least 32-bit type.   */
#define BCHAIN_HAUSNUMERO 156384912

#ifndef ENOBUFS
#define ENOBUFS (BCHAIN_HAUSNUMERO + 1)
#endif
#ifndef EBUSY
#define EBUSY (BCHAIN_HAUSNUMERO + 2)
#endif

/*  Framing errors.                                                           */
#define EBCHAINPREFIX (BCHAIN_HAUSNUMERO + 51)
#define EBCHAINMARKER (BCHAIN_HAUSNUMERO + 52)
#define EBCHAINPREFIXLEN (BCHAIN_HAUSNUMERO + 53)
#define EBCHAINPARTLEN (BCHAIN_HAUSNUMERO + 54)
#define EBCHAINPARTCOUNT (BCHAIN_HAUSNUMERO + 55)
#define EBCHAINSIZE (BCHAIN_HAUSNUMERO + 56)
#define EBCHAINEOS (BCHAIN_HAUSNUMERO + 57)

/*  This function retrieves the errno as it is known to the library. The idea */
/*  behind it is that different runtime libraries may keep errno in a        */
/*  different place, so a caller linked against another CRT still sees the   */
/*  value set by libbchain.                                                   */
BCHAIN_EXPORT int bchain_errno (void);

/*  Resolves system errors and libbchain errors to human-readable string.    */
BCHAIN_EXPORT const char *bchain_strerror (int errnum_);

/*  Run-time API version detection                                            */
BCHAIN_EXPORT void bchain_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Limits.                                                                   */
/******************************************************************************/

/*  Option identifiers for bchain_decoder_setopt / bchain_decoder_getopt.    */
#define BCHAIN_MAX_PREFIX_LENGTH 1
#define BCHAIN_MAX_PART_LENGTH 2
#define BCHAIN_MAX_PART_COUNT 3
#define BCHAIN_MAX_CHAIN_SIZE 4

/*  Default prefix bound. The prefix bound is never unlimited.               */
#define BCHAIN_DEFAULT_MAX_PREFIX_LENGTH 65536

/*  Largest chunk one feed accepts. A chunk yields at most two events per    */
/*  byte plus an error event, so the event count of a feed fits in an int.   */
#define BCHAIN_MAX_FEED_SIZE ((size_t) 0x3fffffff)

/*  A limit of -1 means "no limit beyond what the wire format can carry".    */
typedef struct bchain_limits_t
{
    int64_t max_prefix_length;
    int64_t max_part_length;
    int64_t max_part_count;
    int64_t max_chain_size;
} bchain_limits_t;

BCHAIN_EXPORT void bchain_limits_init (bchain_limits_t *limits_);

/******************************************************************************/
/*  Encoding.                                                                 */
/******************************************************************************/

typedef struct bchain_part_t
{
    const void *data;
    size_t size;
} bchain_part_t;

/*  Serialises one chain into buf_. On entry *size_ holds the capacity of     */
/*  buf_, on success it holds the number of bytes written. If buf_ is NULL   */
/*  or too small, nothing is written, *size_ is set to the required length   */
/*  and the call fails with ENOBUFS. limits_ may be NULL.                    */
BCHAIN_EXPORT int bchain_encode (const char *prefix_,
                                 size_t prefix_size_,
                                 const bchain_part_t *parts_,
                                 size_t part_count_,
                                 const bchain_limits_t *limits_,
                                 void *buf_,
                                 size_t *size_);

/******************************************************************************/
/*  Stream decoding.                                                          */
/******************************************************************************/

#define BCHAIN_EVENT_PREFIX 1
#define BCHAIN_EVENT_PART 2
#define BCHAIN_EVENT_CHAIN 3
#define BCHAIN_EVENT_ERROR 4

/*  For BCHAIN_EVENT_PREFIX data/size hold the prefix. For                   */
/*  BCHAIN_EVENT_PART they hold the part and index is its position in the    */
/*  chain. For BCHAIN_EVENT_CHAIN they hold the prefix and index is the      */
/*  number of parts. For BCHAIN_EVENT_ERROR error holds the errno value.     */
/*  Data pointers stay valid until the next feed or close on the decoder.    */
typedef struct bchain_event_t
{
    int type;
    const void *data;
    size_t size;
    size_t index;
    int error;
} bchain_event_t;

/*  limits_ may be NULL, in which case the defaults are used.                */
BCHAIN_EXPORT void *bchain_decoder_new (const bchain_limits_t *limits_);
BCHAIN_EXPORT int bchain_decoder_close (void *decoder_);

/*  Pushes a chunk of any size into the decoder. Returns the number of       */
/*  events produced by this chunk, or -1 if the stream is broken; in that    */
/*  case the last event is a BCHAIN_EVENT_ERROR carrying the same errno.     */
/*  Chunks larger than BCHAIN_MAX_FEED_SIZE fail with EINVAL and leave the   */
/*  decoder untouched.                                                        */
BCHAIN_EXPORT int
bchain_decoder_feed (void *decoder_, const void *data_, size_t size_);

/*  Number of events held from the last feed, including the error event of   */
/*  a failed one.                                                             */
BCHAIN_EXPORT int bchain_decoder_event_count (void *decoder_);

BCHAIN_EXPORT int
bchain_decoder_event (void *decoder_, size_t index_, bchain_event_t *event_);

/*  Retrieves part part_ of the chain carried by BCHAIN_EVENT_CHAIN event    */
/*  number index_.                                                            */
BCHAIN_EXPORT int bchain_decoder_event_part (void *decoder_,
                                             size_t index_,
                                             size_t part_,
                                             const void **data_,
                                             size_t *size_);

/*  Reports the end of the byte stream. Fails with EBCHAINEOS if the stream  */
/*  stopped inside a chain.                                                   */
BCHAIN_EXPORT int bchain_decoder_finish (void *decoder_);

/*  Returns 1 if the decoder sits on a chain boundary, 0 if it is inside a   */
/*  chain or failed, -1 on a bad handle.                                      */
BCHAIN_EXPORT int bchain_decoder_idle (void *decoder_);

BCHAIN_EXPORT int bchain_decoder_setopt (void *decoder_,
                                         int option_,
                                         const void *optval_,
                                         size_t optvallen_);
BCHAIN_EXPORT int bchain_decoder_getopt (void *decoder_,
                                         int option_,
                                         void *optval_,
                                         size_t *optvallen_);

#undef BCHAIN_EXPORT

#ifdef __cplusplus
}
#endif

#endif
