/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __BCHAIN_MACROS_HPP_INCLUDED__
#define __BCHAIN_MACROS_HPP_INCLUDED__

/******************************************************************************/
/*  libbchain internal use                                                    */
/******************************************************************************/

#define LIBBCHAIN_UNUSED(object) (void) object

/******************************************************************************/

#if !defined BCHAIN_OVERRIDE
#if defined BCHAIN_HAVE_NOEXCEPT
#define BCHAIN_OVERRIDE override
#else
#define BCHAIN_OVERRIDE
#endif
#endif

#if !defined BCHAIN_FINAL
#if defined BCHAIN_HAVE_NOEXCEPT
#define BCHAIN_FINAL final
#else
#define BCHAIN_FINAL
#endif
#endif

#if !defined BCHAIN_DEFAULT
#if defined BCHAIN_HAVE_NOEXCEPT
#define BCHAIN_DEFAULT = default;
#else
#define BCHAIN_DEFAULT                                                         \
    {                                                                          \
    }
#endif
#endif

#if !defined BCHAIN_NON_COPYABLE_NOR_MOVABLE
#if defined BCHAIN_HAVE_NOEXCEPT
#define BCHAIN_NON_COPYABLE_NOR_MOVABLE(classname)                             \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define BCHAIN_NON_COPYABLE_NOR_MOVABLE(classname)                             \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif
#endif

#endif
