#pragma once

// Compile-time selection of the endpoint families modelled by `any_endpoint`.
//
// Each flag defaults from the target platform and may be forced to 0 by the build
// (e.g. -DSOCKANY_HAS_XDP=0) to shrink the variant set.

#if !defined(SOCKANY_HAS_LOCAL)
#if defined(__unix__) || defined(__APPLE__)
#define SOCKANY_HAS_LOCAL 1
#else
#define SOCKANY_HAS_LOCAL 0
#endif
#endif

// Linux abstract namespace: sun_path starting with a NUL byte.
#if !defined(SOCKANY_HAS_ABSTRACT_LOCAL)
#if defined(__linux__) && SOCKANY_HAS_LOCAL
#define SOCKANY_HAS_ABSTRACT_LOCAL 1
#else
#define SOCKANY_HAS_ABSTRACT_LOCAL 0
#endif
#endif

#if !defined(SOCKANY_HAS_NETLINK)
#if defined(__linux__)
#define SOCKANY_HAS_NETLINK 1
#else
#define SOCKANY_HAS_NETLINK 0
#endif
#endif

#if !defined(SOCKANY_HAS_XDP)
#if defined(__linux__) && defined(__has_include)
#if __has_include(<linux/if_xdp.h>)
#define SOCKANY_HAS_XDP 1
#else
#define SOCKANY_HAS_XDP 0
#endif
#else
#define SOCKANY_HAS_XDP 0
#endif
#endif
