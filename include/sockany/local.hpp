#pragma once

// Aggregated public header for local (AF_UNIX) domain endpoints.
//
// This domain is named `local` (not `unix`) because AF_UNIX is not Unix-OS specific.

#include <sockany/config.hpp>

#if SOCKANY_HAS_LOCAL
#include <sockany/local/endpoint.hpp>
#endif
