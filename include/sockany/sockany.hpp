#pragma once

// Primary public header for the sockany socket-address library.
// Most users should include this header only.

// Error & result model
#include <sockany/error.hpp>
#include <sockany/expected.hpp>
#include <sockany/result.hpp>

// Build-time family selection
#include <sockany/config.hpp>

// Generic native-layout contract & untyped storage
#include <sockany/native_storage.hpp>
#include <sockany/native_view.hpp>

// Family endpoints
#include <sockany/ip.hpp>
#include <sockany/local.hpp>
#if SOCKANY_HAS_NETLINK
#include <sockany/netlink/endpoint.hpp>
#endif
#if SOCKANY_HAS_XDP
#include <sockany/xdp/endpoint.hpp>
#endif

// Unified endpoint
#include <sockany/any_endpoint.hpp>
