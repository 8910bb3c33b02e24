#pragma once

// Aggregated public header for IP address and endpoint types.

#include <sockany/ip/address.hpp>
#include <sockany/ip/address_v4.hpp>
#include <sockany/ip/address_v6.hpp>
#include <sockany/ip/endpoint.hpp>
#include <sockany/ip/endpoint_v4.hpp>
#include <sockany/ip/endpoint_v6.hpp>
