#pragma once

// Out-of-line definitions. Include from exactly one translation unit
// (the `sockany` library target does this in src/sockany.cpp).

#include <sockany/impl/assert.ipp>
#include <sockany/impl/error.ipp>
