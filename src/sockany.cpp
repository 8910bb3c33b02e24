#include <sockany/src.hpp>
