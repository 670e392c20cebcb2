// include/easyquery/easyquery.hpp
// Convenience header: includes the whole public API.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "types.hpp"
