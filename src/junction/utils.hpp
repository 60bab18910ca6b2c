#pragma once

/**
 * @defgroup junction Junction
 */

/**
 * @defgroup junction-utils Utilities
 * @ingroup junction
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"
#include "utils/string-utils.hpp"
