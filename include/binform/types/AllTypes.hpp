/**
 * @file AllTypes.hpp
 * @brief A convenience header to include all concrete descriptor types.
 */

#pragma once

#include "Integer.hpp"
#include "Float.hpp"
#include "Array.hpp"
#include "Bytes.hpp"
#include "Tuple.hpp"
