/**
 * @file binform.hpp
 * @brief The main user-facing header: schemas, formats and records.
 */

#pragma once

#include "ByteOrder.hpp"
#include "ByteSource.hpp"
#include "Context.hpp"
#include "Errors.hpp"
#include "FieldDescriptor.hpp"
#include "Format.hpp"
#include "Length.hpp"
#include "Logging.hpp"
#include "Record.hpp"
#include "Termination.hpp"
#include "TextEncoding.hpp"
#include "Value.hpp"
#include "types/AllTypes.hpp"
