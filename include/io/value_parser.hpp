#pragma once

#include "core/error.hpp"
#include "core/row.hpp"

#include <string_view>

namespace gpcopy::io {

/**
 * @brief Convert the text form of a field into a value of the column's kind
 *
 * TEXT and OTHER keep the text, BINARY takes its bytes, USER_DEFINED parses
 * as its storage kind. Booleans accept true/false, t/f, yes/no, on/off, 1/0.
 */
[[nodiscard]] Result<Value> parse_value(std::string_view text, const ColumnType& type);

} // namespace gpcopy::io
