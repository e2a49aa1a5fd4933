/**
 * @file text_utils.hpp
 * @brief Text helpers for report output.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>

namespace spacetraffic::core {

/**
 * @brief Escape text for use inside a JSON string literal.
 *
 * Quotes, backslashes and control characters are escaped; other bytes pass through unchanged.
 */
[[nodiscard]] std::string json_escape(std::string_view text);

}  // namespace spacetraffic::core
