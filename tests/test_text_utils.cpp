/**
 * @file test_text_utils.cpp
 * @brief JSON string escaping tests.
 * @author Watosn
 */

#include <string>

#include <spdlog/spdlog.h>

#include "spacetraffic/core/text_utils.hpp"

int main() {
  using namespace spacetraffic;

  if (core::json_escape("data/kp_2026.csv") != "data/kp_2026.csv" || !core::json_escape("").empty()) {
    spdlog::error("plain text should pass through unchanged");
    return 1;
  }

  // A Windows-style path with a quote in a directory name.
  if (core::json_escape(R"(C:\weather\"storm" kp.csv)") != R"(C:\\weather\\\"storm\" kp.csv)") {
    spdlog::error("quote/backslash escaping mismatch: {}", core::json_escape(R"(C:\weather\"storm" kp.csv)"));
    return 2;
  }

  if (core::json_escape("a\tb\nc\r") != "a\\tb\\nc\\r") {
    spdlog::error("whitespace escaping mismatch");
    return 3;
  }

  const std::string control{'x', '\x01', '\x1f', 'y'};
  if (core::json_escape(control) != "x\\u0001\\u001fy") {
    spdlog::error("control character escaping mismatch: {}", core::json_escape(control));
    return 4;
  }

  // UTF-8 bytes are valid inside JSON strings and are kept as-is.
  if (core::json_escape("Kp \xc3\xa9t\xc3\xa9") != "Kp \xc3\xa9t\xc3\xa9") {
    spdlog::error("utf-8 text should pass through unchanged");
    return 5;
  }

  return 0;
}
