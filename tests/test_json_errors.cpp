#include <iostream>
#include <stdexcept>
#include <string>

#include "resflow/core/conversion_content.h"
#include "resflow/util/json.h"

#define RF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

static std::string parse_error_message(const std::string& text) {
  try {
    (void)resflow::json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

static std::string content_error_message(const std::string& text) {
  try {
    (void)resflow::parse_conversion_content(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

int test_json_errors() {
  // Stray comma in an array.
  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    RF_ASSERT(!msg.empty());
    RF_ASSERT(msg.find("line 3, col 3") != std::string::npos);
    RF_ASSERT(msg.find("unexpected") != std::string::npos);
    RF_ASSERT(msg.find("^") != std::string::npos);
  }

  // Same stray comma with CRLF line endings.
  {
    const std::string msg = parse_error_message("[\r\n  1,\r\n  ,\r\n  2\r\n]\r\n");
    RF_ASSERT(!msg.empty());
    RF_ASSERT(msg.find("line 3, col 3") != std::string::npos);
    RF_ASSERT(msg.find("^") != std::string::npos);
  }

  // Missing closing brace at end-of-file.
  {
    const std::string msg = parse_error_message("{\n  \"a\": 1,\n  \"b\": 2");
    RF_ASSERT(!msg.empty());
    RF_ASSERT(msg.find("line 3, col 9") != std::string::npos);
    RF_ASSERT(msg.find("expected") != std::string::npos);
  }

  // Content loading surfaces the same diagnostics.
  {
    const std::string msg = content_error_message("{\n  \"recipes\": {\n    \"r\": { \"inputs\": {\"ore\": 1,} }\n  }\n}\n");
    RF_ASSERT(!msg.empty());
    RF_ASSERT(msg.find("line 3") != std::string::npos);
  }

  // Well-formed JSON with a wrong value type is rejected too.
  {
    const std::string msg =
        content_error_message("{\"recipes\": {\"r\": {\"inputs\": {\"ore\": \"ten\"}, \"outputs\": {}}}}");
    RF_ASSERT(!msg.empty());
    RF_ASSERT(msg.find("recipe 'r' inputs") != std::string::npos);
    RF_ASSERT(msg.find("ore") != std::string::npos);
  }
  {
    const std::string msg = content_error_message("{\"recipes\": []}");
    RF_ASSERT(msg.find("not an object") != std::string::npos);
  }

  return 0;
}
