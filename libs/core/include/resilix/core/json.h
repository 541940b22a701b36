/**
 * @file json.h
 * @brief Read-only JSON access backed by yyjson
 *
 * Usage:
 *   auto doc = JsonDocument::parse(text);
 *   auto root = doc.root();
 *   KJ_IF_SOME(attempts, root.get("max_attempts")) { ... attempts.get_int() ... }
 */

#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/string.h>

// Forward declarations for yyjson types to avoid including the C header
struct yyjson_doc;
struct yyjson_val;

namespace resilix::core {

class JsonValue;

/**
 * @brief Owning handle to a parsed, immutable JSON document
 */
class JsonDocument {
public:
  JsonDocument();
  ~JsonDocument();

  JsonDocument(const JsonDocument&) = delete;
  JsonDocument& operator=(const JsonDocument&) = delete;
  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;

  /**
   * @brief Parse a JSON string
   * @throws kj::Exception on malformed input, with the error position
   */
  static JsonDocument parse(kj::StringPtr str);

  /**
   * @brief Read and parse a JSON file
   * @throws kj::Exception if the file cannot be read or parsed
   */
  static JsonDocument parse_file(kj::StringPtr path);

  [[nodiscard]] JsonValue root() const;
  [[nodiscard]] bool is_valid() const {
    return doc_ != nullptr;
  }

private:
  explicit JsonDocument(yyjson_doc* doc);
  yyjson_doc* doc_;
};

/**
 * @brief Non-owning view of a value inside a JsonDocument
 *
 * The document must outlive every view taken from it.
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr) : val_(val) {}

  [[nodiscard]] bool is_null() const;
  [[nodiscard]] bool is_bool() const;
  [[nodiscard]] bool is_number() const;
  [[nodiscard]] bool is_int() const;
  [[nodiscard]] bool is_real() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;
  [[nodiscard]] bool is_object() const;

  [[nodiscard]] bool get_bool(bool default_val = false) const;
  [[nodiscard]] int64_t get_int(int64_t default_val = 0) const;
  [[nodiscard]] double get_double(double default_val = 0.0) const;
  [[nodiscard]] kj::StringPtr get_string(kj::StringPtr default_val = ""_kj) const;

  /**
   * @brief Element count of an array or object, 0 otherwise
   */
  [[nodiscard]] size_t size() const;

  [[nodiscard]] JsonValue operator[](size_t index) const;

  /**
   * @brief Object member lookup
   * @return kj::none if this is not an object or the key is absent
   */
  [[nodiscard]] kj::Maybe<JsonValue> get(kj::StringPtr key) const;

  void for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const;
  void for_each_object(kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const;

  [[nodiscard]] kj::Array<kj::String> keys() const;

  [[nodiscard]] bool is_valid() const {
    return val_ != nullptr;
  }

private:
  yyjson_val* val_;
};

} // namespace resilix::core
