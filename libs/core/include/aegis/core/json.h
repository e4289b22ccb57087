#pragma once

#include <cstddef>
#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>

// Forward declarations for yyjson types to avoid including C header
struct yyjson_doc;
struct yyjson_val;

namespace aegis::core {

/**
 * @brief Non-owning view of a value inside a JsonDocument
 *
 * A JsonValue is only valid while the JsonDocument it came from is alive.
 * Lookups on missing keys or wrong types yield an invalid value rather than
 * throwing, so chained access like doc.root()["a"]["b"] is always safe.
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr) : val_(val) {}

  [[nodiscard]] bool is_valid() const {
    return val_ != nullptr;
  }
  [[nodiscard]] bool is_null() const;
  [[nodiscard]] bool is_bool() const;
  [[nodiscard]] bool is_number() const;
  [[nodiscard]] bool is_int() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;
  [[nodiscard]] bool is_object() const;

  [[nodiscard]] bool get_bool(bool default_val = false) const;
  [[nodiscard]] int64_t get_int(int64_t default_val = 0) const;
  [[nodiscard]] uint64_t get_uint(uint64_t default_val = 0) const;
  [[nodiscard]] double get_double(double default_val = 0.0) const;

  /**
   * @brief String content, or the default when the value is not a string
   */
  [[nodiscard]] kj::String get_string(kj::StringPtr default_val = ""_kj) const;

  /**
   * @brief Array length or object member count, zero for scalars
   */
  [[nodiscard]] size_t size() const;

  [[nodiscard]] JsonValue operator[](size_t index) const;
  [[nodiscard]] JsonValue operator[](kj::StringPtr key) const;
  [[nodiscard]] JsonValue operator[](const char* key) const {
    return operator[](kj::StringPtr(key));
  }

  [[nodiscard]] kj::Maybe<JsonValue> get(kj::StringPtr key) const;

  void for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const;
  void for_each_object(kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const;

  /**
   * @brief Serialize this value (and its subtree) back to compact JSON
   */
  [[nodiscard]] kj::String to_json() const;

  [[nodiscard]] yyjson_val* raw() const {
    return val_;
  }

private:
  yyjson_val* val_;
};

/**
 * @brief Owning, immutable parsed JSON document (yyjson backed)
 */
class JsonDocument {
public:
  JsonDocument() : doc_(nullptr) {}
  ~JsonDocument();

  JsonDocument(const JsonDocument&) = delete;
  JsonDocument& operator=(const JsonDocument&) = delete;
  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;

  /**
   * @brief Parse JSON text
   * @throws ParseException if the text is not valid JSON
   */
  static JsonDocument parse(kj::StringPtr text);

  /**
   * @brief Parse JSON text, returning none instead of throwing
   */
  static kj::Maybe<JsonDocument> try_parse(kj::StringPtr text);

  /**
   * @brief Read and parse a JSON file
   * @throws ParseException on read or parse failure
   */
  static JsonDocument parse_file(kj::StringPtr path);

  [[nodiscard]] JsonValue root() const;

  [[nodiscard]] bool is_valid() const {
    return doc_ != nullptr;
  }

private:
  explicit JsonDocument(yyjson_doc* doc) : doc_(doc) {}
  yyjson_doc* doc_;
};

/**
 * @brief Fluent builder for JSON objects and arrays (yyjson mutable API)
 *
 * put() applies to objects and add() to arrays; calling the wrong family on
 * a builder is ignored.
 */
class JsonBuilder {
public:
  static JsonBuilder object();
  static JsonBuilder array();

  ~JsonBuilder();
  JsonBuilder(const JsonBuilder&) = delete;
  JsonBuilder& operator=(const JsonBuilder&) = delete;
  JsonBuilder(JsonBuilder&& other) noexcept;
  JsonBuilder& operator=(JsonBuilder&& other) noexcept;

  JsonBuilder& put(kj::StringPtr key, const char* value);
  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, bool value);
  JsonBuilder& put(kj::StringPtr key, int value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, uint64_t value);
  JsonBuilder& put(kj::StringPtr key, double value);
  JsonBuilder& put(kj::StringPtr key, std::nullptr_t);

  /**
   * @brief Embed an already-serialized JSON value under key
   *
   * Text that does not parse as JSON is embedded as a JSON string instead.
   */
  JsonBuilder& put_raw(kj::StringPtr key, kj::StringPtr json);

  JsonBuilder& put_object(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);
  JsonBuilder& put_array(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);

  JsonBuilder& add(const char* value);
  JsonBuilder& add(kj::StringPtr value);
  JsonBuilder& add(bool value);
  JsonBuilder& add(int64_t value);
  JsonBuilder& add(double value);

  JsonBuilder& add_object(kj::FunctionParam<void(JsonBuilder&)> builder);

  [[nodiscard]] kj::String build(bool pretty = false) const;

private:
  enum class Type { Object, Array };
  explicit JsonBuilder(Type type);

  struct Impl;
  kj::Own<Impl> impl_;
};

namespace json_utils {

/**
 * @brief Escape a string for inclusion inside a JSON string literal (no quotes added)
 */
[[nodiscard]] kj::String escape_string(kj::StringPtr str);

[[nodiscard]] bool is_valid_json(kj::StringPtr str);

} // namespace json_utils

} // namespace aegis::core
