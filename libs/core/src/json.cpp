#include "aegis/core/json.h"

#include "aegis/core/error.h"

#include <cstdlib>
#include <kj/debug.h>
#include <kj/vector.h>
#include <yyjson.h>

namespace aegis::core {

// ============================================================================
// JsonValue
// ============================================================================

bool JsonValue::is_null() const {
  return val_ != nullptr && yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ != nullptr && yyjson_is_bool(val_);
}

bool JsonValue::is_number() const {
  return val_ != nullptr && yyjson_is_num(val_);
}

bool JsonValue::is_int() const {
  return val_ != nullptr && yyjson_is_int(val_);
}

bool JsonValue::is_string() const {
  return val_ != nullptr && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ != nullptr && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ != nullptr && yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool default_val) const {
  return is_bool() ? yyjson_get_bool(val_) : default_val;
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (val_ == nullptr) {
    return default_val;
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<int64_t>(yyjson_get_uint(val_));
  }
  if (yyjson_is_sint(val_)) {
    return yyjson_get_sint(val_);
  }
  if (yyjson_is_real(val_)) {
    return static_cast<int64_t>(yyjson_get_real(val_));
  }
  return default_val;
}

uint64_t JsonValue::get_uint(uint64_t default_val) const {
  if (val_ == nullptr) {
    return default_val;
  }
  if (yyjson_is_uint(val_)) {
    return yyjson_get_uint(val_);
  }
  if (yyjson_is_sint(val_) && yyjson_get_sint(val_) >= 0) {
    return static_cast<uint64_t>(yyjson_get_sint(val_));
  }
  return default_val;
}

double JsonValue::get_double(double default_val) const {
  return is_number() ? yyjson_get_num(val_) : default_val;
}

kj::String JsonValue::get_string(kj::StringPtr default_val) const {
  if (!is_string()) {
    return kj::str(default_val);
  }
  return kj::heapString(yyjson_get_str(val_), yyjson_get_len(val_));
}

size_t JsonValue::size() const {
  if (is_array()) {
    return yyjson_arr_size(val_);
  }
  if (is_object()) {
    return yyjson_obj_size(val_);
  }
  return 0;
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!is_array()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_arr_get(val_, index));
}

JsonValue JsonValue::operator[](kj::StringPtr key) const {
  if (!is_object()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_obj_getn(val_, key.cStr(), key.size()));
}

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  auto value = operator[](key);
  if (!value.is_valid()) {
    return kj::none;
  }
  return value;
}

void JsonValue::for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const {
  if (!is_array()) {
    return;
  }
  size_t idx, max;
  yyjson_val* item;
  yyjson_arr_foreach(val_, idx, max, item) {
    callback(JsonValue(item));
  }
}

void JsonValue::for_each_object(
    kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  size_t idx, max;
  yyjson_val* key;
  yyjson_val* item;
  yyjson_obj_foreach(val_, idx, max, key, item) {
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)), JsonValue(item));
  }
}

kj::String JsonValue::to_json() const {
  if (val_ == nullptr) {
    return kj::str("null");
  }
  size_t len = 0;
  char* out = yyjson_val_write(val_, YYJSON_WRITE_NOFLAG, &len);
  if (out == nullptr) {
    return kj::str("null");
  }
  KJ_DEFER(free(out));
  return kj::heapString(out, len);
}

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument::~JsonDocument() {
  if (doc_) {
    yyjson_doc_free(doc_);
  }
}

JsonDocument::JsonDocument(JsonDocument&& other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

JsonDocument& JsonDocument::operator=(JsonDocument&& other) noexcept {
  if (this != &other) {
    if (doc_) {
      yyjson_doc_free(doc_);
    }
    doc_ = other.doc_;
    other.doc_ = nullptr;
  }
  return *this;
}

JsonDocument JsonDocument::parse(kj::StringPtr text) {
  yyjson_read_err err;
  yyjson_doc* doc =
      yyjson_read_opts(const_cast<char*>(text.cStr()), text.size(), 0, nullptr, &err);
  if (!doc) {
    throw ParseException(kj::str("JSON parse error at ", err.pos, ": ",
                                 err.msg ? err.msg : "unknown error"));
  }
  return JsonDocument(doc);
}

kj::Maybe<JsonDocument> JsonDocument::try_parse(kj::StringPtr text) {
  yyjson_doc* doc =
      yyjson_read_opts(const_cast<char*>(text.cStr()), text.size(), 0, nullptr, nullptr);
  if (!doc) {
    return kj::none;
  }
  return JsonDocument(doc);
}

JsonDocument JsonDocument::parse_file(kj::StringPtr path) {
  yyjson_read_err err;
  yyjson_doc* doc = yyjson_read_file(path.cStr(), 0, nullptr, &err);
  if (!doc) {
    throw ParseException(kj::str("Failed to load JSON file ", path, ": ",
                                 err.msg ? err.msg : "unknown error"));
  }
  return JsonDocument(doc);
}

JsonValue JsonDocument::root() const {
  if (!doc_) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_doc_get_root(doc_));
}

// ============================================================================
// JsonBuilder
// ============================================================================

struct JsonBuilder::Impl {
  yyjson_mut_doc* doc = nullptr;
  yyjson_mut_val* current = nullptr;
  bool is_object = true;

  ~Impl() {
    if (doc) {
      yyjson_mut_doc_free(doc);
    }
  }

  yyjson_mut_val* key(kj::StringPtr k) {
    return yyjson_mut_strncpy(doc, k.cStr(), k.size());
  }

  void put(kj::StringPtr k, yyjson_mut_val* v) {
    if (is_object && v != nullptr) {
      yyjson_mut_obj_add(current, key(k), v);
    }
  }

  void add(yyjson_mut_val* v) {
    if (!is_object && v != nullptr) {
      yyjson_mut_arr_append(current, v);
    }
  }
};

JsonBuilder::JsonBuilder(Type type) : impl_(kj::heap<Impl>()) {
  impl_->doc = yyjson_mut_doc_new(nullptr);
  KJ_ASSERT(impl_->doc != nullptr, "yyjson allocation failed");
  impl_->is_object = (type == Type::Object);
  impl_->current = impl_->is_object ? yyjson_mut_obj(impl_->doc) : yyjson_mut_arr(impl_->doc);
  yyjson_mut_doc_set_root(impl_->doc, impl_->current);
}

JsonBuilder::~JsonBuilder() = default;

JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept : impl_(kj::mv(other.impl_)) {}

JsonBuilder& JsonBuilder::operator=(JsonBuilder&& other) noexcept {
  if (this != &other) {
    impl_ = kj::mv(other.impl_);
  }
  return *this;
}

JsonBuilder JsonBuilder::object() {
  return JsonBuilder(Type::Object);
}

JsonBuilder JsonBuilder::array() {
  return JsonBuilder(Type::Array);
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const char* value) {
  impl_->put(key, yyjson_mut_strcpy(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  impl_->put(key, yyjson_mut_strncpy(impl_->doc, value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, bool value) {
  impl_->put(key, yyjson_mut_bool(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int value) {
  impl_->put(key, yyjson_mut_sint(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  impl_->put(key, yyjson_mut_sint(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint64_t value) {
  impl_->put(key, yyjson_mut_uint(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, double value) {
  impl_->put(key, yyjson_mut_real(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, std::nullptr_t) {
  impl_->put(key, yyjson_mut_null(impl_->doc));
  return *this;
}

JsonBuilder& JsonBuilder::put_raw(kj::StringPtr key, kj::StringPtr json) {
  yyjson_doc* parsed =
      yyjson_read_opts(const_cast<char*>(json.cStr()), json.size(), 0, nullptr, nullptr);
  if (parsed == nullptr) {
    return put(key, json);
  }
  KJ_DEFER(yyjson_doc_free(parsed));
  impl_->put(key, yyjson_val_mut_copy(impl_->doc, yyjson_doc_get_root(parsed)));
  return *this;
}

JsonBuilder& JsonBuilder::put_object(kj::StringPtr key,
                                     kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  yyjson_mut_val* nested = yyjson_mut_obj(impl_->doc);
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  builder(*this);
  impl_->current = saved;
  impl_->put(key, nested);
  return *this;
}

JsonBuilder& JsonBuilder::put_array(kj::StringPtr key,
                                    kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  yyjson_mut_val* nested = yyjson_mut_arr(impl_->doc);
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  impl_->is_object = false;
  builder(*this);
  impl_->is_object = true;
  impl_->current = saved;
  impl_->put(key, nested);
  return *this;
}

JsonBuilder& JsonBuilder::add(const char* value) {
  impl_->add(yyjson_mut_strcpy(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::add(kj::StringPtr value) {
  impl_->add(yyjson_mut_strncpy(impl_->doc, value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::add(bool value) {
  impl_->add(yyjson_mut_bool(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::add(int64_t value) {
  impl_->add(yyjson_mut_sint(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::add(double value) {
  impl_->add(yyjson_mut_real(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::add_object(kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (impl_->is_object) {
    return *this;
  }
  yyjson_mut_val* nested = yyjson_mut_obj(impl_->doc);
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  impl_->is_object = true;
  builder(*this);
  impl_->is_object = false;
  impl_->current = saved;
  impl_->add(nested);
  return *this;
}

kj::String JsonBuilder::build(bool pretty) const {
  size_t len = 0;
  char* out = yyjson_mut_write(impl_->doc, pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG, &len);
  KJ_ASSERT(out != nullptr, "yyjson serialization failed");
  KJ_DEFER(free(out));
  return kj::heapString(out, len);
}

// ============================================================================
// json_utils
// ============================================================================

namespace json_utils {

kj::String escape_string(kj::StringPtr str) {
  kj::Vector<char> out(str.size() + 8);
  for (char c : str) {
    switch (c) {
    case '"':
      out.addAll("\\\""_kj);
      break;
    case '\\':
      out.addAll("\\\\"_kj);
      break;
    case '\n':
      out.addAll("\\n"_kj);
      break;
    case '\r':
      out.addAll("\\r"_kj);
      break;
    case '\t':
      out.addAll("\\t"_kj);
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        out.addAll("\\u00"_kj);
        out.add(kHex[(c >> 4) & 0xF]);
        out.add(kHex[c & 0xF]);
      } else {
        out.add(c);
      }
    }
  }
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

bool is_valid_json(kj::StringPtr str) {
  yyjson_doc* doc =
      yyjson_read_opts(const_cast<char*>(str.cStr()), str.size(), 0, nullptr, nullptr);
  if (doc == nullptr) {
    return false;
  }
  yyjson_doc_free(doc);
  return true;
}

} // namespace json_utils

} // namespace aegis::core
