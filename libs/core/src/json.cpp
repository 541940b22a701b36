#include "resilix/core/json.h"

#include <fstream>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <yyjson.h>

namespace resilix::core {

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument::JsonDocument() : doc_(nullptr) {}

JsonDocument::JsonDocument(yyjson_doc* doc) : doc_(doc) {}

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

JsonDocument JsonDocument::parse(kj::StringPtr str) {
  yyjson_read_err err;
  yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(str.cStr()), str.size(), 0, nullptr, &err);
  if (!doc) {
    KJ_FAIL_REQUIRE("JSON parse error", err.pos, err.msg ? err.msg : "unknown error");
  }
  return JsonDocument(doc);
}

JsonDocument JsonDocument::parse_file(kj::StringPtr path) {
  std::ifstream file(path.cStr(), std::ios::binary | std::ios::ate);
  KJ_REQUIRE(file.is_open(), "failed to open file", path);

  std::streamsize size = file.tellg();
  KJ_REQUIRE(size >= 0, "failed to get file size", path);
  file.seekg(0, std::ios::beg);

  auto buf = kj::heapArray<char>(static_cast<size_t>(size) + 1);
  file.read(buf.begin(), size);
  KJ_REQUIRE(file.good(), "failed to read file", path);
  buf[static_cast<size_t>(size)] = '\0';

  return parse(kj::StringPtr(buf.begin(), static_cast<size_t>(size)));
}

JsonValue JsonDocument::root() const {
  if (!doc_) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_doc_get_root(doc_));
}

// ============================================================================
// JsonValue
// ============================================================================

bool JsonValue::is_null() const {
  return val_ && yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ && yyjson_is_bool(val_);
}

bool JsonValue::is_number() const {
  return val_ && yyjson_is_num(val_);
}

bool JsonValue::is_int() const {
  return val_ && yyjson_is_int(val_);
}

bool JsonValue::is_real() const {
  return val_ && yyjson_is_real(val_);
}

bool JsonValue::is_string() const {
  return val_ && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ && yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool default_val) const {
  if (!is_bool()) {
    return default_val;
  }
  return yyjson_get_bool(val_);
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (yyjson_is_sint(val_)) {
    return yyjson_get_sint(val_);
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<int64_t>(yyjson_get_uint(val_));
  }
  if (is_real()) {
    return static_cast<int64_t>(yyjson_get_real(val_));
  }
  return default_val;
}

double JsonValue::get_double(double default_val) const {
  if (!is_number()) {
    return default_val;
  }
  return yyjson_get_num(val_);
}

kj::StringPtr JsonValue::get_string(kj::StringPtr default_val) const {
  if (!is_string()) {
    return default_val;
  }
  return kj::StringPtr(yyjson_get_str(val_), yyjson_get_len(val_));
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

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  if (!is_object()) {
    return kj::none;
  }
  yyjson_val* member = yyjson_obj_getn(val_, key.begin(), key.size());
  if (member == nullptr) {
    return kj::none;
  }
  return JsonValue(member);
}

void JsonValue::for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const {
  if (!is_array()) {
    return;
  }
  size_t idx = 0;
  size_t max = 0;
  yyjson_val* item = nullptr;
  yyjson_arr_foreach(val_, idx, max, item) {
    callback(JsonValue(item));
  }
}

void JsonValue::for_each_object(
    kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  size_t idx = 0;
  size_t max = 0;
  yyjson_val* key = nullptr;
  yyjson_val* val = nullptr;
  yyjson_obj_foreach(val_, idx, max, key, val) {
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)), JsonValue(val));
  }
}

kj::Array<kj::String> JsonValue::keys() const {
  kj::Vector<kj::String> result(size());
  for_each_object([&result](kj::StringPtr key, const JsonValue&) { result.add(kj::heapString(key)); });
  return result.releaseAsArray();
}

} // namespace resilix::core
