#include "resilix/core/config.h"

#include "resilix/core/json.h"

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/memory.h>

namespace resilix::core {

namespace {

Config section_from_json(const JsonValue& object);

kj::Maybe<Config::Value> json_to_value(const JsonValue& j) {
  if (j.is_null()) {
    return kj::none;
  } else if (j.is_bool()) {
    return Config::Value(j.get_bool());
  } else if (j.is_int()) {
    return Config::Value(j.get_int());
  } else if (j.is_real()) {
    return Config::Value(j.get_double());
  } else if (j.is_string()) {
    return Config::Value(kj::heapString(j.get_string()));
  } else if (j.is_object()) {
    return Config::Value(kj::heap<Config>(section_from_json(j)));
  } else if (j.is_array()) {
    if (j.size() == 0) {
      return Config::Value(kj::heapArray<kj::String>(0));
    }
    auto first = j[0];
    if (first.is_bool()) {
      auto builder = kj::heapArrayBuilder<bool>(j.size());
      j.for_each_array([&builder](const JsonValue& val) {
        KJ_REQUIRE(val.is_bool(), "mixed-type JSON array");
        builder.add(val.get_bool());
      });
      return Config::Value(builder.finish());
    } else if (first.is_int()) {
      // An integer array that contains reals is read as doubles
      bool any_real = false;
      j.for_each_array([&any_real](const JsonValue& val) {
        KJ_REQUIRE(val.is_number(), "mixed-type JSON array");
        any_real = any_real || val.is_real();
      });
      if (any_real) {
        auto builder = kj::heapArrayBuilder<double>(j.size());
        j.for_each_array([&builder](const JsonValue& val) { builder.add(val.get_double()); });
        return Config::Value(builder.finish());
      }
      auto builder = kj::heapArrayBuilder<int64_t>(j.size());
      j.for_each_array([&builder](const JsonValue& val) { builder.add(val.get_int()); });
      return Config::Value(builder.finish());
    } else if (first.is_real()) {
      auto builder = kj::heapArrayBuilder<double>(j.size());
      j.for_each_array([&builder](const JsonValue& val) {
        KJ_REQUIRE(val.is_number(), "mixed-type JSON array");
        builder.add(val.get_double());
      });
      return Config::Value(builder.finish());
    } else if (first.is_string()) {
      auto builder = kj::heapArrayBuilder<kj::String>(j.size());
      j.for_each_array([&builder](const JsonValue& val) {
        KJ_REQUIRE(val.is_string(), "mixed-type JSON array");
        builder.add(kj::heapString(val.get_string()));
      });
      return Config::Value(builder.finish());
    }
  }
  KJ_FAIL_REQUIRE("unsupported JSON value type");
}

Config section_from_json(const JsonValue& object) {
  Config config;
  object.for_each_object([&config](kj::StringPtr key, const JsonValue& value) {
    KJ_IF_SOME(converted, json_to_value(value)) {
      config.set(key, kj::mv(converted));
    }
  });
  return config;
}

template <typename T> kj::Array<T> copy_array(const kj::Array<T>& a) {
  auto builder = kj::heapArrayBuilder<T>(a.size());
  for (const auto& item : a) {
    if constexpr (kj::isSameType<T, kj::String>()) {
      builder.add(kj::heapString(item));
    } else {
      builder.add(item);
    }
  }
  return builder.finish();
}

Config::Value clone_value(const Config::Value& v) {
  KJ_SWITCH_ONEOF(v) {
    KJ_CASE_ONEOF(b, bool) {
      return b;
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return i;
    }
    KJ_CASE_ONEOF(d, double) {
      return d;
    }
    KJ_CASE_ONEOF(s, kj::String) {
      return kj::heapString(s);
    }
    KJ_CASE_ONEOF(a, kj::Array<bool>) {
      return copy_array(a);
    }
    KJ_CASE_ONEOF(a, kj::Array<int64_t>) {
      return copy_array(a);
    }
    KJ_CASE_ONEOF(a, kj::Array<double>) {
      return copy_array(a);
    }
    KJ_CASE_ONEOF(a, kj::Array<kj::String>) {
      return copy_array(a);
    }
    KJ_CASE_ONEOF(section, kj::Own<Config>) {
      return kj::heap<Config>(section->clone());
    }
  }
  KJ_UNREACHABLE;
}

} // namespace

Config Config::parse(kj::StringPtr json_content) {
  auto doc = JsonDocument::parse(json_content);
  auto root = doc.root();
  KJ_REQUIRE(root.is_object(), "configuration root must be a JSON object");
  return section_from_json(root);
}

bool Config::load_from_file(kj::StringPtr file_path) {
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto doc = JsonDocument::parse_file(file_path);
               auto root = doc.root();
               KJ_REQUIRE(root.is_object(), "configuration root must be a JSON object");
               *this = section_from_json(root);
             })) {
    KJ_LOG(ERROR, "failed to load configuration file", file_path, exception);
    return false;
  }
  return true;
}

bool Config::load_from_string(kj::StringPtr json_content) {
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { *this = parse(json_content); })) {
    KJ_LOG(ERROR, "failed to parse configuration", exception);
    return false;
  }
  return true;
}

bool Config::has_key(kj::StringPtr key) const {
  return config_.find(key) != kj::none;
}

void Config::set(kj::StringPtr key, Value value) {
  config_.upsert(kj::heapString(key), kj::mv(value),
                 [](Value& existing, Value&& replacement) { existing = kj::mv(replacement); });
}

void Config::remove(kj::StringPtr key) {
  config_.erase(key);
}

kj::Maybe<const Config&> Config::get_section(kj::StringPtr key) const {
  KJ_IF_SOME(value, config_.find(key)) {
    if (value.is<kj::Own<Config>>()) {
      return *value.get<kj::Own<Config>>();
    }
  }
  return kj::none;
}

void Config::set_section(kj::StringPtr key, Config section) {
  set(key, kj::heap<Config>(kj::mv(section)));
}

void Config::merge(const Config& other) {
  for (const auto& entry : other.config_) {
    if (entry.value.is<kj::Own<Config>>()) {
      KJ_IF_SOME(existing, config_.find(entry.key)) {
        if (existing.is<kj::Own<Config>>()) {
          existing.get<kj::Own<Config>>()->merge(*entry.value.get<kj::Own<Config>>());
          continue;
        }
      }
    }
    set(entry.key, clone_value(entry.value));
  }
}

Config Config::clone() const {
  Config copy;
  for (const auto& entry : config_) {
    copy.set(entry.key, clone_value(entry.value));
  }
  return copy;
}

kj::Array<kj::String> Config::keys() const {
  auto builder = kj::heapArrayBuilder<kj::String>(config_.size());
  for (const auto& entry : config_) {
    builder.add(kj::heapString(entry.key));
  }
  return builder.finish();
}

} // namespace resilix::core
