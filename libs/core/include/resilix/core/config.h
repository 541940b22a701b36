#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <type_traits>

namespace resilix::core {

/**
 * @brief Tree of typed configuration values loaded from JSON
 *
 * JSON objects become nested sections; scalars and homogeneous arrays become
 * typed values. Integer values are readable as double as well.
 */
class Config final {
public:
  using Value = kj::OneOf<bool, int64_t, double, kj::String, kj::Array<bool>, kj::Array<int64_t>,
                          kj::Array<double>, kj::Array<kj::String>, kj::Own<Config>>;

  Config() = default;
  Config(Config&&) = default;
  Config& operator=(Config&&) = default;
  KJ_DISALLOW_COPY(Config);

  /**
   * @brief Replace the contents with a parsed JSON file
   * @return false (after logging) if the file cannot be read or parsed
   */
  bool load_from_file(kj::StringPtr file_path);

  /**
   * @brief Replace the contents with a parsed JSON string
   * @return false (after logging) if the text is not a JSON object
   */
  bool load_from_string(kj::StringPtr json_content);

  /**
   * @brief Parse a JSON string, throwing on malformed input
   */
  static Config parse(kj::StringPtr json_content);

  [[nodiscard]] bool has_key(kj::StringPtr key) const;
  void set(kj::StringPtr key, Value value);
  void remove(kj::StringPtr key);

  template <typename T> [[nodiscard]] kj::Maybe<T> get(kj::StringPtr key) const {
    KJ_IF_SOME(value, config_.find(key)) {
      if constexpr (std::is_same_v<T, bool>) {
        if (value.template is<bool>()) {
          return value.template get<bool>();
        }
      } else if constexpr (std::is_same_v<T, int64_t>) {
        if (value.template is<int64_t>()) {
          return value.template get<int64_t>();
        }
      } else if constexpr (std::is_same_v<T, double>) {
        if (value.template is<double>()) {
          return value.template get<double>();
        }
        if (value.template is<int64_t>()) {
          return static_cast<double>(value.template get<int64_t>());
        }
      } else if constexpr (std::is_same_v<T, kj::StringPtr>) {
        if (value.template is<kj::String>()) {
          return value.template get<kj::String>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const bool>>) {
        if (value.template is<kj::Array<bool>>()) {
          return value.template get<kj::Array<bool>>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const int64_t>>) {
        if (value.template is<kj::Array<int64_t>>()) {
          return value.template get<kj::Array<int64_t>>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const double>>) {
        if (value.template is<kj::Array<double>>()) {
          return value.template get<kj::Array<double>>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const kj::String>>) {
        if (value.template is<kj::Array<kj::String>>()) {
          return value.template get<kj::Array<kj::String>>().asPtr();
        }
      } else {
        static_assert(kj::isSameType<T, void>(), "Unsupported config get<T>() type");
      }
      return kj::none;
    }
    return kj::none;
  }

  template <typename T> T get_or(kj::StringPtr key, T default_value) const {
    KJ_IF_SOME(value, get<T>(key)) {
      return kj::mv(value);
    }
    return kj::mv(default_value);
  }

  // Nested configuration access
  [[nodiscard]] kj::Maybe<const Config&> get_section(kj::StringPtr key) const;
  void set_section(kj::StringPtr key, Config section);

  /**
   * @brief Overlay another configuration onto this one
   *
   * Sections present on both sides are merged recursively; any other key
   * from `other` replaces the existing value.
   */
  void merge(const Config& other);

  [[nodiscard]] Config clone() const;

  [[nodiscard]] kj::Array<kj::String> keys() const;

  [[nodiscard]] bool empty() const {
    return config_.size() == 0;
  }

  [[nodiscard]] size_t size() const {
    return config_.size();
  }

private:
  kj::TreeMap<kj::String, Value> config_;
};

} // namespace resilix::core
