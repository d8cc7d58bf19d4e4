#pragma once

#include <nlohmann/json.hpp>
#include <optional>

// JSON for std::optional fields: an empty optional is `null` and `null` reads
// back as empty. Station coordinates and the extreme routes of an analysis use
// this.
namespace nlohmann {

template <typename T>
struct adl_serializer<std::optional<T>> {
  static void to_json(json& j, const std::optional<T>& value) {
    j = value.has_value() ? json(*value) : json(nullptr);
  }

  static void from_json(const json& j, std::optional<T>& value) {
    if (j.is_null()) {
      value.reset();
      return;
    }
    value.emplace(j.get<T>());
  }
};

}  // namespace nlohmann
