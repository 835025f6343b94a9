#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace rollout::util {

/*
  UUID helpers

  Rollout, instance group and lease ids are RFC4122 v4 UUIDs in canonical text
  form, optionally prefixed ("ro-", "ig-", "lease-") for readability in logs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId(std::string_view prefix);

} // namespace rollout::util
