#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace nsi::util {

/*
  UUID helpers

  Connection ids are plain RFC4122 strings; correlation and global
  reservation ids use the urn:uuid: form expected on the NSI wire.
*/

using UUID = std::array<uint8_t, 16>;

inline constexpr const char* kUrnUuidPrefix = "urn:uuid:";

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string ToUrn(const UUID& id);

} // namespace nsi::util
