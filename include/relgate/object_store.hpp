#pragma once
#include "relgate/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace relgate {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | "tag"
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

// Loose objects only; packfiles are not decoded.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir)
    : objects_dir_(std::move(objects_dir)) {}

  // True if a loose object with this id exists.
  bool contains(std::string_view hex_oid) const;

  // Read and decompress object identified by 40-hex; returns type and payload.
  // The inflated bytes must hash back to the requested id.
  Object read(std::string_view hex_oid) const;

  // Get filesystem path for a binary oid.
  std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  std::filesystem::path objects_dir_;
};

} // namespace relgate
