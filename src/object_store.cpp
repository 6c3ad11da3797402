#include "relgate/object_store.hpp"

#include "relgate/consts.hpp"
#include "relgate/fs.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace gfs = relgate::fs;

namespace relgate {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  oid id{};
  return from_hex(hex_oid, id) && gfs::exists(path_for_oid(id));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw std::runtime_error("object_store: bad oid hex");
  }
  auto store = gfs::z_decompress(gfs::read_file(path_for_oid(id)));
  if (sha1(store) != id) {
    throw std::runtime_error("object_store: hash mismatch for " + std::string(hex_oid));
  }

  // "<type> <size>\0<payload>"
  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw std::runtime_error("object_store: invalid header in " + std::string(hex_oid));
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header in " + std::string(hex_oid));
  }

  std::size_t declared = 0;
  const auto *size_begin = reinterpret_cast<const char *>(&*(it_space + 1));
  const auto *size_end = reinterpret_cast<const char *>(store.data()) + (it_nul - store.begin());
  const auto [ptr, ec] = std::from_chars(size_begin, size_end, declared);
  const std::size_t payload_off = (it_nul - store.begin()) + 1;
  if (ec != std::errc{} || ptr != size_end || declared != store.size() - payload_off) {
    throw std::runtime_error("object_store: size mismatch in " + std::string(hex_oid));
  }

  std::string type(store.begin(), it_space);
  return Object{.type = std::move(type), .data = {store.begin() + payload_off, store.end()}};
}

} // namespace relgate
