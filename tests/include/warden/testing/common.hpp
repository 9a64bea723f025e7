#pragma once

#include <warden/schema/authorization_tuple.hpp>
#include <warden/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::schema::address_t make_address(const uint8_t seed) {
  auto out = warden::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline warden::schema::authorization_tuple_t make_tuple(
    const uint8_t seed,
    const warden::schema::amount_t& amount = 100) {
  return warden::schema::authorization_tuple_t{
      .version = 1,
      .vault = make_address(0xA0),
      .recipient = make_address(seed),
      .amount = amount,
      .authorization_id = make_hash(seed),
      .domain = make_hash(0xD0)};
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes the directory on destruction; declare before anything that keeps
/// the database open.
struct scoped_path final {
  explicit scoped_path(const std::string_view prefix)
      : path{make_db_path(prefix)} {}
  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;
  ~scoped_path() { remove_path(path); }

  std::string path;
};

}  // namespace warden::testing
