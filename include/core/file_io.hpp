#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace vaultstream::file_io {

[[nodiscard]] Result<std::vector<uint8_t>> read_bytes(const std::filesystem::path& path);

/**
 * @brief Write bytes to a uniquely named sibling temp file, fsync, then
 * rename over target.
 *
 * The temp file is created exclusively (`<target>.XXXXXX.tmp`), so no
 * existing file other than target is ever truncated or replaced. A crash
 * leaves either the old file or the new one in place, never a half-written
 * target.
 *
 * The temp file starts owner-only. It is then set to `perms` when given,
 * otherwise to the permissions of the existing target; a new target with
 * no explicit perms stays owner-only. Returns the number of bytes written.
 */
[[nodiscard]] Result<size_t> write_atomic(const std::filesystem::path& target,
                                          const uint8_t* data, size_t len,
                                          std::optional<std::filesystem::perms> perms = std::nullopt);

[[nodiscard]] inline Result<size_t> write_atomic(const std::filesystem::path& target,
                                                 const std::vector<uint8_t>& data,
                                                 std::optional<std::filesystem::perms> perms = std::nullopt) {
    return write_atomic(target, data.data(), data.size(), perms);
}

[[nodiscard]] inline Result<size_t> write_atomic(const std::filesystem::path& target,
                                                 std::string_view text,
                                                 std::optional<std::filesystem::perms> perms = std::nullopt) {
    return write_atomic(target, reinterpret_cast<const uint8_t*>(text.data()), text.size(), perms);
}

} // namespace vaultstream::file_io
