#pragma once

#include "strata/core/result.hpp"

#include <cstdint>
#include <filesystem>

namespace strata {

/**
 * @brief Permission bits and modification time of a file, as stored in the journal
 */
struct FileAttributes {
    std::uint32_t permissions = 0;   ///< POSIX permission bits (mode & 07777)
    std::int64_t modified_time_ns = 0; ///< Unix epoch nanoseconds
    std::uint64_t size = 0;
};

/**
 * @brief Stat a file, following symlinks
 */
Result<FileAttributes> read_attributes(const std::filesystem::path& path);

/**
 * @brief Apply permission bits to an existing file
 */
Result<void> apply_permissions(const std::filesystem::path& path, std::uint32_t permissions);

/**
 * @brief Set both access and modification time to the given epoch nanoseconds
 */
Result<void> apply_modified_time(const std::filesystem::path& path, std::int64_t modified_time_ns);

} // namespace strata
