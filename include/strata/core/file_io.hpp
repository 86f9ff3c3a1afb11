#pragma once

#include "strata/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace strata {

/**
 * @brief Read a whole file into memory
 *
 * Used for captured file content and for journal segments alike.
 */
Result<std::vector<std::uint8_t>> read_file_bytes(const std::filesystem::path& path);

} // namespace strata
