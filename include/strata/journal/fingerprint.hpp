#pragma once

#include "strata/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace strata::journal {

/// Length of a hex-encoded SHA-256 digest.
constexpr std::size_t kFingerprintLength = 64;

/**
 * @brief SHA-256 of a file's full byte stream, lowercase hex
 */
Result<std::string> fingerprint_file(const std::filesystem::path& path);

/**
 * @brief SHA-256 of an in-memory buffer, lowercase hex
 */
Result<std::string> fingerprint_bytes(const std::vector<std::uint8_t>& data);

Result<std::string> fingerprint_bytes(const std::string& data);

} // namespace strata::journal
