#include "strata/core/file_io.hpp"

#include <fstream>
#include <iterator>

namespace strata {

Result<std::vector<std::uint8_t>> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to open file: " + path.string());
    }

    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Io, "Failed to read file: " + path.string());
    }
    return Ok(std::move(bytes));
}

} // namespace strata
