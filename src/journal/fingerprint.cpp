#include "strata/journal/fingerprint.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace strata::journal {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string digest_to_hex(const unsigned char* digest, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
    }

    void update(const void* data, std::size_t length) {
        ok_ = ok_ && EVP_DigestUpdate(ctx_.get(), data, length) == 1;
    }

    Result<std::string> finish() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (!ok_ || EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
            return Err<std::string>(ErrorKind::Io, "SHA-256 digest computation failed");
        }
        return Ok(digest_to_hex(digest.data(), length));
    }

private:
    DigestContext ctx_;
    bool ok_ = false;
};

} // namespace

Result<std::string> fingerprint_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Io, "Failed to open for hashing: " + path.string());
    }

    Sha256 sha;
    std::vector<char> buffer(kReadBlockSize);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        sha.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Io, "Failed to read for hashing: " + path.string());
    }
    return sha.finish();
}

Result<std::string> fingerprint_bytes(const std::vector<std::uint8_t>& data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.finish();
}

Result<std::string> fingerprint_bytes(const std::string& data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.finish();
}

} // namespace strata::journal
