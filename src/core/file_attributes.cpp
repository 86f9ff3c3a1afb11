#include "strata/core/file_attributes.hpp"
#include "strata/core/platform.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <system_error>

#ifdef STRATA_PLATFORM_POSIX
    #include <fcntl.h>
#endif

namespace strata {
namespace fs = std::filesystem;

namespace {

constexpr std::int64_t kNanosPerSecond = 1000000000LL;

std::string errno_message(const std::string& what, const fs::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

#ifdef STRATA_PLATFORM_WINDOWS
// file_time_type has no portable epoch in C++17; anchor it against system_clock.
std::int64_t to_epoch_ns(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return duration_cast<nanoseconds>(system_time.time_since_epoch()).count();
}

fs::file_time_type from_epoch_ns(std::int64_t ns) {
    using namespace std::chrono;
    const system_clock::time_point system_time{duration_cast<system_clock::duration>(nanoseconds(ns))};
    return time_point_cast<fs::file_time_type::duration>(
        system_time - system_clock::now() + fs::file_time_type::clock::now());
}
#endif

} // namespace

Result<FileAttributes> read_attributes(const fs::path& path) {
    FileAttributes attributes;
#ifdef STRATA_PLATFORM_POSIX
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return Err<FileAttributes>(ErrorKind::Io, errno_message("Failed to stat", path));
    }
    attributes.permissions = static_cast<std::uint32_t>(info.st_mode & 07777);
    attributes.modified_time_ns =
        static_cast<std::int64_t>(info.st_mtim.tv_sec) * kNanosPerSecond + info.st_mtim.tv_nsec;
    attributes.size = static_cast<std::uint64_t>(info.st_size);
#else
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec) {
        return Err<FileAttributes>(ErrorKind::Io, "Failed to stat " + path.string() + ": " + ec.message());
    }
    attributes.permissions = static_cast<std::uint32_t>(status.permissions() & fs::perms::mask);
    const auto write_time = fs::last_write_time(path, ec);
    if (ec) {
        return Err<FileAttributes>(ErrorKind::Io, "Failed to read mtime of " + path.string() + ": " + ec.message());
    }
    attributes.modified_time_ns = to_epoch_ns(write_time);
    attributes.size = fs::file_size(path, ec);
    if (ec) {
        return Err<FileAttributes>(ErrorKind::Io, "Failed to read size of " + path.string() + ": " + ec.message());
    }
#endif
    return Ok(attributes);
}

Result<void> apply_permissions(const fs::path& path, std::uint32_t permissions) {
#ifdef STRATA_PLATFORM_POSIX
    if (::chmod(path.c_str(), static_cast<mode_t>(permissions & 07777)) != 0) {
        return Err<void>(Error(ErrorKind::Io, errno_message("Failed to chmod", path)));
    }
#else
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(permissions) & fs::perms::mask,
                    fs::perm_options::replace, ec);
    if (ec) {
        return Err<void>(Error(ErrorKind::Io, "Failed to set permissions on " + path.string() + ": " + ec.message()));
    }
#endif
    return Ok();
}

Result<void> apply_modified_time(const fs::path& path, std::int64_t modified_time_ns) {
#ifdef STRATA_PLATFORM_POSIX
    // Floor division keeps tv_nsec in [0, 1e9) for pre-1970 timestamps
    std::int64_t seconds = modified_time_ns / kNanosPerSecond;
    std::int64_t nanos = modified_time_ns % kNanosPerSecond;
    if (nanos < 0) {
        nanos += kNanosPerSecond;
        --seconds;
    }
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(seconds);
    times[0].tv_nsec = static_cast<long>(nanos);
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        return Err<void>(Error(ErrorKind::Io, errno_message("Failed to set times on", path)));
    }
#else
    std::error_code ec;
    fs::last_write_time(path, from_epoch_ns(modified_time_ns), ec);
    if (ec) {
        return Err<void>(Error(ErrorKind::Io, "Failed to set mtime on " + path.string() + ": " + ec.message()));
    }
#endif
    return Ok();
}

} // namespace strata
