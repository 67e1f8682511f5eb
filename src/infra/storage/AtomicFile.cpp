#include "infra/storage/AtomicFile.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace infra::storage {
namespace {

namespace fs = std::filesystem;

std::runtime_error makeError(const fs::path& path, const std::string& what, int err) {
    std::ostringstream oss;
    oss << "Atomic write failed for " << path.string() << ": " << what;
    if (err != 0) {
        oss << " (" << std::strerror(err) << ")";
    }
    return std::runtime_error(oss.str());
}

void writeAll(int fd, std::string_view content, const fs::path& path) {
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw makeError(path, "write", errno);
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void syncDirectory(const fs::path& dir) {
    const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return;
    }
    ::fsync(fd);
    ::close(fd);
}

}  // namespace

fs::path backupPathFor(const fs::path& path) {
    fs::path backup = path;
    backup += ".bak";
    return backup;
}

void writeFileAtomic(const fs::path& path, std::string_view content, bool keepBackup) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw makeError(path, "create_directories " + parent.string() + ": " + ec.message(), 0);
        }
    }

    fs::path tmpPath = path;
    tmpPath += ".tmp";

    const int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw makeError(path, "open " + tmpPath.string(), errno);
    }

    try {
        writeAll(fd, content, path);
        if (::fsync(fd) != 0) {
            throw makeError(path, "fsync", errno);
        }
    } catch (...) {
        ::close(fd);
        ::unlink(tmpPath.c_str());
        throw;
    }
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmpPath.c_str());
        throw makeError(path, "close", err);
    }

    if (keepBackup && fs::exists(path, ec)) {
        fs::copy_file(path, backupPathFor(path), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            ::unlink(tmpPath.c_str());
            throw makeError(path, "backup copy: " + ec.message(), 0);
        }
    }

    if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmpPath.c_str());
        throw makeError(path, "rename", err);
    }
    syncDirectory(parent);
}

std::optional<std::string> readWholeFile(const fs::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

}  // namespace infra::storage
