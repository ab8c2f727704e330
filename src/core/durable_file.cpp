/**
 * @file durable_file.cpp
 * @brief Implementation of the durable file helpers
 */

#include "chimera/durable_file.h"
#include "chimera/errors.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace chimera {

namespace {

/**
 * @brief Write a whole buffer to fd, retrying on EINTR and short writes
 * @return true if every byte was written
 */
bool writeAll(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

std::string errnoMessage(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

std::string parentDirectory(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return ".";
    }
    if (slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

} // anonymous namespace

void replaceFileDurably(const std::string& path, const std::string& content, Logger& logger) {
    std::string tmp_path = path + ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError(errnoMessage("Cannot open", tmp_path));
    }

    if (!writeAll(fd, content)) {
        std::string msg = errnoMessage("Cannot write", tmp_path);
        ::close(fd);
        ::unlink(tmp_path.c_str());
        throw StorageError(msg);
    }

    if (::fsync(fd) != 0) {
        std::string msg = errnoMessage("Cannot sync", tmp_path);
        ::close(fd);
        ::unlink(tmp_path.c_str());
        throw StorageError(msg);
    }

    if (::close(fd) != 0) {
        std::string msg = errnoMessage("Cannot close", tmp_path);
        ::unlink(tmp_path.c_str());
        throw StorageError(msg);
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        std::string msg = errnoMessage("Cannot rename", tmp_path);
        ::unlink(tmp_path.c_str());
        throw StorageError(msg);
    }

    // Make the rename itself durable
    std::string dir = parentDirectory(path);
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        if (::fsync(dir_fd) != 0) {
            logger.warn(errnoMessage("Cannot sync directory", dir));
        }
        ::close(dir_fd);
    }
}

std::optional<std::string> readWholeFile(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        throw StorageError(errnoMessage("Cannot stat", path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw StorageError("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw StorageError("Cannot read " + path);
    }
    return buffer.str();
}

} // namespace chimera
