#include "core/file_io.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace vaultstream::file_io {

Result<std::vector<uint8_t>> read_bytes(const std::filesystem::path& path) {
    using R = Result<std::vector<uint8_t>>;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return R::error(ErrorCategory::FILE_ACCESS_ERROR,
                        std::format("File not found: {}", path.string()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return R::error(ErrorCategory::FILE_ACCESS_ERROR,
                        std::format("Cannot open {}", path.string()));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        return R::error(ErrorCategory::FILE_ACCESS_ERROR,
                        std::format("Read failed: {}", path.string()));
    }
    return R::ok(std::move(data));
}

namespace {

// Closes the descriptor on every exit path; unlinks the temp file unless released
class TempFile {
public:
    TempFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
    ~TempFile() {
        close();
        if (!path_.empty()) ::unlink(path_.c_str());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

    bool close() {
        if (fd_ < 0) return true;
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0;
    }
    void release() { path_.clear(); }

private:
    int fd_;
    std::string path_;
};

std::string errno_message() {
    return std::error_code(errno, std::generic_category()).message();
}

} // anonymous namespace

Result<size_t> write_atomic(const std::filesystem::path& target,
                            const uint8_t* data, size_t len,
                            std::optional<std::filesystem::perms> perms) {
    using R = Result<size_t>;

    std::error_code ec;
    if (!perms && std::filesystem::exists(target, ec)) {
        perms = std::filesystem::status(target, ec).permissions();
        if (ec) perms.reset();
    }

    // mkstemps replaces the six X's and creates the file 0600 with O_EXCL
    std::string templ = target.string() + ".XXXXXX.tmp";
    const int fd = ::mkstemps(templ.data(), 4);
    if (fd < 0) {
        return R::error(ErrorCategory::FILE_ACCESS_ERROR,
                        std::format("Cannot create temp file for {}: {}",
                                    target.string(), errno_message()));
    }
    TempFile tmp(fd, templ);

    if (perms && ::fchmod(tmp.fd(), static_cast<mode_t>(*perms)) != 0) {
        utils::log::warn(std::format("Cannot set permissions on {}, leaving it owner-only: {}",
                                     tmp.path(), errno_message()));
    }

    size_t offset = 0;
    while (offset < len) {
        const ssize_t n = ::write(tmp.fd(), data + offset, len - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return R::error(ErrorCategory::FILE_ACCESS_ERROR,
                            std::format("Write failed: {}: {}", tmp.path(), errno_message()));
        }
        offset += static_cast<size_t>(n);
    }
    if (::fsync(tmp.fd()) != 0 || !tmp.close()) {
        return R::error(ErrorCategory::FILE_ACCESS_ERROR,
                        std::format("Flush failed: {}: {}", tmp.path(), errno_message()));
    }

    std::filesystem::rename(tmp.path(), target, ec);
    if (ec) {
        return R::error(ErrorCategory::FILE_ACCESS_ERROR,
                        std::format("Rename {} -> {} failed: {}",
                                    tmp.path(), target.string(), ec.message()));
    }
    tmp.release();
    return R::ok(len);
}

} // namespace vaultstream::file_io
