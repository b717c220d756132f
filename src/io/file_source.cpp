#include "io/file_source.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace uplink {

Result FileSource::Open(std::string path, FileSource& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::InputValidation,
                            "Failed to open input: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::InputValidation,
                            "fstat failed: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(ErrorKind::InputValidation, "Path is not a file: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);

    return Result::Ok();
}

ssize_t FileSource::ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::pread(fd_.Get(), out.data(), out.size(), static_cast<off_t>(offset));
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

std::uint64_t FileSource::Size() const { return size_; }

Result FileSource::CurrentSize(std::uint64_t& out) const {
    struct stat st{};
    if (::fstat(fd_.Get(), &st) != 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::InputValidation,
                            "fstat failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    out = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

Result ReadExactAt(IByteSource& src, std::uint64_t offset, std::span<std::uint8_t> out) {
    size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = src.ReadAt(offset + done, out.subspan(done));
        if (n < 0) {
            const int err = errno;
            return Result::Fail(ErrorKind::InputValidation,
                                "Read failed at offset " + std::to_string(offset + done) + " (" +
                                    std::strerror(err) + ")");
        }
        if (n == 0) {
            return Result::Fail(ErrorKind::InputValidation,
                                "Source ended early at offset " + std::to_string(offset + done));
        }
        done += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result ReadWholeFile(const std::string& path, std::vector<std::uint8_t>& out) {
    FileSource src;
    auto r = FileSource::Open(path, src);
    if (!r.is_ok()) return r;
    out.resize(static_cast<size_t>(src.Size()));
    return ReadExactAt(src, 0, std::span<std::uint8_t>(out.data(), out.size()));
}

} // namespace uplink
