#pragma once

#include "io/byte_source.hpp"
#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace uplink {

// Regular file opened O_RDONLY and read with pread(2), so the read position
// is never shared state. Each session opens its own instance.
class FileSource final : public IByteSource {
public:
    static Result Open(std::string path, FileSource& out);

    ssize_t ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) override;
    std::uint64_t Size() const override;

    // Re-stats the open descriptor; used to detect the file changing size
    // between validation and session start.
    Result CurrentSize(std::uint64_t& out) const;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::uint64_t size_{0};
};

// Fills `out` completely from `src` at `offset`; fails on short read.
Result ReadExactAt(IByteSource& src, std::uint64_t offset, std::span<std::uint8_t> out);

// Whole-file read for small payloads (thumbnails).
Result ReadWholeFile(const std::string& path, std::vector<std::uint8_t>& out);

} // namespace uplink
