#pragma once

#include <cstdint>
#include <span>
#include <sys/types.h>

namespace uplink {

// Random-access, read-only view of an upload payload.
class IByteSource {
public:
    virtual ~IByteSource() = default;

    // Reads up to out.size() bytes starting at `offset`. Returns the number of
    // bytes read, 0 at end of data, -1 on error.
    virtual ssize_t ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) = 0;

    virtual std::uint64_t Size() const = 0;
};

} // namespace uplink
