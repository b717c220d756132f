#pragma once

#include <cstdint>
#include <optional>

namespace uplink {

// Half-open byte range [offset, offset + length).
struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    std::uint64_t End() const { return offset + length; }
    bool operator==(const ByteRange&) const = default;
};

// Ordered, restartable sequence of ranges covering [0, total) exactly once.
// A zero total yields one empty range.
class ByteRangeChunker {
public:
    ByteRangeChunker(std::uint64_t total, std::uint64_t chunk_size);

    std::optional<ByteRange> Next();

    // Next range starts at `confirmed` (clamped to total).
    void Seek(std::uint64_t confirmed);
    void Reset() { Seek(0); }

    bool Done() const;
    std::uint64_t Position() const { return next_; }
    std::uint64_t Total() const { return total_; }
    std::uint64_t ChunkSize() const { return chunk_size_; }

private:
    std::uint64_t total_;
    std::uint64_t chunk_size_;
    std::uint64_t next_ = 0;
    bool empty_emitted_ = false;
};

} // namespace uplink
