#include "uplink/byte_range_chunker.hpp"

#include <algorithm>
#include <stdexcept>

namespace uplink {

ByteRangeChunker::ByteRangeChunker(std::uint64_t total, std::uint64_t chunk_size)
    : total_(total), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

std::optional<ByteRange> ByteRangeChunker::Next() {
    if (total_ == 0) {
        if (empty_emitted_) return std::nullopt;
        empty_emitted_ = true;
        return ByteRange{0, 0};
    }
    if (next_ >= total_) return std::nullopt;

    ByteRange r{next_, std::min(chunk_size_, total_ - next_)};
    next_ = r.End();
    return r;
}

void ByteRangeChunker::Seek(std::uint64_t confirmed) {
    next_ = std::min(confirmed, total_);
    empty_emitted_ = false;
}

bool ByteRangeChunker::Done() const {
    return total_ == 0 ? empty_emitted_ : next_ >= total_;
}

} // namespace uplink
