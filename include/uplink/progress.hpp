#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace uplink {

struct ProgressEvent {
    std::uint64_t bytes_confirmed = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};
};

// Called synchronously on the upload thread after every response that
// confirmed bytes. Anything thrown from OnProgress is logged and dropped.
class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

class CallbackProgress final : public IProgress {
  public:
    using Fn = std::function<void(std::uint64_t, std::uint64_t, std::chrono::milliseconds)>;

    explicit CallbackProgress(Fn fn) : fn_(std::move(fn)) {}

    void OnProgress(const ProgressEvent& e) override {
        if (fn_) fn_(e.bytes_confirmed, e.total_bytes, e.elapsed);
    }

  private:
    Fn fn_;
};

} // namespace uplink
