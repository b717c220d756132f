#pragma once

#include "uplink/progress.hpp"

#include <string>
#include <vector>

namespace uplink {

// Rewrites `path` atomically with a small JSON status object on every event.
class FileProgressSink final : public IProgress {
public:
    explicit FileProgressSink(std::string path);

    void OnProgress(const ProgressEvent& e) override;

private:
    std::string path_;
};

// Single self-overwriting stderr line: "[upload]  42% | 10.5/25.0 MiB | 3.1 MiB/s".
class ConsoleProgressSink final : public IProgress {
public:
    ConsoleProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;

private:
    bool finished_ = false;
};

// Forwards every event to each sink in order. Sinks are not owned.
class FanoutProgress final : public IProgress {
public:
    explicit FanoutProgress(std::vector<IProgress*> sinks) : sinks_(std::move(sinks)) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::vector<IProgress*> sinks_;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace uplink
