#include "uplink/progress_sinks.hpp"

#include <cstdio>
#include <fstream>
#include <string>

namespace uplink {

namespace {
bool g_progress_line_active = false;

int Percent(const ProgressEvent& e) {
    if (e.total_bytes == 0) return 100;
    int pct = static_cast<int>((e.bytes_confirmed * 100ULL) / e.total_bytes);
    if (pct > 100)
        pct = 100;
    return pct;
}

double MiB(std::uint64_t n) { return static_cast<double>(n) / (1024.0 * 1024.0); }

double RateMiBps(const ProgressEvent& e) {
    const double sec = std::chrono::duration<double>(e.elapsed).count();
    if (sec <= 0.0) return 0.0;
    return MiB(e.bytes_confirmed) / sec;
}
} // namespace

FileProgressSink::FileProgressSink(std::string path) : path_(std::move(path)) {}

void FileProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string tmp_path = path_ + ".tmp";
    std::ofstream os(tmp_path, std::ios::trunc);
    if (!os.good())
        return;

    os << "{"
       << "\"bytes_confirmed\":" << e.bytes_confirmed << ","
       << "\"total_bytes\":" << e.total_bytes << ","
       << "\"percent\":" << Percent(e) << ","
       << "\"elapsed_ms\":" << e.elapsed.count() << "}";
    os.close();

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0)
        std::remove(tmp_path.c_str());
}

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (finished_) return;

    std::fprintf(stderr,
                 "\r[upload] %3d%% | %.1f/%.1f MiB | %.1f MiB/s",
                 Percent(e),
                 MiB(e.bytes_confirmed),
                 MiB(e.total_bytes),
                 RateMiBps(e));
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.bytes_confirmed >= e.total_bytes) {
        std::fprintf(stderr, "\n");
        finished_ = true;
        g_progress_line_active = false;
    }
}

void FanoutProgress::OnProgress(const ProgressEvent& e) {
    for (IProgress* s : sinks_) {
        if (s) s->OnProgress(e);
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

} // namespace uplink
