#include "mediaxfer/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace mediaxfer {

namespace {
std::atomic<bool> g_verbose{false};
std::atomic<bool> g_info_to_stderr{false};

// Guards g_log_file and every write, so a swap never closes a stream that
// another thread is writing to
std::mutex g_log_mutex;
FILE* g_log_file = nullptr;

FILE* info_stream() {
    if (g_log_file) return g_log_file;
    return g_info_to_stderr.load(std::memory_order_relaxed) ? stderr : stdout;
}

FILE* error_stream() {
    return g_log_file ? g_log_file : stderr;
}

void write_line(FILE* out, const char* prefix, const char* fmt, va_list args, bool flush) {
    if (prefix) fputs(prefix, out);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    if (flush) fflush(out);
}
}  // namespace

void set_log_verbose(bool verbose) { g_verbose = verbose; }
bool log_verbose() { return g_verbose.load(); }

void set_log_to_stderr(bool enabled) { g_info_to_stderr = enabled; }

bool set_log_file(const std::string& path) {
    FILE* f = nullptr;
    if (!path.empty()) {
        f = fopen(path.c_str(), "a");
        if (!f) return false;
        // Line-buffered so a crash loses at most the current line
        setvbuf(f, nullptr, _IOLBF, 0);
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = f;
    return true;
}

void log_info(const char* fmt, ...) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    write_line(info_stream(), nullptr, fmt, args, true);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    write_line(error_stream(), "WARN: ", fmt, args, false);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    write_line(error_stream(), "ERROR: ", fmt, args, false);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!g_verbose.load(std::memory_order_relaxed)) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    va_list args;
    va_start(args, fmt);
    write_line(info_stream(), nullptr, fmt, args, true);
    va_end(args);
}

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&time, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03lldZ", date, static_cast<long long>(millis));
    return out;
}

}  // namespace mediaxfer
