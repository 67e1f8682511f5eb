#include "logging/Log.h"

#include "core/LogUtils.h"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace {

namespace fs = std::filesystem;

constexpr std::size_t kMessageBufferSize = 2048;

std::atomic<config::LogLevel> gLevel{config::LogLevel::Info};

struct Line {
    config::LogLevel level{};
    logging::LogCategory category{};
    std::chrono::system_clock::time_point timestamp{};
    std::string text;
};

std::string render(const Line& line) {
    using namespace std::chrono;
    const auto sinceEpoch = duration_cast<milliseconds>(line.timestamp.time_since_epoch()).count();
    const std::time_t seconds = static_cast<std::time_t>(sinceEpoch / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char prefix[64];
    std::snprintf(prefix, sizeof(prefix), "%02d:%02d:%02d.%03d %s %s ", utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(sinceEpoch % 1000), config::toString(line.level),
                  logging::Log::category_to_string(line.category));
    std::string out(prefix);
    out += line.text;
    return out;
}

void writeStream(FILE* stream, const std::string& text) {
    std::fwrite(text.data(), 1, text.size(), stream);
    std::fputc('\n', stream);
    std::fflush(stream);
}

// Owns the queue, the drain thread and the rotating debug file.
class Backend {
public:
    static Backend& instance() {
        static Backend backend;
        return backend;
    }

    ~Backend() { stop(); }

    void configure(const logging::LogOptions& options) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            capacity_ = options.queueCapacity == 0 ? 1 : options.queueCapacity;
        }
        std::lock_guard<std::mutex> lock(sinkMutex_);
        if (options.debugFile != sink_.debugFile) {
            closeDebugUnlocked_();
        }
        sink_ = options;
        applyLevelUnlocked_(options.level);
    }

    void applyLevel(config::LogLevel level) {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        sink_.level = level;
        applyLevelUnlocked_(level);
    }

    bool submit(Line&& line) {
        startOnce_();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(line));
        }
        work_.notify_one();
        return true;
    }

    void write(const Line& line) {
        const std::string text = render(line);
        switch (line.level) {
        case config::LogLevel::Error:
        case config::LogLevel::Warn:
            writeStream(stderr, text);
            break;
        case config::LogLevel::Info:
            writeStream(stdout, text);
            break;
        case config::LogLevel::Debug:
        case config::LogLevel::Trace:
            if (!writeDebug_(text)) {
                writeStream(stdout, text);
            }
            break;
        }
        written_.fetch_add(1, std::memory_order_relaxed);
    }

    void flush() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        idle_.wait(lock, [&] { return stopping_ || (queue_.empty() && !writing_); });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        work_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        std::lock_guard<std::mutex> lock(sinkMutex_);
        closeDebugUnlocked_();
    }

    void countDropped() { dropped_.fetch_add(1, std::memory_order_relaxed); }
    void countSuppressed(std::size_t n) { suppressed_.fetch_add(n, std::memory_order_relaxed); }

    logging::LogStats stats() const {
        logging::LogStats out;
        out.written = written_.load(std::memory_order_relaxed);
        out.dropped = dropped_.load(std::memory_order_relaxed);
        out.suppressed = suppressed_.load(std::memory_order_relaxed);
        out.rotations = rotations_.load(std::memory_order_relaxed);
        return out;
    }

    core::RateLogger& throttle() { return throttle_; }

private:
    Backend() = default;

    static void stopAtExit_() { instance().stop(); }

    void startOnce_() {
        std::call_once(started_, [this] {
            worker_ = std::thread([this] { drain_(); });
            // Registered after construction, so it runs before the destructor of this static.
            std::atexit(&Backend::stopAtExit_);
        });
    }

    void drain_() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            work_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;  // stopping with nothing left
            }
            Line line = std::move(queue_.front());
            queue_.pop_front();
            writing_ = true;
            lock.unlock();

            write(line);

            lock.lock();
            writing_ = false;
            if (queue_.empty()) {
                idle_.notify_all();
            }
        }
        idle_.notify_all();
    }

    void applyLevelUnlocked_(config::LogLevel level) {
        debugEnabled_ = config::isEnabled(config::LogLevel::Debug, level) && !sink_.debugFile.empty();
        if (!debugEnabled_) {
            closeDebugUnlocked_();
        }
    }

    bool writeDebug_(const std::string& text) {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        if (!debugEnabled_) {
            return false;
        }
        if (!debug_.is_open() && !openDebugUnlocked_()) {
            return false;
        }
        const std::size_t bytes = text.size() + 1;
        if (debugSize_ + bytes > sink_.debugFileMaxBytes) {
            rotateDebugUnlocked_();
            if (!openDebugUnlocked_()) {
                return false;
            }
        }
        debug_ << text << '\n';
        debug_.flush();
        debugSize_ += bytes;
        return true;
    }

    bool openDebugUnlocked_() {
        std::error_code ec;
        if (sink_.debugFile.has_parent_path()) {
            fs::create_directories(sink_.debugFile.parent_path(), ec);
        }
        debug_.open(sink_.debugFile, std::ios::out | std::ios::app);
        if (!debug_) {
            debugSize_ = 0;
            return false;
        }
        const auto size = fs::file_size(sink_.debugFile, ec);
        debugSize_ = ec ? 0 : static_cast<std::size_t>(size);
        return true;
    }

    // Keeps one previous generation as <file>.1.
    void rotateDebugUnlocked_() {
        closeDebugUnlocked_();
        std::error_code ec;
        fs::path previous = sink_.debugFile;
        previous += ".1";
        fs::remove(previous, ec);
        fs::rename(sink_.debugFile, previous, ec);
        if (!ec) {
            rotations_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void closeDebugUnlocked_() {
        if (debug_.is_open()) {
            debug_.flush();
            debug_.close();
        }
        debugSize_ = 0;
    }

    std::mutex mutex_;
    std::condition_variable work_;
    std::condition_variable idle_;
    std::deque<Line> queue_;
    std::size_t capacity_ = logging::LogOptions{}.queueCapacity;
    bool stopping_ = false;
    bool writing_ = false;
    std::once_flag started_;
    std::thread worker_;

    std::mutex sinkMutex_;
    logging::LogOptions sink_;
    std::ofstream debug_;
    std::size_t debugSize_ = 0;
    bool debugEnabled_ = false;

    core::RateLogger throttle_;

    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> suppressed_{0};
    std::atomic<std::uint64_t> rotations_{0};
};

}  // namespace

namespace logging {

void Log::configure(const LogOptions& options) {
    gLevel.store(options.level, std::memory_order_relaxed);
    Backend::instance().configure(options);
}

void Log::set_log_level(config::LogLevel level) {
    gLevel.store(level, std::memory_order_relaxed);
    Backend::instance().applyLevel(level);
}

config::LogLevel Log::get_log_level() {
    return gLevel.load(std::memory_order_relaxed);
}

bool Log::enabled(config::LogLevel level) {
    return config::isEnabled(level, gLevel.load(std::memory_order_relaxed));
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET:
        return "NET";
    case LogCategory::DATA:
        return "DATA";
    case LogCategory::CURSOR:
        return "CURSOR";
    case LogCategory::STORAGE:
        return "STORAGE";
    case LogCategory::INTEGRITY:
        return "INTEGRITY";
    case LogCategory::APP:
        return "APP";
    }
    return "UNKNOWN";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::log_every(const char* key, long long intervalMs, config::LogLevel level, LogCategory category,
                    const char* fmt, ...) {
    if (!enabled(level)) {
        return;
    }
    auto& backend = Backend::instance();
    if (!backend.throttle().allow(key, std::chrono::milliseconds(intervalMs))) {
        backend.countSuppressed(1);
        return;
    }
    const std::size_t skipped = backend.throttle().takeSuppressed(key);

    std::array<char, kMessageBufferSize> buffer{};
    std::va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    if (skipped > 0U) {
        log(level, category, "%s (+%zu similar suppressed)", buffer.data(), skipped);
    } else {
        log(level, category, "%s", buffer.data());
    }
}

void Log::flush() {
    Backend::instance().flush();
}

LogStats Log::stats() {
    return Backend::instance().stats();
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (!enabled(level)) {
        return;
    }

    std::array<char, kMessageBufferSize> buffer{};
    const int written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    if (written < 0) {
        std::snprintf(buffer.data(), buffer.size(), "<format-error>");
    } else if (static_cast<std::size_t>(written) >= buffer.size()) {
        // Mark the cut.
        buffer[buffer.size() - 4] = '.';
        buffer[buffer.size() - 3] = '.';
        buffer[buffer.size() - 2] = '.';
    }

    Line line{level, category, std::chrono::system_clock::now(), std::string(buffer.data())};
    auto& backend = Backend::instance();
    if (level == config::LogLevel::Error || level == config::LogLevel::Warn) {
        Line copy = line;
        if (!backend.submit(std::move(copy))) {
            backend.write(line);
        }
        return;
    }
    if (!backend.submit(std::move(line))) {
        backend.countDropped();
    }
}

}  // namespace logging
