#ifdef TS_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace TS {

/*
 * Tag rules applied before a message is queued. A message passes when none of
 * its tags is skipped and, if an allow list is present, all of them are on it.
 */
struct LogFilter {
    std::set<std::string> skipTags{"INFO", "ColorParse"};
    std::set<std::string> enableTags;

    /*
     * Reads TONESTYLE_LOG_CLEAR_DEFAULT_SKIPS, TONESTYLE_LOG_SKIP_TAGS and
     * TONESTYLE_LOG_ENABLE_TAGS (comma separated, entries trimmed).
     */
    static auto fromEnvironment() -> LogFilter;

    auto accepts(const std::vector<std::string>& tags) const -> bool;
};

/*
 * Asynchronous tagged logger. Messages are queued by the caller and written to
 * stderr by a worker thread as
 *   `2026-01-01 12:00:00.000 [Tag][Tag] [Thread] dir/File.cpp:42 message`.
 * Output is off unless TONESTYLE_LOG_ENABLED or TONESTYLE_LOG is set to
 * something other than "0", "off" or "false". Destruction drains the queue.
 */
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::vector<std::string>              tags;
        std::string                           text;
        std::string                           thread;
        std::source_location                  where;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;

    // Held while a line is written to stderr.
    static std::mutex coutMutex;

private:
    auto enqueue(Entry entry) -> void;
    auto drain() -> void;
    auto threadLabel() -> std::string;

    static auto format(const Entry& entry) -> std::string;
    static auto shortPath(const char* filepath) -> std::string;

    const LogFilter   filter;
    std::atomic<bool> enabled;
    std::atomic<int>  unnamedThreads{0};

    std::deque<Entry>       pending;
    std::mutex              pendingMutex;
    std::condition_variable pendingCv;
    bool                    stopping = false;

    std::unordered_map<std::thread::id, std::string> threadLabels;
    std::mutex                                       threadLabelsMutex;

    std::thread worker;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;

    std::vector<std::string> tagList{std::string(std::forward<Tags>(tags))...};
    if (!this->filter.accepts(tagList))
        return;

    this->enqueue(Entry{.timestamp = std::chrono::system_clock::now(),
                        .tags      = std::move(tagList),
                        .text      = message,
                        .thread    = this->threadLabel(),
                        .where     = location});
}

#define ts_log(message, ...) ::TS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace TS

#else
#define ts_log(message, ...) ((void)0)
#endif // TS_LOG_DEBUG
