#ifdef TS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string_view>

namespace TS {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto readTagList(const char* variable, std::set<std::string>& into) -> void {
    const char* raw = std::getenv(variable);
    if (raw == nullptr)
        return;
    std::string_view list{raw};
    while (!list.empty()) {
        auto comma = list.find(',');
        auto token = trim(list.substr(0, comma));
        if (!token.empty())
            into.emplace(token);
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
}

// nullopt when unset; false for "", "0", "off" and "false" in any case.
auto readSwitch(const char* variable) -> std::optional<bool> {
    const char* raw = std::getenv(variable);
    if (raw == nullptr)
        return std::nullopt;
    std::string value(trim(raw));
    std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(value.empty() || value == "0" || value == "off" || value == "false");
}

auto enabledFromEnvironment() -> bool {
    if (auto explicitSwitch = readSwitch("TONESTYLE_LOG_ENABLED"))
        return *explicitSwitch;
    return readSwitch("TONESTYLE_LOG").value_or(false);
}

} // namespace

auto LogFilter::fromEnvironment() -> LogFilter {
    LogFilter filter;
    if (readSwitch("TONESTYLE_LOG_CLEAR_DEFAULT_SKIPS").value_or(false))
        filter.skipTags.clear();
    readTagList("TONESTYLE_LOG_SKIP_TAGS", filter.skipTags);
    readTagList("TONESTYLE_LOG_ENABLE_TAGS", filter.enableTags);
    return filter;
}

auto LogFilter::accepts(const std::vector<std::string>& tags) const -> bool {
    return std::ranges::none_of(tags, [this](const std::string& tag) {
        return this->skipTags.contains(tag) || (!this->enableTags.empty() && !this->enableTags.contains(tag));
    });
}

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : filter(LogFilter::fromEnvironment()), enabled(enabledFromEnvironment()) {
    this->worker = std::thread([this] { this->drain(); });
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->stopping = true;
    }
    this->pendingCv.notify_one();
    if (this->worker.joinable())
        this->worker.join();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadLabelsMutex);
    this->threadLabels[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool on) -> void {
    this->enabled.store(on, std::memory_order_relaxed);
}

auto TaggedLogger::enqueue(Entry entry) -> void {
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->pending.push_back(std::move(entry));
    }
    this->pendingCv.notify_one();
}

auto TaggedLogger::drain() -> void {
    std::unique_lock<std::mutex> lock(this->pendingMutex);
    while (true) {
        this->pendingCv.wait(lock, [this] { return this->stopping || !this->pending.empty(); });
        if (this->pending.empty())
            return;

        std::deque<Entry> batch;
        batch.swap(this->pending);
        lock.unlock();
        for (const auto& entry : batch) {
            auto line = format(entry);
            std::lock_guard<std::mutex> out(coutMutex);
            std::cerr << line << std::flush;
        }
        lock.lock();
    }
}

auto TaggedLogger::threadLabel() -> std::string {
    std::lock_guard<std::mutex> lock(this->threadLabelsMutex);
    auto [it, inserted] = this->threadLabels.try_emplace(std::this_thread::get_id());
    if (inserted)
        it->second = "Thread " + std::to_string(this->unnamedThreads++);
    return it->second;
}

auto TaggedLogger::format(const Entry& entry) -> std::string {
    const auto seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    const auto millis  = std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    line << '[';
    for (size_t i = 0; i < entry.tags.size(); ++i)
        line << (i == 0 ? "" : "][") << entry.tags[i];
    line << "] [" << entry.thread << "] " << shortPath(entry.where.file_name()) << ':' << entry.where.line() << ' ' << entry.text
         << '\n';
    return line.str();
}

auto TaggedLogger::shortPath(const char* filepath) -> std::string {
    std::filesystem::path path(filepath);
    auto                  parent = path.parent_path().filename();
    return parent.empty() ? path.filename().string() : (parent / path.filename()).string();
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace TS
#endif // TS_LOG_DEBUG
