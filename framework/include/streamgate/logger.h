#ifndef STREAMGATE_LOGGER_H
#define STREAMGATE_LOGGER_H

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>

namespace streamgate {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

LogLevel parse_log_level(std::string_view name);

/**
 * @brief Asynchronous line logger.
 *
 * Producers only push onto a queue; a single worker thread formats and writes.
 * Owned by the App and handed out by reference.
 */
class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Selects the sink: "stdout" (or empty), "/dev/null" to disable,
     * anything else is a file opened in append mode.
     */
    void configure(const std::string& path);
    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
    void info(std::string_view message) { log(LogLevel::INFO, message); }
    void warn(std::string_view message) { log(LogLevel::WARN, message); }
    void log_error(std::string_view message) { log(LogLevel::ERROR, message); }

    void log_access(std::string_view client_ip,
                    std::string_view method,
                    std::string_view path,
                    int status_code,
                    long long response_time_ms,
                    std::string_view request_id = {});

    void log_circuit_breaker(std::string_view service, std::string_view from, std::string_view to);
    void log_service_health(std::string_view service, std::string_view url, bool healthy,
                            long long response_time_ms, std::string_view error = {});
    void log_rate_limit(std::string_view policy, std::string_view key, long limit);
    void log_proxy_error(std::string_view service, std::string_view target, std::string_view error);

private:
    static std::string get_timestamp();
    void process_queue();
    void push(std::string line);

    std::ofstream file_stream_;
    std::atomic<bool> use_stdout_{true};
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{true};
};

} // namespace streamgate

#endif // STREAMGATE_LOGGER_H
