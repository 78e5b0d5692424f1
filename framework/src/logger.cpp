#include <streamgate/logger.h>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace streamgate {

LogLevel parse_log_level(std::string_view name) {
    if (name == "debug" || name == "DEBUG") return LogLevel::DEBUG;
    if (name == "warn" || name == "WARN" || name == "warning") return LogLevel::WARN;
    if (name == "error" || name == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger::Logger() {
    worker_ = std::thread(&Logger::process_queue, this);
}

Logger::~Logger() {
    running_ = false;
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string Logger::get_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto now_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};

    localtime_r(&now_time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::process_queue() {
    while (running_ || !queue_.empty()) {
        std::string msg;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (queue_.empty() && !running_) {
                break;
            }

            msg = std::move(queue_.front());
            queue_.pop();
        }

        std::stringstream output;
        output << "[" << get_timestamp() << "] " << msg << "\n";
        std::string out_str = output.str();
        const bool is_error = msg.starts_with("ERROR");

        if (use_stdout_) {
            if (is_error) {
                std::cerr << out_str;
            } else {
                std::cout << out_str;
            }
        } else if (file_stream_.is_open()) {
            file_stream_ << out_str;
            if (is_error) {
                file_stream_.flush();
            }
        }
    }
}

void Logger::configure(const std::string& path) {
    if (path == "/dev/null") {
        enabled_ = false;
        return;
    }

    enabled_ = true;

    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (path == "stdout" || path.empty()) {
        use_stdout_ = true;
        return;
    }

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    if (file_stream_.is_open()) file_stream_.close();
    file_stream_.open(path, std::ios::out | std::ios::app);
    use_stdout_ = !file_stream_.is_open();
}

void Logger::push(std::string line) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(line));
    }
    cv_.notify_one();
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!enabled_ || level < level_) return;

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::INFO:  level_str = "INFO";  break;
        case LogLevel::WARN:  level_str = "WARN";  break;
        case LogLevel::ERROR: level_str = "ERROR"; break;
    }

    push(level_str + ": " + std::string(message));
}

void Logger::log_access(std::string_view client_ip,
                        std::string_view method,
                        std::string_view path,
                        int status_code,
                        long long response_time_ms,
                        std::string_view request_id) {
    if (!enabled_ || LogLevel::INFO < level_) return;

    std::stringstream ss;
    ss << "ACCESS: " << client_ip << " " << method << " " << path << " "
       << status_code << " " << response_time_ms << "ms";
    if (!request_id.empty()) {
        ss << " rid=" << request_id;
    }
    push(ss.str());
}

void Logger::log_circuit_breaker(std::string_view service, std::string_view from, std::string_view to) {
    std::stringstream ss;
    ss << "circuit breaker " << service << " " << from << " -> " << to;
    log(to == "OPEN" ? LogLevel::WARN : LogLevel::INFO, ss.str());
}

void Logger::log_service_health(std::string_view service, std::string_view url, bool healthy,
                                long long response_time_ms, std::string_view error) {
    std::stringstream ss;
    ss << "health " << service << " " << url << " "
       << (healthy ? "healthy" : "unhealthy") << " " << response_time_ms << "ms";
    if (!error.empty()) {
        ss << " (" << error << ")";
    }
    log(healthy ? LogLevel::DEBUG : LogLevel::WARN, ss.str());
}

void Logger::log_rate_limit(std::string_view policy, std::string_view key, long limit) {
    std::stringstream ss;
    ss << "rate limit exceeded policy=" << policy << " key=" << key << " limit=" << limit;
    log(LogLevel::WARN, ss.str());
}

void Logger::log_proxy_error(std::string_view service, std::string_view target, std::string_view error) {
    std::stringstream ss;
    ss << "proxy error " << service << " " << target << ": " << error;
    log(LogLevel::ERROR, ss.str());
}

} // namespace streamgate
