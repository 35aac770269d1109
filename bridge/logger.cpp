#include "logger.hpp"
#include <ctime>

std::mutex Logger::output_mutex;
std::atomic<bool> Logger::verbose{true};

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::set_verbose(bool enabled) {
    verbose.store(enabled);
}

void Logger::write(std::ostream& out, const char* color, const char* level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex);
    out << color << "[" << timestamp() << "] [" << level << "]" RESET " " << msg << std::endl;
}

void Logger::debug(const std::string& msg) {
    if (!verbose.load()) return;
    write(std::cout, BLUE, "DEBUG", msg);
}

void Logger::info(const std::string& msg) {
    write(std::cout, CYAN, "INFO", msg);
}

void Logger::success(const std::string& msg) {
    write(std::cout, GREEN, "OK", msg);
}

void Logger::warning(const std::string& msg) {
    write(std::cerr, YELLOW, "WARN", msg);
}

void Logger::error(const std::string& msg) {
    write(std::cerr, RED BOLD, "ERROR", msg);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout.flush();
    std::cerr.flush();
}
