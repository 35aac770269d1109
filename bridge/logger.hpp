// bridge/logger.hpp
#pragma once
#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <atomic>

#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define BLUE    "\033[34m"
#define CYAN    "\033[36m"
#define BOLD    "\033[1m"

// The MQTT client logs from its own thread, so every line is written
// under a single mutex.
class Logger {
private:
    static std::mutex output_mutex;
    static std::atomic<bool> verbose;

    static void write(std::ostream& out, const char* color, const char* level, const std::string& msg);

public:
    static std::string timestamp();
    static void set_verbose(bool enabled);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void success(const std::string& msg);
    static void warning(const std::string& msg);
    static void error(const std::string& msg);
    static void flush();
};
