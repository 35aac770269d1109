// bridge/serial_port.hpp
#pragma once
#include <chrono>
#include <string>
#include <sys/types.h>

// Raw 8N1 tty opened non-blocking. Reads wait with select() so callers can
// bound how long a request may take.
class SerialPort {
private:
    int fd{-1};
    std::string path;

public:
    SerialPort() = default;
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bool open(const std::string& device, int baud_rate);
    void close();
    bool is_open() const { return fd != -1; }

    bool write_all(const std::string& data);
    // Returns bytes appended to out, 0 on timeout, -1 when the tty failed.
    ssize_t read_some(std::string& out, std::chrono::milliseconds timeout);
};
