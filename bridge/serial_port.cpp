#include "serial_port.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>

namespace {

bool lookup_speed(int baud_rate, speed_t& speed) {
    switch (baud_rate) {
        case 9600:   speed = B9600;   return true;
        case 19200:  speed = B19200;  return true;
        case 38400:  speed = B38400;  return true;
        case 57600:  speed = B57600;  return true;
        case 115200: speed = B115200; return true;
        default:     return false;
    }
}

}

SerialPort::~SerialPort() {
    close();
}

bool SerialPort::open(const std::string& device, int baud_rate) {
    close();

    speed_t speed = 0;
    if (!lookup_speed(baud_rate, speed)) {
        Logger::error("Unsupported baud rate " + std::to_string(baud_rate) + " for " + device);
        return false;
    }

    int new_fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (new_fd == -1) {
        Logger::error("Cannot open " + device + ": " + std::strerror(errno));
        return false;
    }

    // Another bridge holding the same meter would interleave responses.
    if (flock(new_fd, LOCK_EX | LOCK_NB) == -1) {
        Logger::error(device + " is locked by another process");
        ::close(new_fd);
        return false;
    }

    struct termios tios{};
    if (cfsetispeed(&tios, speed) < 0 || cfsetospeed(&tios, speed) < 0) {
        Logger::error("Cannot set speed on " + device + ": " + std::strerror(errno));
        ::close(new_fd);
        return false;
    }

    tios.c_cflag |= (CREAD | CLOCAL);
    tios.c_cflag &= ~CSIZE;
    tios.c_cflag |= CS8;
    tios.c_cflag &= ~CSTOPB;
    tios.c_cflag &= ~PARENB;
    tios.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
    tios.c_iflag &= ~(INPCK | IXON | IXOFF | IXANY);
    tios.c_oflag &= ~OPOST;
    tios.c_cc[VMIN] = 0;
    tios.c_cc[VTIME] = 0;

    if (tcsetattr(new_fd, TCSANOW, &tios) < 0) {
        Logger::error("Cannot configure " + device + ": " + std::strerror(errno));
        ::close(new_fd);
        return false;
    }
    tcflush(new_fd, TCIOFLUSH);

    fd = new_fd;
    path = device;
    Logger::debug("Opened " + device + " at " + std::to_string(baud_rate) + " baud");
    return true;
}

void SerialPort::close() {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
        Logger::debug("Closed " + path);
    }
}

bool SerialPort::write_all(const std::string& data) {
    if (fd == -1) return false;

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                fd_set writefds;
                FD_ZERO(&writefds);
                FD_SET(fd, &writefds);
                struct timeval tv{1, 0};
                if (select(fd + 1, nullptr, &writefds, nullptr, &tv) <= 0) {
                    Logger::warning("Timed out writing to " + path);
                    return false;
                }
                continue;
            }
            Logger::error("Write to " + path + " failed: " + std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

ssize_t SerialPort::read_some(std::string& out, std::chrono::milliseconds timeout) {
    if (fd == -1) return -1;

    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd, &readfds);

    auto ms = std::max<long long>(0, timeout.count());
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);

    int activity = select(fd + 1, &readfds, nullptr, nullptr, &tv);
    if (activity < 0) {
        if (errno == EINTR) return 0;
        Logger::error("select() on " + path + " failed: " + std::strerror(errno));
        return -1;
    }
    if (activity == 0) return 0;

    char buf[1024];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
        Logger::error("Read from " + path + " failed: " + std::strerror(errno));
        return -1;
    }
    if (n == 0) {
        // A readable tty that yields nothing has been unplugged.
        Logger::warning(path + " reported end of file");
        return -1;
    }
    out.append(buf, static_cast<size_t>(n));
    return n;
}
