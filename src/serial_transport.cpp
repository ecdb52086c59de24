#include "serial_transport.hpp"
#include "glove_errors.hpp"
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>
#include <string.h>
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

SerialTransport::SerialTransport(const std::string &devicePath, int baudRate,
                                 std::chrono::milliseconds writeTimeout)
    : fd(-1), path(devicePath), baud(baudRate), writeTimeout(writeTimeout) {}

SerialTransport::~SerialTransport()
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

static speed_t baudToFlag(int baud)
{
    switch (baud)
    {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    default:
        std::cerr << "WARN: unsupported baud " << baud << ", using 115200\n";
        return B115200;
    }
}

static std::string errnoText(const std::string &what, const std::string &path)
{
    return what + "(" + path + ") failed: " + strerror(errno);
}

void SerialTransport::configurePort()
{
    struct termios tio;
    if (tcgetattr(fd, &tio) != 0)
        throw IoFailureError(errnoText("tcgetattr", path));

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS; // no HW flow
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;
    tio.c_cc[VMIN] = 0;   // non-blocking read, timeouts handled with poll()
    tio.c_cc[VTIME] = 0;

    speed_t sp = baudToFlag(baud);
    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    if (tcsetattr(fd, TCSANOW, &tio) != 0)
        throw IoFailureError(errnoText("tcsetattr", path));
}

void SerialTransport::open()
{
    if (fd >= 0) return;
    fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0)
        throw IoFailureError(errnoText("open", path));
    try
    {
        configurePort();
    }
    catch (const IoFailureError &)
    {
        ::close(fd);
        fd = -1;
        throw;
    }
}

void SerialTransport::close()
{
    if (fd >= 0)
    {
        int rc = ::close(fd);
        fd = -1;
        if (rc != 0 && errno != EINTR)
            throw IoFailureError(errnoText("close", path));
    }
}

bool SerialTransport::isOpen() const
{
    return fd >= 0;
}

void SerialTransport::flush(int queue)
{
    if (fd < 0)
        throw IoFailureError("flush on closed port " + path);
    if (tcflush(fd, queue) != 0)
        throw IoFailureError(errnoText("tcflush", path));
}

void SerialTransport::discardBuffers()
{
    flush(TCIOFLUSH);
}

void SerialTransport::discardInput()
{
    flush(TCIFLUSH);
}

// Errors that mean the device is gone rather than momentarily busy.
static bool isTransient(int err)
{
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

size_t SerialTransport::write(const std::vector<uint8_t> &bytes)
{
    if (fd < 0)
        throw IoFailureError("write on closed port " + path);
    if (bytes.empty()) return 0;

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int ready = ::poll(&pfd, 1, static_cast<int>(writeTimeout.count()));
    if (ready < 0)
    {
        if (isTransient(errno)) return 0;
        throw IoFailureError(errnoText("poll", path));
    }
    if (ready == 0) return 0; // write timeout
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        throw IoFailureError("device " + path + " disconnected");

    ssize_t n = ::write(fd, bytes.data(), bytes.size());
    if (n < 0)
    {
        if (isTransient(errno)) return 0;
        throw IoFailureError(errnoText("write", path));
    }
    return static_cast<size_t>(n);
}

std::vector<uint8_t> SerialTransport::read(size_t maxBytes, std::chrono::milliseconds timeout)
{
    if (fd < 0)
        throw IoFailureError("read on closed port " + path);

    std::vector<uint8_t> out;
    out.reserve(maxBytes);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    uint8_t buf[256];

    while (out.size() < maxBytes)
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() < 0) break;

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready < 0)
        {
            if (isTransient(errno)) continue;
            throw IoFailureError(errnoText("poll", path));
        }
        if (ready == 0) break; // timed out, return what we have
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
            throw IoFailureError("device " + path + " disconnected");

        size_t want = std::min(sizeof(buf), maxBytes - out.size());
        ssize_t n = ::read(fd, buf, want);
        if (n < 0)
        {
            if (isTransient(errno)) continue;
            throw IoFailureError(errnoText("read", path));
        }
        if (n == 0)
            throw IoFailureError("device " + path + " disconnected");
        out.insert(out.end(), buf, buf + n);
    }
    return out;
}

// ========== Port enumeration ==========
std::vector<std::string> listSerialPorts(const std::string &devDir)
{
    static const char *prefixes[] = {"ttyUSB", "ttyACM", "ttyS", "rfcomm"};
    std::vector<std::string> ports;
    std::error_code ec;
    fs::directory_iterator it(devDir, ec);
    if (ec)
        return ports;
    for (const auto &entry : it)
    {
        std::string name = entry.path().filename().string();
        for (const char *p : prefixes)
        {
            if (name.rfind(p, 0) == 0)
            {
                ports.push_back(entry.path().string());
                break;
            }
        }
    }
    // USB adapters first, then by name
    std::sort(ports.begin(), ports.end(), [](const std::string &a, const std::string &b)
              {
        auto rank = [](const std::string &p) {
            std::string n = fs::path(p).filename().string();
            for (int i = 0; i < 4; ++i)
                if (n.rfind(prefixes[i], 0) == 0) return i;
            return 4;
        };
        int ra = rank(a), rb = rank(b);
        return ra != rb ? ra < rb : a < b; });
    return ports;
}

std::string resolvePort(const std::string &requested, const std::string &devDir)
{
    if (!requested.empty())
        return requested;
    auto ports = listSerialPorts(devDir);
    if (ports.empty())
        throw NoPortAvailableError("No serial ports found in " + devDir);
    return ports.front();
}
