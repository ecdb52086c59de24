#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "byte_transport.hpp"

// Simple POSIX serial transport (USB adapter or Bluetooth RFCOMM).
// Open with a device path like /dev/ttyUSB0, /dev/ttyS0 or /dev/rfcomm0
class SerialTransport : public ByteTransport
{
public:
    SerialTransport(const std::string &devicePath, int baudRate,
                    std::chrono::milliseconds writeTimeout = std::chrono::milliseconds(1000));
    ~SerialTransport() override;

    SerialTransport(const SerialTransport &) = delete;
    SerialTransport &operator=(const SerialTransport &) = delete;

    void open() override;
    void close() override;
    bool isOpen() const override;
    size_t write(const std::vector<uint8_t> &bytes) override;
    std::vector<uint8_t> read(size_t maxBytes, std::chrono::milliseconds timeout) override;
    void discardBuffers() override;
    void discardInput() override;

    const std::string &devicePath() const { return path; }
    int baudRate() const { return baud; }

private:
    int fd;
    std::string path;
    int baud;
    std::chrono::milliseconds writeTimeout;

    void configurePort();
    void flush(int queue);
};

// Serial devices present on this machine, sorted by name.
std::vector<std::string> listSerialPorts(const std::string &devDir = "/dev");

// Explicit port wins; otherwise the first enumerated port.
// Throws NoPortAvailableError when nothing can be found.
std::string resolvePort(const std::string &requested, const std::string &devDir = "/dev");
