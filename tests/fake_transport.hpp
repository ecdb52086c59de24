#pragma once
#include <gmock/gmock.h>
#include <deque>
#include <string>
#include <vector>
#include "byte_transport.hpp"

// Scripted transport: each write()/read() pops the next scripted result.
// When a script runs dry, writes succeed and reads time out with no bytes.
class FakeTransport : public ByteTransport
{
public:
    std::deque<size_t> writeResults;
    std::deque<std::vector<uint8_t>> readResults;
    std::vector<std::string> calls;         // "open", "write", "read", ...
    std::vector<std::vector<uint8_t>> written;
    bool opened = false;

    void open() override
    {
        calls.push_back("open");
        opened = true;
    }
    void close() override
    {
        calls.push_back("close");
        opened = false;
    }
    bool isOpen() const override { return opened; }

    size_t write(const std::vector<uint8_t> &bytes) override
    {
        calls.push_back("write");
        written.push_back(bytes);
        if (writeResults.empty())
            return bytes.size();
        size_t n = writeResults.front();
        writeResults.pop_front();
        return n;
    }

    std::vector<uint8_t> read(size_t maxBytes, std::chrono::milliseconds) override
    {
        calls.push_back("read");
        if (readResults.empty())
            return {};
        std::vector<uint8_t> r = readResults.front();
        readResults.pop_front();
        if (r.size() > maxBytes)
            r.resize(maxBytes);
        return r;
    }

    void discardBuffers() override { calls.push_back("discard"); }
    void discardInput() override { calls.push_back("discard_input"); }

    size_t count(const std::string &call) const
    {
        size_t n = 0;
        for (const auto &c : calls)
            if (c == call) ++n;
        return n;
    }
};

class MockTransport : public ByteTransport
{
public:
    MOCK_METHOD(void, open, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(bool, isOpen, (), (const, override));
    MOCK_METHOD(size_t, write, (const std::vector<uint8_t> &bytes), (override));
    MOCK_METHOD(std::vector<uint8_t>, read, (size_t maxBytes, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(void, discardBuffers, (), (override));
    MOCK_METHOD(void, discardInput, (), (override));
};

// [lead, 1..channels, trail]
inline std::vector<uint8_t> makeFrame(size_t channels, uint8_t lead = 0xFF, uint8_t trail = 0xFF)
{
    std::vector<uint8_t> f;
    f.push_back(lead);
    for (size_t i = 1; i <= channels; ++i)
        f.push_back(static_cast<uint8_t>(i));
    f.push_back(trail);
    return f;
}
