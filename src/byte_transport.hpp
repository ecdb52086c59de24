#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

// Byte-oriented duplex stream consumed by the glove session.
// write/read report transient conditions through their return values (0 bytes
// on timeout); fatal conditions throw IoFailureError.
class ByteTransport
{
public:
    virtual ~ByteTransport() {}

    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Returns the number of bytes actually written.
    virtual size_t write(const std::vector<uint8_t> &bytes) = 0;

    // Reads up to maxBytes, waiting at most timeout. May return fewer bytes
    // (or none) when the timeout expires first.
    virtual std::vector<uint8_t> read(size_t maxBytes, std::chrono::milliseconds timeout) = 0;

    // Drop anything pending in the input and output buffers.
    virtual void discardBuffers() = 0;
    virtual void discardInput() = 0;
};
