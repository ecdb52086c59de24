#pragma once
#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "byte_transport.hpp"
#include "calibration.hpp"
#include "glove_protocol.hpp"

// ==================== Sync policy ====================
// Ceilings for the request/frame resync loop. Zero means unbounded, which is
// the behaviour of the glove's reference driver.
struct SyncPolicy {
    int maxAttempts;                     // request writes per readSample()
    std::chrono::milliseconds deadline;  // wall time per readSample()
    int maxConsecutiveWriteFailures;     // escalates to IoFailureError

    SyncPolicy()
        : maxAttempts(0), deadline(0), maxConsecutiveWriteFailures(0) {}
};

// Cooperative cancellation of a blocked readSample(), checked between attempts.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    void reset() { flag_.store(false); }
    bool cancelled() const { return flag_.load(); }
private:
    std::atomic<bool> flag_{false};
};

// ==================== Exchange state ====================
enum class ExchangeState {
    IDLE,
    AWAITING_WRITE,
    AWAITING_FRAME,
    RESYNC,
    DECODED
};

const char* exchangeStateName(ExchangeState state);

struct ExchangeStats {
    int attempts;        // request bytes written (or tried)
    int writeFailures;   // writes that did not report exactly one byte
    int shortFrames;     // reads that returned the wrong byte count
    ExchangeState finalState;

    ExchangeStats() : attempts(0), writeFailures(0), shortFrames(0), finalState(ExchangeState::IDLE) {}
};

// ==================== Glove options ====================
struct GloveOptions {
    int channels;                           // 18 or 22
    std::string port;                       // empty = first serial port found
    int baudRate;
    int samplesPerRead;                     // requests per read()
    std::string calibrationPath;            // empty = raw readings
    std::chrono::milliseconds readTimeout;  // per attempt
    std::chrono::milliseconds writeTimeout;
    SyncPolicy sync;
    bool verbose;                           // log each resync to stderr

    GloveOptions()
        : channels(18), baudRate(115200), samplesPerRead(1),
          readTimeout(1000), writeTimeout(1000), verbose(false) {}
};

// ==================== CyberGlove session ====================
// Owns the transport exclusively. Not safe for concurrent use: callers that
// poll periodically must serialize readSample()/read() calls themselves.
class CyberGlove {
public:
    // Serial session: resolves the port (NoPortAvailableError if none) and
    // loads the calibration file when one is given. The port is not opened
    // until open()/start().
    explicit CyberGlove(const GloveOptions& options);

    // Session over an already constructed transport.
    CyberGlove(std::unique_ptr<ByteTransport> transport, const GloveOptions& options);

    ~CyberGlove();

    CyberGlove(const CyberGlove&) = delete;
    CyberGlove& operator=(const CyberGlove&) = delete;

    // Idempotent. Opening discards stale bytes, closing discards pending
    // bytes before releasing the port.
    void open();
    void close();
    void start() { open(); }
    void stop() { close(); }
    bool isOpen() const;

    // One request/frame exchange. Blocks until a complete frame arrives,
    // resyncing on failed writes and short frames. Throws SyncTimeoutError or
    // IoFailureError when a SyncPolicy ceiling is hit, CancelledError when
    // the token fires, IoFailureError on transport failure.
    std::vector<double> readSample(const CancelToken* cancel = nullptr);

    // samplesPerRead exchanges, one column per sample: channels x samplesPerRead.
    cv::Mat_<double> read(const CancelToken* cancel = nullptr);

    bool isCalibrated() const { return calibrated_; }
    const CalibrationVectors& calibration() const { return cal_; }
    const cv::Mat_<double>& offset() const { return cal_.offset; }
    const cv::Mat_<double>& gain() const { return cal_.gain; }

    DeviceModel model() const { return model_; }
    size_t channels() const { return glovecmd::channelCount(model_); }
    size_t frameBytes() const { return glovecmd::frameSize(model_); }
    int samplesPerRead() const { return options_.samplesPerRead; }
    const std::string& port() const { return port_; }

    const SyncPolicy& syncPolicy() const { return options_.sync; }
    void setSyncPolicy(const SyncPolicy& policy) { options_.sync = policy; }

    // Statistics of the most recent readSample(), also after it threw.
    const ExchangeStats& lastExchange() const { return stats_; }

private:
    GloveOptions options_;
    DeviceModel model_;
    std::string port_;
    std::unique_ptr<ByteTransport> transport_;
    bool calibrated_;
    CalibrationVectors cal_;
    ExchangeStats stats_;

    void init();
    void checkCeilings(const CancelToken* cancel, std::chrono::steady_clock::time_point started) const;
};

// Opens the glove for the lifetime of the scope and closes it on every exit path.
class ScopedGlove {
public:
    explicit ScopedGlove(CyberGlove& glove);
    ~ScopedGlove();

    ScopedGlove(const ScopedGlove&) = delete;
    ScopedGlove& operator=(const ScopedGlove&) = delete;

    CyberGlove& glove() { return glove_; }

private:
    CyberGlove& glove_;
};
