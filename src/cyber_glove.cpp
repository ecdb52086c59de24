#include "cyber_glove.hpp"
#include "glove_errors.hpp"
#include "serial_transport.hpp"
#include <iostream>

const char* exchangeStateName(ExchangeState state)
{
    switch (state)
    {
    case ExchangeState::IDLE: return "idle";
    case ExchangeState::AWAITING_WRITE: return "awaiting-write";
    case ExchangeState::AWAITING_FRAME: return "awaiting-frame";
    case ExchangeState::RESYNC: return "resync";
    case ExchangeState::DECODED: return "decoded";
    }
    return "unknown";
}

CyberGlove::CyberGlove(const GloveOptions& options)
    : options_(options), model_(glovecmd::modelFromChannels(options.channels)),
      calibrated_(false)
{
    port_ = resolvePort(options_.port);
    transport_.reset(new SerialTransport(port_, options_.baudRate, options_.writeTimeout));
    init();
}

CyberGlove::CyberGlove(std::unique_ptr<ByteTransport> transport, const GloveOptions& options)
    : options_(options), model_(glovecmd::modelFromChannels(options.channels)),
      port_(options.port), transport_(std::move(transport)), calibrated_(false)
{
    if (!transport_)
        throw InvalidConfigurationError("CyberGlove needs a transport");
    init();
}

void CyberGlove::init()
{
    if (options_.samplesPerRead < 1)
        throw InvalidConfigurationError("samples_per_read must be >= 1, got " +
                                        std::to_string(options_.samplesPerRead));
    if (options_.readTimeout.count() <= 0)
        throw InvalidConfigurationError("read timeout must be positive");
    if (options_.writeTimeout.count() <= 0)
        throw InvalidConfigurationError("write timeout must be positive");

    if (!options_.calibrationPath.empty())
    {
        cal_ = loadCalibration(options_.calibrationPath, model_);
        calibrated_ = true;
    }
}

CyberGlove::~CyberGlove()
{
    try
    {
        close();
    }
    catch (const GloveException& e)
    {
        std::cerr << "WARN: closing " << port_ << " failed: " << e.what() << "\n";
    }
}

void CyberGlove::open()
{
    if (transport_->isOpen())
        return;
    transport_->open();
    try
    {
        transport_->discardBuffers();
    }
    catch (const IoFailureError&)
    {
        transport_->close();
        throw;
    }
}

void CyberGlove::close()
{
    if (!transport_->isOpen())
        return;
    try
    {
        transport_->discardBuffers();
    }
    catch (const IoFailureError&)
    {
        transport_->close();
        throw;
    }
    transport_->close();
}

bool CyberGlove::isOpen() const
{
    return transport_->isOpen();
}

void CyberGlove::checkCeilings(const CancelToken* cancel,
                               std::chrono::steady_clock::time_point started) const
{
    if (cancel && cancel->cancelled())
        throw CancelledError("readSample cancelled after " + std::to_string(stats_.attempts) +
                             " attempts");

    const SyncPolicy& policy = options_.sync;
    if (policy.maxAttempts > 0 && stats_.attempts >= policy.maxAttempts)
        throw SyncTimeoutError("no complete frame after " + std::to_string(stats_.attempts) +
                               " attempts");
    if (policy.deadline.count() > 0 &&
        std::chrono::steady_clock::now() - started >= policy.deadline)
        throw SyncTimeoutError("no complete frame within " + std::to_string(policy.deadline.count()) +
                               " ms (" + std::to_string(stats_.attempts) + " attempts)");
}

std::vector<double> CyberGlove::readSample(const CancelToken* cancel)
{
    if (!transport_->isOpen())
        throw IoFailureError("readSample on closed port " + port_);

    stats_ = ExchangeStats();
    const auto started = std::chrono::steady_clock::now();
    const size_t expected = frameBytes();
    const std::vector<uint8_t> request(1, glovecmd::kRequestSample);
    int consecutiveWriteFailures = 0;
    std::vector<uint8_t> frame;

    ExchangeState state = ExchangeState::IDLE;
    while (state != ExchangeState::DECODED)
    {
        switch (state)
        {
        case ExchangeState::IDLE:
        case ExchangeState::RESYNC:
            checkCeilings(cancel, started);
            transport_->discardInput();
            state = ExchangeState::AWAITING_WRITE;
            break;

        case ExchangeState::AWAITING_WRITE:
        {
            ++stats_.attempts;
            size_t written = transport_->write(request);
            if (written == 1)
            {
                consecutiveWriteFailures = 0;
                state = ExchangeState::AWAITING_FRAME;
                break;
            }
            ++stats_.writeFailures;
            ++consecutiveWriteFailures;
            if (options_.verbose)
                std::cerr << "WARN: resync from " << exchangeStateName(state) << ", request write reported "
                          << written << " bytes\n";
            const int maxFailures = options_.sync.maxConsecutiveWriteFailures;
            if (maxFailures > 0 && consecutiveWriteFailures >= maxFailures)
            {
                stats_.finalState = ExchangeState::RESYNC;
                throw IoFailureError("request write failed " + std::to_string(consecutiveWriteFailures) +
                                     " times in a row on " + port_);
            }
            state = ExchangeState::RESYNC;
            break;
        }

        case ExchangeState::AWAITING_FRAME:
            frame = transport_->read(expected, options_.readTimeout);
            if (frame.size() == expected)
            {
                state = ExchangeState::DECODED;
                break;
            }
            ++stats_.shortFrames;
            if (options_.verbose)
                std::cerr << "WARN: resync from " << exchangeStateName(state) << ", frame " << frame.size()
                          << "/" << expected << " bytes\n";
            state = ExchangeState::RESYNC;
            break;

        case ExchangeState::DECODED:
            break;
        }
        stats_.finalState = state;
    }

    std::vector<double> raw = glovecmd::decodeFrame(frame);
    if (calibrated_)
        return calibrateData(raw, cal_);
    return raw;
}

cv::Mat_<double> CyberGlove::read(const CancelToken* cancel)
{
    const int rows = static_cast<int>(channels());
    cv::Mat_<double> data(rows, options_.samplesPerRead, 0.0);
    for (int i = 0; i < options_.samplesPerRead; ++i)
    {
        std::vector<double> sample = readSample(cancel);
        for (int ch = 0; ch < rows; ++ch)
            data(ch, i) = sample[ch];
    }
    return data;
}

// ==================== ScopedGlove ====================
ScopedGlove::ScopedGlove(CyberGlove& glove) : glove_(glove)
{
    glove_.open();
}

ScopedGlove::~ScopedGlove()
{
    try
    {
        glove_.close();
    }
    catch (const GloveException& e)
    {
        std::cerr << "WARN: closing " << glove_.port() << " failed: " << e.what() << "\n";
    }
}
