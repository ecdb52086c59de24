// Wire protocol of the CyberGlove serial link.
// The host sends a single request byte 'G' (0x47); the glove answers with one
// frame of (channels + 2) unsigned bytes:
//   [reserved] [ch0] [ch1] ... [chN-1] [reserved]
// Byte 0 and the last byte carry no sensor data.
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "glove_errors.hpp"

enum class DeviceModel {
    DOF18 = 18,
    DOF22 = 22
};

namespace glovecmd
{
constexpr uint8_t kRequestSample = 0x47;
constexpr size_t kReservedBytes = 2;

inline size_t channelCount(DeviceModel model)
{
    return static_cast<size_t>(model);
}

inline size_t frameSize(DeviceModel model)
{
    return channelCount(model) + kReservedBytes;
}

// 18 and 22 are the only channel counts the glove comes in.
inline DeviceModel modelFromChannels(int channels)
{
    if (channels == 18) return DeviceModel::DOF18;
    if (channels == 22) return DeviceModel::DOF22;
    throw InvalidConfigurationError("CyberGlove can be either 18-DOF or 22-DOF, got " +
                                    std::to_string(channels));
}

// Drop the leading and trailing reserved bytes and widen the samples.
// The frame must be exactly frameSize(model) long.
inline std::vector<double> decodeFrame(const std::vector<uint8_t> &frame)
{
    std::vector<double> out;
    if (frame.size() < kReservedBytes) return out;
    out.reserve(frame.size() - kReservedBytes);
    for (size_t i = 1; i + 1 < frame.size(); ++i)
        out.push_back(static_cast<double>(frame[i]));
    return out;
}
} // namespace glovecmd
