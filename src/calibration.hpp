#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "glove_protocol.hpp"

// ==================== Calibration vectors ====================
// Per-sensor affine calibration read from a DCU calibration file.
// Both columns are channels x 1, gain already in degrees per raw unit.
struct CalibrationVectors {
    cv::Mat_<double> offset;
    cv::Mat_<double> gain;

    size_t channels() const { return static_cast<size_t>(offset.rows); }
};

// Line numbers (0-based) of the calibration file holding each channel's offset
// and gain. DCU stores the Finger2_3 gain in the Finger1_3 slot (line 10), so
// the gain table differs from the offset table in that single position.
// Finger1_3 and Finger5_3 offsets are not used by any implemented DOF.
const std::vector<int> &offsetLineIndex(DeviceModel model);
const std::vector<int> &gainLineIndex(DeviceModel model);

// Whitespace-delimited token positions of the offset and gain fields.
constexpr size_t kOffsetField = 6;
constexpr size_t kGainField = 9;

// Reads the calibration file for a glove with the given channel count (18 or 22).
// Offsets are negated, gains converted from radians to degrees.
// Throws InvalidConfigurationError for other channel counts and
// MalformedCalibrationError for missing lines or unparsable fields.
CalibrationVectors loadCalibration(const std::string &calPath, int channels);
CalibrationVectors loadCalibration(const std::string &calPath, DeviceModel model);

// result = data * gain + offset, per row. data is channels x N (any N >= 1).
cv::Mat_<double> calibrateData(const cv::Mat_<double> &data, const CalibrationVectors &cal);

// Single reading convenience overload.
std::vector<double> calibrateData(const std::vector<double> &raw, const CalibrationVectors &cal);
