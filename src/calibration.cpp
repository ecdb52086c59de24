#include "calibration.hpp"
#include "glove_errors.hpp"
#include <cmath>
#include <fstream>
#include <sstream>

static const std::vector<int> kOffsetLines18 = {2, 3, 4, 5, 7, 8, 12, 13, 15, 17, 18, 20, 22, 23,
                                                25, 27, 28, 29};
static const std::vector<int> kGainLines18 = {2, 3, 4, 5, 7, 8, 12, 13, 10, 17, 18, 20, 22, 23,
                                              25, 27, 28, 29};

static const std::vector<int> kOffsetLines22 = {2, 3, 4, 5, 7, 8, 9, 12, 13, 14, 15, 17, 18, 19,
                                                20, 22, 23, 24, 25, 27, 28, 29};
static const std::vector<int> kGainLines22 = {2, 3, 4, 5, 7, 8, 9, 12, 13, 14, 10, 17, 18, 19,
                                              20, 22, 23, 24, 25, 27, 28, 29};

const std::vector<int> &offsetLineIndex(DeviceModel model)
{
    return model == DeviceModel::DOF18 ? kOffsetLines18 : kOffsetLines22;
}

const std::vector<int> &gainLineIndex(DeviceModel model)
{
    return model == DeviceModel::DOF18 ? kGainLines18 : kGainLines22;
}

static double parseField(const std::vector<std::string> &lines, int lineNo, size_t field,
                         const std::string &calPath)
{
    std::string where = calPath + ":" + std::to_string(lineNo + 1);
    if (lineNo < 0 || static_cast<size_t>(lineNo) >= lines.size())
        throw MalformedCalibrationError(where + ": line missing (file has " +
                                        std::to_string(lines.size()) + " lines)");

    std::istringstream ss(lines[lineNo]);
    std::vector<std::string> tokens;
    std::string tok;
    while (ss >> tok)
        tokens.push_back(tok);
    if (field >= tokens.size())
        throw MalformedCalibrationError(where + ": expected at least " + std::to_string(field + 1) +
                                        " fields, found " + std::to_string(tokens.size()));

    const std::string &text = tokens[field];
    size_t used = 0;
    double value = 0.0;
    try
    {
        value = std::stod(text, &used);
    }
    catch (const std::invalid_argument &)
    {
        used = 0;
    }
    catch (const std::out_of_range &)
    {
        used = 0;
    }
    if (used == 0 || used != text.size())
        throw MalformedCalibrationError(where + ": field " + std::to_string(field) + " '" + text +
                                        "' is not a number");
    return value;
}

CalibrationVectors loadCalibration(const std::string &calPath, int channels)
{
    return loadCalibration(calPath, glovecmd::modelFromChannels(channels));
}

CalibrationVectors loadCalibration(const std::string &calPath, DeviceModel model)
{
    std::vector<std::string> lines;
    {
        std::ifstream in(calPath);
        if (!in.is_open())
            throw MalformedCalibrationError("Cannot open calibration file " + calPath);
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            lines.push_back(line);
        }
    }

    const std::vector<int> &offLines = offsetLineIndex(model);
    const std::vector<int> &gainLines = gainLineIndex(model);
    const int n = static_cast<int>(glovecmd::channelCount(model));

    CalibrationVectors cal;
    cal.offset = cv::Mat_<double>(n, 1, 0.0);
    cal.gain = cv::Mat_<double>(n, 1, 0.0);
    for (int i = 0; i < n; ++i)
        cal.offset(i) = -parseField(lines, offLines[i], kOffsetField, calPath);
    for (int i = 0; i < n; ++i)
        cal.gain(i) = parseField(lines, gainLines[i], kGainField, calPath) * (180.0 / M_PI); // degrees
    return cal;
}

cv::Mat_<double> calibrateData(const cv::Mat_<double> &data, const CalibrationVectors &cal)
{
    if (data.rows != cal.offset.rows || data.rows != cal.gain.rows)
        throw InvalidConfigurationError("Reading has " + std::to_string(data.rows) +
                                        " channels, calibration has " + std::to_string(cal.offset.rows));
    cv::Mat_<double> out(data.rows, data.cols);
    for (int c = 0; c < data.cols; ++c)
    {
        cv::Mat col = data.col(c).mul(cal.gain) + cal.offset;
        col.copyTo(out.col(c));
    }
    return out;
}

std::vector<double> calibrateData(const std::vector<double> &raw, const CalibrationVectors &cal)
{
    cv::Mat_<double> column(static_cast<int>(raw.size()), 1);
    for (size_t i = 0; i < raw.size(); ++i)
        column(static_cast<int>(i)) = raw[i];
    cv::Mat_<double> calibrated = calibrateData(column, cal);
    return std::vector<double>(calibrated.begin(), calibrated.end());
}
