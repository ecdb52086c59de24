#include "glove_config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

const std::vector<std::string> kDefaultConfigPaths = {"../config/glove_config.yaml",
                                                      "config/glove_config.yaml"};

static std::string trim(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static void parseLines(std::istream &in, ConfigMap &cfg)
{
    std::string line;
    while (std::getline(in, line))
    {
        std::string t = trim(line);
        if (t.empty())
            continue;
        if (t[0] == '#')
            continue;
        auto pos = t.find(':');
        if (pos == std::string::npos)
            continue;
        std::string key = trim(t.substr(0, pos));
        std::string value = trim(t.substr(pos + 1));
        // trailing comment
        auto hash = value.find(" #");
        if (hash != std::string::npos)
            value = trim(value.substr(0, hash));
        // remove surrounding quotes if any
        if (!value.empty() && (value.front() == '"' || value.front() == '\''))
            value.erase(0, 1);
        if (!value.empty() && (value.back() == '"' || value.back() == '\''))
            value.pop_back();
        if (!key.empty())
            cfg[key] = value;
    }
}

ConfigMap loadConfig(const std::vector<std::string> &candidatePaths)
{
    ConfigMap cfg;
    for (const auto &path : candidatePaths)
    {
        std::ifstream in(path);
        if (!in.is_open())
            continue;
        parseLines(in, cfg);
        break; // stop at the first file found
    }
    return cfg;
}

ConfigMap parseConfig(const std::string &text)
{
    ConfigMap cfg;
    std::istringstream in(text);
    parseLines(in, cfg);
    return cfg;
}

std::string cfgStr(const ConfigMap &cfg, const std::string &key, const std::string &defVal)
{
    auto it = cfg.find(key);
    return it == cfg.end() ? defVal : it->second;
}

int cfgInt(const ConfigMap &cfg, const std::string &key, int defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    try
    {
        size_t used = 0;
        int value = std::stoi(it->second, &used);
        return used == it->second.size() ? value : defVal;
    }
    catch (const std::invalid_argument &)
    {
        return defVal;
    }
    catch (const std::out_of_range &)
    {
        return defVal;
    }
}

double cfgDouble(const ConfigMap &cfg, const std::string &key, double defVal)
{
    auto it = cfg.find(key);
    if (it == cfg.end())
        return defVal;
    try
    {
        size_t used = 0;
        double value = std::stod(it->second, &used);
        return used == it->second.size() ? value : defVal;
    }
    catch (const std::invalid_argument &)
    {
        return defVal;
    }
    catch (const std::out_of_range &)
    {
        return defVal;
    }
}

bool cfgBool(const ConfigMap &cfg, const std::string &key, bool defVal)
{
    std::string v = cfgStr(cfg, key, "");
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c)
                   { return std::tolower(c); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return defVal;
}

GloveConfig gloveConfigFrom(const ConfigMap &cfg)
{
    GloveConfig out;
    GloveOptions &g = out.glove;
    g.port = cfgStr(cfg, "glove.port", g.port);
    g.baudRate = cfgInt(cfg, "glove.baud", g.baudRate);
    g.channels = cfgInt(cfg, "glove.model", g.channels);
    g.calibrationPath = cfgStr(cfg, "glove.calibration", g.calibrationPath);
    g.samplesPerRead = cfgInt(cfg, "glove.samples_per_read", g.samplesPerRead);
    g.readTimeout = std::chrono::milliseconds(cfgInt(cfg, "serial.read_timeout_ms",
                                                     static_cast<int>(g.readTimeout.count())));
    g.writeTimeout = std::chrono::milliseconds(cfgInt(cfg, "serial.write_timeout_ms",
                                                      static_cast<int>(g.writeTimeout.count())));
    g.sync.maxAttempts = cfgInt(cfg, "sync.max_attempts", g.sync.maxAttempts);
    g.sync.deadline = std::chrono::milliseconds(cfgInt(cfg, "sync.deadline_ms", 0));
    g.sync.maxConsecutiveWriteFailures = cfgInt(cfg, "sync.max_write_failures",
                                                g.sync.maxConsecutiveWriteFailures);
    g.verbose = cfgBool(cfg, "log.verbose", g.verbose);

    out.display.intervalMs = cfgInt(cfg, "display.interval_ms", out.display.intervalMs);
    out.display.rateWindow = cfgInt(cfg, "display.rate_window", out.display.rateWindow);
    return out;
}
