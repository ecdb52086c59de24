#pragma once
#include <map>
#include <string>
#include <vector>
#include "cyber_glove.hpp"

using ConfigMap = std::map<std::string, std::string>;

// Simple config loader (key: value, dotted keys supported, '#' comments).
// Reads the first candidate path that exists; empty map if none does.
ConfigMap loadConfig(const std::vector<std::string> &candidatePaths);

// Same format, from an in-memory text.
ConfigMap parseConfig(const std::string &text);

std::string cfgStr(const ConfigMap &cfg, const std::string &key, const std::string &defVal);
int cfgInt(const ConfigMap &cfg, const std::string &key, int defVal);
double cfgDouble(const ConfigMap &cfg, const std::string &key, double defVal);
bool cfgBool(const ConfigMap &cfg, const std::string &key, bool defVal);

// Settings of the console tools on top of the glove session.
struct DisplayConfig {
    int intervalMs;   // raw_readings print period
    int rateWindow;   // glove_rate intervals averaged

    DisplayConfig() : intervalMs(500), rateWindow(200) {}
};

struct GloveConfig {
    GloveOptions glove;
    DisplayConfig display;
};

// glove.*, serial.*, sync.*, log.* and display.* keys on top of the defaults.
GloveConfig gloveConfigFrom(const ConfigMap &cfg);

extern const std::vector<std::string> kDefaultConfigPaths;
