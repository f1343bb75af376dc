#pragma once

#include <string>

// Installs the "webtiles" stderr logger as the spdlog default. Unknown level
// names fall back to info.
void setupLogging(const std::string& level);
void setLogLevel(const std::string& level);
void disableLogging();
