#ifndef LOGGING_HPP
#define LOGGING_HPP

#include "util/config.hpp"

// Installs the default spdlog logger: a file sink while the terminal UI owns the screen,
// a colour stderr sink otherwise
void initialiseLogging(const DownloadConfig &config);

#endif
