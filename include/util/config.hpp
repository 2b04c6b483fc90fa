#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <ostream>
#include <string>

static constexpr const char SEGDL_STATE_DIRECTORY[] = "segdl";
static constexpr const char SEGDL_STATE_FILENAME[] = "state";
static constexpr const char SEGDL_LOG_FILENAME[] = "segdl.log";
static constexpr int SEGDL_DEFAULT_SEGMENTS = 8;

struct DownloadConfig
{
    std::string url;
    int segmentCount{SEGDL_DEFAULT_SEGMENTS};
    std::string outputDirectory;
    std::string stateFilePath;
    std::string logFilePath;
    long connectTimeoutSecs{30};
    long stallTimeoutSecs{60};
    bool useUI{true};
    bool verbose{false};
    bool forceRestart{false};
};

// ~/.segdl, or the current directory when HOME is not set
std::string getStateDirectory();

// Fills config from argv. Returns false if only --help was requested (usage is written to out).
// Throws DownloadError(INVALID_CONFIGURATION) for unusable arguments.
bool parseCommandLine(int argc, const char *const argv[], DownloadConfig &config, std::ostream &out);

#endif
