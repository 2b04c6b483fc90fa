#ifndef DOWNLOADAPPLICATION_HPP
#define DOWNLOADAPPLICATION_HPP

#include "core/SegmentedDownload.hpp"
#include "util/config.hpp"

static constexpr int SEGDL_EXIT_OK = 0;
static constexpr int SEGDL_EXIT_INCOMPLETE = 1;
static constexpr int SEGDL_EXIT_CONFIGURATION = 2;
static constexpr int SEGDL_EXIT_MERGE = 3;
static constexpr int SEGDL_EXIT_FAILURE = 4;

// Runs one download from the command line: fresh or resumed, with the terminal UI or plain logging
class DownloadApplication
{
public:
    explicit DownloadApplication(const DownloadConfig &config);
    ~DownloadApplication();

    int run();

private:
    DownloadConfig _config;

    DownloadOutcome execute(SegmentedDownload &download, bool resume);
    int report(const SegmentedDownload &download, DownloadOutcome outcome) const;
};

#endif
