#ifndef SEGMENT_SCREEN_HPP
#define SEGMENT_SCREEN_HPP

#include <curses.h>
#include <chrono>
#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "core/SegmentedDownload.hpp"

static constexpr int LEFT_PADDING = 2;
static constexpr int BAR_WIDTH = 32;

enum class ScreenAction
{
    PAUSE, // Interrupt every segment and keep the UI open until the state is saved
    QUIT   // Interrupt and close the UI
};

struct ScreenCommand
{
    std::vector<std::string> names;
    const char *description;
    ScreenAction action;
};

// Live view of one segmented download: a summary, a bar per segment and the overall transfer
class SegmentScreen
{
public:
    explicit SegmentScreen(SegmentedDownload &download);

    // Returns true when the command asks the UI to close
    bool handleCommand(const std::string &input);

    // Pad rows: one per segment, a gap, the total bar and the ETA line
    int getRowCount() const { return _download.getTarget().segmentCount + 3; }

    void drawSummary(WINDOW *win) const;
    void drawSegments(WINDOW *pad);
    void drawCommands(WINDOW *win) const;

private:
    using Clock = std::chrono::steady_clock;

    SegmentedDownload &_download;
    std::vector<ScreenCommand> _commands;
    std::deque<std::pair<Clock::time_point, double>> _speedSamples;

    void drawProgressBar(WINDOW *win, int row, const std::string &label,
                         double bytesDone, double bytesTotal, const char *status) const;

    void recordSpeedSample(Clock::time_point time, double bytesDownloaded);
    double calcCurrentSpeedBps() const;
};

#endif
