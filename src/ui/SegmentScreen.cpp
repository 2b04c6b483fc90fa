#include <curses.h>
#include <algorithm>
#include <string>
#include <vector>

#include "ui/SegmentScreen.hpp"
#include "util/format.hpp"

SegmentScreen::SegmentScreen(SegmentedDownload &download)
    : _download(download),
      _commands{
          {{"pause", "p"}, "save progress and stop", ScreenAction::PAUSE},
          {{"quit", "exit", "q"}, "pause and close", ScreenAction::QUIT}}
{
}

bool SegmentScreen::handleCommand(const std::string &input)
{
    for (const auto &command : _commands)
    {
        if (std::find(command.names.begin(), command.names.end(), input) == command.names.end())
            continue;

        // Either way the coordinator saves the state once every worker has stopped
        _download.interrupt();
        return command.action == ScreenAction::QUIT;
    }

    return false;
}

void SegmentScreen::drawSummary(WINDOW *win) const
{
    const Target &target = _download.getTarget();

    const char *state = coordinatorStateToString(_download.getState());
    if (_download.isInterrupted() && _download.getState() == CoordinatorState::TRANSFERRING)
    {
        state = "pausing";
    }

    std::string size = formatBytes(static_cast<double>(target.totalSize));
    std::string partition = formatBytes(static_cast<double>(_download.getPartitionSize()));

    mvwprintw(win, 1, LEFT_PADDING, "SEGDL  %s  %s in %d segments of %s  [%s]",
              target.fileName.c_str(), size.c_str(), target.segmentCount, partition.c_str(), state);
    mvwprintw(win, 2, LEFT_PADDING, "%s -> %s", target.url.c_str(), _download.artifactPath().c_str());
}

void SegmentScreen::drawSegments(WINDOW *pad)
{
    std::vector<SegmentProgress> progress = _download.getProgress();

    int row = 0;
    double done = 0.0;
    double total = 0.0;
    for (const auto &segment : progress)
    {
        done += static_cast<double>(segment.bytesDone);
        total += static_cast<double>(segment.bytesTotal);

        drawProgressBar(pad, row++, "Segment " + std::to_string(segment.id),
                        static_cast<double>(segment.bytesDone),
                        static_cast<double>(segment.bytesTotal),
                        segmentStateToString(segment.state));
    }

    drawProgressBar(pad, ++row, "Total", done, total, "");

    recordSpeedSample(Clock::now(), done);
    double speedBps = calcCurrentSpeedBps();
    std::string speed = formatBytes(speedBps);
    if (speedBps > 0.0 && total > done)
    {
        int sec = static_cast<int>((total - done) / speedBps);
        mvwprintw(pad, ++row, LEFT_PADDING + 1, "ETA: %dm %ds @ %s/s", sec / 60, sec % 60, speed.c_str());
    }
    else
    {
        mvwprintw(pad, ++row, LEFT_PADDING + 1, "ETA: -- @ %s/s", speed.c_str());
    }
}

void SegmentScreen::drawCommands(WINDOW *win) const
{
    wmove(win, 0, LEFT_PADDING);
    for (const auto &command : _commands)
    {
        std::string names;
        for (const auto &name : command.names)
        {
            names += names.empty() ? name : "|" + name;
        }
        wprintw(win, "%s: %s    ", names.c_str(), command.description);
    }
}

// [=======>   ] <progress>% (<currentBytes> / <totalBytes>) <state>
void SegmentScreen::drawProgressBar(WINDOW *win, int row, const std::string &label,
                                    double bytesDone, double bytesTotal, const char *status) const
{
    mvwprintw(win, row, LEFT_PADDING + 1, "%-11s", label.c_str());

    int filled = 0;
    double percentage = 0.0;
    if (bytesTotal > 0.1)
    {
        percentage = std::min((bytesDone / bytesTotal) * 100.0, 100.0);
        filled = std::min(static_cast<int>((bytesDone / bytesTotal) * BAR_WIDTH), BAR_WIDTH);
    }

    std::string bar(BAR_WIDTH, ' ');
    std::fill(bar.begin(), bar.begin() + filled, '=');
    if (filled < BAR_WIDTH)
    {
        bar[filled] = '>';
    }

    std::string currentStr = formatBytes(bytesDone);
    std::string totalStr = formatBytes(bytesTotal);
    wprintw(win, "[%s] %5.1f%% (%s / %s) %s",
            bar.c_str(), percentage, currentStr.c_str(), totalStr.c_str(), status);
}

// Keeps a 10 second window of (time, total bytes) samples
void SegmentScreen::recordSpeedSample(Clock::time_point timestamp, double bytesDownloaded)
{
    _speedSamples.push_back({timestamp, bytesDownloaded});

    while (!_speedSamples.empty() && timestamp - _speedSamples.front().first > std::chrono::seconds(10))
    {
        _speedSamples.pop_front();
    }
}

double SegmentScreen::calcCurrentSpeedBps() const
{
    if (_speedSamples.size() < 2)
    {
        return 0.0;
    }

    double dt = std::chrono::duration<double>(_speedSamples.back().first - _speedSamples.front().first).count();
    double deltaBytes = _speedSamples.back().second - _speedSamples.front().second;

    if (dt <= 0.0 || deltaBytes <= 0.0)
    {
        return 0.0;
    }

    return deltaBytes / dt;
}
