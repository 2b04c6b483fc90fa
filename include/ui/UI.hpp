#ifndef UI_HPP
#define UI_HPP

#include <curses.h>
#include <atomic>
#include <chrono>
#include <string>

#include "ui/SegmentScreen.hpp"
#include "core/SegmentedDownload.hpp"

// Keys that go into the prompt; curses reports function keys as codes above 255
bool isPromptCharacter(int ch);

// Terminal front end for one segmented download. Runs on the main thread until the
// download returns or the user quits; the terminal is restored on destruction.
class UI
{
public:
    // finished is raised by the thread running the download once it has returned
    UI(SegmentedDownload &download, const std::atomic<bool> &finished);
    ~UI();

    void run();

private:
    using Clock = std::chrono::steady_clock;

    const std::atomic<bool> &_finished;
    SegmentScreen _screen;
    bool _terminalOpen{false};
    bool _closeRequested{false};
    std::string _input;
    Clock::time_point _lastRender;

    WINDOW *_summaryWin = nullptr;
    WINDOW *_segmentPad = nullptr;
    WINDOW *_promptWin = nullptr;
    int _columns = 0;
    int _padRows = 0;
    int _firstVisibleRow = 0;

    void openTerminal();
    void closeTerminal();
    void layoutWindows();
    void releaseWindows();

    void pollKeys();
    void onKey(int ch);

    void render();
    void renderPrompt();
    int visibleSegmentRows() const;
    void scrollBy(int rows);
};

#endif
