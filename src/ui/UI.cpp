#include <curses.h>
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <thread>

#include "ui/UI.hpp"

namespace
{
    constexpr int SUMMARY_ROWS = 4;
    constexpr int PROMPT_ROWS = 3;
    constexpr std::chrono::milliseconds RENDER_INTERVAL(250);
    constexpr std::chrono::milliseconds POLL_INTERVAL(10);
}

bool isPromptCharacter(int ch)
{
    return ch >= 0 && ch < 256 && std::isprint(ch);
}

UI::UI(SegmentedDownload &download, const std::atomic<bool> &finished)
    : _finished(finished),
      _screen(download),
      _lastRender(Clock::now())
{
}

UI::~UI()
{
    closeTerminal();
}

void UI::run()
{
    openTerminal();
    layoutWindows();
    render();

    while (!_closeRequested && !_finished.load())
    {
        pollKeys();

        // Segment bars change continuously; the prompt only needs the cursor kept in place
        if (Clock::now() - _lastRender >= RENDER_INTERVAL)
            render();
        else
            renderPrompt();

        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    closeTerminal();
}

void UI::openTerminal()
{
    if (_terminalOpen)
        return;

    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    _terminalOpen = true;
}

void UI::closeTerminal()
{
    if (!_terminalOpen)
        return;

    releaseWindows();
    endwin();
    _terminalOpen = false;
}

// Summary on top, the segment pad below it, prompt at the bottom. The pad holds every
// segment row and scrolls when the terminal is shorter than the segment count.
void UI::layoutWindows()
{
    releaseWindows();

    int rows = 0;
    getmaxyx(stdscr, rows, _columns);

    _padRows = _screen.getRowCount();
    _summaryWin = newwin(SUMMARY_ROWS, _columns, 0, 0);
    _segmentPad = newpad(_padRows, std::max(_columns, 1));
    _promptWin = newwin(PROMPT_ROWS, _columns, std::max(rows - PROMPT_ROWS, SUMMARY_ROWS), 0);

    scrollBy(0);
}

void UI::releaseWindows()
{
    for (WINDOW **win : {&_summaryWin, &_segmentPad, &_promptWin})
    {
        if (*win)
        {
            delwin(*win);
            *win = nullptr;
        }
    }
}

void UI::pollKeys()
{
    for (int ch = getch(); ch != ERR; ch = getch())
    {
        onKey(ch);
    }
}

void UI::onKey(int ch)
{
    switch (ch)
    {
    case KEY_RESIZE:
        layoutWindows();
        break;

    case '\n':
    case '\r':
    case KEY_ENTER:
        if (_screen.handleCommand(_input))
            _closeRequested = true;
        _input.clear();
        break;

    case KEY_BACKSPACE:
    case 127:
        if (!_input.empty())
            _input.pop_back();
        break;

    case KEY_UP:
        scrollBy(-1);
        break;
    case KEY_DOWN:
        scrollBy(1);
        break;
    case KEY_PPAGE:
        scrollBy(-visibleSegmentRows());
        break;
    case KEY_NPAGE:
        scrollBy(visibleSegmentRows());
        break;

    default:
        if (isPromptCharacter(ch))
            _input.push_back(static_cast<char>(ch));
        break;
    }

    render();
}

void UI::render()
{
    werase(_summaryWin);
    _screen.drawSummary(_summaryWin);
    wnoutrefresh(_summaryWin);

    werase(_segmentPad);
    _screen.drawSegments(_segmentPad);

    int visible = visibleSegmentRows();
    if (visible > 0)
    {
        pnoutrefresh(_segmentPad, _firstVisibleRow, 0,
                     SUMMARY_ROWS, 0, SUMMARY_ROWS + visible - 1, _columns - 1);
    }

    renderPrompt();
    _lastRender = Clock::now();
}

void UI::renderPrompt()
{
    werase(_promptWin);
    _screen.drawCommands(_promptWin);
    mvwprintw(_promptWin, 1, LEFT_PADDING, "> %s", _input.c_str());
    wmove(_promptWin, 1, LEFT_PADDING + 2 + static_cast<int>(_input.size()));
    wnoutrefresh(_promptWin);
    doupdate();
}

int UI::visibleSegmentRows() const
{
    int rows = getmaxy(stdscr);
    return std::max(std::min(rows - SUMMARY_ROWS - PROMPT_ROWS, _padRows), 0);
}

void UI::scrollBy(int rows)
{
    int lastFirstRow = std::max(_padRows - visibleSegmentRows(), 0);
    _firstVisibleRow = std::min(std::max(_firstVisibleRow + rows, 0), lastFirstRow);
}
