#pragma once

#include "widget/rect.hpp"

#include <string>

namespace rev::display {

enum ColorPair : short {
    kHeader   = 1,   // header/footer bar
    kAccent   = 2,   // repository / ids
    kName     = 3,   // titles, authors
    kText     = 4,   // default text
    kSuccess  = 5,
    kPending  = 6,
    kFailure  = 7,
    kExpired  = 8,
    kSelected = 9,
};

/// ncurses session; the screen is restored when this goes out of scope.
class Terminal
{
public:
    Terminal()  { init(); }
    ~Terminal();

    Terminal(const Terminal&)            = delete;
    Terminal& operator=(const Terminal&) = delete;

    /// Next pending key or -1 (ERR) when none is queued.
    int pollKey();
    widget::Rect size() const;

    void clear();
    void present();

private:
    void init();
};

/* ───── drawing helpers on stdscr ───── */
void DrawText(int y, int x, int width, const std::string& text, short pair = kText, int attrs = 0);
void DrawBox(const widget::Rect& area, const std::string& title, short pair = kText);
void FillRect(const widget::Rect& area, short pair);

} // namespace rev::display
