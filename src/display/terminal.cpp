#include "display/terminal.hpp"
#include "widget/text_wrap.hpp"

#include <ncurses.h>
#include <locale.h>

namespace rev::display {

/* ─────────────– init ─────────────– */
void Terminal::init()
{
    setlocale(LC_ALL, "");
    initscr();
    cbreak(); noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);

    start_color();  use_default_colors();
    init_pair(kHeader,   COLOR_WHITE,  COLOR_BLUE);
    init_pair(kAccent,   COLOR_YELLOW, -1);
    init_pair(kName,     COLOR_CYAN,   -1);
    init_pair(kText,     COLOR_WHITE,  -1);
    init_pair(kSuccess,  COLOR_GREEN,  -1);
    init_pair(kPending,  COLOR_YELLOW, -1);
    init_pair(kFailure,  COLOR_RED,    -1);
    init_pair(kExpired,  COLOR_BLUE,   -1);
    init_pair(kSelected, COLOR_BLACK,  COLOR_WHITE);
    bkgd(COLOR_PAIR(kText));
}

Terminal::~Terminal() { endwin(); }

int Terminal::pollKey()
{
    return getch();
}

widget::Rect Terminal::size() const
{
    return widget::Rect{0, 0, COLS, LINES};
}

void Terminal::clear()   { erase(); }
void Terminal::present() { refresh(); }

void DrawText(int y, int x, int width, const std::string& text, short pair, int attrs)
{
    if (width <= 0 || y < 0 || y >= LINES) return;
    attron(COLOR_PAIR(pair) | attrs);
    mvaddstr(y, x, widget::Ellipsize(text, width).c_str());
    attroff(COLOR_PAIR(pair) | attrs);
}

void FillRect(const widget::Rect& area, short pair)
{
    attron(COLOR_PAIR(pair));
    for (int row = 0; row < area.height; ++row)
        mvhline(area.y + row, area.x, ' ', area.width);
    attroff(COLOR_PAIR(pair));
}

void DrawBox(const widget::Rect& area, const std::string& title, short pair)
{
    if (area.width < 2 || area.height < 1) return;
    const int right  = area.x + area.width - 1;
    const int bottom = area.y + area.height - 1;

    attron(COLOR_PAIR(pair));
    mvhline(area.y, area.x + 1, ACS_HLINE, area.width - 2);
    mvaddch(area.y, area.x, ACS_ULCORNER);
    mvaddch(area.y, right,  ACS_URCORNER);
    if (area.height >= 2) {
        mvhline(bottom, area.x + 1, ACS_HLINE, area.width - 2);
        mvaddch(bottom, area.x, ACS_LLCORNER);
        mvaddch(bottom, right,  ACS_LRCORNER);
        if (area.height > 2) {
            mvvline(area.y + 1, area.x, ACS_VLINE, area.height - 2);
            mvvline(area.y + 1, right,  ACS_VLINE, area.height - 2);
        }
    }
    attroff(COLOR_PAIR(pair));

    if (!title.empty())
        DrawText(area.y, area.x + 2, area.width - 4, " " + title + " ", pair, A_BOLD);
}

} // namespace rev::display
