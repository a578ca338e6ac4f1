#include "CursesRenderer.hpp"
#include <ncurses.h>
#include <algorithm>
#include <clocale>
#include "core/Logger.hpp"
#include "ui/TextLayout.hpp"

namespace cal {

namespace {

constexpr short kPairNormal = 1;
constexpr short kPairCurrent = 2;

} // namespace

CursesRenderer::CursesRenderer(const UIConfig& config) : config_(config) {
}

CursesRenderer::~CursesRenderer() {
    shutdown();
}

Result<void> CursesRenderer::init() {
    if (active_)
        return Result<void>::ok();

    std::setlocale(LC_ALL, "");
    if (!initscr())
        return Result<void>::err("Could not initialize the terminal");
    active_ = true;

    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    curs_set(0);

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(kPairNormal, static_cast<short>(config_.color), -1);
        init_pair(kPairCurrent, static_cast<short>(config_.colorCurrent), -1);
        colors_ = true;
    }

    LOG_DEBUG("Curses renderer started ({}x{}, colors: {})",
              COLS,
              LINES,
              colors_);
    return Result<void>::ok();
}

void CursesRenderer::shutdown() {
    if (!active_)
        return;
    endwin();
    active_ = false;
}

void CursesRenderer::render(const RenderFrame& frame) {
    if (!active_)
        return;

    int h = 0;
    int w = 0;
    getmaxyx(stdscr, h, w);
    if (h <= 0 || w <= 0)
        return;

    auto width = static_cast<usize>(w);
    auto band = layout::visibleBand(static_cast<usize>(h), config_.limitHeight);

    erase();

    if (frame.lines.empty()) {
        drawStatus(frame.status, band.firstRow + band.rows / 2, width);
        refresh();
        return;
    }

    auto rows = layout::layoutLines(frame.lines,
                                    frame.offset,
                                    width,
                                    band.rows,
                                    config_.center);
    usize y = band.firstRow;
    for (const auto& row : rows) {
        attr_t attrs = 0;
        if (colors_)
            attrs |= COLOR_PAIR(row.current ? kPairCurrent : kPairNormal);
        if (row.current)
            attrs |= A_BOLD;
        attron(attrs);
        mvaddnstr(static_cast<int>(y),
                  0,
                  row.text.c_str(),
                  static_cast<int>(layout::fitColumns(row.text, width)));
        attroff(attrs);
        ++y;
    }
    refresh();
}

std::vector<InputEvent> CursesRenderer::readInput() {
    std::vector<InputEvent> events;
    if (!active_)
        return events;

    int half = std::max(1, LINES / 2);
    if (config_.limitHeight > 0)
        half = std::max(1, std::min(half, static_cast<int>(config_.limitHeight) / 2));

    for (int ch = getch(); ch != ERR; ch = getch()) {
        switch (ch) {
        case KEY_UP:
            events.push_back({InputKind::Scroll, -1});
            break;
        case KEY_DOWN:
            events.push_back({InputKind::Scroll, 1});
            break;
        case KEY_PPAGE:
            events.push_back({InputKind::Scroll, -half});
            break;
        case KEY_NPAGE:
            events.push_back({InputKind::Scroll, half});
            break;
        case 'r':
        case 'R':
            events.push_back({InputKind::Refresh, 0});
            break;
        case 'q':
        case 'Q':
            events.push_back({InputKind::Quit, 0});
            break;
        case KEY_RESIZE:
            events.push_back({InputKind::Resize, 0});
            break;
        default:
            break;
        }
    }
    return events;
}

void CursesRenderer::drawStatus(const std::string& status,
                                usize row,
                                usize width) {
    if (status.empty())
        return;
    std::string text = config_.center ? layout::centerText(status, width)
                                      : status;
    attr_t attrs = colors_ ? COLOR_PAIR(kPairNormal) : 0;
    attron(attrs);
    mvaddnstr(static_cast<int>(row),
              0,
              text.c_str(),
              static_cast<int>(layout::fitColumns(text, width)));
    attroff(attrs);
}

} // namespace cal
