#include "UI.hpp"
#include <ncurses.h>
#include <chrono>
#include <thread>

UI::UI(WakeService& service, Scanner& scanner)
    : service_(service), scanner_(scanner), running_(false), initialized_(false), selected_(0) {}

UI::~UI() {
    if (initialized_) endwin();
}

bool UI::init() {
    if (initscr() == nullptr) return false;
    initialized_ = true;
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE); // non-blocking getch
    curs_set(0);
    return true;
}

void UI::draw() {
    auto hosts = service_.all_statuses();
    if (!hosts.empty() && selected_ >= hosts.size()) selected_ = hosts.size() - 1;

    clear();
    mvprintw(0, 0, "LANWake - %zu hosts, %llu scans completed", hosts.size(),
             static_cast<unsigned long long>(scanner_.cycles_completed()));
    mvprintw(2, 0, "  %-20s  %-24s  %-17s  %s", "ID", "Name", "MAC", "State");

    int row = 3;
    for (std::size_t i = 0; i < hosts.size() && row < LINES - 3; ++i, ++row) {
        const auto& h = hosts[i];
        if (i == selected_) attron(A_REVERSE);
        mvprintw(row, 0, "%c %-20s  %-24s  %-17s  %s", i == selected_ ? '>' : ' ', h.id.c_str(),
                 h.display_name.c_str(), h.hardware_address.to_string().c_str(), state_label(h).c_str());
        if (i == selected_) attroff(A_REVERSE);
    }
    if (hosts.empty()) mvprintw(row, 2, "(no hosts)");

    mvprintw(LINES - 2, 0, "%s", message_.c_str());
    mvprintw(LINES - 1, 0, "Commands: arrows=select, w/Enter=wake, r=rescan, l=reload host list, q=quit");
    refresh();
}

void UI::wake_selected() {
    auto hosts = service_.all_statuses();
    if (selected_ >= hosts.size()) {
        message_ = "No host selected.";
        return;
    }
    const auto& id = hosts[selected_].id;
    WakeRequestResult result = service_.request_wake(id);
    message_ = (succeeded(result) ? "Wake " : "Wake failed ") + id + ": " + name_for(result);
}

void UI::reload() {
    if (service_.reload()) {
        selected_ = 0;
        message_ = "Host list reloaded.";
    } else {
        message_ = "Host list reload failed, see log.";
    }
}

void UI::handle_input() {
    int ch = getch();
    if (ch == ERR) return;
    switch (ch) {
        case 'q':
        case 'Q':
            running_ = false;
            break;
        case KEY_UP:
        case 'k':
            if (selected_ > 0) --selected_;
            break;
        case KEY_DOWN:
        case 'j':
            ++selected_; // clamped by draw()
            break;
        case 'w':
        case 'W':
        case '\n':
        case KEY_ENTER:
            wake_selected();
            break;
        case 'r':
        case 'R':
            scanner_.trigger();
            message_ = "Rescan requested.";
            break;
        case 'l':
        case 'L':
            reload();
            break;
        default:
            break;
    }
}

void UI::run(const std::atomic<bool>& stop_requested, std::atomic<bool>& reload_requested) {
    running_ = true;
    while (running_ && !stop_requested.load()) {
        if (reload_requested.exchange(false)) reload();
        draw();
        handle_input();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}
