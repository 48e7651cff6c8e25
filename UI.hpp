#ifndef UI_HPP
#define UI_HPP

#include <atomic>
#include <cstddef>
#include <string>
#include "Scanner.hpp"
#include "WakeService.hpp"

// ncurses front-end: host table with a selectable row, wake, rescan and
// reload on single keys.
class UI {
public:
    UI(WakeService& service, Scanner& scanner);
    ~UI();

    // Initialize ncurses, returns false on failure
    bool init();
    // Runs until q is pressed or stop_requested becomes true. reload_requested
    // is consumed (reset) whenever it is seen set.
    void run(const std::atomic<bool>& stop_requested, std::atomic<bool>& reload_requested);

private:
    WakeService& service_;
    Scanner& scanner_;
    bool running_;
    bool initialized_;
    std::size_t selected_;
    std::string message_;

    void draw();
    void handle_input();
    void wake_selected();
    void reload();
};

#endif // UI_HPP
