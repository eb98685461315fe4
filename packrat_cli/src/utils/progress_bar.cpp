//
// Created by the packrat authors on 18/10/26.
//

#include "progress_bar.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>

#ifdef _WIN32

#include <windows.h>

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

void print_progress_bar(const double percent, const std::string& label, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 60u ? term_width - 60u : 20u);

    // the library doesn't clamp; a file growing after the estimate can overshoot
    const double shown = std::clamp(percent, 0.0, 100.0);
    const auto pos = static_cast<unsigned>(bar_width * shown / 100.0);

    std::string name = std::filesystem::path(label).filename().string();
    if (name.size() > 24) {
        name = name.substr(0, 21) + "...";
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && shown < 100.0) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << shown << "%"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s "
              << std::left << std::setw(24) << name << std::right
              << std::flush;
}
