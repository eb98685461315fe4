//
// Created by the packrat authors on 18/10/26.
//

#ifndef PACKRAT_PROGRESS_BAR_HPP
#define PACKRAT_PROGRESS_BAR_HPP

#include <string>

unsigned get_terminal_width();

/**
 * @brief Redraws a one-line progress bar on stderr.
 * @param percent Completed percentage, as reported by the library.
 * @param label Path currently processed, shortened to its file name.
 * @param elapsed_seconds Time since the request started.
 */
void print_progress_bar(double percent, const std::string& label, double elapsed_seconds);

#endif // PACKRAT_PROGRESS_BAR_HPP
