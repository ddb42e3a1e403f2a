//
// Created by Giuseppe Francione on 15/03/26.
//

#ifndef TRAWL_COLOR_HPP
#define TRAWL_COLOR_HPP

// ANSI escape sequences used for console output
inline constexpr const char* RESET  = "\033[0m";
inline constexpr const char* RED    = "\033[1;31m";
inline constexpr const char* GREEN  = "\033[1;32m";
inline constexpr const char* YELLOW = "\033[1;33m";
inline constexpr const char* BLUE   = "\033[1;34m";
inline constexpr const char* CYAN   = "\033[1;36m";
inline constexpr const char* GRAY   = "\033[0;90m";

#endif // TRAWL_COLOR_HPP
