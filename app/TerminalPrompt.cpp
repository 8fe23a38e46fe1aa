#include "TerminalPrompt.hpp"
#include <cstdio>
#include <iostream>
#include <termios.h>
#include <unistd.h>

std::optional<std::string> promptSecret(const std::string &prompt) {
    std::fprintf(stderr, "%s", prompt.c_str());
    std::fflush(stderr);

    termios old{};
    const bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &old) == 0;
    if (tty) {
        termios quiet = old;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        quiet.c_lflag |= ECHONL;
        ::tcsetattr(STDIN_FILENO, TCSANOW, &quiet);
    }
    std::string line;
    const bool got = static_cast<bool>(std::getline(std::cin, line));
    if (tty)
        ::tcsetattr(STDIN_FILENO, TCSANOW, &old);
    if (!got)
        return std::nullopt;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

bool promptYesNo(const std::string &question) {
    std::fprintf(stderr, "%s [y/N] ", question.c_str());
    std::fflush(stderr);
    std::string line;
    if (!std::getline(std::cin, line))
        return false;
    return line == "y" || line == "Y" || line == "yes" || line == "YES";
}
