// Interactive prompts on the controlling terminal.
#pragma once
#include <optional>
#include <string>

// Reads one line with echo disabled. std::nullopt when stdin is closed.
std::optional<std::string> promptSecret(const std::string &prompt);

// Asks a yes/no question; anything but "y"/"yes" is a no.
bool promptYesNo(const std::string &question);
