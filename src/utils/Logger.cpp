#include "utils/Logger.h"
#include <iostream>
#include <sstream>
#include <unistd.h>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";
}

Logger::Logger() : colorEnabled(isatty(STDOUT_FILENO) != 0) {}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    std::string color;
    std::string tag;
    switch (level) {
        case LogLevel::INFO:
            color = CYAN;
            tag = "[Info] ";
            break;
        case LogLevel::SUCCESS:
            color = GREEN;
            tag = "[OK] ";
            break;
        case LogLevel::WARNING:
            color = YELLOW;
            tag = "[Warn] ";
            break;
        case LogLevel::ERROR:
            color = RED + BOLD;
            tag = "[Error] ";
            break;
        case LogLevel::DEBUG:
            color = GRAY;
            tag = "[Debug] ";
            break;
    }
    std::string prefix = colorEnabled ? color + tag + RESET : tag;

    // Trim trailing newlines from message to avoid double spacing
    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    // Handle multi-line messages by prepending prefix to each line
    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        std::cout << prefix << line << std::endl;
    }
}
