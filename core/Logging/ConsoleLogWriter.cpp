#include "ConsoleLogWriter.h"

#include <cstdlib>
#include <string>

#include <unistd.h>

namespace LvTiles {

namespace Colors {
    const char* RESET = "\033[0m";
    const char* RED = "\033[31m";
    const char* GREEN = "\033[32m";
    const char* YELLOW = "\033[33m";
    const char* BLUE = "\033[34m";
    const char* CYAN = "\033[36m";
    const char* WHITE = "\033[37m";
    const char* BOLD_RED = "\033[1;31m";
}

ConsoleLogWriter::ConsoleLogWriter(LogLevel level)
    : LogWriter(level), colorsEnabled(supportsColors())
{
}

void ConsoleLogWriter::WriteLogMessage(const LogMessage& msg) {
    std::ostream& output = getOutputStream(msg.level);

    if (colorsEnabled) {
        output << getLevelColor(msg.level) << "[" << LogLevelName(msg.level) << "]" << Colors::RESET
               << Colors::CYAN << "[" << msg.owner << "]" << Colors::RESET
               << " " << msg.message << '\n';
    } else {
        output << "[" << LogLevelName(msg.level) << "]["
               << msg.owner << "] "
               << msg.message << '\n';
    }
}

void ConsoleLogWriter::Flush() {
    std::cout.flush();
    std::cerr.flush();
}

std::ostream& ConsoleLogWriter::getOutputStream(LogLevel level) const {
    switch (level) {
        case FATAL:
        case ERROR:
        case WARNING:
            return std::cerr;
        default:
            return std::cout;
    }
}

const char* ConsoleLogWriter::getLevelColor(LogLevel level) const {
    switch (level) {
        case FATAL: return Colors::BOLD_RED;
        case ERROR: return Colors::RED;
        case WARNING: return Colors::YELLOW;
        case MESSAGE: return Colors::GREEN;
        case DEBUG: return Colors::BLUE;
        default: return Colors::WHITE;
    }
}

bool ConsoleLogWriter::supportsColors() const {
    // Piped output (e.g. into a file or CI log) stays plain
    if (!isatty(STDOUT_FILENO)) return false;

    const char* term = std::getenv("TERM");
    if (!term) return false;

    std::string terminal(term);
    return (terminal.find("xterm") != std::string::npos ||
            terminal.find("linux") != std::string::npos ||
            terminal.find("screen") != std::string::npos ||
            terminal.find("tmux") != std::string::npos ||
            terminal.find("color") != std::string::npos);
}

} // namespace LvTiles
