#include <llvm/Support/raw_ostream.h>

#include "logging.h"

const char* severityName(const Severity severity) {
    switch (severity) {
        case LOG_DEBUG:
            return "DEBUG";
        case LOG_INFO:
            return "INFO";
        case LOG_WARNING:
            return "WARNING";
        case LOG_ERROR:
            return "ERROR";
        case LOG_CRITICAL:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

void PlainFormatter::write(llvm::raw_ostream& out, const Severity severity, const std::string& message) {
    out << severityName(severity) << ": " << message << "\n";
}

static llvm::raw_ostream::Colors severityColor(const Severity severity) {
    switch (severity) {
        case LOG_DEBUG:
            return llvm::raw_ostream::BLUE;
        case LOG_INFO:
            return llvm::raw_ostream::GREEN;
        case LOG_WARNING:
            return llvm::raw_ostream::YELLOW;
        case LOG_ERROR:
            return llvm::raw_ostream::RED;
        case LOG_CRITICAL:
            return llvm::raw_ostream::MAGENTA;
    }
    return llvm::raw_ostream::SAVEDCOLOR;
}

void ColorFormatter::write(llvm::raw_ostream& out, const Severity severity, const std::string& message) {
    out.enable_colors(out.has_colors());
    out.changeColor(severityColor(severity), severity >= LOG_ERROR);
    out << severityName(severity);
    out.resetColor();
    out << ": " << message << "\n";
}

std::unique_ptr<LogFormatter> makeFormatter(llvm::raw_ostream& out) {
    if (out.has_colors()) {
        return std::make_unique<ColorFormatter>();
    }
    return std::make_unique<PlainFormatter>();
}

Logger::Logger(const Severity threshold, std::unique_ptr<LogFormatter> formatter, llvm::raw_ostream& out)
    : threshold(threshold), formatter(std::move(formatter)), out(out) {
}

Logger::Logger(const Severity threshold) : Logger(threshold, makeFormatter(llvm::errs()), llvm::errs()) {
}

bool Logger::enabled(const Severity severity) const {
    return severity >= threshold;
}

void Logger::log(const Severity severity, const std::string& message) {
    if (!enabled(severity)) {
        return;
    }
    formatter->write(out, severity, message);
    out.flush();
}
