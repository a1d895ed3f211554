#pragma once

#include <memory>
#include <string>

namespace llvm {
    class raw_ostream;
}

enum Severity {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR,
    LOG_CRITICAL,
};

const char* severityName(Severity severity);

class LogFormatter {
public:
    virtual ~LogFormatter() = default;

    virtual void write(llvm::raw_ostream& out, Severity severity, const std::string& message) = 0;
};

class PlainFormatter : public LogFormatter {
public:
    void write(llvm::raw_ostream& out, Severity severity, const std::string& message) override;
};

class ColorFormatter : public LogFormatter {
public:
    void write(llvm::raw_ostream& out, Severity severity, const std::string& message) override;
};

// Colours only when the stream is attached to a terminal
std::unique_ptr<LogFormatter> makeFormatter(llvm::raw_ostream& out);

class Logger {
    Severity threshold;
    std::unique_ptr<LogFormatter> formatter;
    llvm::raw_ostream& out;

public:
    Logger(Severity threshold, std::unique_ptr<LogFormatter> formatter, llvm::raw_ostream& out);

    explicit Logger(Severity threshold);

    bool enabled(Severity severity) const;

    void log(Severity severity, const std::string& message);

    void debug(const std::string& message) { log(LOG_DEBUG, message); }

    void info(const std::string& message) { log(LOG_INFO, message); }

    void warning(const std::string& message) { log(LOG_WARNING, message); }

    void error(const std::string& message) { log(LOG_ERROR, message); }

    void critical(const std::string& message) { log(LOG_CRITICAL, message); }
};
