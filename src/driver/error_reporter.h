#pragma once

#include "driver/errors.h"

class Logger;

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILED = 1;
inline constexpr int EXIT_USAGE = 2;

class ErrorReporter {
    Logger& logger;

public:
    explicit ErrorReporter(Logger& logger);

    // Logs a recovered failure and returns the process exit code for it.
    // ERR_UNIMPLEMENTED is never recovered: it is logged and raised as UnimplementedFeature.
    int report(const DriverError& error);

    // Only logs; the caller rethrows so the fault reaches the runtime intact
    void reportUnimplemented(const UnimplementedFeature& error);
};
