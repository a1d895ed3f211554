#pragma once

struct RawArguments;
class Backend;
class Logger;

// Runs one compilation and returns the process exit code. An UnimplementedFeature
// raised by the backend is logged and then rethrown.
int runDriver(const RawArguments& args, Backend& backend, Logger& logger);
