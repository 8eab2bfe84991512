#ifndef NETNAME_LOGGING_H_
#define NETNAME_LOGGING_H_

#include <spdlog/spdlog.h>

enum class Verbosity { kQuiet, kNormal, kVerbose };

// Installs a stderr logger named |name| as the spdlog default. Standard
// output is left to the tools' results.
void init_logging(const char* name, Verbosity verbosity);

#endif  // NETNAME_LOGGING_H_
