#ifndef IMAGESTASH_SHUTDOWN_OPTIONS_HPP
#define IMAGESTASH_SHUTDOWN_OPTIONS_HPP

#include <filesystem>
#include <string>

namespace imagestash {

struct ShutdownOptions {
    bool logCleanup = false;
};

/**
 * @brief Reads the shutdown_options section of a YAML file.
 *
 * A missing file yields the defaults. A malformed file is reported to stderr
 * and also yields the defaults.
 */
ShutdownOptions loadShutdownOptions(const std::filesystem::path& path);

// Runs after the event loop has stopped; the logger may already be gone.
void applyShutdownOptions(const ShutdownOptions& options, const std::filesystem::path& logDir);

}

#endif // IMAGESTASH_SHUTDOWN_OPTIONS_HPP
