#include <support/shutdown_options.hpp>
#include <yaml-cpp/yaml.h>
#include <iostream>

namespace imagestash {

ShutdownOptions loadShutdownOptions(const std::filesystem::path& path) {
    ShutdownOptions result;
    if (!std::filesystem::exists(path)) return result;

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto options = root["shutdown_options"];
        if (options && options["log_cleanup"]) {
            result.logCleanup = options["log_cleanup"].as<bool>();
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to parse " << path.string() << ": " << e.what() << std::endl;
        return ShutdownOptions{};
    }
    return result;
}

void applyShutdownOptions(const ShutdownOptions& options, const std::filesystem::path& logDir) {
    if (options.logCleanup) {
        std::cout << "Cleaning up log directory" << std::endl;
        std::error_code ec;
        std::filesystem::remove_all(logDir, ec);
        std::filesystem::create_directory(logDir, ec);
        if (ec) {
            std::cerr << "Failed to reset " << logDir.string() << ": " << ec.message() << std::endl;
        }
    }
}

}
