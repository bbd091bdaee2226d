#include <drogon/drogon.h>
#include <filesystem>
#include <support/error_handler.hpp>
#include <support/image_store.hpp>
#include <support/shutdown_options.hpp>

int main() {
    
    // load configuration files
    std::string configPath;
    if (std::filesystem::exists("config.json")) {
        configPath = "config.json";
    } else if (std::filesystem::exists("config.yaml")) {
        configPath = "config.yaml";
    } else if (std::filesystem::exists("../config.json")) {
        std::filesystem::current_path("..");
        configPath = "config.json";
    } else if (std::filesystem::exists("../config.yaml")) {
        std::filesystem::current_path("..");
        configPath = "config.yaml";
    }

    if (configPath.empty()) {
        LOG_ERROR << "Could not find config.yaml or config.json";
        return 1;
    }

    if (!std::filesystem::exists("logs")) {
        std::filesystem::create_directory("logs");
        LOG_INFO << "Created log directory";
    }

    try {
        drogon::app().loadConfigFile(configPath);
        LOG_INFO << "Loaded config file from: " << std::filesystem::absolute(configPath);
        LOG_INFO << "Current working directory: " << std::filesystem::current_path();
    } catch (const std::exception& e) {
        LOG_ERROR << "Failed to load config file: " << e.what();
        return 1;
    }

    // create the storage directory up front rather than on the first request
    if (!imagestash::ImageStore::instance()) {
        LOG_ERROR << "Image store is not available, refusing to start";
        return 1;
    }

    drogon::app().setExceptionHandler(imagestash::handleUncaughtException);
    drogon::app().run();

    auto options = imagestash::loadShutdownOptions("shutdown_options.yaml");
    imagestash::applyShutdownOptions(options, "logs");
}
