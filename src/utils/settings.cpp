/**
 * LSV Inspector - Settings Implementation
 */

#include "lsv/settings.hpp"

#include <nlohmann/json.hpp>
#include <fstream>

namespace lsv {

namespace {

const char* level_key(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
        case LogLevel::None:    return "none";
        default:                return "info";
    }
}

} // anonymous namespace

Settings load_settings(const std::filesystem::path& path) {
    Settings settings;

    std::ifstream file(path);
    if (!file) {
        LSV_LOG_WARNING("Settings", "Cannot open " << path.string() << ", using defaults");
        return settings;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("log_level")) {
            auto name = j["log_level"].get<std::string>();
            if (auto level = parse_log_level(name)) {
                settings.log_level = *level;
            } else {
                LSV_LOG_WARNING("Settings", "Unknown log level '" << name << "', keeping "
                                << level_key(settings.log_level));
            }
        }
        if (j.contains("log_file")) settings.log_file = j["log_file"].get<std::string>();
        if (j.contains("console_log")) settings.console_log = j["console_log"].get<bool>();
        if (j.contains("max_member_size")) settings.max_member_size = j["max_member_size"].get<uint64_t>();
        if (j.contains("max_package_size")) settings.max_package_size = j["max_package_size"].get<uint64_t>();
        if (j.contains("output_dir")) settings.output_dir = j["output_dir"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        LSV_LOG_WARNING("Settings", "Invalid settings file " << path.string() << ": " << e.what()
                        << ", using defaults");
        return Settings{};
    }

    LSV_LOG_DEBUG("Settings", "Loaded " << path.string());
    return settings;
}

Result<void> save_settings(const Settings& settings, const std::filesystem::path& path) {
    std::string text;
    try {
        nlohmann::json j;
        j["log_level"] = level_key(settings.log_level);
        j["log_file"] = settings.log_file.string();
        j["console_log"] = settings.console_log;
        j["max_member_size"] = settings.max_member_size;
        j["max_package_size"] = settings.max_package_size;
        j["output_dir"] = settings.output_dir.string();
        text = j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        return Error::invalid_argument(std::string("Cannot serialize settings: ") + e.what());
    }

    std::ofstream file(path);
    if (!file) {
        return Error::io_error("Cannot create settings file", path.string());
    }
    file << text << "\n";
    if (!file) {
        return Error::io_error("Write failed", path.string());
    }
    return Result<void>::success();
}

Result<void> apply_logging(const Settings& settings) {
    auto& logger = Logger::instance();
    logger.set_level(settings.log_level);
    logger.set_console_output(settings.console_log);

    if (settings.log_file.empty()) {
        logger.close_file();
        return Result<void>::success();
    }
    if (!logger.set_file(settings.log_file)) {
        return Error::io_error("Cannot open log file", settings.log_file.string());
    }
    return Result<void>::success();
}

} // namespace lsv
