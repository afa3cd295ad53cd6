#include "utils/ReadSimulationConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <fstream>
#include <sstream>

namespace dissim {

static std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

static std::string stripTrailingComment(const std::string& line) {
    for (size_t i = 1; i < line.size(); ++i) {
        if (line[i] == '#' && (line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::map<std::string, std::string> readSettingsFile(const std::string& filename) {
    Logger& logger = Logger::getInstance();
    std::map<std::string, std::string> settings;
    std::ifstream file(filename);
    if (!file.is_open()) {
        logger.error("ReadSimulationConfiguration::readSettingsFile", "Error opening settings file: " + filename);
        throw FileIOException("readSettingsFile", "Error opening settings file: " + filename);
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        line = trim(stripTrailingComment(line));

        std::istringstream iss(line);
        std::string setting_name;
        iss >> setting_name;
        std::string value;
        std::getline(iss, value);
        value = trim(value);
        if (value.empty()) {
            logger.error("ReadSimulationConfiguration::readSettingsFile", "Missing value in settings file (line " + std::to_string(line_number) + "): " + line);
            throw DataFormatException("readSettingsFile", "Missing value for setting '" + setting_name + "' on line " + std::to_string(line_number));
        }

        auto existing = settings.find(setting_name);
        if (setting_name == "patient0" && existing != settings.end()) {
            existing->second += ";" + value;
        } else {
            settings[setting_name] = value;
        }
    }
    logger.info("ReadSimulationConfiguration::readSettingsFile", "Successfully read " + std::to_string(settings.size()) + " settings from " + filename);
    return settings;
}

void readSimulationParameters(const std::string& filename, SimulationParameters& params) {
    const auto settings = readSettingsFile(filename);
    for (const auto& entry : settings) {
        applySetting(params, entry.first, entry.second);
    }
}

} // namespace dissim
