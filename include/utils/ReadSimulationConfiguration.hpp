#ifndef READSIMULATIONCONFIGURATION_HPP
#define READSIMULATIONCONFIGURATION_HPP

#include <map>
#include <string>
#include "simulation/SimulationParameters.hpp"

namespace dissim {

/**
 * @brief Reads raw settings from a text file.
 *
 * Each non-empty line in the file should contain:
 * <setting_name> <value>
 * Lines starting with '#' are ignored, as is anything after a '#' preceded by
 * whitespace. Repeated patient0 lines are joined with ';'; any other repeated
 * setting keeps its last value.
 *
 * @param filename Path to the settings file.
 * @return std::map<std::string, std::string> Map of setting names to values.
 *
 * @throws FileIOException if the file cannot be opened.
 * @throws DataFormatException if a line has a name but no value.
 */
std::map<std::string, std::string> readSettingsFile(const std::string& filename);

/**
 * @brief Loads simulation settings from a configuration file into @p params.
 *
 * Settings absent from the file keep their current values, so the result can
 * be overridden afterwards by command-line options.
 *
 * @param filename Path to the configuration file.
 * @param params Parameters to update.
 *
 * @throws FileIOException if the file cannot be opened.
 * @throws DataFormatException if a line is malformed.
 * @throws InvalidParameterException if a setting name or value is invalid.
 */
void readSimulationParameters(const std::string& filename, SimulationParameters& params);

} // namespace dissim

#endif // READSIMULATIONCONFIGURATION_HPP
