#ifndef WEATHERMCP_TOOLS_WEATHER_TOOL_HPP_
#define WEATHERMCP_TOOLS_WEATHER_TOOL_HPP_

#include "weathermcp/tools/tool_registry.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace weathermcp {
namespace tools {

/**
 * @brief Temperature unit system
 */
enum class TemperatureUnit {
  Metric,  ///< Celsius
  Imperial ///< Fahrenheit
};

/**
 * @brief "metric" or "imperial"
 */
std::string unitToString(TemperatureUnit unit);

/**
 * @brief Parse "metric" or "imperial"
 *
 * @throws std::invalid_argument for any other value
 */
TemperatureUnit unitFromString(const std::string &name);

/**
 * @brief One weather record as stored by a data source
 */
struct WeatherReading {
  double temperature;   ///< In the record's native unit
  std::string description;
  int humidity;         ///< Percent
  TemperatureUnit unit; ///< Native unit of temperature
};

/**
 * @brief Black-box weather lookup
 */
class WeatherSource {
public:
  virtual ~WeatherSource() = default;

  /**
   * @brief Find the reading for a city
   *
   * @param city Lower-case city name
   * @return std::optional<WeatherReading> Empty when the city is unknown
   */
  virtual std::optional<WeatherReading>
  lookup(const std::string &city) const = 0;
};

/**
 * @brief In-memory source with a fixed table of readings
 */
class StaticWeatherSource : public WeatherSource {
public:
  /**
   * @brief Source with the bundled paris/london/tokyo table
   */
  StaticWeatherSource();

  explicit StaticWeatherSource(std::map<std::string, WeatherReading> readings);

  std::optional<WeatherReading> lookup(const std::string &city) const override;

private:
  std::map<std::string, WeatherReading> readings_;
};

/**
 * @brief Convert between Celsius and Fahrenheit; identity when units match
 */
double convertTemperature(double value, TemperatureUnit from,
                          TemperatureUnit to);

/**
 * @brief Round to one decimal place, halves away from zero
 */
double roundToTenth(double value);

/**
 * @brief Shortest decimal text of a value already rounded to a tenth
 * (15 -> "15", 37.5 -> "37.5")
 */
std::string formatTemperature(double value);

/**
 * @brief Name of the weather tool in the catalog
 */
inline constexpr const char *kWeatherToolName = "get_city_weather";

/**
 * @brief Build the get_city_weather tool over a data source
 *
 * Input: city (string, case-insensitive), unit ("metric" | "imperial",
 * default "metric"). Output: city, temperature, unit, description, humidity,
 * where unit is the unit the returned temperature is expressed in.
 */
ToolDefinition makeWeatherTool(std::shared_ptr<const WeatherSource> source);

} // namespace tools
} // namespace weathermcp

#endif // WEATHERMCP_TOOLS_WEATHER_TOOL_HPP_
