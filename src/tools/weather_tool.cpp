#include "weathermcp/tools/weather_tool.hpp"
#include "weathermcp/utils/logging.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace weathermcp {
namespace tools {

std::string unitToString(TemperatureUnit unit) {
  return unit == TemperatureUnit::Imperial ? "imperial" : "metric";
}

TemperatureUnit unitFromString(const std::string &name) {
  if (name == "metric") {
    return TemperatureUnit::Metric;
  }
  if (name == "imperial") {
    return TemperatureUnit::Imperial;
  }
  throw std::invalid_argument("Unknown temperature unit: " + name);
}

StaticWeatherSource::StaticWeatherSource()
    : StaticWeatherSource(
          {{"paris", {15, "Cloudy", 70, TemperatureUnit::Metric}},
           {"london", {12, "Rainy", 85, TemperatureUnit::Metric}},
           {"tokyo", {22, "Sunny", 60, TemperatureUnit::Metric}}}) {}

StaticWeatherSource::StaticWeatherSource(
    std::map<std::string, WeatherReading> readings)
    : readings_(std::move(readings)) {}

std::optional<WeatherReading>
StaticWeatherSource::lookup(const std::string &city) const {
  auto it = readings_.find(city);
  if (it == readings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

double convertTemperature(double value, TemperatureUnit from,
                          TemperatureUnit to) {
  if (from == to) {
    return value;
  }
  if (to == TemperatureUnit::Imperial) {
    return value * 9.0 / 5.0 + 32.0;
  }
  return (value - 32.0) * 5.0 / 9.0;
}

double roundToTenth(double value) {
  double rounded = std::round(value * 10.0) / 10.0;
  // Avoid reporting -0
  return rounded == 0.0 ? 0.0 : rounded;
}

std::string formatTemperature(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << roundToTenth(value);
  std::string text = out.str();
  if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0) {
    text.erase(text.size() - 2);
  }
  return text;
}

ToolDefinition makeWeatherTool(std::shared_ptr<const WeatherSource> source) {
  if (!source) {
    throw std::invalid_argument("Weather tool requires a data source");
  }

  ToolDefinition tool;
  tool.name = kWeatherToolName;
  tool.title = "Get City Weather";
  tool.description =
      "Fetches the current weather forecast for a specified city.";

  tool.input_schema
      .add({.name = "city",
            .type = FieldType::String,
            .description = "The name of the city (e.g., Paris, London, Tokyo).",
            .lowercase = true})
      .add({.name = "unit",
            .type = FieldType::String,
            .description = "The unit for temperature (metric for Celsius, "
                           "imperial for Fahrenheit).",
            .required = false,
            .default_value = "metric",
            .allowed_values = {"metric", "imperial"}});

  tool.output_schema = ObjectSchema({
      {.name = "city", .type = FieldType::String},
      {.name = "temperature", .type = FieldType::Number},
      {.name = "unit",
       .type = FieldType::String,
       .allowed_values = {"metric", "imperial"}},
      {.name = "description", .type = FieldType::String},
      {.name = "humidity", .type = FieldType::Number},
  });

  tool.annotations = types::ToolAnnotations{.title = "Get City Weather",
                                            .read_only_hint = true};

  tool.handler = [source](const nlohmann::json &arguments,
                          ToolContext &context) -> ToolOutcome {
    const auto city = arguments.at("city").get<std::string>();
    const auto requested = unitFromString(arguments.at("unit").get<std::string>());

    WEATHERMCP_LOG_INFO("Weather request for city: " << city << ", unit: "
                                                     << unitToString(requested));
    context.notifier.notify(types::LoggingLevel::Info,
                            "Processing weather request for " + city);

    auto reading = source->lookup(city);
    if (!reading) {
      return DomainMiss{"Sorry, I don't have weather data for " + city + "."};
    }

    double temperature = roundToTenth(
        convertTemperature(reading->temperature, reading->unit, requested));

    std::ostringstream text;
    text << "The weather in " << city << " is "
         << formatTemperature(temperature) << "°"
         << (requested == TemperatureUnit::Metric ? "C" : "F") << ", "
         << reading->description << " with " << reading->humidity
         << "% humidity.";

    nlohmann::json structured = {{"city", city},
                                 {"temperature", temperature},
                                 {"unit", unitToString(requested)},
                                 {"description", reading->description},
                                 {"humidity", reading->humidity}};

    return ToolSuccess{text.str(), std::move(structured)};
  };

  return tool;
}

} // namespace tools
} // namespace weathermcp
