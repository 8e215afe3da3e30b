#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace scalebox::code_interpreter {

enum class ChartType {
    kLine,
    kScatter,
    kBar,
    kPie,
    kBoxAndWhisker,
    kSuperchart
};

const char* ToString(ChartType type);
std::optional<ChartType> ChartTypeFromString(const std::string& value);

struct ChartAxes {
    std::optional<std::string> x_label;
    std::optional<std::string> y_label;
    std::optional<std::string> x_unit;
    std::optional<std::string> y_unit;

    bool operator==(const ChartAxes&) const = default;
};

// One line or scatter series. Coordinates stay JSON since x is often a
// date string rather than a number.
struct PointSeries {
    std::string label;
    std::vector<std::pair<nlohmann::json, nlohmann::json>> points;

    bool operator==(const PointSeries&) const = default;
};

struct PointChart {
    std::string title;
    ChartAxes axes;
    std::vector<nlohmann::json> x_ticks;
    std::vector<std::string> x_tick_labels;
    std::string x_scale = "linear";
    std::vector<nlohmann::json> y_ticks;
    std::vector<std::string> y_tick_labels;
    std::string y_scale = "linear";
    std::vector<PointSeries> elements;

    bool operator==(const PointChart&) const = default;
};

struct LineChart : PointChart {
    bool operator==(const LineChart&) const = default;
};

struct ScatterChart : PointChart {
    bool operator==(const ScatterChart&) const = default;
};

struct BarElement {
    std::string label;
    std::string group;
    double value = 0.0;

    bool operator==(const BarElement&) const = default;
};

struct BarChart {
    std::string title;
    ChartAxes axes;
    std::vector<BarElement> elements;

    bool operator==(const BarChart&) const = default;
};

struct PieElement {
    std::string label;
    double angle = 0.0;
    double radius = 0.0;

    bool operator==(const PieElement&) const = default;
};

struct PieChart {
    std::string title;
    std::vector<PieElement> elements;

    bool operator==(const PieChart&) const = default;
};

struct BoxAndWhiskerElement {
    std::string label;
    double min = 0.0;
    double first_quartile = 0.0;
    double median = 0.0;
    double third_quartile = 0.0;
    double max = 0.0;
    std::vector<double> outliers;

    bool operator==(const BoxAndWhiskerElement&) const = default;
};

struct BoxAndWhiskerChart {
    std::string title;
    ChartAxes axes;
    std::vector<BoxAndWhiskerElement> elements;

    bool operator==(const BoxAndWhiskerChart&) const = default;
};

struct SuperChart;

using Chart = std::variant<LineChart, ScatterChart, BarChart, PieChart, BoxAndWhiskerChart, SuperChart>;

struct SuperChart {
    std::string title;
    std::vector<Chart> elements;

    bool operator==(const SuperChart&) const = default;
};

ChartType GetChartType(const Chart& chart);

// Decodes a chart payload {"type": ..., ...}. Unknown types, non-objects and
// malformed payloads yield nullopt. Axis keys are accepted in snake_case
// and camelCase. Superchart elements that fail to decode are dropped.
std::optional<Chart> DeserializeChart(const nlohmann::json& data);

// Inverse of DeserializeChart, snake_case keys.
nlohmann::json SerializeChart(const Chart& chart);

}  // namespace scalebox::code_interpreter
