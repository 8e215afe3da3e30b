#include "code_interpreter/charts.hpp"

#include <initializer_list>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scalebox::code_interpreter {

namespace {

using nlohmann::json;

// Reads the first of the given keys that is present and not null.
const json* FindKey(const json& data, std::initializer_list<const char*> keys) {
    for (const auto* key : keys) {
        auto it = data.find(key);
        if (it != data.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string ReadString(const json& data, std::initializer_list<const char*> keys, const std::string& fallback = {}) {
    if (const auto* value = FindKey(data, keys)) {
        return value->get<std::string>();
    }
    return fallback;
}

std::optional<std::string> ReadOptionalString(const json& data, std::initializer_list<const char*> keys) {
    if (const auto* value = FindKey(data, keys)) {
        return value->get<std::string>();
    }
    return std::nullopt;
}

// Numbers sometimes arrive as strings, e.g. bar values built in notebooks.
double ReadNumber(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        std::size_t consumed = 0;
        const double number = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("not a number: " + text);
        }
        return number;
    }
    throw std::invalid_argument("expected a number, got " + std::string(value.type_name()));
}

double ReadNumberField(const json& data, std::initializer_list<const char*> keys) {
    if (const auto* value = FindKey(data, keys)) {
        return ReadNumber(*value);
    }
    return 0.0;
}

const json& ElementsOf(const json& data) {
    static const json kEmpty = json::array();
    if (const auto* value = FindKey(data, {"elements"})) {
        if (!value->is_array()) {
            throw std::invalid_argument("chart elements must be an array");
        }
        return *value;
    }
    return kEmpty;
}

ChartAxes ReadAxes(const json& data) {
    return ChartAxes{
        .x_label = ReadOptionalString(data, {"x_label", "xLabel"}),
        .y_label = ReadOptionalString(data, {"y_label", "yLabel"}),
        .x_unit = ReadOptionalString(data, {"x_unit", "xUnit"}),
        .y_unit = ReadOptionalString(data, {"y_unit", "yUnit"}),
    };
}

void WriteAxes(json& out, const ChartAxes& axes) {
    if (axes.x_label) out["x_label"] = *axes.x_label;
    if (axes.y_label) out["y_label"] = *axes.y_label;
    if (axes.x_unit) out["x_unit"] = *axes.x_unit;
    if (axes.y_unit) out["y_unit"] = *axes.y_unit;
}

std::vector<json> ReadJsonList(const json& data, std::initializer_list<const char*> keys) {
    std::vector<json> items;
    if (const auto* value = FindKey(data, keys)) {
        for (const auto& item : *value) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> ReadStringList(const json& data, std::initializer_list<const char*> keys) {
    std::vector<std::string> items;
    if (const auto* value = FindKey(data, keys)) {
        for (const auto& item : *value) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

PointChart ReadPointChart(const json& data) {
    PointChart chart{};
    chart.title = ReadString(data, {"title"});
    chart.axes = ReadAxes(data);
    chart.x_ticks = ReadJsonList(data, {"x_ticks", "xTicks"});
    chart.x_tick_labels = ReadStringList(data, {"x_tick_labels", "xTickLabels"});
    chart.x_scale = ReadString(data, {"x_scale", "xScale"}, "linear");
    chart.y_ticks = ReadJsonList(data, {"y_ticks", "yTicks"});
    chart.y_tick_labels = ReadStringList(data, {"y_tick_labels", "yTickLabels"});
    chart.y_scale = ReadString(data, {"y_scale", "yScale"}, "linear");
    for (const auto& element : ElementsOf(data)) {
        PointSeries series{};
        series.label = ReadString(element, {"label"});
        if (const auto* points = FindKey(element, {"points"})) {
            for (const auto& point : *points) {
                if (!point.is_array() || point.size() != 2) {
                    throw std::invalid_argument("chart point must be an [x, y] pair");
                }
                series.points.emplace_back(point.at(0), point.at(1));
            }
        }
        chart.elements.push_back(std::move(series));
    }
    return chart;
}

json WritePointChart(ChartType type, const PointChart& chart) {
    json out = {
        {"type", ToString(type)},
        {"title", chart.title},
        {"x_ticks", chart.x_ticks},
        {"x_tick_labels", chart.x_tick_labels},
        {"x_scale", chart.x_scale},
        {"y_ticks", chart.y_ticks},
        {"y_tick_labels", chart.y_tick_labels},
        {"y_scale", chart.y_scale}
    };
    WriteAxes(out, chart.axes);
    json elements = json::array();
    for (const auto& series : chart.elements) {
        json points = json::array();
        for (const auto& [x, y] : series.points) {
            points.push_back(json::array({x, y}));
        }
        elements.push_back({{"label", series.label}, {"points", points}});
    }
    out["elements"] = std::move(elements);
    return out;
}

BarChart ReadBarChart(const json& data) {
    BarChart chart{};
    chart.title = ReadString(data, {"title"});
    chart.axes = ReadAxes(data);
    for (const auto& element : ElementsOf(data)) {
        chart.elements.push_back(BarElement{
            .label = ReadString(element, {"label"}),
            .group = ReadString(element, {"group"}),
            .value = ReadNumberField(element, {"value"}),
        });
    }
    return chart;
}

PieChart ReadPieChart(const json& data) {
    PieChart chart{};
    chart.title = ReadString(data, {"title"});
    for (const auto& element : ElementsOf(data)) {
        chart.elements.push_back(PieElement{
            .label = ReadString(element, {"label"}),
            .angle = ReadNumberField(element, {"angle"}),
            .radius = ReadNumberField(element, {"radius"}),
        });
    }
    return chart;
}

BoxAndWhiskerChart ReadBoxAndWhiskerChart(const json& data) {
    BoxAndWhiskerChart chart{};
    chart.title = ReadString(data, {"title"});
    chart.axes = ReadAxes(data);
    for (const auto& element : ElementsOf(data)) {
        BoxAndWhiskerElement box{
            .label = ReadString(element, {"label"}),
            .min = ReadNumberField(element, {"min"}),
            .first_quartile = ReadNumberField(element, {"first_quartile", "firstQuartile"}),
            .median = ReadNumberField(element, {"median"}),
            .third_quartile = ReadNumberField(element, {"third_quartile", "thirdQuartile"}),
            .max = ReadNumberField(element, {"max"}),
            .outliers = {},
        };
        if (const auto* outliers = FindKey(element, {"outliers"})) {
            for (const auto& outlier : *outliers) {
                box.outliers.push_back(ReadNumber(outlier));
            }
        }
        chart.elements.push_back(std::move(box));
    }
    return chart;
}

Chart ReadChart(ChartType type, const json& data) {
    switch (type) {
        case ChartType::kLine: return LineChart{ReadPointChart(data)};
        case ChartType::kScatter: return ScatterChart{ReadPointChart(data)};
        case ChartType::kBar: return ReadBarChart(data);
        case ChartType::kPie: return ReadPieChart(data);
        case ChartType::kBoxAndWhisker: return ReadBoxAndWhiskerChart(data);
        case ChartType::kSuperchart: {
            SuperChart chart{};
            chart.title = ReadString(data, {"title"});
            for (const auto& element : ElementsOf(data)) {
                if (auto nested = DeserializeChart(element)) {
                    chart.elements.push_back(std::move(*nested));
                }
            }
            return chart;
        }
    }
    throw std::invalid_argument("unsupported chart type");
}

}  // namespace

const char* ToString(ChartType type) {
    switch (type) {
        case ChartType::kLine: return "line";
        case ChartType::kScatter: return "scatter";
        case ChartType::kBar: return "bar";
        case ChartType::kPie: return "pie";
        case ChartType::kBoxAndWhisker: return "box_and_whisker";
        case ChartType::kSuperchart: return "superchart";
    }
    return "unknown";
}

std::optional<ChartType> ChartTypeFromString(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "line") return ChartType::kLine;
    if (lowered == "scatter") return ChartType::kScatter;
    if (lowered == "bar") return ChartType::kBar;
    if (lowered == "pie") return ChartType::kPie;
    if (lowered == "box_and_whisker") return ChartType::kBoxAndWhisker;
    if (lowered == "superchart") return ChartType::kSuperchart;
    return std::nullopt;
}

ChartType GetChartType(const Chart& chart) {
    return std::visit(utils::Overloaded{
        [](const LineChart&) { return ChartType::kLine; },
        [](const ScatterChart&) { return ChartType::kScatter; },
        [](const BarChart&) { return ChartType::kBar; },
        [](const PieChart&) { return ChartType::kPie; },
        [](const BoxAndWhiskerChart&) { return ChartType::kBoxAndWhisker; },
        [](const SuperChart&) { return ChartType::kSuperchart; }
    }, chart);
}

std::optional<Chart> DeserializeChart(const json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    auto it = data.find("type");
    if (it == data.end() || !it->is_string()) {
        return std::nullopt;
    }
    const auto type = ChartTypeFromString(it->get<std::string>());
    if (!type.has_value()) {
        utils::LogDebug("execution", "unknown chart type: " + it->get<std::string>());
        return std::nullopt;
    }
    try {
        return ReadChart(*type, data);
    } catch (const json::exception& ex) {
        utils::LogDebug("execution", std::string("dropping malformed chart: ") + ex.what());
    } catch (const std::invalid_argument& ex) {
        utils::LogDebug("execution", std::string("dropping malformed chart: ") + ex.what());
    } catch (const std::out_of_range& ex) {
        utils::LogDebug("execution", std::string("dropping malformed chart: ") + ex.what());
    }
    return std::nullopt;
}

json SerializeChart(const Chart& chart) {
    return std::visit(utils::Overloaded{
        [](const LineChart& line) { return WritePointChart(ChartType::kLine, line); },
        [](const ScatterChart& scatter) { return WritePointChart(ChartType::kScatter, scatter); },
        [](const BarChart& bar) {
            json out = {{"type", ToString(ChartType::kBar)}, {"title", bar.title}};
            WriteAxes(out, bar.axes);
            json elements = json::array();
            for (const auto& element : bar.elements) {
                elements.push_back({{"label", element.label}, {"group", element.group}, {"value", element.value}});
            }
            out["elements"] = std::move(elements);
            return out;
        },
        [](const PieChart& pie) {
            json elements = json::array();
            for (const auto& element : pie.elements) {
                elements.push_back({{"label", element.label}, {"angle", element.angle}, {"radius", element.radius}});
            }
            return json{{"type", ToString(ChartType::kPie)}, {"title", pie.title}, {"elements", elements}};
        },
        [](const BoxAndWhiskerChart& box) {
            json out = {{"type", ToString(ChartType::kBoxAndWhisker)}, {"title", box.title}};
            WriteAxes(out, box.axes);
            json elements = json::array();
            for (const auto& element : box.elements) {
                elements.push_back({
                    {"label", element.label},
                    {"min", element.min},
                    {"first_quartile", element.first_quartile},
                    {"median", element.median},
                    {"third_quartile", element.third_quartile},
                    {"max", element.max},
                    {"outliers", element.outliers}
                });
            }
            out["elements"] = std::move(elements);
            return out;
        },
        [](const SuperChart& super) {
            json elements = json::array();
            for (const auto& element : super.elements) {
                elements.push_back(SerializeChart(element));
            }
            return json{{"type", ToString(ChartType::kSuperchart)}, {"title", super.title}, {"elements", elements}};
        }
    }, chart);
}

}  // namespace scalebox::code_interpreter
