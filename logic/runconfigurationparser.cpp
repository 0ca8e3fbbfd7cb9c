#include "cbudget/runconfigurationparser.h"
#include "cbudget/runconfiguration.h"

#include "infra/cast.h"
#include "infra/exception.h"

#include <cassert>
#include <filesystem>
#include <toml++/toml.h>

namespace cbudget {

using namespace inf;
using namespace std::string_view_literals;

struct NamedSection
{
    NamedSection(std::string_view theName, toml::node_view<const toml::node> theSection)
    : name(theName)
    , section(theSection)
    {
    }

    std::string name;
    toml::node_view<const toml::node> section;
};

static fs::path read_path(const NamedSection& ns, std::string_view name, const fs::path& basePath)
{
    assert(ns.section.is_table());
    auto nodeValue = ns.section[name];

    if (!nodeValue) {
        throw RuntimeError("'{0:}' key not present in '{1:}' section (e.g. {0:} = \"/some/path\")", name, ns.name);
    }

    if (auto pathValue = nodeValue.value<std::string_view>(); pathValue.has_value()) {
        auto result = fs::u8path(*pathValue);
        if (result.is_relative()) {
            result = basePath / result;
            if (fs::exists(result)) {
                result = fs::canonical(result);
            }
        }

        return result;
    } else {
        throw RuntimeError("Invalid path value for '{0:}' key in '{1:}' section (e.g. {0:} = \"/some/path\")", name, ns.name);
    }
}

static fs::path read_optional_path(const NamedSection& ns, std::string_view name, const fs::path& basePath)
{
    if (!ns.section[name]) {
        return basePath;
    }

    return read_path(ns, name, basePath);
}

static date::year parse_year(const NamedSection& ns, std::string_view name)
{
    auto nodeValue = ns.section[name];
    if (!nodeValue) {
        throw RuntimeError("No {0:} present in '{1:}' section (e.g. {0:} = 2020)", name, ns.name);
    }

    if (!nodeValue.is_integer()) {
        if (nodeValue.is_string()) {
            throw RuntimeError("Invalid {0:} present in '{1:}' section, year values should not be quoted (e.g. {0:} = 2020)", name, ns.name);
        }

        throw RuntimeError("Invalid {} present in '{}' section", name, ns.name);
    }

    auto yearInt = nodeValue.value<int64_t>();
    if (!yearInt.has_value()) {
        throw RuntimeError("Invalid {} present in '{}' section", name, ns.name);
    }

    date::year result(truncate<int32_t>(*yearInt));
    if (!fits_in_type<int32_t>(*yearInt) || !result.ok()) {
        throw RuntimeError("Invalid {} value present in '{}' section ({})", name, ns.name, *yearInt);
    }

    return result;
}

static Quantity read_quantity(const NamedSection& ns, std::string_view name, std::string_view example)
{
    auto nodeValue = ns.section[name];
    if (!nodeValue) {
        throw RuntimeError("'{0:}' key not present in '{1:}' section (e.g. {0:} = \"{2:}\")", name, ns.name, example);
    }

    if (!nodeValue.is_string()) {
        throw RuntimeError("'{0:}' key value in '{1:}' section should be a quoted quantity with unit (e.g. {0:} = \"{2:}\")", name, ns.name, example);
    }

    try {
        return Quantity::parse(nodeValue.value_or<std::string_view>(""sv));
    } catch (const std::exception& e) {
        throw RuntimeError("Invalid '{}' value in '{}' section: {}", name, ns.name, e.what());
    }
}

static std::vector<std::string> read_string_list(const NamedSection& ns, std::string_view name)
{
    std::vector<std::string> result;

    auto nodeValue = ns.section[name];
    if (!nodeValue) {
        return result;
    }

    const auto* array = nodeValue.as_array();
    if (array == nullptr) {
        throw RuntimeError("'{0:}' key value in '{1:}' section should be a list of strings (e.g. {0:} = [\"ID1\", \"ID2\"])", name, ns.name);
    }

    for (const auto& item : *array) {
        if (auto value = item.value<std::string>(); value.has_value()) {
            result.push_back(*value);
        } else {
            throw RuntimeError("'{}' key in '{}' section contains a value that is not a string", name, ns.name);
        }
    }

    return result;
}

static void throw_on_missing_section(const toml::table& table, std::string_view name)
{
    if (!table.contains(name)) {
        throw RuntimeError("No '{}' section present in configuration", name);
    }
}

static RunConfiguration parse_run_configuration_impl(std::string_view configContents, const fs::path& basePath, std::string_view sourcePath)
{
    try {
        const toml::table table = toml::parse(configContents, sourcePath);

        throw_on_missing_section(table, "model");
        throw_on_missing_section(table, "benchmark");
        throw_on_missing_section(table, "output");

        NamedSection model("model", table["model"]);
        NamedSection benchmark("benchmark", table["benchmark"]);
        NamedSection options("options", table["options"]);
        NamedSection output("output", table["output"]);

        const auto dataPath = read_optional_path(model, "datapath", basePath);

        RunConfiguration::Input input;
        input.companies           = read_path(model, "companies", dataPath);
        input.companySeries       = read_path(model, "company_series", dataPath);
        input.intensityBenchmark  = read_path(model, "intensity_benchmark", dataPath);
        input.productionBenchmark = read_path(model, "production_benchmark", dataPath);

        ProjectionControls controls;
        controls.baseYear   = parse_year(model, "base_year");
        controls.targetYear = parse_year(model, "target_year");
        if (controls.targetYear <= controls.baseYear) {
            throw RuntimeError("target_year ({}) should be later than base_year ({}) in 'model' section", static_cast<int>(controls.targetYear), static_cast<int>(controls.baseYear));
        }

        RunConfiguration::Benchmark benchmarkConfig;
        benchmarkConfig.productionCentric = benchmark.section["production_centric"].value_or<bool>(false);
        benchmarkConfig.globalBudget      = read_quantity(benchmark, "global_budget", "396 Gt CO2");
        benchmarkConfig.temperature       = read_quantity(benchmark, "temperature", "1.5 delta_degC");

        bool estimateMissingS3 = false;
        std::vector<std::string> companies;
        if (options.section) {
            estimateMissingS3 = options.section["estimate_missing_s3"].value_or<bool>(false);
            companies         = read_string_list(options, "companies");
        }

        const auto outputPath = read_path(output, "path", basePath);

        return RunConfiguration(std::move(input), controls, std::move(benchmarkConfig), estimateMissingS3, std::move(companies), outputPath);
    } catch (const toml::parse_error& e) {
        if (const auto& errorBegin = e.source().begin; errorBegin) {
            throw RuntimeError("Failed to parse run configuration: {} (line {} column {})", e.description(), errorBegin.line, errorBegin.column);
        }

        throw RuntimeError("Failed to parse run configuration: {}", e.description());
    }
}

RunConfiguration parse_run_configuration_file(const fs::path& config)
{
    return parse_run_configuration_impl(file::read_as_text(config), config.parent_path(), str::from_u8(config.u8string()));
}

RunConfiguration parse_run_configuration(std::string_view configContents, const fs::path& basePath)
{
    return parse_run_configuration_impl(configContents, basePath, "");
}

}
