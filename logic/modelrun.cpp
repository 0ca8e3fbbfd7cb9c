#include "cbudget/modelrun.h"

#include "cbudget/datawarehouse.h"
#include "cbudget/inputparsers.h"
#include "cbudget/runconfigurationparser.h"
#include "outputwriters.h"
#include "runsummary.h"

#include "infra/chrono.h"
#include "infra/exception.h"

#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/info.h>

namespace cbudget {

using namespace inf;

int run_model(const fs::path& runConfigPath, inf::Log::Level logLevel, std::optional<int32_t> concurrency, const ModelProgress::Callback& progressCb)
{
    auto runConfig = parse_run_configuration_file(runConfigPath);
    runConfig.set_max_concurrency(concurrency);
    std::unique_ptr<inf::LogRegistration> logReg;
    fs::create_directories(runConfig.output_path());
    inf::Log::add_file_sink(runConfig.output_path() / "cbudget.log");

    logReg = std::make_unique<inf::LogRegistration>("cbudget");
    inf::Log::set_level(logLevel);

    return run_model(runConfig, progressCb);
}

static IntensityBenchmark load_intensity_benchmark(const RunConfiguration& cfg)
{
    const auto& benchmark = cfg.benchmark();

    IntensityBenchmark::Properties properties;
    properties.productionCentric = benchmark.productionCentric;
    properties.globalBudget      = benchmark.globalBudget;
    properties.temperature       = benchmark.temperature;

    return parse_intensity_benchmark(cfg.intensity_benchmark_path(), cfg.projection_controls(), std::move(properties));
}

int run_model(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb)
{
    try {
        tbb::global_control tbbControl(tbb::global_control::max_allowed_parallelism, cfg.max_concurrency().value_or(oneapi::tbb::info::default_concurrency()));

        const auto& controls = cfg.projection_controls();
        Log::info("Scoring companies from {} up to {}", static_cast<int>(controls.baseYear), static_cast<int>(controls.targetYear));

        RunSummary summary;
        ModelProgress progress(4, progressCb);

        progress.set_payload(ModelProgressInfo("Load input data"));
        auto companies                 = load_companies(cfg);
        const auto intensityBenchmark  = load_intensity_benchmark(cfg);
        const auto productionBenchmark = parse_production_benchmark(cfg.production_benchmark_path(), controls);
        progress.tick();

        progress.set_payload(ModelProgressInfo("Prepare company data"));
        DataWarehouse::Options options;
        options.estimateMissingS3 = cfg.estimate_missing_s3();
        DataWarehouse warehouse(std::move(companies), controls, intensityBenchmark, productionBenchmark, options, summary);
        progress.tick();

        progress.set_payload(ModelProgressInfo("Score companies"));
        const auto companyIds = warehouse.company_ids();
        auto aggregates       = warehouse.get_preprocessed_company_data(companyIds);
        Log::info("Scored {} of {} companies", aggregates.size(), companyIds.size());
        progress.tick();

        progress.set_payload(ModelProgressInfo("Write results"));
        {
            chrono::ScopedDurationLog d("Write model run summary");
            write_company_aggregates(cfg.output_path() / "company_aggregates.csv", aggregates);

            summary.set_results(std::move(aggregates));
            summary.write_summary(cfg.output_path());
        }
        progress.tick();

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Log::error("{}", e.what());
        fmt::print("{}\n", e.what());
        return EXIT_FAILURE;
    }
}
}
