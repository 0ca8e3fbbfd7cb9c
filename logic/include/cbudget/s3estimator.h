#pragma once

#include "cbudget/company.h"
#include "cbudget/dataproviders.h"

namespace cbudget {

class RunSummary;

/* Synthesizes scope 3 data from the benchmark S3 intensity for a company that reports no scope 3 emissions
 * S3 emissions are the projected production of the company multiplied with the benchmark intensity
 * The company is returned unchanged when the benchmark has no S3 pathway or the units do not combine to emissions
 */
CompanyRecord estimate_missing_s3(CompanyRecord company,
                                  const IntensityBenchmarkDataProvider& intensityBenchmark,
                                  const ProductionBenchmarkDataProvider& productionBenchmark,
                                  const ProjectionControls& controls,
                                  RunSummary& summary);

}
