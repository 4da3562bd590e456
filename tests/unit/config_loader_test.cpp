#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace fs = std::filesystem;

using ticketflow::config::ConfigLoader;
using ticketflow::runtime::config::RuntimeConfig;

fs::path WriteYaml(const std::string& name, const std::string& content) {
  const fs::path dir = fs::temp_directory_path() / "ticketflow_config_loader_tests";
  fs::create_directories(dir);
  const fs::path path = dir / name;
  std::ofstream out(path);
  out << content;
  out.close();
  return path;
}

template <typename Fn>
bool ThrowsConfigError(Fn&& fn) {
  try {
    fn();
  } catch (const ticketflow::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestLoadsShippedConfig() {
  const RuntimeConfig config = ConfigLoader::LoadFromYaml("config/ticketflow.yaml");

  assert(config.logging().level() == "info");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "ticketflow.db");

  const auto& pipeline = config.pipeline();
  assert(pipeline.vendor_templates_path() == "config/vendor_templates.yaml");
  assert(pipeline.synonyms_path() == "config/synonyms.yaml");
  assert(pipeline.job_code() == "24-105");
  assert(pipeline.ticket_type() == "EXPORT");
  assert(pipeline.min_ticket_date() == "2020-01-01");
  assert(pipeline.duplicate_window_days() == 120);
  assert(pipeline.has_check_duplicate_files() && pipeline.check_duplicate_files());
  assert(pipeline.quantity_limits().max_cubic_yards() == 40.0);

  assert(config.batch().workers() == 4);
  assert(config.batch().has_max_retries());
  assert(config.batch().max_retries() == 2);
  assert(config.batch().backoff_multiplier() == 2.0);
  assert(config.reference().has_preload() && config.reference().preload());
}

void TestQuotedScalarsStayStrings() {
  const RuntimeConfig config = ConfigLoader::LoadFromString(R"(
pipeline:
  job_code: "1234"
  assumed_vendor: 'LDI_YARD'
)");
  assert(config.pipeline().job_code() == "1234");
  assert(config.pipeline().assumed_vendor() == "LDI_YARD");
}

void TestUnknownFieldsAreRejected() {
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromString("pipeline:\n  vendor_treshold: 0.8\n"); }));
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromString("server:\n  port: 8080\n"); }));
}

void TestMissingFileIsConfigError() {
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromYaml("/nonexistent/ticketflow.yaml"); }));
}

void TestMalformedYamlIsConfigError() {
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromString("pipeline: [unterminated\n"); }));
}

void TestOptionalFieldsReportPresence() {
  const auto path = WriteYaml("minimal.yaml", R"(
database:
  memory: {}
batch:
  workers: 1
)");
  const RuntimeConfig config = ConfigLoader::LoadFromYaml(path.string());

  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
  assert(!config.batch().has_max_retries());
  assert(!config.pipeline().has_check_duplicate_files());
  assert(!config.reference().has_preload());

  const auto options = ticketflow::factory::BuildBatchOptions(config);
  assert(options.workers == 1);
  assert(options.max_retries == 2);
  assert(options.check_duplicate_files);
  assert(options.preload_references);
  assert(options.processed_by == "ticketflow");
}

void TestExplicitZeroRetriesIsKept() {
  const RuntimeConfig config = ConfigLoader::LoadFromString(R"(
batch:
  max_retries: 0
  initial_backoff_ms: 10
pipeline:
  check_duplicate_files: false
reference:
  preload: false
)");
  const auto options = ticketflow::factory::BuildBatchOptions(config);
  assert(options.max_retries == 0);
  assert(options.initial_backoff == std::chrono::milliseconds(10));
  assert(!options.check_duplicate_files);
  assert(!options.preload_references);
}

void TestBackoffMultiplierBelowOneIsRejected() {
  const RuntimeConfig config = ConfigLoader::LoadFromString("batch:\n  backoff_multiplier: 0.5\n");
  assert(ThrowsConfigError([&] { ticketflow::factory::BuildBatchOptions(config); }));
}

void TestBuildSettingsAppliesOverrides() {
  const RuntimeConfig config = ConfigLoader::LoadFromString(R"(
pipeline:
  job_code: "25-001"
  assumed_vendor: POST_OAK
  duplicate_window_days: 30
  min_ticket_date: "2023-06-01"
  quantity_limits:
    max_tons: 25
)");
  const auto settings = ticketflow::factory::BuildSettings(config.pipeline());

  assert(settings.job_code == "25-001");
  assert(settings.ticket_type == "EXPORT");
  assert(settings.assumed_vendor && *settings.assumed_vendor == "POST_OAK");
  assert(settings.vendor_confidence_threshold == 0.80);
  assert(settings.duplicate_window_days == 30);
  assert(ticketflow::util::FormatDate(settings.limits.min_date) == "2023-06-01");
  assert(settings.limits.max_tons == 25.0);
  assert(settings.limits.max_cubic_yards == 40.0);
}

void TestBuildSettingsRejectsBadValues() {
  const RuntimeConfig bad_date = ConfigLoader::LoadFromString("pipeline:\n  min_ticket_date: \"01/01/2020\"\n");
  assert(ThrowsConfigError([&] { ticketflow::factory::BuildSettings(bad_date.pipeline()); }));

  const RuntimeConfig bad_threshold = ConfigLoader::LoadFromString("pipeline:\n  vendor_confidence_threshold: 1.5\n");
  assert(ThrowsConfigError([&] { ticketflow::factory::BuildSettings(bad_threshold.pipeline()); }));
}

} // namespace

int main() {
  TestLoadsShippedConfig();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsConfigError();
  TestMalformedYamlIsConfigError();
  TestOptionalFieldsReportPresence();
  TestExplicitZeroRetriesIsKept();
  TestBackoffMultiplierBelowOneIsRejected();
  TestBuildSettingsAppliesOverrides();
  TestBuildSettingsRejectsBadValues();

  std::cout << "ticketflow_unit_config_loader: pass\n";
  return 0;
}
