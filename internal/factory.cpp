#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/reference/seed_data.hpp"
#include "internal/templates/template_loader.hpp"
#include "internal/util/errors.hpp"
#if TICKETFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace ticketflow::factory {

using ticketflow::runtime::config::PipelineConfig;
using ticketflow::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TICKETFLOW_DB_SQLITE
    if (database.sqlite().path().empty()) throw util::ConfigError("database.sqlite.path is required");
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

processing::ProcessorSettings BuildSettings(const PipelineConfig& pipeline) {
  processing::ProcessorSettings settings;

  if (!pipeline.job_code().empty()) settings.job_code = pipeline.job_code();
  if (!pipeline.ticket_type().empty()) settings.ticket_type = pipeline.ticket_type();
  if (!pipeline.default_material().empty()) settings.default_material = pipeline.default_material();
  if (!pipeline.assumed_vendor().empty()) settings.assumed_vendor = pipeline.assumed_vendor();

  if (pipeline.vendor_confidence_threshold() > 0) settings.vendor_confidence_threshold = pipeline.vendor_confidence_threshold();
  if (pipeline.low_confidence_threshold() > 0) settings.low_confidence_threshold = pipeline.low_confidence_threshold();
  if (settings.vendor_confidence_threshold > 1.0 || settings.low_confidence_threshold > 1.0) {
    throw util::ConfigError("pipeline confidence thresholds must be within (0, 1]");
  }

  if (pipeline.duplicate_window_days() > 0) settings.duplicate_window_days = static_cast<int>(pipeline.duplicate_window_days());

  if (!pipeline.min_ticket_date().empty()) {
    auto date = util::ParseIsoDate(pipeline.min_ticket_date());
    if (!date) throw util::ConfigError("pipeline.min_ticket_date must be YYYY-MM-DD, got '" + pipeline.min_ticket_date() + "'");
    settings.limits.min_date = *date;
  }
  if (pipeline.max_future_days() > 0) settings.limits.max_future_days = static_cast<int>(pipeline.max_future_days());

  const auto& q = pipeline.quantity_limits();
  if (q.max_tons() > 0) settings.limits.max_tons = q.max_tons();
  if (q.max_cubic_yards() > 0) settings.limits.max_cubic_yards = q.max_cubic_yards();
  if (q.max_loads() > 0) settings.limits.max_loads = q.max_loads();

  return settings;
}

processing::BatchOptions BuildBatchOptions(const RuntimeConfig& config) {
  processing::BatchOptions options;
  const auto&              batch = config.batch();

  options.workers = batch.workers();
  if (batch.has_max_retries()) options.max_retries = static_cast<int>(batch.max_retries());
  if (batch.initial_backoff_ms() > 0) options.initial_backoff = std::chrono::milliseconds(batch.initial_backoff_ms());
  if (batch.backoff_multiplier() > 0) options.backoff_multiplier = batch.backoff_multiplier();
  if (options.backoff_multiplier < 1.0) throw util::ConfigError("batch.backoff_multiplier must be >= 1");
  options.processed_by = batch.processed_by().empty() ? "ticketflow" : batch.processed_by();

  const auto& pipeline          = config.pipeline();
  options.check_duplicate_files = !pipeline.has_check_duplicate_files() || pipeline.check_duplicate_files();
  options.preload_references    = !config.reference().has_preload() || config.reference().preload();
  return options;
}

Pipeline Build(const RuntimeConfig& config) {
  Pipeline pipeline;

  pipeline.repository = BuildRepository(config);

  const auto& reference = config.reference();
  if (!reference.has_seed_defaults() || reference.seed_defaults()) {
    const auto inserted = reference::SeedDefaults(*pipeline.repository);
    TICKETFLOW_LOG_INFO("reference data seeded", {observability::IntField("inserted", static_cast<int64_t>(inserted))});
  }

  const auto& p = config.pipeline();
  if (p.vendor_templates_path().empty()) throw util::ConfigError("pipeline.vendor_templates_path is required");
  pipeline.catalog = std::make_shared<const templates::TemplateCatalog>(templates::TemplateLoader::LoadFromYaml(p.vendor_templates_path()));

  if (!p.synonyms_path().empty()) {
    pipeline.normalizer = std::make_shared<const normalize::SynonymNormalizer>(normalize::SynonymNormalizer::LoadFromYaml(p.synonyms_path()));
  } else {
    pipeline.normalizer = std::make_shared<const normalize::SynonymNormalizer>();
  }

  pipeline.settings      = BuildSettings(p);
  pipeline.batch_options = BuildBatchOptions(config);
  return pipeline;
}

std::unique_ptr<processing::BatchProcessor> BuildBatchProcessor(const Pipeline& pipeline, processing::DocumentSourceFactory sources) {
  if (!sources) {
    sources = [] { return std::make_unique<processing::SidecarDocumentSource>(); };
  }
  return std::make_unique<processing::BatchProcessor>(pipeline.repository, pipeline.catalog, pipeline.normalizer, pipeline.settings, std::move(sources),
                                                      pipeline.batch_options);
}

} // namespace ticketflow::factory
