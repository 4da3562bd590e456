#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/normalize/synonym_normalizer.hpp"
#include "internal/processing/batch_processor.hpp"
#include "internal/processing/document_source.hpp"
#include "internal/processing/ticket_processor.hpp"
#include "internal/templates/vendor_template.hpp"

namespace ticketflow::factory {

/*
  Pipeline

  Long-lived, immutable pieces shared by every batch in the process.
  Per-run state (reference cache, ticket processor) is created by the
  batch processor itself.
*/
struct Pipeline {
  std::shared_ptr<db::Repository>                     repository;
  std::shared_ptr<const templates::TemplateCatalog>   catalog;
  std::shared_ptr<const normalize::SynonymNormalizer> normalizer;

  processing::ProcessorSettings settings;
  processing::BatchOptions      batch_options;
};

/*
  Composition root. The only place that knows concrete repository types.
  Throws util::ConfigError / util::TemplateError on bad input.
*/
std::shared_ptr<db::Repository> BuildRepository(const ticketflow::runtime::config::RuntimeConfig& config);

processing::ProcessorSettings BuildSettings(const ticketflow::runtime::config::PipelineConfig& pipeline);
processing::BatchOptions      BuildBatchOptions(const ticketflow::runtime::config::RuntimeConfig& config);

Pipeline Build(const ticketflow::runtime::config::RuntimeConfig& config);

// Defaults to sidecar OCR files when no factory is given.
std::unique_ptr<processing::BatchProcessor> BuildBatchProcessor(const Pipeline& pipeline, processing::DocumentSourceFactory sources = {});

} // namespace ticketflow::factory
