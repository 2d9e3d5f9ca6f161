#include "crec/ingest/data_loader.h"

#include "crec/ingest/clicks_reader.h"
#include "crec/ingest/embeddings_reader.h"
#include "crec/ingest/metadata_reader.h"

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace crec::ingest {

namespace {

struct ClickLoad {
  interaction::InteractionLog log;
  std::size_t files_loaded{0};
  std::size_t files_skipped{0};
  std::vector<std::string> warnings;
};

ClickLoad load_clicks(const LoadOptions& options) {
  ClickLoad out;
  const auto files = discover_click_files(options.data_dir, options.max_click_files);
  if (files.empty()) {
    out.warnings.push_back("no interaction-log files found under " + options.data_dir +
                           " (expected clicks/*.csv or clicks_hour*); interaction log is empty");
    return out;
  }

  std::vector<domain::InteractionEvent> all_events;
  for (const auto& file : files) {
    auto events = read_clicks_csv(file);
    if (!events.has_value()) {
      out.warnings.push_back("skipping interaction log " + events.error());
      ++out.files_skipped;
      continue;
    }
    const auto& loaded = events.value();
    all_events.insert(all_events.end(), loaded.begin(), loaded.end());
    ++out.files_loaded;
  }

  if (out.files_loaded == 0) {
    out.warnings.push_back("no interaction-log file loaded successfully; interaction log is empty");
  }
  out.log = interaction::InteractionLog(std::move(all_events));
  return out;
}

}  // namespace

LoadResult load_artifacts(const LoadOptions& options) {
  const fs::path dir(options.data_dir);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return LoadResult::err("data directory not found: " + options.data_dir);
  }

  // 1. Metadata (fatal on failure)
  auto records = read_catalog_csv((dir / kMetadataFile).string());
  if (!records.has_value()) {
    return LoadResult::err("failed to load metadata: " + records.error());
  }
  catalog::ItemCatalog catalog(std::move(records.value()));

  // 2. Embeddings (fatal on failure)
  const fs::path json_path = dir / kEmbeddingsJsonFile;
  const fs::path npy_path = dir / kEmbeddingsNpyFile;
  std::string embeddings_path;
  std::optional<EmbeddingSourceResult> source;
  if (fs::exists(json_path, ec)) {
    embeddings_path = json_path.string();
    source = read_embeddings_json(embeddings_path);
  } else if (fs::exists(npy_path, ec)) {
    embeddings_path = npy_path.string();
    source = read_embeddings_npy(embeddings_path);
  } else {
    return LoadResult::err("embeddings artifact not found: expected " + json_path.string() +
                           " or " + npy_path.string());
  }
  if (!source->has_value()) {
    return LoadResult::err("failed to load embeddings: " + source->error());
  }

  auto store = vector::EmbeddingStore::build(std::move(source->value()), catalog.ids());
  if (!store.has_value()) {
    return LoadResult::err("failed to load embeddings: " + embeddings_path + ": " +
                           store.error());
  }

  // 3. Interaction logs (soft failures only)
  auto clicks = load_clicks(options);

  LoadReport report;
  report.embeddings_path = embeddings_path;
  report.embedding_layout = store.value().source_layout();
  report.embedding_count = store.value().size();
  report.embedding_dim = store.value().dim();
  report.catalog_size = catalog.size();
  report.click_files_loaded = clicks.files_loaded;
  report.click_files_skipped = clicks.files_skipped;
  report.click_count = clicks.log.size();
  report.warnings = std::move(clicks.warnings);

  return LoadResult::ok(LoadedArtifacts{std::move(store.value()), std::move(catalog),
                                        std::move(clicks.log), std::move(report)});
}

}  // namespace crec::ingest
