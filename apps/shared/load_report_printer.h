#pragma once

#include "crec/ingest/data_loader.h"
#include "crec/vector/embedding_source.h"

#include <ostream>
#include <string>

namespace crec::apps {

// print_load_report writes the diagnostic block shared by the apps: one line per
// artifact, then one WARNING line per skipped click file.
inline void print_load_report(std::ostream& out, const std::string& data_dir,
                              const ingest::LoadReport& report) {
  out << "Data:        " << data_dir << "\n"
      << "Embeddings:  " << report.embedding_count << " x " << report.embedding_dim << " ("
      << vector::to_string(report.embedding_layout) << ") -- " << report.embeddings_path << "\n"
      << "Catalog:     " << report.catalog_size << " items\n"
      << "Clicks:      " << report.click_count << " events from " << report.click_files_loaded
      << " file(s)\n";
  for (const auto& warning : report.warnings) {
    out << "WARNING: " << warning << "\n";
  }
}

}  // namespace crec::apps
