#pragma once

#include "xrd_match/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace xrd_match::reference {

namespace fs = std::filesystem;

enum class ReferenceFormat {
  AUTO,       // decide per file
  RAW,        // card tables, read through the tabular ingestor
  EXTRACTED   // angle,phase,symbol lines
};

std::string reference_format_to_string(ReferenceFormat format);
// Throws ValidationError for unknown names.
ReferenceFormat string_to_reference_format(const std::string &s);

// Per-file diagnostic gathered while loading. Loading continues past these.
struct LoadIssue {
  fs::path file;
  std::string severity;  // "warning" | "error"
  std::string message;
};

struct CatalogBuildResult {
  ReferenceCatalog catalog;
  std::vector<std::string> loaded_phases;  // load order
  std::vector<LoadIssue> issues;
};

// Phase id of a raw card: file name up to the first '.'.
std::string phase_id_from_path(const fs::path &path);

// Loads raw reference cards. The i-th file gets symbol_pool[i]; files beyond
// the pool are skipped with a warning. Throws NoReferenceDataError when no
// file yields a usable peak.
CatalogBuildResult build_catalog(const std::vector<fs::path> &paths,
                                 const std::vector<std::string> &symbol_pool);

// Loads files in the extracted angle,phase,symbol form. Throws
// NoReferenceDataError when no peak was read.
CatalogBuildResult load_extracted_references(const std::vector<fs::path> &paths);

// True if the first non-blank, non-comment line looks like angle,phase,symbol.
bool is_extracted_format(const fs::path &path);

// Dispatches on format. With AUTO, extracted files and raw cards may be mixed;
// raw cards draw symbols from the pool in their own order.
CatalogBuildResult load_references(const std::vector<fs::path> &paths,
                                   ReferenceFormat format,
                                   const std::vector<std::string> &symbol_pool);

} // namespace xrd_match::reference
