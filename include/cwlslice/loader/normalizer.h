// cwlslice/loader/normalizer.h
#ifndef CWLSLICE_LOADER_NORMALIZER_H
#define CWLSLICE_LOADER_NORMALIZER_H

#include "cwlslice/common/types.h"
#include <string>

namespace cwlslice {

/**
 * Expand the document-local identifiers of a process into absolute ids.
 *
 * - map-form "inputs", "outputs", "steps" and step "in" become lists of records
 * - the process id is its "id" resolved against base_uri, else default_id,
 *   else base_uri itself
 * - parameters and steps get join_scope(process id, name)
 * - step ports get "<step id>/<name>"
 * - "source" and "outputSource" resolve against the process id
 * - string "run" references resolve against base_uri; embedded "run" maps are
 *   normalized recursively with "<step id>/run" as their default id
 * - "$graph" entries are normalized one by one
 *
 * Ids that are already absolute are kept.
 */
Document normalize_process(const Document& raw,
                           const std::string& base_uri,
                           const std::string& default_id = "");

// YAML or JSON text -> normalized document. Throws DocumentLoadError.
Document parse_document(const std::string& text, const std::string& base_uri);

// The process a location designates inside a normalized document: the
// document itself, or for "$graph" documents the entry named by the
// location's fragment ("#main" when there is none). Throws DocumentLoadError.
Document select_process(const Document& doc, const std::string& location);

} // namespace cwlslice

#endif // CWLSLICE_LOADER_NORMALIZER_H
