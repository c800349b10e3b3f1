#ifndef NL_COMMAND_CATALOG_CATALOG_LOADER_H
#define NL_COMMAND_CATALOG_CATALOG_LOADER_H

#include <string>

#include "nl_command/catalog/pattern_catalog.h"

// Reads action definitions from JSON.
//
// {
//   "actions": [
//     {
//       "intent": "task_management",
//       "name": "snooze",
//       "description": "Snoozes a task",
//       "triggers": ["snooze task", "remind me later"],
//       "slots": [
//         {"name": "task_id", "type": "integer", "required": true, "min": 1},
//         {"name": "when", "type": "enum", "values": ["today", "tomorrow"],
//          "aliases": {"tonight": "today"}},
//         {"name": "target", "type": "path", "keywords": ["in"],
//          "fallback": "current_file"}
//       ]
//     }
//   ],
//   "synonyms": {"snooze": ["postpone", "defer"]}
// }
//
// "strategy" may name the extraction strategy explicitly; otherwise it
// follows the slot type.

namespace nl_command {

/// Adds the actions and synonyms in `json_text` to `catalog`.
/// @param json_text Catalog document, see above
/// @param catalog In/out catalog; left untouched on failure
/// @param error Receives the first problem found
/// @return true if every action registered
bool LoadCatalogFromJson(const std::string& json_text,
                         PatternCatalog& catalog,
                         std::string& error);

/// Reads a catalog document from a file. See LoadCatalogFromJson().
bool LoadCatalogFromFile(const std::string& path,
                         PatternCatalog& catalog,
                         std::string& error);

}  // namespace nl_command

#endif  // NL_COMMAND_CATALOG_CATALOG_LOADER_H
