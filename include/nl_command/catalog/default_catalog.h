#ifndef NL_COMMAND_CATALOG_DEFAULT_CATALOG_H
#define NL_COMMAND_CATALOG_DEFAULT_CATALOG_H

#include <memory>

#include "nl_command/catalog/pattern_catalog.h"

namespace nl_command {

// Builds the built-in catalog covering every Intent: system status, file
// operations, project navigation, code analysis, task management, voice
// control and help, plus the built-in synonym table.
std::unique_ptr<PatternCatalog> BuildDefaultCatalog();

}  // namespace nl_command

#endif  // NL_COMMAND_CATALOG_DEFAULT_CATALOG_H
