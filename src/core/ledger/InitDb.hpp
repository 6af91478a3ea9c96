#pragma once
#include <string>

namespace frl {

// Creates/opens the ledger database, applies pragmas and the schema file.
// Idempotent: the schema only uses CREATE ... IF NOT EXISTS.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace frl
