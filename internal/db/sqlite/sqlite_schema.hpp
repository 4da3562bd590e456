#pragma once

#include "sqlite_db.hpp"

namespace ticketflow::db::sqlite {

// Idempotent: CREATE ... IF NOT EXISTS for every table, index and trigger.
void BootstrapSchema(SqliteDB& db);

} // namespace ticketflow::db::sqlite
