#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace ticketflow::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS reference_entity (id INTEGER PRIMARY KEY AUTOINCREMENT, category TEXT NOT NULL, canonical_name TEXT NOT NULL, attributes TEXT NOT NULL, "
      "requires_manifest INTEGER NOT NULL DEFAULT 0, UNIQUE(category, canonical_name));",

      "CREATE TABLE IF NOT EXISTS truck_ticket (id INTEGER PRIMARY KEY AUTOINCREMENT, ticket_number TEXT NOT NULL, ticket_date INTEGER NOT NULL, quantity REAL, "
      "quantity_unit TEXT NOT NULL, job_id INTEGER NOT NULL REFERENCES reference_entity(id), material_id INTEGER NOT NULL REFERENCES reference_entity(id), "
      "source_id INTEGER REFERENCES reference_entity(id), destination_id INTEGER REFERENCES reference_entity(id), vendor_id INTEGER REFERENCES reference_entity(id), "
      "ticket_type_id INTEGER NOT NULL REFERENCES reference_entity(id), manifest_number TEXT, truck_number TEXT, file_id TEXT NOT NULL, file_page INTEGER NOT NULL, "
      "file_hash TEXT NOT NULL, request_guid TEXT NOT NULL, duplicate_of INTEGER REFERENCES truck_ticket(id) ON DELETE SET NULL, review_required INTEGER NOT NULL, "
      "confidence REAL NOT NULL, field_confidence TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",

      // ticket_date is stored as days since epoch; that day is the uniqueness bucket
      "CREATE UNIQUE INDEX IF NOT EXISTS truck_ticket_key ON truck_ticket(ticket_number, IFNULL(vendor_id, 0), ticket_date);",
      "CREATE INDEX IF NOT EXISTS truck_ticket_file ON truck_ticket(file_id, request_guid);",

      // version 1 only rejected a NULL manifest
      "DROP TRIGGER IF EXISTS truck_ticket_manifest_required;",
      "CREATE TRIGGER IF NOT EXISTS truck_ticket_manifest_valid BEFORE INSERT ON truck_ticket "
      "WHEN NEW.review_required = 0 AND (SELECT requires_manifest FROM reference_entity WHERE id = NEW.material_id) = 1 "
      "AND (NEW.manifest_number IS NULL OR length(NEW.manifest_number) NOT BETWEEN 6 AND 20 OR NEW.manifest_number GLOB '*[^A-Za-z0-9]*') "
      "BEGIN SELECT RAISE(ABORT, 'valid manifest required for regulated material'); END;",

      "CREATE TABLE IF NOT EXISTS review_queue (id INTEGER PRIMARY KEY AUTOINCREMENT, page_id TEXT NOT NULL, file_id TEXT NOT NULL, file_page INTEGER NOT NULL, "
      "request_guid TEXT NOT NULL, reason TEXT NOT NULL, severity TEXT NOT NULL, problems TEXT NOT NULL, detected_fields TEXT NOT NULL, suggested_fix TEXT NOT NULL, "
      "provisional_ticket TEXT, resolved INTEGER NOT NULL DEFAULT 0, resolved_by TEXT, resolved_at_ms INTEGER, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS review_queue_file ON review_queue(file_id, request_guid);",

      "CREATE TABLE IF NOT EXISTS processed_file (file_hash TEXT PRIMARY KEY, file_id TEXT NOT NULL, request_guid TEXT NOT NULL, processed_at_ms INTEGER NOT NULL, "
      "ticket_ids TEXT NOT NULL, review_ids TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS processing_run (request_guid TEXT PRIMARY KEY, processed_by TEXT, started_at_ms INTEGER NOT NULL, completed_at_ms INTEGER, "
      "files_count INTEGER NOT NULL, pages_count INTEGER NOT NULL, ok_count INTEGER NOT NULL, error_count INTEGER NOT NULL, review_count INTEGER NOT NULL, "
      "skipped_count INTEGER NOT NULL, status TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS ticketflow_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO ticketflow_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);",
      "INSERT OR IGNORE INTO ticketflow_schema_migrations(version, applied_at_ms) VALUES (2, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace ticketflow::db::sqlite
