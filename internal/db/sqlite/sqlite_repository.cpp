#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "sqlite_codec.hpp"

namespace ticketflow::db::sqlite {

using ticketflow::db::ErrorCode;
using ticketflow::db::Result;

namespace {

constexpr const char* kTicketColumns =
    "id,ticket_number,ticket_date,quantity,quantity_unit,job_id,material_id,source_id,destination_id,vendor_id,ticket_type_id,"
    "manifest_number,truck_number,file_id,file_page,file_hash,request_guid,duplicate_of,review_required,confidence,field_confidence,created_at_ms";

constexpr const char* kReviewColumns =
    "id,page_id,file_id,file_page,request_guid,reason,severity,problems,detected_fields,suggested_fix,provisional_ticket,resolved,resolved_by,"
    "resolved_at_ms,created_at_ms";

constexpr const char* kRunColumns =
    "request_guid,processed_by,started_at_ms,completed_at_ms,files_count,pages_count,ok_count,error_count,review_count,skipped_count,status";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) BindI64(st, idx, *v);
  else sqlite3_bind_null(st, idx);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) BindText(st, idx, *v);
  else sqlite3_bind_null(st, idx);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColI64(st, col);
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

model::TruckTicket ReadTicket(sqlite3_stmt* st) {
  model::TruckTicket t;
  t.id              = ColI64(st, 0);
  t.ticket_number   = ColText(st, 1);
  t.ticket_date     = util::FromEpochDays(ColI64(st, 2));
  if (!ColIsNull(st, 3)) t.quantity = sqlite3_column_double(st, 3);
  t.quantity_unit   = model::ParseQuantityUnit(ColText(st, 4)).value_or(model::QuantityUnit::Tons);
  t.job_id          = ColI64(st, 5);
  t.material_id     = ColI64(st, 6);
  t.source_id       = ColOptionalI64(st, 7);
  t.destination_id  = ColOptionalI64(st, 8);
  t.vendor_id       = ColOptionalI64(st, 9);
  t.ticket_type_id  = ColI64(st, 10);
  t.manifest_number = ColOptionalText(st, 11);
  t.truck_number    = ColOptionalText(st, 12);
  t.file_id         = ColText(st, 13);
  t.file_page       = static_cast<int>(ColI64(st, 14));
  t.file_hash       = ColText(st, 15);
  t.request_guid    = ColText(st, 16);
  t.duplicate_of    = ColOptionalI64(st, 17);
  t.review_required = ColI64(st, 18) != 0;
  t.confidence      = sqlite3_column_double(st, 19);
  t.field_confidence = DecodeDoubleMap(ColText(st, 20));
  t.created_at      = util::FromUnixMillis(static_cast<uint64_t>(ColI64(st, 21)));
  return t;
}

model::ReviewQueueEntry ReadReview(sqlite3_stmt* st) {
  model::ReviewQueueEntry r;
  r.id           = ColI64(st, 0);
  r.page_id      = ColText(st, 1);
  r.file_id      = ColText(st, 2);
  r.file_page    = static_cast<int>(ColI64(st, 3));
  r.request_guid = ColText(st, 4);
  r.reason       = model::ParseReviewReason(ColText(st, 5)).value_or(model::ReviewReason::MissingTicketNumber);
  r.severity     = model::ParseSeverity(ColText(st, 6)).value_or(model::Severity::Critical);
  r.problems        = DecodeProblems(ColText(st, 7));
  r.detected_fields = DecodeStringMap(ColText(st, 8));
  r.suggested_fix   = DecodeSuggestedFix(ColText(st, 9));
  if (!ColIsNull(st, 10)) r.provisional_ticket = DecodeTicket(ColText(st, 10));
  r.resolved    = ColI64(st, 11) != 0;
  r.resolved_by = ColText(st, 12);
  if (!ColIsNull(st, 13)) r.resolved_at = util::FromUnixMillis(static_cast<uint64_t>(ColI64(st, 13)));
  r.created_at = util::FromUnixMillis(static_cast<uint64_t>(ColI64(st, 14)));
  return r;
}

model::ProcessingRun ReadRun(sqlite3_stmt* st) {
  model::ProcessingRun r;
  r.request_guid = ColText(st, 0);
  r.processed_by = ColText(st, 1);
  r.started_at   = util::FromUnixMillis(static_cast<uint64_t>(ColI64(st, 2)));
  if (!ColIsNull(st, 3)) r.completed_at = util::FromUnixMillis(static_cast<uint64_t>(ColI64(st, 3)));
  r.files_count   = static_cast<uint64_t>(ColI64(st, 4));
  r.pages_count   = static_cast<uint64_t>(ColI64(st, 5));
  r.ok_count      = static_cast<uint64_t>(ColI64(st, 6));
  r.error_count   = static_cast<uint64_t>(ColI64(st, 7));
  r.review_count  = static_cast<uint64_t>(ColI64(st, 8));
  r.skipped_count = static_cast<uint64_t>(ColI64(st, 9));
  r.status        = model::ParseRunStatus(ColText(st, 10)).value_or(model::RunStatus::Failed);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

static Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
  }
  return Statement(raw, &sqlite3_finalize);
}

// ------------------------------------------------------------------
// Reference data
// ------------------------------------------------------------------

Result SqliteRepository::InsertReference(Transaction& t, model::ReferenceEntity& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO reference_entity(category,canonical_name,attributes,requires_manifest) VALUES(?,?,?,?);");

  BindText(st.get(), 1, std::string(model::ToString(r.category)));
  BindText(st.get(), 2, r.canonical_name);
  BindText(st.get(), 3, EncodeStringMap(r.attributes));
  BindI64(st.get(), 4, r.RequiresManifest() ? 1 : 0);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "reference exists: " + r.canonical_name);
  auto result = Translate(db, rc);
  if (result) r.id = sqlite3_last_insert_rowid(db);
  return result;
}

std::optional<model::ReferenceEntity> SqliteRepository::FindReference(Transaction& t, model::ReferenceCategory category, const std::string& name) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,attributes FROM reference_entity WHERE category=? AND canonical_name=?;");
  BindText(st.get(), 1, std::string(model::ToString(category)));
  BindText(st.get(), 2, name);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ReferenceEntity r;
  r.id             = ColI64(st.get(), 0);
  r.category       = category;
  r.canonical_name = name;
  r.attributes     = DecodeStringMap(ColText(st.get(), 1));
  return r;
}

std::vector<model::ReferenceEntity> SqliteRepository::ListReferences(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,category,canonical_name,attributes FROM reference_entity ORDER BY id;");

  std::vector<model::ReferenceEntity> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    auto category = model::ParseReferenceCategory(ColText(st.get(), 1));
    if (!category) continue;
    model::ReferenceEntity r;
    r.id             = ColI64(st.get(), 0);
    r.category       = *category;
    r.canonical_name = ColText(st.get(), 2);
    r.attributes     = DecodeStringMap(ColText(st.get(), 3));
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Tickets
// ------------------------------------------------------------------

Result SqliteRepository::InsertTicket(Transaction& t, model::TruckTicket& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO truck_ticket(ticket_number,ticket_date,quantity,quantity_unit,job_id,material_id,source_id,destination_id,vendor_id,"
                     "ticket_type_id,manifest_number,truck_number,file_id,file_page,file_hash,request_guid,duplicate_of,review_required,confidence,"
                     "field_confidence,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.ticket_number);
  BindI64(st.get(), 2, util::ToEpochDays(r.ticket_date));
  if (r.quantity) sqlite3_bind_double(st.get(), 3, *r.quantity);
  else sqlite3_bind_null(st.get(), 3);
  BindText(st.get(), 4, std::string(model::ToString(r.quantity_unit)));
  BindI64(st.get(), 5, r.job_id);
  BindI64(st.get(), 6, r.material_id);
  BindOptionalI64(st.get(), 7, r.source_id);
  BindOptionalI64(st.get(), 8, r.destination_id);
  BindOptionalI64(st.get(), 9, r.vendor_id);
  BindI64(st.get(), 10, r.ticket_type_id);
  BindOptionalText(st.get(), 11, r.manifest_number);
  BindOptionalText(st.get(), 12, r.truck_number);
  BindText(st.get(), 13, r.file_id);
  BindI64(st.get(), 14, r.file_page);
  BindText(st.get(), 15, r.file_hash);
  BindText(st.get(), 16, r.request_guid);
  BindOptionalI64(st.get(), 17, r.duplicate_of);
  BindI64(st.get(), 18, r.review_required ? 1 : 0);
  sqlite3_bind_double(st.get(), 19, r.confidence);
  BindText(st.get(), 20, EncodeDoubleMap(r.field_confidence));
  BindI64(st.get(), 21, static_cast<int64_t>(util::ToUnixMillis(r.created_at)));

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.id = sqlite3_last_insert_rowid(db);
  return result;
}

std::vector<model::TruckTicket> SqliteRepository::QueryTickets(Transaction& t, const std::string& where, const std::function<void(sqlite3_stmt*)>& bind) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kTicketColumns + " FROM truck_ticket " + where + ";");
  bind(st.get());

  std::vector<model::TruckTicket> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadTicket(st.get()));
  return out;
}

std::optional<model::TruckTicket> SqliteRepository::GetTicket(Transaction& t, int64_t id) {
  auto rows = QueryTickets(t, "WHERE id=?", [&](sqlite3_stmt* st) { BindI64(st, 1, id); });
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::TruckTicket> SqliteRepository::FindTicketsInWindow(Transaction& t, const std::string& ticket_number, std::optional<int64_t> vendor_id, const util::Date& from,
                                                                      const util::Date& to) {
  return QueryTickets(t, "WHERE ticket_number=? AND vendor_id IS ? AND ticket_date BETWEEN ? AND ? ORDER BY ticket_date, id", [&](sqlite3_stmt* st) {
    BindText(st, 1, ticket_number);
    BindOptionalI64(st, 2, vendor_id);
    BindI64(st, 3, util::ToEpochDays(from));
    BindI64(st, 4, util::ToEpochDays(to));
  });
}

std::vector<model::TruckTicket> SqliteRepository::FindTicketsByManifest(Transaction& t, std::optional<int64_t> vendor_id, const util::Date& date, const std::string& manifest_number) {
  return QueryTickets(t, "WHERE vendor_id IS ? AND ticket_date=? AND manifest_number=? ORDER BY id", [&](sqlite3_stmt* st) {
    BindOptionalI64(st, 1, vendor_id);
    BindI64(st, 2, util::ToEpochDays(date));
    BindText(st, 3, manifest_number);
  });
}

std::vector<model::TruckTicket> SqliteRepository::ListTicketsForFile(Transaction& t, const std::string& file_id) {
  return QueryTickets(t, "WHERE file_id=? ORDER BY file_page, id", [&](sqlite3_stmt* st) { BindText(st, 1, file_id); });
}

Result SqliteRepository::DeleteFileResults(Transaction& t, const std::string& file_id, const std::string& request_guid) {
  auto* db = TX(t).Handle();
  // other files' provisional tickets must not keep pointing at rows about to go
  const char* kDetach =
      "UPDATE review_queue SET provisional_ticket = json_set(provisional_ticket, '$.duplicate_of', NULL) "
      "WHERE provisional_ticket IS NOT NULL AND NOT (file_id=?1 AND request_guid=?2) "
      "AND json_extract(provisional_ticket, '$.duplicate_of') IN (SELECT id FROM truck_ticket WHERE file_id=?1 AND request_guid=?2);";
  const char* kDetachCommitted =
      "UPDATE truck_ticket SET duplicate_of = NULL WHERE NOT (file_id=?1 AND request_guid=?2) "
      "AND duplicate_of IN (SELECT id FROM truck_ticket WHERE file_id=?1 AND request_guid=?2);";
  for (const char* sql : {kDetach, kDetachCommitted, "DELETE FROM truck_ticket WHERE file_id=?1 AND request_guid=?2;",
                          "DELETE FROM review_queue WHERE file_id=?1 AND request_guid=?2;"}) {
    auto st = Prepare(db, sql);
    BindText(st.get(), 1, file_id);
    BindText(st.get(), 2, request_guid);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Review queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertReviewEntry(Transaction& t, model::ReviewQueueEntry& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO review_queue(page_id,file_id,file_page,request_guid,reason,severity,problems,detected_fields,suggested_fix,provisional_ticket,"
                     "resolved,resolved_by,resolved_at_ms,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.page_id);
  BindText(st.get(), 2, r.file_id);
  BindI64(st.get(), 3, r.file_page);
  BindText(st.get(), 4, r.request_guid);
  BindText(st.get(), 5, std::string(model::ToString(r.reason)));
  BindText(st.get(), 6, std::string(model::ToString(r.severity)));
  BindText(st.get(), 7, EncodeProblems(r.problems));
  BindText(st.get(), 8, EncodeStringMap(r.detected_fields));
  BindText(st.get(), 9, EncodeSuggestedFix(r.suggested_fix));
  BindOptionalText(st.get(), 10, r.provisional_ticket ? std::optional<std::string>(EncodeTicket(*r.provisional_ticket)) : std::nullopt);
  BindI64(st.get(), 11, r.resolved ? 1 : 0);
  BindText(st.get(), 12, r.resolved_by);
  BindOptionalI64(st.get(), 13, r.resolved_at ? std::optional<int64_t>(util::ToUnixMillis(*r.resolved_at)) : std::nullopt);
  BindI64(st.get(), 14, static_cast<int64_t>(util::ToUnixMillis(r.created_at)));

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.id = sqlite3_last_insert_rowid(db);
  return result;
}

std::vector<model::ReviewQueueEntry> SqliteRepository::QueryReviews(Transaction& t, const std::string& where, const std::function<void(sqlite3_stmt*)>& bind) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kReviewColumns + " FROM review_queue " + where + ";");
  bind(st.get());

  std::vector<model::ReviewQueueEntry> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadReview(st.get()));
  return out;
}

std::optional<model::ReviewQueueEntry> SqliteRepository::GetReviewEntry(Transaction& t, int64_t id) {
  auto rows = QueryReviews(t, "WHERE id=?", [&](sqlite3_stmt* st) { BindI64(st, 1, id); });
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::ReviewQueueEntry> SqliteRepository::ListReviewEntries(Transaction& t, bool unresolved_only) {
  return QueryReviews(t, unresolved_only ? "WHERE resolved=0 ORDER BY id" : "ORDER BY id", [](sqlite3_stmt*) {});
}

Result SqliteRepository::MarkReviewResolved(Transaction& t, int64_t id, const std::string& resolved_by, util::TimePoint resolved_at) {
  auto existing = GetReviewEntry(t, id);
  if (!existing) return Result::Err(ErrorCode::NotFound, "review entry " + std::to_string(id));
  if (existing->resolved) return Result::Err(ErrorCode::Conflict, "review entry already resolved");

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE review_queue SET resolved=1,resolved_by=?,resolved_at_ms=? WHERE id=?;");
  BindText(st.get(), 1, resolved_by);
  BindI64(st.get(), 2, static_cast<int64_t>(util::ToUnixMillis(resolved_at)));
  BindI64(st.get(), 3, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Processed-file ledger
// ------------------------------------------------------------------

Result SqliteRepository::RecordProcessedFile(Transaction& t, const model::ProcessedFileRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO processed_file(file_hash,file_id,request_guid,processed_at_ms,ticket_ids,review_ids) VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.file_hash);
  BindText(st.get(), 2, r.file_id);
  BindText(st.get(), 3, r.request_guid);
  BindI64(st.get(), 4, static_cast<int64_t>(util::ToUnixMillis(r.processed_at)));
  BindText(st.get(), 5, EncodeIdList(r.ticket_ids));
  BindText(st.get(), 6, EncodeIdList(r.review_ids));

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "file hash already recorded");
  return Translate(db, rc);
}

std::optional<model::ProcessedFileRecord> SqliteRepository::FindProcessedFile(Transaction& t, const std::string& file_hash) {
  auto st = Prepare(TX(t).Handle(), "SELECT file_id,request_guid,processed_at_ms,ticket_ids,review_ids FROM processed_file WHERE file_hash=?;");
  BindText(st.get(), 1, file_hash);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ProcessedFileRecord r;
  r.file_hash    = file_hash;
  r.file_id      = ColText(st.get(), 0);
  r.request_guid = ColText(st.get(), 1);
  r.processed_at = util::FromUnixMillis(static_cast<uint64_t>(ColI64(st.get(), 2)));
  r.ticket_ids   = DecodeIdList(ColText(st.get(), 3));
  r.review_ids   = DecodeIdList(ColText(st.get(), 4));
  return r;
}

// ------------------------------------------------------------------
// Processing runs
// ------------------------------------------------------------------

static void BindRunCounters(sqlite3_stmt* st, int first, const model::ProcessingRun& r) {
  BindI64(st, first + 0, static_cast<int64_t>(r.files_count));
  BindI64(st, first + 1, static_cast<int64_t>(r.pages_count));
  BindI64(st, first + 2, static_cast<int64_t>(r.ok_count));
  BindI64(st, first + 3, static_cast<int64_t>(r.error_count));
  BindI64(st, first + 4, static_cast<int64_t>(r.review_count));
  BindI64(st, first + 5, static_cast<int64_t>(r.skipped_count));
  BindText(st, first + 6, std::string(model::ToString(r.status)));
}

Result SqliteRepository::InsertRun(Transaction& t, const model::ProcessingRun& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO processing_run(") + kRunColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.request_guid);
  BindText(st.get(), 2, r.processed_by);
  BindI64(st.get(), 3, static_cast<int64_t>(util::ToUnixMillis(r.started_at)));
  BindOptionalI64(st.get(), 4, r.completed_at ? std::optional<int64_t>(util::ToUnixMillis(*r.completed_at)) : std::nullopt);
  BindRunCounters(st.get(), 5, r);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "run exists: " + r.request_guid);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::ProcessingRun& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE processing_run SET processed_by=?,completed_at_ms=?,files_count=?,pages_count=?,ok_count=?,error_count=?,review_count=?,"
                     "skipped_count=?,status=? WHERE request_guid=?;");
  BindText(st.get(), 1, r.processed_by);
  BindOptionalI64(st.get(), 2, r.completed_at ? std::optional<int64_t>(util::ToUnixMillis(*r.completed_at)) : std::nullopt);
  BindRunCounters(st.get(), 3, r);
  BindText(st.get(), 10, r.request_guid);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "run " + r.request_guid);
  return Result::Ok();
}

std::vector<model::ProcessingRun> SqliteRepository::QueryRuns(Transaction& t, const std::string& tail, const std::function<void(sqlite3_stmt*)>& bind) {
  auto st = Prepare(TX(t).Handle(), std::string("SELECT ") + kRunColumns + " FROM processing_run " + tail + ";");
  bind(st.get());

  std::vector<model::ProcessingRun> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadRun(st.get()));
  return out;
}

std::optional<model::ProcessingRun> SqliteRepository::GetRun(Transaction& t, const std::string& request_guid) {
  auto rows = QueryRuns(t, "WHERE request_guid=?", [&](sqlite3_stmt* st) { BindText(st, 1, request_guid); });
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<model::ProcessingRun> SqliteRepository::ListRuns(Transaction& t, std::size_t limit) {
  return QueryRuns(t, "ORDER BY started_at_ms DESC LIMIT ?", [&](sqlite3_stmt* st) { BindI64(st, 1, static_cast<int64_t>(limit)); });
}

} // namespace ticketflow::db::sqlite
