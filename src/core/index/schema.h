#pragma once

namespace lc {

// Per-connection pragmas: no write lock required, safe on every open.
// busy_timeout is high so a reader (the finder service) waits out an
// ingestion batch transaction instead of failing.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -65536;
PRAGMA journal_size_limit = 33554432;
)";

// Database-level pragmas: require write lock, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x4C4358;
PRAGMA user_version = 1;
)";

// paragraphs.id is the identifier shared by every index. AUTOINCREMENT
// keeps ids monotonic: a deleted id is never handed out again.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS paragraphs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    doc_id INTEGER NOT NULL,
    chapter_id INTEGER NOT NULL,
    paragraph_id INTEGER NOT NULL,
    text TEXT NOT NULL CHECK (length(text) > 0),
    stored_at REAL NOT NULL,
    UNIQUE (doc_id, chapter_id, paragraph_id)
);

CREATE INDEX IF NOT EXISTS idx_paragraphs_doc ON paragraphs(doc_id);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE VIRTUAL TABLE IF NOT EXISTS paragraphs_fts USING fts5(
    text,
    tokenize = 'unicode61 remove_diacritics 2'
);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
INSERT OR IGNORE INTO settings (key, value) VALUES ('embedding_model', '');
INSERT OR IGNORE INTO settings (key, value) VALUES ('embedding_dimensions', '0');
INSERT OR IGNORE INTO settings (key, value) VALUES ('last_ingest_at', '0');
)";

constexpr int kCurrentSchemaVersion = 1;

} // namespace lc
