#pragma once

namespace hr {

// Per-connection pragmas, applied on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -32768;
PRAGMA journal_mode = WAL;
)";

constexpr int kSchemaVersion = 1;

// Index schema. chunk_text_fts.rowid always equals chunks.id; sparse terms
// hang off the same row id.
constexpr const char* kIndexSchema = R"(
CREATE TABLE IF NOT EXISTS chunks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    document_id TEXT NOT NULL,
    chunk_id INTEGER NOT NULL,
    filename TEXT NOT NULL DEFAULT '',
    source_url TEXT NOT NULL DEFAULT '',
    text TEXT NOT NULL,
    token_count INTEGER NOT NULL DEFAULT 0,
    char_count INTEGER NOT NULL DEFAULT 0,
    dense_dims INTEGER NOT NULL DEFAULT 0,
    dense_vector BLOB,
    has_sparse INTEGER NOT NULL DEFAULT 0,
    indexed_at REAL NOT NULL,
    UNIQUE(document_id, chunk_id)
);

CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id);

CREATE VIRTUAL TABLE IF NOT EXISTS chunk_text_fts USING fts5(
    text_alias,
    tokenize = 'unicode61 remove_diacritics 2'
);

CREATE TABLE IF NOT EXISTS sparse_terms (
    chunk_row INTEGER NOT NULL REFERENCES chunks(id) ON DELETE CASCADE,
    term TEXT NOT NULL,
    weight REAL NOT NULL,
    PRIMARY KEY (chunk_row, term)
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_sparse_terms_term ON sparse_terms(term);

CREATE TABLE IF NOT EXISTS index_meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

constexpr const char* kDropIndexSchema = R"(
DROP TABLE IF EXISTS sparse_terms;
DROP TABLE IF EXISTS chunk_text_fts;
DROP TABLE IF EXISTS chunks;
DROP TABLE IF EXISTS index_meta;
)";

} // namespace hr
