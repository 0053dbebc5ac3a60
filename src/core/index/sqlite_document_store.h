#pragma once

#include "core/index/document_store.h"
#include "core/index/vector_index.h"

#include <QString>

#include <memory>
#include <mutex>
#include <optional>

#include <sqlite3.h>

namespace hr {

// SQLiteDocumentStore: DocumentStore over one SQLite database.
//
//   chunks          one row per (document_id, chunk_id), dense vector as BLOB
//   chunk_text_fts  FTS5 copy of the chunk text (lexical alias), rowid = chunks.id
//   sparse_terms    (chunk_row, term, weight) postings for expansion search
//   index_meta      schema version, creation time, dense dimensions
//
// Dense vectors are mirrored in an in-memory VectorIndex labelled by
// chunks.id, rebuilt from the BLOBs on open. Every public operation holds
// m_mutex, so the store can be shared by concurrent callers.
class SQLiteDocumentStore : public DocumentStore {
public:
    ~SQLiteDocumentStore() override;

    SQLiteDocumentStore(const SQLiteDocumentStore&) = delete;
    SQLiteDocumentStore& operator=(const SQLiteDocumentStore&) = delete;

    // Opens (or creates) the database file. The index itself is only
    // created by ensureIndex().
    static std::unique_ptr<SQLiteDocumentStore> open(const QString& dbPath);

    bool ensureIndex() override;
    bool indexExists() override;
    bool deleteIndex() override;

    std::optional<UpsertOutcome> upsert(const ChunkDocument& doc) override;
    std::optional<ChunkDocument> get(const QString& documentId, int chunkId) override;
    int64_t count() override;

    std::optional<std::vector<StoreHit>> searchLexical(const QString& text, int limit) override;
    std::optional<std::vector<StoreHit>> searchDense(const DenseVector& vector, int limit) override;
    std::optional<std::vector<StoreHit>> searchSparse(const SparseVector& vector, int limit) override;

    StoreHealth health() override;

    // Query terms beyond this many (by weight) are ignored by searchSparse.
    static constexpr int kMaxSparseQueryTerms = 256;

    // Free text -> FTS5 MATCH expression: each word quoted, OR-joined.
    // Empty when the text has no searchable words.
    static QString toFtsQuery(const QString& text);

private:
    SQLiteDocumentStore() = default;

    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    bool indexExistsUnlocked();
    bool rebuildVectorIndex();
    std::optional<int64_t> findRowId(const QString& documentId, int chunkId);
    bool writeSparseTerms(int64_t rowId, const SparseVector& terms);
    std::optional<Chunk> loadChunkByRow(int64_t rowId);
    std::optional<QString> readMeta(const char* key);
    bool writeMeta(const char* key, const QString& value);

    sqlite3* m_db = nullptr;
    VectorIndex m_vectors;
    std::mutex m_mutex;
};

} // namespace hr
