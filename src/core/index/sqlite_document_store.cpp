#include "core/index/sqlite_document_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QStringList>

#include <algorithm>
#include <cstring>
#include <set>
#include <utility>

namespace hr {

namespace {

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(hrIndex, "prepare failed: %s", sqlite3_errmsg(db));
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_stmt != nullptr; }
    sqlite3_stmt* get() const { return m_stmt; }

private:
    sqlite3_stmt* m_stmt = nullptr;
};

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), static_cast<int>(utf8.size()),
                      SQLITE_TRANSIENT);
}

QString columnText(sqlite3_stmt* stmt, int col)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text) {
        return {};
    }
    return QString::fromUtf8(text, sqlite3_column_bytes(stmt, col));
}

// Columns: document_id, chunk_id, filename, source_url, text, token_count, char_count
constexpr const char* kChunkColumns =
    "c.document_id, c.chunk_id, c.filename, c.source_url, c.text, c.token_count, c.char_count";

Chunk readChunk(sqlite3_stmt* stmt, int firstCol)
{
    Chunk chunk;
    chunk.documentId = columnText(stmt, firstCol);
    chunk.chunkId = sqlite3_column_int(stmt, firstCol + 1);
    chunk.filename = columnText(stmt, firstCol + 2);
    chunk.sourceUrl = columnText(stmt, firstCol + 3);
    chunk.text = columnText(stmt, firstCol + 4);
    chunk.tokenCount = sqlite3_column_int(stmt, firstCol + 5);
    chunk.charCount = sqlite3_column_int(stmt, firstCol + 6);
    return chunk;
}

DenseVector readDense(sqlite3_stmt* stmt, int col, int dims)
{
    const void* blob = sqlite3_column_blob(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (!blob || dims <= 0 || bytes != dims * static_cast<int>(sizeof(float))) {
        return {};
    }
    DenseVector vector(static_cast<size_t>(dims));
    std::memcpy(vector.data(), blob, static_cast<size_t>(bytes));
    return vector;
}

double nowEpochSeconds()
{
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

} // anonymous namespace

// ── Lifecycle ───────────────────────────────────────────────

SQLiteDocumentStore::~SQLiteDocumentStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SQLiteDocumentStore> SQLiteDocumentStore::open(const QString& dbPath)
{
    std::unique_ptr<SQLiteDocumentStore> store(new SQLiteDocumentStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool SQLiteDocumentStore::init(const QString& dbPath)
{
    if (sqlite3_open(dbPath.toUtf8().constData(), &m_db) != SQLITE_OK) {
        LOG_ERROR(hrIndex, "Failed to open database %s: %s",
                  qUtf8Printable(dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(hrIndex, "Failed to set connection pragmas");
        return false;
    }

    if (indexExistsUnlocked() && !rebuildVectorIndex()) {
        LOG_ERROR(hrIndex, "Failed to rebuild dense vector index from %s", qUtf8Printable(dbPath));
        return false;
    }

    LOG_INFO(hrIndex, "Opened document store %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteDocumentStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(hrIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Index management ────────────────────────────────────────

bool SQLiteDocumentStore::indexExistsUnlocked()
{
    Statement stmt(m_db,
        "SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = 'chunks'");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return false;
    }
    return sqlite3_column_int(stmt.get(), 0) > 0;
}

bool SQLiteDocumentStore::indexExists()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return indexExistsUnlocked();
}

bool SQLiteDocumentStore::ensureIndex()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (indexExistsUnlocked()) {
        LOG_DEBUG(hrIndex, "Index already exists, leaving it untouched");
        return true;
    }

    if (!execSql("BEGIN IMMEDIATE")) {
        return false;
    }
    if (!execSql(kIndexSchema)
        || !writeMeta("schema_version", QString::number(kSchemaVersion))
        || !writeMeta("created_at", QString::number(nowEpochSeconds(), 'f', 3))) {
        LOG_ERROR(hrIndex, "Failed to create index schema");
        execSql("ROLLBACK");
        return false;
    }
    if (!execSql("COMMIT")) {
        execSql("ROLLBACK");
        return false;
    }

    m_vectors.reset();
    LOG_INFO(hrIndex, "Created index (schema v%d)", kSchemaVersion);
    return true;
}

bool SQLiteDocumentStore::deleteIndex()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!execSql(kDropIndexSchema)) {
        LOG_ERROR(hrIndex, "Failed to delete index");
        return false;
    }
    m_vectors.reset();
    LOG_INFO(hrIndex, "Deleted index");
    return true;
}

bool SQLiteDocumentStore::rebuildVectorIndex()
{
    m_vectors.reset();

    int dims = readMeta("dense_dimensions").value_or(QString()).toInt();
    int64_t denseRows = 0;
    {
        Statement stmt(m_db,
            "SELECT count(*), max(dense_dims) FROM chunks WHERE dense_vector IS NOT NULL");
        if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return false;
        }
        denseRows = sqlite3_column_int64(stmt.get(), 0);
        if (dims <= 0) {
            dims = sqlite3_column_int(stmt.get(), 1);
        }
    }
    if (denseRows == 0 || dims <= 0) {
        return true;
    }

    const int capacity = static_cast<int>(std::max<int64_t>(denseRows * 2, VectorIndex::kInitialCapacity));
    if (!m_vectors.create(dims, capacity)) {
        return false;
    }

    Statement stmt(m_db,
        "SELECT id, dense_dims, dense_vector FROM chunks WHERE dense_vector IS NOT NULL");
    if (!stmt.ok()) {
        return false;
    }
    int loaded = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const int64_t rowId = sqlite3_column_int64(stmt.get(), 0);
        const DenseVector vector = readDense(stmt.get(), 2, sqlite3_column_int(stmt.get(), 1));
        if (static_cast<int>(vector.size()) != dims) {
            LOG_WARN(hrIndex, "Skipping dense vector of row %lld with wrong dimensions",
                     static_cast<long long>(rowId));
            continue;
        }
        if (m_vectors.upsert(static_cast<uint64_t>(rowId), vector)) {
            ++loaded;
        }
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(hrIndex, "Dense vector scan failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    LOG_INFO(hrIndex, "Rebuilt dense vector index: %d vectors, %d dims", loaded, dims);
    return true;
}

std::optional<QString> SQLiteDocumentStore::readMeta(const char* key)
{
    Statement stmt(m_db, "SELECT value FROM index_meta WHERE key = ?1");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

bool SQLiteDocumentStore::writeMeta(const char* key, const QString& value)
{
    Statement stmt(m_db,
        "INSERT INTO index_meta (key, value) VALUES (?1, ?2) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    if (!stmt.ok()) {
        return false;
    }
    sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
    bindText(stmt.get(), 2, value);
    return sqlite3_step(stmt.get()) == SQLITE_DONE;
}

// ── Writes ──────────────────────────────────────────────────

std::optional<int64_t> SQLiteDocumentStore::findRowId(const QString& documentId, int chunkId)
{
    Statement stmt(m_db, "SELECT id FROM chunks WHERE document_id = ?1 AND chunk_id = ?2");
    if (!stmt.ok()) {
        return std::nullopt;
    }
    bindText(stmt.get(), 1, documentId);
    sqlite3_bind_int(stmt.get(), 2, chunkId);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return sqlite3_column_int64(stmt.get(), 0);
    }
    if (rc == SQLITE_DONE) {
        return 0;
    }
    LOG_ERROR(hrIndex, "Row lookup failed: %s", sqlite3_errmsg(m_db));
    return std::nullopt;
}

bool SQLiteDocumentStore::writeSparseTerms(int64_t rowId, const SparseVector& terms)
{
    Statement stmt(m_db, "INSERT INTO sparse_terms (chunk_row, term, weight) VALUES (?1, ?2, ?3)");
    if (!stmt.ok()) {
        return false;
    }
    for (const auto& [term, weight] : terms) {
        if (term.isEmpty() || !(weight > 0.0f)) {
            continue;
        }
        sqlite3_reset(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, rowId);
        bindText(stmt.get(), 2, term);
        sqlite3_bind_double(stmt.get(), 3, static_cast<double>(weight));
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            LOG_ERROR(hrIndex, "sparse term insert failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
    }
    return true;
}

std::optional<UpsertOutcome> SQLiteDocumentStore::upsert(const ChunkDocument& doc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const QString key = compositeKey(doc.chunk);

    if (!indexExistsUnlocked()) {
        LOG_WARN(hrIndex, "Rejecting %s: index does not exist", qUtf8Printable(key));
        return std::nullopt;
    }
    if (doc.chunk.documentId.isEmpty()) {
        LOG_WARN(hrIndex, "Rejecting chunk without document id");
        return std::nullopt;
    }

    const int denseDims = doc.denseEmbedding ? static_cast<int>(doc.denseEmbedding->size()) : 0;
    if (doc.denseEmbedding) {
        if (denseDims == 0) {
            LOG_WARN(hrIndex, "Rejecting %s: empty dense vector", qUtf8Printable(key));
            return std::nullopt;
        }
        if (m_vectors.isAvailable() && m_vectors.dimensions() != denseDims) {
            LOG_WARN(hrIndex, "Rejecting %s: dense vector has %d dims, index has %d",
                     qUtf8Printable(key), denseDims, m_vectors.dimensions());
            return std::nullopt;
        }
    }

    if (!execSql("SAVEPOINT upsert_chunk")) {
        return std::nullopt;
    }
    auto fail = [this, &key](const char* stage) -> std::optional<UpsertOutcome> {
        LOG_ERROR(hrIndex, "Upsert of %s failed at %s: %s",
                  qUtf8Printable(key), stage, sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT upsert_chunk");
        execSql("RELEASE SAVEPOINT upsert_chunk");
        return std::nullopt;
    };

    const std::optional<int64_t> existing = findRowId(doc.chunk.documentId, doc.chunk.chunkId);
    if (!existing) {
        return fail("lookup");
    }
    const bool isUpdate = *existing > 0;
    const double indexedAt = doc.indexedAt > 0.0 ? doc.indexedAt : nowEpochSeconds();
    const QByteArray denseBlob = doc.denseEmbedding
        ? QByteArray(reinterpret_cast<const char*>(doc.denseEmbedding->data()),
                     denseDims * static_cast<int>(sizeof(float)))
        : QByteArray();

    int64_t rowId = *existing;
    {
        Statement stmt(m_db, isUpdate
            ? "UPDATE chunks SET filename = ?3, source_url = ?4, text = ?5, token_count = ?6, "
              "char_count = ?7, dense_dims = ?8, dense_vector = ?9, has_sparse = ?10, "
              "indexed_at = ?11 WHERE document_id = ?1 AND chunk_id = ?2"
            : "INSERT INTO chunks (document_id, chunk_id, filename, source_url, text, "
              "token_count, char_count, dense_dims, dense_vector, has_sparse, indexed_at) "
              "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)");
        if (!stmt.ok()) {
            return fail("prepare");
        }
        bindText(stmt.get(), 1, doc.chunk.documentId);
        sqlite3_bind_int(stmt.get(), 2, doc.chunk.chunkId);
        bindText(stmt.get(), 3, doc.chunk.filename);
        bindText(stmt.get(), 4, doc.chunk.sourceUrl);
        bindText(stmt.get(), 5, doc.chunk.text);
        sqlite3_bind_int(stmt.get(), 6, doc.chunk.tokenCount);
        sqlite3_bind_int(stmt.get(), 7, doc.chunk.charCount);
        sqlite3_bind_int(stmt.get(), 8, denseDims);
        if (doc.denseEmbedding) {
            sqlite3_bind_blob(stmt.get(), 9, denseBlob.constData(),
                              static_cast<int>(denseBlob.size()), SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt.get(), 9);
        }
        sqlite3_bind_int(stmt.get(), 10, doc.sparseExpansion ? 1 : 0);
        sqlite3_bind_double(stmt.get(), 11, indexedAt);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return fail("chunk row");
        }
        if (!isUpdate) {
            rowId = sqlite3_last_insert_rowid(m_db);
        }
    }

    // Lexical alias: replace the FTS row sharing this rowid.
    {
        Statement del(m_db, "DELETE FROM chunk_text_fts WHERE rowid = ?1");
        if (!del.ok()) {
            return fail("fts delete");
        }
        sqlite3_bind_int64(del.get(), 1, rowId);
        if (sqlite3_step(del.get()) != SQLITE_DONE) {
            return fail("fts delete");
        }

        Statement ins(m_db, "INSERT INTO chunk_text_fts (rowid, text_alias) VALUES (?1, ?2)");
        if (!ins.ok()) {
            return fail("fts insert");
        }
        sqlite3_bind_int64(ins.get(), 1, rowId);
        bindText(ins.get(), 2, doc.chunk.text);
        if (sqlite3_step(ins.get()) != SQLITE_DONE) {
            return fail("fts insert");
        }
    }

    {
        Statement del(m_db, "DELETE FROM sparse_terms WHERE chunk_row = ?1");
        if (!del.ok()) {
            return fail("sparse delete");
        }
        sqlite3_bind_int64(del.get(), 1, rowId);
        if (sqlite3_step(del.get()) != SQLITE_DONE) {
            return fail("sparse delete");
        }
        if (doc.sparseExpansion && !writeSparseTerms(rowId, *doc.sparseExpansion)) {
            return fail("sparse insert");
        }
    }

    const auto label = static_cast<uint64_t>(rowId);
    if (doc.denseEmbedding) {
        if (!m_vectors.isAvailable()) {
            if (!m_vectors.create(denseDims)) {
                return fail("vector index create");
            }
            if (!writeMeta("dense_dimensions", QString::number(denseDims))) {
                m_vectors.reset();
                return fail("index meta");
            }
        }
        if (!m_vectors.upsert(label, *doc.denseEmbedding)) {
            return fail("vector upsert");
        }
    } else if (m_vectors.contains(label) && !m_vectors.remove(label)) {
        return fail("vector remove");
    }

    if (!execSql("RELEASE SAVEPOINT upsert_chunk")) {
        execSql("ROLLBACK TO SAVEPOINT upsert_chunk");
        execSql("RELEASE SAVEPOINT upsert_chunk");
        // The vector index was already touched; resync it with what is on disk.
        rebuildVectorIndex();
        LOG_ERROR(hrIndex, "Upsert of %s failed at commit", qUtf8Printable(key));
        return std::nullopt;
    }

    return isUpdate ? UpsertOutcome::Updated : UpsertOutcome::Created;
}

// ── Reads ───────────────────────────────────────────────────

std::optional<ChunkDocument> SQLiteDocumentStore::get(const QString& documentId, int chunkId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexExistsUnlocked()) {
        return std::nullopt;
    }

    const QByteArray sql = QByteArray("SELECT c.id, c.dense_dims, c.dense_vector, c.has_sparse, "
                                      "c.indexed_at, ")
        + kChunkColumns + " FROM chunks c WHERE c.document_id = ?1 AND c.chunk_id = ?2";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    bindText(stmt.get(), 1, documentId);
    sqlite3_bind_int(stmt.get(), 2, chunkId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    ChunkDocument doc;
    const int64_t rowId = sqlite3_column_int64(stmt.get(), 0);
    if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL) {
        DenseVector dense = readDense(stmt.get(), 2, sqlite3_column_int(stmt.get(), 1));
        if (!dense.empty()) {
            doc.denseEmbedding = std::move(dense);
        }
    }
    const bool hasSparse = sqlite3_column_int(stmt.get(), 3) != 0;
    doc.indexedAt = sqlite3_column_double(stmt.get(), 4);
    doc.chunk = readChunk(stmt.get(), 5);

    if (hasSparse) {
        Statement terms(m_db, "SELECT term, weight FROM sparse_terms WHERE chunk_row = ?1");
        if (!terms.ok()) {
            return std::nullopt;
        }
        sqlite3_bind_int64(terms.get(), 1, rowId);
        SparseVector sparse;
        while (sqlite3_step(terms.get()) == SQLITE_ROW) {
            sparse[columnText(terms.get(), 0)] = static_cast<float>(sqlite3_column_double(terms.get(), 1));
        }
        doc.sparseExpansion = std::move(sparse);
    }
    return doc;
}

int64_t SQLiteDocumentStore::count()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexExistsUnlocked()) {
        return 0;
    }
    Statement stmt(m_db, "SELECT count(*) FROM chunks");
    if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

std::optional<Chunk> SQLiteDocumentStore::loadChunkByRow(int64_t rowId)
{
    const QByteArray sql = QByteArray("SELECT ") + kChunkColumns + " FROM chunks c WHERE c.id = ?1";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt.get(), 1, rowId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readChunk(stmt.get(), 0);
}

// ── Search ──────────────────────────────────────────────────

QString SQLiteDocumentStore::toFtsQuery(const QString& text)
{
    QStringList terms;
    std::set<QString> seen;
    QString current;

    auto flush = [&]() {
        if (!current.isEmpty()) {
            const QString folded = current.toLower();
            if (seen.insert(folded).second) {
                terms.append(QLatin1Char('"') + current + QLatin1Char('"'));
            }
            current.clear();
        }
    };

    for (const QChar ch : text) {
        if (ch.isLetterOrNumber() || ch == QLatin1Char('_')) {
            current.append(ch);
        } else {
            flush();
        }
    }
    flush();

    return terms.join(QStringLiteral(" OR "));
}

std::optional<std::vector<StoreHit>> SQLiteDocumentStore::searchLexical(const QString& text, int limit)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexExistsUnlocked()) {
        LOG_WARN(hrIndex, "Lexical search against missing index");
        return std::nullopt;
    }

    std::vector<StoreHit> hits;
    const QString ftsQuery = toFtsQuery(text);
    if (ftsQuery.isEmpty() || limit <= 0) {
        return hits;
    }

    const QByteArray sql = QByteArray("SELECT bm25(chunk_text_fts), ") + kChunkColumns
        + " FROM chunk_text_fts JOIN chunks c ON c.id = chunk_text_fts.rowid"
          " WHERE chunk_text_fts MATCH ?1"
          " ORDER BY bm25(chunk_text_fts) ASC, c.id ASC LIMIT ?2";
    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    bindText(stmt.get(), 1, ftsQuery);
    sqlite3_bind_int(stmt.get(), 2, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        StoreHit hit;
        // bm25() is lower-is-better; flip it so every signal ranks descending.
        hit.score = -sqlite3_column_double(stmt.get(), 0);
        hit.chunk = readChunk(stmt.get(), 1);
        hits.push_back(std::move(hit));
    }
    if (rc != SQLITE_DONE) {
        LOG_WARN(hrIndex, "Lexical search failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return hits;
}

std::optional<std::vector<StoreHit>> SQLiteDocumentStore::searchDense(const DenseVector& vector, int limit)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexExistsUnlocked()) {
        LOG_WARN(hrIndex, "Dense search against missing index");
        return std::nullopt;
    }

    std::vector<StoreHit> hits;
    if (!m_vectors.isAvailable() || limit <= 0) {
        return hits;
    }
    if (static_cast<int>(vector.size()) != m_vectors.dimensions()) {
        LOG_WARN(hrIndex, "Dense query has %zu dims, index has %d",
                 vector.size(), m_vectors.dimensions());
        return std::nullopt;
    }

    for (const VectorIndex::KnnResult& knn : m_vectors.search(vector, limit)) {
        std::optional<Chunk> chunk = loadChunkByRow(static_cast<int64_t>(knn.label));
        if (!chunk) {
            continue;
        }
        hits.push_back(StoreHit{std::move(*chunk), static_cast<double>(knn.similarity)});
    }
    return hits;
}

std::optional<std::vector<StoreHit>> SQLiteDocumentStore::searchSparse(const SparseVector& vector, int limit)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexExistsUnlocked()) {
        LOG_WARN(hrIndex, "Sparse search against missing index");
        return std::nullopt;
    }

    std::vector<std::pair<QString, float>> terms;
    for (const auto& [term, weight] : vector) {
        if (!term.isEmpty() && weight > 0.0f) {
            terms.emplace_back(term, weight);
        }
    }
    std::vector<StoreHit> hits;
    if (terms.empty() || limit <= 0) {
        return hits;
    }
    if (static_cast<int>(terms.size()) > kMaxSparseQueryTerms) {
        std::partial_sort(terms.begin(), terms.begin() + kMaxSparseQueryTerms, terms.end(),
                          [](const auto& a, const auto& b) {
                              if (a.second != b.second) {
                                  return a.second > b.second;
                              }
                              return a.first < b.first;
                          });
        terms.resize(kMaxSparseQueryTerms);
    }

    QByteArray sql("WITH q(term, qweight) AS (VALUES ");
    for (size_t i = 0; i < terms.size(); ++i) {
        if (i > 0) {
            sql += ", ";
        }
        sql += "(?" + QByteArray::number(static_cast<int>(2 * i + 1))
             + ", ?" + QByteArray::number(static_cast<int>(2 * i + 2)) + ")";
    }
    const int limitParam = static_cast<int>(2 * terms.size() + 1);
    sql += ") SELECT SUM(s.weight * q.qweight) AS score, ";
    sql += kChunkColumns;
    sql += " FROM q JOIN sparse_terms s ON s.term = q.term"
           " JOIN chunks c ON c.id = s.chunk_row"
           " GROUP BY c.id ORDER BY score DESC, c.id ASC LIMIT ?"
         + QByteArray::number(limitParam);

    Statement stmt(m_db, sql.constData());
    if (!stmt.ok()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < terms.size(); ++i) {
        bindText(stmt.get(), static_cast<int>(2 * i + 1), terms[i].first);
        sqlite3_bind_double(stmt.get(), static_cast<int>(2 * i + 2),
                            static_cast<double>(terms[i].second));
    }
    sqlite3_bind_int(stmt.get(), limitParam, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        StoreHit hit;
        hit.score = sqlite3_column_double(stmt.get(), 0);
        hit.chunk = readChunk(stmt.get(), 1);
        hits.push_back(std::move(hit));
    }
    if (rc != SQLITE_DONE) {
        LOG_WARN(hrIndex, "Sparse search failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return hits;
}

// ── Health ──────────────────────────────────────────────────

StoreHealth SQLiteDocumentStore::health()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    StoreHealth h;
    h.indexExists = indexExistsUnlocked();
    if (!h.indexExists) {
        return h;
    }

    Statement stmt(m_db,
        "SELECT count(*), "
        "       sum(CASE WHEN dense_vector IS NOT NULL THEN 1 ELSE 0 END), "
        "       sum(has_sparse), "
        "       max(indexed_at) "
        "FROM chunks");
    if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
        h.chunkCount = sqlite3_column_int64(stmt.get(), 0);
        h.denseCount = sqlite3_column_int64(stmt.get(), 1);
        h.sparseCount = sqlite3_column_int64(stmt.get(), 2);
        h.lastIndexedAt = sqlite3_column_double(stmt.get(), 3);
    }
    h.denseDimensions = m_vectors.dimensions();
    return h;
}

} // namespace hr
