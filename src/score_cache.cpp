#include "core/score_cache.hpp"
#include "logging/logger.hpp"
#include <filesystem>

using json = nlohmann::json;

ScoreCache::ScoreCache(const std::string &db_path, Mode mode)
    : db_(nullptr), db_path_(db_path), mode_(mode)
{
    open();
}

ScoreCache::~ScoreCache()
{
    if (db_)
    {
        sqlite3_close(db_);
        Logger::debug("Score cache closed: " + db_path_);
    }
}

void ScoreCache::open()
{
    if (mode_ == Mode::READ_ONLY)
    {
        std::error_code ec;
        if (!std::filesystem::exists(db_path_, ec))
        {
            Logger::debug("Score cache not present, read-only lookups will miss: " + db_path_);
            return;
        }
        int rc = sqlite3_open_v2(db_path_.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to open score cache read-only: " + std::string(sqlite3_errmsg(db_)));
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return;
    }

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        Logger::error("Failed to create score cache directory " + parent.string() + ": " + ec.message());
        return;
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to open score cache: " + std::string(sqlite3_errmsg(db_)));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    Logger::info("Score cache opened: " + db_path_);
    if (!createScoresTable())
        Logger::error("Failed to create photo_scores table");
}

bool ScoreCache::createScoresTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS photo_scores (
            file_path TEXT PRIMARY KEY,
            file_hash TEXT NOT NULL,
            score REAL NOT NULL,
            analysis_json TEXT,
            quality_json TEXT,
            last_processed_at TEXT NOT NULL
        )
    )";
    return executeStatement(sql).success;
}

DBOpResult ScoreCache::executeStatement(const std::string &sql)
{
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string msg = "SQL error: " + std::string(err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        Logger::error(msg);
        return DBOpResult(false, msg);
    }
    return DBOpResult(true);
}

std::optional<ScoreRecord> ScoreCache::get(const std::string &file_path, const std::string &file_hash)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_)
        return std::nullopt;

    const std::string select_sql = R"(
        SELECT file_path, file_hash, score, analysis_json, quality_json, last_processed_at
        FROM photo_scores
        WHERE file_path = ?
    )";

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        // A read-only handle onto a foreign file has no table; that is a miss
        Logger::warn("CacheCorruption: failed to query score cache: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, file_path.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<ScoreRecord> result;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        const unsigned char *stored_hash = sqlite3_column_text(stmt, 1);
        if (stored_hash && file_hash == reinterpret_cast<const char *>(stored_hash))
        {
            ScoreRecord record;
            record.file_path = file_path;
            record.file_hash = file_hash;
            record.score = sqlite3_column_double(stmt, 2);
            bool readable = loadJson(sqlite3_column_text(stmt, 3), file_path, record.analysis) &&
                            loadJson(sqlite3_column_text(stmt, 4), file_path, record.quality);
            const unsigned char *timestamp = sqlite3_column_text(stmt, 5);
            record.last_processed_at = timestamp ? reinterpret_cast<const char *>(timestamp) : "";
            if (readable)
                result = record;
        }
        else
        {
            Logger::debug("Cached fingerprint is stale for: " + file_path);
        }
    }
    else if (rc != SQLITE_DONE)
    {
        Logger::warn("CacheCorruption: failed to read cache row for " + file_path + ": " + sqlite3_errmsg(db_));
    }

    sqlite3_finalize(stmt);
    return result;
}

DBOpResult ScoreCache::upsert(const std::string &file_path, const std::string &file_hash, double score,
                              const std::optional<json> &analysis, const std::optional<json> &quality)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (mode_ == Mode::READ_ONLY)
    {
        return DBOpResult(false, "Score cache is read-only");
    }
    if (!db_)
    {
        std::string msg = "Score cache not initialized";
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    const std::string upsert_sql = R"(
        INSERT INTO photo_scores
        (file_path, file_hash, score, analysis_json, quality_json, last_processed_at)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(file_path) DO UPDATE SET
            file_hash = excluded.file_hash,
            score = excluded.score,
            analysis_json = excluded.analysis_json,
            quality_json = excluded.quality_json,
            last_processed_at = excluded.last_processed_at
    )";

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, upsert_sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string msg = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    const std::string analysis_text = dumpJson(analysis);
    const std::string quality_text = dumpJson(quality);
    const std::string timestamp = Logger::utcTimestamp();

    sqlite3_bind_text(stmt, 1, file_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, file_hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, score);
    if (analysis)
        sqlite3_bind_text(stmt, 4, analysis_text.c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, 4);
    if (quality)
        sqlite3_bind_text(stmt, 5, quality_text.c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, 5);
    sqlite3_bind_text(stmt, 6, timestamp.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE)
    {
        std::string msg = "Failed to upsert score: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    Logger::debug("Stored score for: " + file_path);
    return DBOpResult(true);
}

std::string ScoreCache::dumpJson(const std::optional<json> &value)
{
    if (!value)
        return "";
    return value->dump(-1, ' ', true);
}

bool ScoreCache::loadJson(const unsigned char *text, const std::string &file_path, std::optional<json> &out)
{
    out.reset();
    if (!text || *text == '\0')
        return true;
    try
    {
        out = json::parse(reinterpret_cast<const char *>(text));
        return true;
    }
    catch (const json::parse_error &e)
    {
        Logger::warn("CacheCorruption: unreadable payload for " + file_path + ", treating as miss: " + e.what());
        return false;
    }
}
