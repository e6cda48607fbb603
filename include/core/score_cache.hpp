#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>
#include <nlohmann/json.hpp>

/**
 * @brief Result of a cache write
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Previously computed score for one path
 */
struct ScoreRecord
{
    std::string file_path;
    std::string file_hash;
    double score = 0.0;
    std::optional<nlohmann::json> analysis;
    std::optional<nlohmann::json> quality;
    std::string last_processed_at;
};

/**
 * @brief SQLite-backed resume cache keyed by file path
 *
 * A record is only returned while its stored fingerprint equals the caller's
 * current fingerprint, so any content change invalidates it transparently.
 */
class ScoreCache
{
public:
    enum class Mode
    {
        READ_WRITE,
        READ_ONLY // Never creates the database; a missing file behaves as empty
    };

    explicit ScoreCache(const std::string &db_path, Mode mode = Mode::READ_WRITE);
    ~ScoreCache();

    ScoreCache(const ScoreCache &) = delete;
    ScoreCache &operator=(const ScoreCache &) = delete;

    /**
     * @brief Look up a record for a path
     * @param file_path Path the record is keyed by
     * @param file_hash Current fingerprint of the file (hex)
     * @return The record if present and its fingerprint matches, otherwise nullopt
     */
    std::optional<ScoreRecord> get(const std::string &file_path, const std::string &file_hash);

    /**
     * @brief Insert or replace the record for a path
     */
    DBOpResult upsert(const std::string &file_path, const std::string &file_hash, double score,
                      const std::optional<nlohmann::json> &analysis,
                      const std::optional<nlohmann::json> &quality);

    bool isValid() const { return db_ != nullptr; }
    bool isReadOnly() const { return mode_ == Mode::READ_ONLY; }
    const std::string &path() const { return db_path_; }

private:
    sqlite3 *db_;
    std::string db_path_;
    Mode mode_;
    std::mutex db_mutex_;

    void open();
    bool createScoresTable();
    DBOpResult executeStatement(const std::string &sql);

    static std::string dumpJson(const std::optional<nlohmann::json> &value);
    // False when the stored text is present but not valid JSON
    static bool loadJson(const unsigned char *text, const std::string &file_path, std::optional<nlohmann::json> &out);
};
