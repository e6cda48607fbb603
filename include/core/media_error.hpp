#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Failure categories for per-item and batch errors
 */
enum class MediaErrorKind
{
    DECODE_FAILURE,         // Imaging library could not read the file
    TRANSCODE_FAILURE,      // ffmpeg/ffprobe exited non-zero
    INVALID_JUDGE_RESPONSE, // Judge payload is not a usable JSON object (never retried)
    JUDGE_UNAVAILABLE,      // Network or HTTP failure talking to the judge (retried)
    UNSAFE_CLEANUP_TARGET,  // Cleanup path failed the containment check
    CACHE_CORRUPTION        // Stored cache record could not be read
};

/**
 * @brief Exception raised inside a per-item step
 *
 * Item loops catch it and store what() on the item, so it never escapes a batch.
 */
class MediaError : public std::runtime_error
{
public:
    MediaError(MediaErrorKind kind, const std::string &message)
        : std::runtime_error(kindName(kind) + ": " + message), kind_(kind) {}

    MediaErrorKind kind() const { return kind_; }

    static std::string kindName(MediaErrorKind kind)
    {
        switch (kind)
        {
        case MediaErrorKind::DECODE_FAILURE:
            return "DecodeFailure";
        case MediaErrorKind::TRANSCODE_FAILURE:
            return "TranscodeFailure";
        case MediaErrorKind::INVALID_JUDGE_RESPONSE:
            return "InvalidJudgeResponse";
        case MediaErrorKind::JUDGE_UNAVAILABLE:
            return "JudgeUnavailable";
        case MediaErrorKind::UNSAFE_CLEANUP_TARGET:
            return "UnsafeCleanupTarget";
        case MediaErrorKind::CACHE_CORRUPTION:
            return "CacheCorruption";
        }
        return "UnknownError";
    }

private:
    MediaErrorKind kind_;
};

/**
 * @brief Configuration-level error; the only kind that aborts a batch
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};
