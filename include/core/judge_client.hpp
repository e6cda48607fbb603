#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace httplib
{
    class Client;
}

/**
 * @brief Raw outcome of one HTTP exchange with the judge service
 */
struct TransportResponse
{
    bool success = false; // Transport-level success (a response was received)
    int status = 0;
    std::string body;
    std::string error_message;
};

/**
 * @brief Request/response channel to the judge service
 */
class JudgeTransport
{
public:
    virtual ~JudgeTransport() = default;
    virtual TransportResponse post(const std::string &path, const std::string &body) = 0;
    virtual TransportResponse get(const std::string &path) = 0;
};

/**
 * @brief JudgeTransport over cpp-httplib
 */
class HttpJudgeTransport : public JudgeTransport
{
public:
    HttpJudgeTransport(const std::string &base_url, int timeout_seconds = 30);
    ~HttpJudgeTransport() override;

    TransportResponse post(const std::string &path, const std::string &body) override;
    TransportResponse get(const std::string &path) override;

private:
    std::unique_ptr<httplib::Client> client_;
};

/**
 * @brief Client for an Ollama-compatible vision-language judge
 */
class JudgeClient
{
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    struct Settings
    {
        int max_retries = 2; // Extra attempts after the first
        std::chrono::milliseconds retry_backoff{800};
    };

    JudgeClient(std::shared_ptr<JudgeTransport> transport, Settings settings, SleepFunction sleep = nullptr);

    /**
     * @brief Ask the judge about one image
     * @param model Model name
     * @param image_b64 Base64 encoded image
     * @param prompt Instruction including the schema and quality hints
     * @return The first JSON object found in the reply
     * @throws MediaError JudgeUnavailable after all retries, or InvalidJudgeResponse
     */
    nlohmann::json chat(const std::string &model, const std::string &image_b64, const std::string &prompt);

    /**
     * @brief Check that the service answers on /api/tags
     */
    bool ping();

    static nlohmann::json buildChatPayload(const std::string &model, const std::string &image_b64,
                                           const std::string &prompt);

    /**
     * @brief Extract the first balanced {...} span, ignoring braces inside strings
     */
    static std::optional<std::string> extractJsonObject(const std::string &text);

    /**
     * @brief Parse the JSON object embedded in free text
     * @throws MediaError (InvalidJudgeResponse)
     */
    static nlohmann::json parseJsonFromText(const std::string &text);

private:
    std::shared_ptr<JudgeTransport> transport_;
    Settings settings_;
    SleepFunction sleep_;

    nlohmann::json chatOnce(const std::string &payload);
};
