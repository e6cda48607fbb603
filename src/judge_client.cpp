#include "core/judge_client.hpp"
#include "core/error_recovery.hpp"
#include "core/media_error.hpp"
#include "logging/logger.hpp"
#include <httplib.h>

using json = nlohmann::json;

HttpJudgeTransport::HttpJudgeTransport(const std::string &base_url, int timeout_seconds)
{
    std::string url = base_url;
    while (!url.empty() && url.back() == '/')
        url.pop_back();

    client_ = std::make_unique<httplib::Client>(url);
    client_->set_connection_timeout(timeout_seconds, 0);
    client_->set_read_timeout(timeout_seconds, 0);
    client_->set_write_timeout(timeout_seconds, 0);
}

HttpJudgeTransport::~HttpJudgeTransport() = default;

TransportResponse HttpJudgeTransport::post(const std::string &path, const std::string &body)
{
    TransportResponse response;
    auto result = client_->Post(path, body, "application/json");
    if (!result)
    {
        response.error_message = "HTTP request failed: " + httplib::to_string(result.error());
        return response;
    }
    response.success = true;
    response.status = result->status;
    response.body = result->body;
    return response;
}

TransportResponse HttpJudgeTransport::get(const std::string &path)
{
    TransportResponse response;
    auto result = client_->Get(path);
    if (!result)
    {
        response.error_message = "HTTP request failed: " + httplib::to_string(result.error());
        return response;
    }
    response.success = true;
    response.status = result->status;
    response.body = result->body;
    return response;
}

JudgeClient::JudgeClient(std::shared_ptr<JudgeTransport> transport, Settings settings, SleepFunction sleep)
    : transport_(std::move(transport)), settings_(settings), sleep_(std::move(sleep))
{
    if (!sleep_)
        sleep_ = ErrorRecovery::realSleep();
}

json JudgeClient::buildChatPayload(const std::string &model, const std::string &image_b64, const std::string &prompt)
{
    return json{
        {"model", model},
        {"stream", false},
        {"messages", json::array({
                         {{"role", "system"}, {"content", "You are a photo selection assistant. Return only JSON."}},
                         {{"role", "user"}, {"content", prompt}, {"images", json::array({image_b64})}},
                     })}};
}

json JudgeClient::chatOnce(const std::string &payload)
{
    TransportResponse response = transport_->post("/api/chat", payload);
    if (!response.success)
    {
        throw MediaError(MediaErrorKind::JUDGE_UNAVAILABLE, response.error_message);
    }
    if (response.status != 200)
    {
        throw MediaError(MediaErrorKind::JUDGE_UNAVAILABLE,
                         "HTTP " + std::to_string(response.status) + ": " + response.body.substr(0, 200));
    }

    json data;
    try
    {
        data = json::parse(response.body);
    }
    catch (const json::parse_error &e)
    {
        throw MediaError(MediaErrorKind::INVALID_JUDGE_RESPONSE, std::string("Response body is not JSON: ") + e.what());
    }

    std::string content;
    if (data.is_object() && data.contains("message") && data["message"].is_object() &&
        data["message"].contains("content"))
    {
        const json &content_value = data["message"]["content"];
        if (!content_value.is_string())
        {
            throw MediaError(MediaErrorKind::INVALID_JUDGE_RESPONSE,
                             std::string("Judge message content is not a string: ") + content_value.type_name());
        }
        content = content_value.get<std::string>();
    }
    if (content.empty())
    {
        throw MediaError(MediaErrorKind::JUDGE_UNAVAILABLE, "Empty judge response content");
    }
    return parseJsonFromText(content);
}

json JudgeClient::chat(const std::string &model, const std::string &image_b64, const std::string &prompt)
{
    const std::string payload = buildChatPayload(model, image_b64, prompt).dump();

    auto is_retryable = [](const std::exception &e)
    {
        const auto *media_error = dynamic_cast<const MediaError *>(&e);
        return media_error == nullptr || media_error->kind() == MediaErrorKind::JUDGE_UNAVAILABLE;
    };

    return ErrorRecovery::retryWithLinearBackoff(
        [this, &payload]()
        { return chatOnce(payload); },
        settings_.max_retries + 1, settings_.retry_backoff, "judge chat", sleep_, is_retryable);
}

bool JudgeClient::ping()
{
    TransportResponse response = transport_->get("/api/tags");
    if (!response.success)
    {
        Logger::warn("Judge service unreachable: " + response.error_message);
        return false;
    }
    return response.status == 200;
}

std::optional<std::string> JudgeClient::extractJsonObject(const std::string &text)
{
    size_t start = text.find('{');
    while (start != std::string::npos)
    {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (size_t i = start; i < text.size(); ++i)
        {
            char c = text[i];
            if (in_string)
            {
                if (escaped)
                    escaped = false;
                else if (c == '\\')
                    escaped = true;
                else if (c == '"')
                    in_string = false;
                continue;
            }
            if (c == '"')
                in_string = true;
            else if (c == '{')
                depth++;
            else if (c == '}')
            {
                depth--;
                if (depth == 0)
                    return text.substr(start, i - start + 1);
            }
        }
        // Unbalanced from this brace; no later brace can close either
        break;
    }
    return std::nullopt;
}

json JudgeClient::parseJsonFromText(const std::string &text)
{
    std::optional<std::string> object_text = extractJsonObject(text);
    if (!object_text)
    {
        throw MediaError(MediaErrorKind::INVALID_JUDGE_RESPONSE, "No JSON object found in judge response");
    }
    try
    {
        return json::parse(*object_text);
    }
    catch (const json::parse_error &e)
    {
        throw MediaError(MediaErrorKind::INVALID_JUDGE_RESPONSE, std::string("Malformed JSON in judge response: ") + e.what());
    }
}
