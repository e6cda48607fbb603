#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/media_item.hpp"

/**
 * @brief Builds judge instructions for photos and clip frames
 */
class PromptBuilder
{
public:
    enum class Subject
    {
        PHOTO,
        CLIP_FRAME
    };

    // Response shape the judge is asked to fill in
    static nlohmann::json schemaTemplate();

    static std::string build(Subject subject, const QualityMetrics &quality);
};
