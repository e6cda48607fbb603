#include "core/prompt_builder.hpp"

using json = nlohmann::json;

json PromptBuilder::schemaTemplate()
{
    return json{
        {"caption", ""},
        {"tags", json::array()},
        {"risks", {{"blur", false}, {"dark", false}, {"overexposed", false}, {"out_of_focus", false}}},
        {"score", 0.0},
        {"overall_score", 0.0},
        {"sharpness", 0.0},
        {"subject_visibility", 0.0},
        {"composition", 0.0},
        {"duplication_penalty", 0.0},
        {"reasoning", ""}};
}

std::string PromptBuilder::build(Subject subject, const QualityMetrics &quality)
{
    std::string opening = subject == Subject::PHOTO
                              ? "You are evaluating a photo for a family highlight slideshow. "
                              : "You are evaluating a representative frame from a short video clip for a family highlight reel. ";

    return opening +
           "Return ONLY JSON. Do NOT output anything else. "
           "No extra text, no explanations, no markdown. "
           "The JSON MUST match this schema exactly, with no extra keys: " +
           schemaTemplate().dump(-1, ' ', true) + " "
           "Tags must be at most 5 items, all lowercase snake_case English words. "
           "Caption must be a short sentence. "
           "All scores must be between 0.0 and 1.0. "
           "If the image is inappropriate or cannot be judged, still return JSON with a low score. "
           "Background blur is acceptable. Focus on whether the subject looks sharp. "
           "Set risks.blur true when the subject or hands show motion blur. "
           "Set risks.out_of_focus true when the subject is not in focus. "
           "Consider the provided quality hints, including center and lower-area sharpness and exposure. "
           "Quality hints: " +
           qualityToJson(quality).dump(-1, ' ', true);
}
