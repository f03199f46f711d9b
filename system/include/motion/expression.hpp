// ============= include/motion/expression.hpp =============
#pragma once
#include <string>
#include <vector>

struct Expression {
    std::vector<std::string> emojis;
    int duration_per_emoji = 2000;
    std::string transition = "bounce";
};

// OpenMoji codepoints for an emotion; unknown → neutral list
const std::vector<std::string>& emotion_to_emojis(const std::string& emotion);

// Contextual emojis first, then the first two of the emotion.
// Without contextual emojis the emotion list is used alone.
Expression build_expression(const std::string& emotion,
                            const std::vector<std::string>& contextual_emojis);
