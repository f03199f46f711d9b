// ============= src/motion/expression.cpp =============
#include "motion/expression.hpp"
#include <algorithm>
#include <map>

namespace {
    const std::map<std::string, std::vector<std::string>>& emoji_table() {
        static const std::map<std::string, std::vector<std::string>> table = {
            {"happy",     {"1F600", "1F603", "1F604"}},
            {"excited",   {"1F929", "2728", "1F389"}},
            {"sad",       {"1F622", "1F614"}},
            {"empathy",   {"1F97A", "1F917"}},
            {"confused",  {"1F615", "1F914"}},
            {"surprised", {"1F62E", "1F632"}},
            {"love",      {"2764", "1F60D", "1F970"}},
            {"cool",      {"1F60E", "1F44D"}},
            {"greeting",  {"1F44B", "1F60A"}},
            {"neutral",   {"1F642", "1F610"}},
            {"curious",   {"1F914", "1F9D0"}},
            {"worried",   {"1F61F", "1F625"}},
            {"playful",   {"1F61C", "1F604"}},
        };
        return table;
    }
}

const std::vector<std::string>& emotion_to_emojis(const std::string& emotion) {
    const auto& table = emoji_table();
    auto it = table.find(emotion);
    if (it == table.end()) {
        it = table.find("neutral");
    }
    return it->second;
}

Expression build_expression(const std::string& emotion,
                            const std::vector<std::string>& contextual_emojis)
{
    Expression expression;
    const auto& defaults = emotion_to_emojis(emotion);

    if (contextual_emojis.empty()) {
        expression.emojis = defaults;
        return expression;
    }

    expression.emojis = contextual_emojis;
    size_t extra = std::min<size_t>(2, defaults.size());
    expression.emojis.insert(expression.emojis.end(), defaults.begin(), defaults.begin() + extra);
    return expression;
}
