// ============= src/motion/motion_compiler.cpp =============
#include "motion/motion_compiler.hpp"
#include <cstdint>
#include <map>

namespace {
    struct AliasPart {
        const char* action;
        std::vector<int> args;
        int weight;               // share of the alias duration
    };

    struct AliasDef {
        int default_duration_ms;
        std::vector<AliasPart> parts;
    };

    const std::map<std::string, AliasDef>& alias_table() {
        static const std::map<std::string, AliasDef> table = {
            {"wave",         {1500, {{"turn_right_deg", {20}, 1},
                                     {"turn_left_deg", {40}, 2},
                                     {"turn_right_deg", {20}, 1}}}},
            {"nod",          {800,  {{"move_forward_cm", {2}, 1},
                                     {"move_backward_cm", {2}, 1}}}},
            {"shake_head",   {1200, {{"turn_left_deg", {25}, 1},
                                     {"turn_right_deg", {50}, 2},
                                     {"turn_left_deg", {25}, 1}}}},
            {"rotate_left",  {1000, {{"turn_left_deg", {90}, 1}}}},
            {"rotate_right", {1000, {{"turn_right_deg", {90}, 1}}}},
            {"spin",         {2000, {{"turn_right_deg", {360}, 1}}}},
            {"celebrate",    {2500, {{"led_color", {255, 215, 0}, 1},
                                     {"turn_right_deg", {360}, 3},
                                     {"led_off", {}, 1}}}},
            {"look_around",  {2000, {{"turn_left_deg", {45}, 1},
                                     {"turn_right_deg", {90}, 2},
                                     {"turn_left_deg", {45}, 1}}}},
        };
        return table;
    }

    std::vector<std::string> param_names(const std::string& action) {
        if (action == "turn_right_deg" || action == "turn_left_deg") return {"degrees"};
        if (action == "move_forward_cm" || action == "move_backward_cm") return {"cm"};
        if (action == "led_color") return {"r", "g", "b"};
        return {};
    }

    CompiledStep make_primitive(const std::string& action, const std::vector<int>& args,
                                int duration_ms, bool has_duration)
    {
        CompiledStep step;
        step.action = action;
        step.duration_ms = duration_ms;
        step.has_duration = has_duration;

        std::vector<std::string> names = param_names(action);
        for (size_t i = 0; i < names.size() && i < args.size(); ++i) {
            step.params.emplace_back(names[i], args[i]);
        }
        return step;
    }
}

bool is_motion_primitive(const std::string& action) {
    return action == "turn_right_deg" || action == "turn_left_deg" ||
           action == "move_forward_cm" || action == "move_backward_cm" ||
           action == "led_color" || action == "led_off" || action == "pause";
}

bool is_motion_alias(const std::string& action) {
    return alias_table().count(action) > 0;
}

std::vector<CompiledStep> expand_step(const MotionStep& step) {
    if (is_motion_primitive(step.action)) {
        return {make_primitive(step.action, step.args, step.duration_ms, step.has_duration)};
    }

    auto it = alias_table().find(step.action);
    if (it == alias_table().end()) {
        CompiledStep unknown;
        unknown.action = step.action;
        unknown.duration_ms = step.duration_ms;
        unknown.has_duration = step.has_duration;
        unknown.raw_args = step.args;
        return {unknown};
    }

    const AliasDef& alias = it->second;
    int64_t total = step.has_duration ? step.duration_ms : alias.default_duration_ms;

    int64_t weight_sum = 0;
    for (const auto& part : alias.parts) weight_sum += part.weight;

    std::vector<CompiledStep> expanded;
    int64_t assigned = 0;
    for (size_t i = 0; i < alias.parts.size(); ++i) {
        const AliasPart& part = alias.parts[i];

        // last part takes the rounding remainder so the sum is exact
        int64_t duration = (i + 1 == alias.parts.size())
                               ? total - assigned
                               : total * part.weight / weight_sum;
        assigned += duration;

        // A lone number is the duration; the angle needs both:
        // rotate_left:45:1000 turns 45 degrees in 1000 ms
        std::vector<int> args = part.args;
        if (alias.parts.size() == 1 && !step.args.empty() && !args.empty()) {
            args[0] = step.args[0];
        }

        expanded.push_back(make_primitive(part.action, args, static_cast<int>(duration), true));
    }
    return expanded;
}

MoveSequence build_move_sequence(const std::string& description,
                                 const std::vector<MotionStep>& steps,
                                 const std::string& emotion_during)
{
    MoveSequence sequence;
    sequence.description = description;
    sequence.emotion_during = emotion_during;

    for (const auto& step : steps) {
        for (auto& compiled : expand_step(step)) {
            sequence.total_duration_ms += compiled.has_duration ? compiled.duration_ms : 0;
            sequence.steps.push_back(std::move(compiled));
        }
    }
    return sequence;
}

MoveSequence build_face_scan_sequence() {
    std::vector<MotionStep> steps;

    for (int i = 0; i < 4; ++i) {
        steps.push_back({"turn_right_deg", {90}, 1000, true});
        steps.push_back({"led_color", {0, 255, 0}, 300, true});
        steps.push_back({"pause", {}, 1200, true});
    }
    steps.push_back({"led_off", {}, 100, true});

    return build_move_sequence("Escaneo facial 360°", steps, "curious");
}

MoveSequence build_look_around_sequence() {
    MotionStep look;
    look.action = "look_around";
    return build_move_sequence("Explorando alrededor", std::vector<MotionStep>{look}, "curious");
}
