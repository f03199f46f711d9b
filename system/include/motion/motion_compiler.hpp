// ============= include/motion/motion_compiler.hpp =============
/*
 * Motion Compiler - gestos de alto nivel → primitivas del robot
 *
 * PRIMITIVAS (pasan sin cambios):
 *   turn_right_deg / turn_left_deg   (degrees)
 *   move_forward_cm / move_backward_cm (cm)
 *   led_color (r, g, b) / led_off / pause
 *
 * ALIAS:
 *   wave, nod, shake_head, rotate_left, rotate_right,
 *   spin, celebrate, look_around
 *
 * Un alias con duración D se expande en primitivas cuya suma es
 * exactamente D; sin duración usa la suya por defecto.
 * Pasos desconocidos se dejan tal cual. Duración ausente = 0.
 */

#pragma once
#include "tags/tag_parser.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct CompiledStep {
    std::string action;
    int duration_ms = 0;
    bool has_duration = false;

    // named parameters in output order: degrees | cm | r,g,b
    std::vector<std::pair<std::string, int>> params;

    // only for unknown actions, forwarded untouched
    std::vector<int> raw_args;
};

struct MoveSequence {
    std::string description;
    std::string emotion_during = "neutral";
    int64_t total_duration_ms = 0;
    std::vector<CompiledStep> steps;

    int step_count() const { return static_cast<int>(steps.size()); }
};

bool is_motion_primitive(const std::string& action);
bool is_motion_alias(const std::string& action);

// Expansion of one raw step (a primitive yields exactly itself)
std::vector<CompiledStep> expand_step(const MotionStep& step);

MoveSequence build_move_sequence(const std::string& description,
                                 const std::vector<MotionStep>& steps,
                                 const std::string& emotion_during = "neutral");

// Four quarter turns, each followed by a green pulse and a pause
MoveSequence build_face_scan_sequence();

// Fallback when the model suggests no exploration moves
MoveSequence build_look_around_sequence();
