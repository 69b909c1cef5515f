#pragma once

#include <string>
#include <string_view>

// Post-processing of raw engine output. Hallucinated filler that engines emit
// for silence ("[BLANK_AUDIO]", "(silence)", a word repeated over and over)
// is reduced to an empty string.
namespace transcript {

bool is_silence_marker(std::string_view text);
bool is_repetitive(std::string_view text);

// Trimmed text, or "" if the text should be treated as no speech.
std::string clean(std::string_view text);

// Appends `part` to `out` separated by one space.
void append(std::string& out, std::string_view part);

} // namespace transcript
