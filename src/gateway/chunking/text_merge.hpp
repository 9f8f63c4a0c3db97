#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

// Placeholder rendered for a window whose transcription failed.
inline constexpr std::string_view kInaudible = "[inaudible]";

// Per-window outcome: text on success, failure reason otherwise.
using WindowText = std::expected<std::string, std::string>;

// Failed windows become kInaudible; successful ones pass through.
std::vector<std::string> render_window_texts(const std::vector<WindowText>& windows);

// Joins window texts in order, dropping empty and kInaudible pieces and
// removing up to window_words words repeated across each seam.
std::string merge_chunk_texts(const std::vector<std::string>& texts, size_t window_words = 5);
