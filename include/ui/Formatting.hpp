#pragma once

#include <string>

namespace folio::ui {

/**
 * Display width of a string. CSI escape sequences take no space and each
 * UTF-8 code point counts as one column.
 */
int display_cols(const std::string& s);

// First `width` display columns of `s`, escape sequences preserved.
std::string take_cols(const std::string& s, int width);

/**
 * Truncate (with an ellipsis) or pad with spaces to exactly `width` columns.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Left text and right text separated by enough spaces to fill `width`.
 * Example: lr_align(30, "Chapter 3", "1:02:03") -> "Chapter 3              1:02:03"
 */
std::string lr_align(int width, const std::string& left, const std::string& right);

// Text progress bar, e.g. "[#####-----]" for fraction 0.5 and width 12.
std::string progress_bar(double fraction, int width);

}  // namespace folio::ui
