#include "ui/Formatting.hpp"
#include <algorithm>

namespace folio::ui {

namespace {

// Length of a CSI sequence (ESC [ ... final byte) starting at i, or 0.
size_t csi_length(const std::string& s, size_t i) {
    if (s[i] != '\x1B' || i + 1 >= s.size() || s[i + 1] != '[') return 0;
    size_t j = i + 2;
    while (j < s.size() && (s[j] < '@' || s[j] > '~')) {
        j++;
    }
    if (j < s.size()) j++;  // Final byte
    return j - i;
}

size_t utf8_length(const std::string& s, size_t i) {
    unsigned char c = s[i];
    size_t len = 1;
    if ((c & 0xE0) == 0xC0) {
        len = 2;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
    }
    return i + len > s.size() ? 1 : len;
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size();) {
        if (size_t esc = csi_length(s, i)) {
            i += esc;
            continue;
        }
        i += utf8_length(s, i);
        cols++;
    }
    return cols;
}

std::string take_cols(const std::string& s, int width) {
    if (width <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    for (size_t i = 0; i < s.size() && seen < width;) {
        size_t len = csi_length(s, i);
        if (len == 0) {
            len = utf8_length(s, i);
            seen++;
        }
        out.append(s, i, len);
        i += len;
    }
    return out;
}

std::string trunc_pad(const std::string& s, int width) {
    if (width <= 0) return "";

    int cols = display_cols(s);
    if (cols == width) return s;
    if (cols < width) return s + std::string(width - cols, ' ');
    if (width == 1) return take_cols(s, 1);
    return take_cols(s, width - 1) + "…";
}

std::string lr_align(int width, const std::string& left, const std::string& right) {
    if (width <= 0) return "";

    int right_cols = display_cols(right);
    std::string l = trunc_pad(left, std::max(0, width - right_cols - 1));
    int space = std::max(0, width - display_cols(l) - right_cols);
    return l + std::string(space, ' ') + right;
}

std::string progress_bar(double fraction, int width) {
    if (width < 3) return "";
    int inner = width - 2;
    int filled = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * inner);
    return "[" + std::string(filled, '#') + std::string(inner - filled, '-') + "]";
}

}  // namespace folio::ui
