#pragma once

#include <string>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace folio::util {

/// Clean up a chapter title taken from tags or a file name.
/// NFC-composes the text, folds typographic dashes, quotes, ellipses and
/// non-breaking spaces to plain ASCII, and collapses runs of whitespace.
inline std::string normalize_chapter_title(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(text);

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    icu::UnicodeString composed;
    if (U_SUCCESS(status) && nfc) {
        composed = nfc->normalize(source, status);
    }
    if (U_FAILURE(status) || !nfc) {
        composed = source;
    }

    icu::UnicodeString folded;
    bool pending_space = false;
    for (int32_t i = 0; i < composed.length();) {
        UChar32 c = composed.char32At(i);
        i += U16_LENGTH(c);

        switch (c) {
            case 0x2010: case 0x2011: case 0x2012:
            case 0x2013: case 0x2014: case 0x2015:
                c = '-';
                break;
            case 0x2018: case 0x2019: case 0x201A: case 0x2032:
                c = '\'';
                break;
            case 0x201C: case 0x201D: case 0x201E: case 0x2033:
                c = '"';
                break;
            default:
                break;
        }

        if (c == 0x2026) {
            if (pending_space && folded.length() > 0) folded.append(static_cast<UChar>(' '));
            pending_space = false;
            folded.append(icu::UnicodeString("..."));
            continue;
        }
        if (c == 0x00A0 || u_isUWhiteSpace(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && folded.length() > 0) {
            folded.append(static_cast<UChar>(' '));
        }
        pending_space = false;
        folded.append(c);
    }

    std::string result;
    folded.toUTF8String(result);
    return result;
}

/// Case-insensitive string comparison using ICU
/// Returns: <0 if a < b, 0 if a == b, >0 if a > b (like strcmp)
inline int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);

    ua.foldCase();
    ub.foldCase();

    return ua.compare(ub);
}

}  // namespace folio::util
