#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace folio::backend::binary {

template <typename T>
inline void write_pod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
inline bool read_pod(std::istream& in, T& value) {
    return static_cast<bool>(in.read(reinterpret_cast<char*>(&value), sizeof(T)));
}

// uint32 length followed by the raw bytes
inline void write_string(std::ostream& out, const std::string& s) {
    uint32_t len = static_cast<uint32_t>(s.size());
    write_pod(out, len);
    out.write(s.data(), len);
}

inline bool read_string(std::istream& in, std::string& s, uint32_t max_len = 1u << 20) {
    uint32_t len = 0;
    if (!read_pod(in, len) || len > max_len) return false;
    s.resize(len);
    if (len == 0) return true;
    return static_cast<bool>(in.read(&s[0], len));
}

}  // namespace folio::backend::binary
