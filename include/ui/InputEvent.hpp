#pragma once

#include <string>

namespace folio::ui {

struct InputEvent {
    enum class Type {
        None,
        KeyPress,
        Resize,
    };

    Type type = Type::None;
    int key = 0;           // char code or 0 for named keys
    std::string key_name;  // "left", "enter", "space", "a", "B", ...

    bool is_key(const std::string& name_to_check) const {
        return type == Type::KeyPress && key_name == name_to_check;
    }
};

}  // namespace folio::ui
