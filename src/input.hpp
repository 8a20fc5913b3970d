//
//  input.hpp
//  aberred
//
//  Created by the aberred authors on 03/09/2025.
//

#pragma once

#include "glm/vec2.hpp"
#include <array>
#include <string>
#include <optional>

// Same values as sapp_keycode, the core never includes sokol_app
#define KEY_CODES           \
    X(SPACE, 32)            \
    X(A, 65)                \
    X(D, 68)                \
    X(S, 83)                \
    X(W, 87)                \
    X(ESCAPE, 256)          \
    X(ENTER, 257)           \
    X(TAB, 258)             \
    X(RIGHT, 262)           \
    X(LEFT, 263)            \
    X(DOWN, 264)            \
    X(UP, 265)              \
    X(F11, 300)             \
    X(F12, 301)

enum KeyCode: int {
#define X(NAME, VALUE) KEY_##NAME = VALUE,
    KEY_CODES
#undef X
    KEY_COUNT = 349
};

#define INPUT_BUTTONS                                   \
    X(MainUp, main_up, KEY_W)                           \
    X(MainDown, main_down, KEY_S)                       \
    X(MainLeft, main_left, KEY_A)                       \
    X(MainRight, main_right, KEY_D)                     \
    X(SecondaryUp, secondary_up, KEY_UP)                \
    X(SecondaryDown, secondary_down, KEY_DOWN)          \
    X(SecondaryLeft, secondary_left, KEY_LEFT)          \
    X(SecondaryRight, secondary_right, KEY_RIGHT)       \
    X(Back, back, KEY_ESCAPE)                           \
    X(Action1, action_1, KEY_SPACE)                     \
    X(Action2, action_2, KEY_ENTER)                     \
    X(Debug, debug, KEY_F11)                            \
    X(Special, special, KEY_F12)

enum class InputButton: int {
#define X(NAME, VAR, KEY) NAME,
    INPUT_BUTTONS
#undef X
    Count
};

struct ButtonState {
    bool pressed = false;
    bool just_pressed = false;
    bool just_released = false;

    ButtonState operator|(const ButtonState& other) const {
        return ButtonState{pressed || other.pressed,
                           just_pressed || other.just_pressed,
                           just_released || other.just_released};
    }

    bool operator==(const ButtonState& other) const {
        return pressed == other.pressed &&
               just_pressed == other.just_pressed &&
               just_released == other.just_released;
    }
};

// Raw keyboard and mouse state, fed by the application shell
class InputState {
    std::array<bool, KEY_COUNT> _keys{};
    std::array<bool, KEY_COUNT> _keys_prev{};
    std::array<bool, 3> _mouse_buttons{};
    std::array<bool, 3> _mouse_buttons_prev{};
    std::array<int, static_cast<int>(InputButton::Count)> _bindings{
#define X(NAME, VAR, KEY) KEY,
        INPUT_BUTTONS
#undef X
    };
    glm::vec2 _mouse_position{0.f};

public:
    void key_down(int key) {
        if (key >= 0 && key < KEY_COUNT)
            _keys[key] = true;
    }

    void key_up(int key) {
        if (key >= 0 && key < KEY_COUNT)
            _keys[key] = false;
    }

    void mouse_button(int button, bool down) {
        if (button >= 0 && button < 3)
            _mouse_buttons[button] = down;
    }

    void mouse_move(const glm::vec2& position) {
        _mouse_position = position;
    }

    const glm::vec2& mouse_position() const {
        return _mouse_position;
    }

    bool is_down(int key) const {
        return key >= 0 && key < KEY_COUNT && _keys[key];
    }

    bool is_pressed(int key) const {
        return key >= 0 && key < KEY_COUNT && _keys[key] && !_keys_prev[key];
    }

    bool is_released(int key) const {
        return key >= 0 && key < KEY_COUNT && !_keys[key] && _keys_prev[key];
    }

    bool is_mouse_pressed(int button) const {
        return button >= 0 && button < 3 && _mouse_buttons[button] && !_mouse_buttons_prev[button];
    }

    void bind(InputButton button, int key) {
        _bindings[static_cast<int>(button)] = key;
    }

    int binding(InputButton button) const {
        return _bindings[static_cast<int>(button)];
    }

    ButtonState button(InputButton button) const {
        int key = binding(button);
        return ButtonState{is_down(key), is_pressed(key), is_released(key)};
    }

    // Called once the frame has consumed the edges
    void end_frame() {
        _keys_prev = _keys;
        _mouse_buttons_prev = _mouse_buttons;
    }

    // Drop everything held, used when the window loses focus
    void release_all() {
        _keys.fill(false);
        _mouse_buttons.fill(false);
    }
};

#define DIGITAL_BUTTONS     \
    X(up)                   \
    X(down)                 \
    X(left)                 \
    X(right)                \
    X(action_1)             \
    X(action_2)             \
    X(back)                 \
    X(special)

// What scripts see: directions merge the main and secondary bindings
struct InputSnapshot {
#define X(NAME) ButtonState NAME;
    DIGITAL_BUTTONS
#undef X

    static InputSnapshot from(const InputState& input) {
        InputSnapshot snapshot;
        snapshot.up = input.button(InputButton::MainUp) | input.button(InputButton::SecondaryUp);
        snapshot.down = input.button(InputButton::MainDown) | input.button(InputButton::SecondaryDown);
        snapshot.left = input.button(InputButton::MainLeft) | input.button(InputButton::SecondaryLeft);
        snapshot.right = input.button(InputButton::MainRight) | input.button(InputButton::SecondaryRight);
        snapshot.action_1 = input.button(InputButton::Action1);
        snapshot.action_2 = input.button(InputButton::Action2);
        snapshot.back = input.button(InputButton::Back);
        snapshot.special = input.button(InputButton::Special);
        return snapshot;
    }

    std::optional<ButtonState> get(const std::string& name) const {
#define X(NAME) if (name == #NAME) return NAME;
        DIGITAL_BUTTONS
#undef X
        return std::nullopt;
    }

    bool operator==(const InputSnapshot& other) const {
#define X(NAME) if (!(NAME == other.NAME)) return false;
        DIGITAL_BUTTONS
#undef X
        return true;
    }
};
