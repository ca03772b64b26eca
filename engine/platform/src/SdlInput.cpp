#include "slide/platform/SdlInput.hpp"

#include <algorithm>

namespace slide::platform {

namespace {

using slide::core::Direction;

InputEvent CommandEvent(InputDevice device, Command command) {
    InputEvent evt;
    evt.type = InputEventType::Command;
    evt.device = device;
    evt.command = command;
    return evt;
}

InputEvent MoveEvent(InputDevice device, Direction direction) {
    InputEvent evt = CommandEvent(device, Command::Move);
    evt.direction = direction;
    return evt;
}

std::optional<InputEvent> FromKey(const SDL_KeyboardEvent& key) {
    std::optional<InputEvent> evt;
    switch (key.keysym.sym) {
        case SDLK_UP:
        case SDLK_w:
            evt = MoveEvent(InputDevice::MouseKeyboard, Direction::Up);
            break;
        case SDLK_DOWN:
        case SDLK_s:
            evt = MoveEvent(InputDevice::MouseKeyboard, Direction::Down);
            break;
        case SDLK_LEFT:
        case SDLK_a:
            evt = MoveEvent(InputDevice::MouseKeyboard, Direction::Left);
            break;
        case SDLK_RIGHT:
        case SDLK_d:
            evt = MoveEvent(InputDevice::MouseKeyboard, Direction::Right);
            break;
        case SDLK_RETURN:
        case SDLK_KP_ENTER:
        case SDLK_SPACE:
            evt = CommandEvent(InputDevice::MouseKeyboard, Command::Confirm);
            break;
        case SDLK_ESCAPE:
        case SDLK_BACKSPACE:
            evt = CommandEvent(InputDevice::MouseKeyboard, Command::Back);
            break;
        case SDLK_p:
            evt = CommandEvent(InputDevice::MouseKeyboard, Command::Pause);
            break;
        case SDLK_n:
            evt = CommandEvent(InputDevice::MouseKeyboard, Command::NewGame);
            break;
        case SDLK_m:
            evt = CommandEvent(InputDevice::MouseKeyboard, Command::ToggleMute);
            break;
        default:
            return std::nullopt;
    }
    evt->repeat = key.repeat != 0;
    return evt;
}

std::optional<InputEvent> FromButton(Uint8 button) {
    switch (button) {
        case SDL_CONTROLLER_BUTTON_DPAD_UP:
            return MoveEvent(InputDevice::Controller, Direction::Up);
        case SDL_CONTROLLER_BUTTON_DPAD_DOWN:
            return MoveEvent(InputDevice::Controller, Direction::Down);
        case SDL_CONTROLLER_BUTTON_DPAD_LEFT:
            return MoveEvent(InputDevice::Controller, Direction::Left);
        case SDL_CONTROLLER_BUTTON_DPAD_RIGHT:
            return MoveEvent(InputDevice::Controller, Direction::Right);
        case SDL_CONTROLLER_BUTTON_A:
            return CommandEvent(InputDevice::Controller, Command::Confirm);
        case SDL_CONTROLLER_BUTTON_B:
            return CommandEvent(InputDevice::Controller, Command::Back);
        case SDL_CONTROLLER_BUTTON_START:
            return CommandEvent(InputDevice::Controller, Command::Pause);
        case SDL_CONTROLLER_BUTTON_Y:
            return CommandEvent(InputDevice::Controller, Command::NewGame);
        case SDL_CONTROLLER_BUTTON_BACK:
            return CommandEvent(InputDevice::Controller, Command::ToggleMute);
        default:
            return std::nullopt;
    }
}

std::optional<InputEvent> FromStick(const SDL_ControllerAxisEvent& motion, StickLatch& stick) {
    int* latch = nullptr;
    if (motion.axis == SDL_CONTROLLER_AXIS_LEFTX) {
        latch = &stick.horizontal;
    } else if (motion.axis == SDL_CONTROLLER_AXIS_LEFTY) {
        latch = &stick.vertical;
    } else {
        return std::nullopt;
    }

    int push = 0;
    if (motion.value > kStickThreshold) {
        push = +1;
    } else if (motion.value < -kStickThreshold) {
        push = -1;
    }
    if (push == *latch) {
        return std::nullopt;
    }
    *latch = push;
    if (push == 0) {
        return std::nullopt;
    }
    if (motion.axis == SDL_CONTROLLER_AXIS_LEFTX) {
        return MoveEvent(InputDevice::Controller, push > 0 ? Direction::Right : Direction::Left);
    }
    return MoveEvent(InputDevice::Controller, push > 0 ? Direction::Down : Direction::Up);
}

InputEvent PointerEvent(InputEventType type, int x, int y) {
    InputEvent evt;
    evt.type = type;
    evt.device = InputDevice::MouseKeyboard;
    evt.x = x;
    evt.y = y;
    return evt;
}

}  // namespace

std::optional<InputEvent> TranslateEvent(const SDL_Event& event, StickLatch& stick) {
    switch (event.type) {
        case SDL_QUIT: {
            InputEvent evt;
            evt.type = InputEventType::Quit;
            return evt;
        }
        case SDL_MOUSEMOTION:
            return PointerEvent(InputEventType::PointerMove, event.motion.x, event.motion.y);
        case SDL_MOUSEBUTTONDOWN: {
            InputEvent evt = PointerEvent(InputEventType::PointerDown, event.button.x, event.button.y);
            if (event.button.button == SDL_BUTTON_LEFT) {
                evt.button = PointerButton::Primary;
            } else if (event.button.button == SDL_BUTTON_RIGHT) {
                evt.button = PointerButton::Secondary;
            }
            return evt;
        }
        case SDL_KEYDOWN:
            return FromKey(event.key);
        case SDL_CONTROLLERBUTTONDOWN:
            return FromButton(event.cbutton.button);
        case SDL_CONTROLLERAXISMOTION:
            return FromStick(event.caxis, stick);
        case SDL_WINDOWEVENT:
            if (event.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
                InputEvent evt;
                evt.type = InputEventType::FocusLost;
                return evt;
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

SdlInput::~SdlInput() {
    Shutdown();
}

bool SdlInput::Initialize() {
    if (initialized_) {
        return true;
    }
    if (SDL_WasInit(SDL_INIT_GAMECONTROLLER) == 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_INPUT, "Controllers unavailable: subsystem not initialized");
        return false;
    }
    for (int i = 0; i < SDL_NumJoysticks(); ++i) {
        if (SDL_IsGameController(i)) {
            Attach(i);
        }
    }
    initialized_ = true;
    return true;
}

void SdlInput::Shutdown() {
    for (Pad& pad : pads_) {
        SDL_GameControllerClose(pad.controller);
    }
    pads_.clear();
    stick_ = StickLatch{};
    initialized_ = false;
}

void SdlInput::Attach(int device_index) {
    SDL_GameController* controller = SDL_GameControllerOpen(device_index);
    if (!controller) {
        SDL_LogWarn(SDL_LOG_CATEGORY_INPUT, "Cannot open controller %d: %s", device_index, SDL_GetError());
        return;
    }
    const SDL_JoystickID id = SDL_JoystickInstanceID(SDL_GameControllerGetJoystick(controller));
    const bool known = std::any_of(pads_.begin(), pads_.end(), [id](const Pad& pad) { return pad.id == id; });
    if (known) {
        SDL_GameControllerClose(controller);
        return;
    }
    const char* name = SDL_GameControllerName(controller);
    SDL_LogInfo(SDL_LOG_CATEGORY_INPUT, "Controller attached: %s", name ? name : "unknown");
    pads_.push_back(Pad{id, controller});
}

void SdlInput::Detach(SDL_JoystickID id) {
    auto it = std::find_if(pads_.begin(), pads_.end(), [id](const Pad& pad) { return pad.id == id; });
    if (it == pads_.end()) {
        return;
    }
    SDL_GameControllerClose(it->controller);
    pads_.erase(it);
    if (pads_.empty()) {
        stick_ = StickLatch{};
    }
    SDL_LogInfo(SDL_LOG_CATEGORY_INPUT, "Controller detached");
}

std::vector<InputEvent> SdlInput::Poll() {
    std::vector<InputEvent> events;
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_CONTROLLERDEVICEADDED) {
            Attach(event.cdevice.which);
            continue;
        }
        if (event.type == SDL_CONTROLLERDEVICEREMOVED) {
            Detach(event.cdevice.which);
            continue;
        }
        if (auto evt = TranslateEvent(event, stick_)) {
            events.push_back(*evt);
        }
    }
    return events;
}

void SdlInput::RumbleControllers(float strength, Uint32 duration_ms) {
    const float clamped = std::clamp(strength, 0.0f, 1.0f);
    const Uint16 motor = static_cast<Uint16>(clamped * 0xFFFF);
    for (const Pad& pad : pads_) {
        if (SDL_GameControllerRumble(pad.controller, motor, motor, duration_ms) != 0) {
            SDL_LogDebug(SDL_LOG_CATEGORY_INPUT, "Rumble unsupported: %s", SDL_GetError());
        }
    }
}

}  // namespace slide::platform
