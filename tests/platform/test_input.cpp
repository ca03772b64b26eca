#define SDL_MAIN_HANDLED
#include <SDL2/SDL.h>

#include <cassert>
#include <cstring>
#include <iostream>

#include "slide/platform/SdlInput.hpp"

using slide::core::Direction;
using slide::platform::Command;
using slide::platform::InputDevice;
using slide::platform::InputEventType;
using slide::platform::PointerButton;
using slide::platform::StickLatch;
using slide::platform::TranslateEvent;

namespace {

SDL_Event Blank(Uint32 type) {
    SDL_Event event;
    std::memset(&event, 0, sizeof(event));
    event.type = type;
    return event;
}

SDL_Event Key(SDL_Keycode sym, bool repeat = false) {
    SDL_Event event = Blank(SDL_KEYDOWN);
    event.key.keysym.sym = sym;
    event.key.repeat = repeat ? 1 : 0;
    return event;
}

SDL_Event Button(SDL_GameControllerButton button) {
    SDL_Event event = Blank(SDL_CONTROLLERBUTTONDOWN);
    event.cbutton.button = static_cast<Uint8>(button);
    return event;
}

SDL_Event Stick(SDL_GameControllerAxis axis, Sint16 value) {
    SDL_Event event = Blank(SDL_CONTROLLERAXISMOTION);
    event.caxis.axis = static_cast<Uint8>(axis);
    event.caxis.value = value;
    return event;
}

void TestKeyboardMoves() {
    StickLatch stick;
    auto left = TranslateEvent(Key(SDLK_LEFT), stick);
    assert(left && left->isMove());
    assert(left->direction == Direction::Left);
    assert(left->device == InputDevice::MouseKeyboard);
    assert(!left->repeat);

    auto up = TranslateEvent(Key(SDLK_w), stick);
    assert(up && up->isMove() && up->direction == Direction::Up);

    auto held = TranslateEvent(Key(SDLK_d, true), stick);
    assert(held && held->direction == Direction::Right);
    assert(held->repeat);
}

void TestKeyboardCommands() {
    StickLatch stick;
    auto back = TranslateEvent(Key(SDLK_ESCAPE), stick);
    assert(back && back->is(Command::Back));
    assert(!back->isMove());

    auto fresh = TranslateEvent(Key(SDLK_n), stick);
    assert(fresh && fresh->is(Command::NewGame));

    auto confirm = TranslateEvent(Key(SDLK_RETURN), stick);
    assert(confirm && confirm->is(Command::Confirm));

    auto mute = TranslateEvent(Key(SDLK_m), stick);
    assert(mute && mute->is(Command::ToggleMute));

    assert(!TranslateEvent(Key(SDLK_F7), stick));
}

void TestControllerButtons() {
    StickLatch stick;
    auto down = TranslateEvent(Button(SDL_CONTROLLER_BUTTON_DPAD_DOWN), stick);
    assert(down && down->isMove());
    assert(down->direction == Direction::Down);
    assert(down->device == InputDevice::Controller);

    auto pause = TranslateEvent(Button(SDL_CONTROLLER_BUTTON_START), stick);
    assert(pause && pause->is(Command::Pause));

    auto fresh = TranslateEvent(Button(SDL_CONTROLLER_BUTTON_Y), stick);
    assert(fresh && fresh->is(Command::NewGame));
}

void TestStickFiresOncePerPush() {
    StickLatch stick;
    auto right = TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTX, 30000), stick);
    assert(right && right->direction == Direction::Right);
    assert(right->device == InputDevice::Controller);

    // Still held past the threshold.
    assert(!TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTX, 31000), stick));
    // Inside the dead zone only releases the latch.
    assert(!TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTX, 5000), stick));
    assert(!TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTX, 0), stick));

    auto again = TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTX, 30000), stick);
    assert(again && again->direction == Direction::Right);

    // Swinging straight across the centre fires the opposite way.
    auto left = TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTX, -30000), stick);
    assert(left && left->direction == Direction::Left);

    auto up = TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTY, -30000), stick);
    assert(up && up->direction == Direction::Up);
    auto down_after_up = TranslateEvent(Stick(SDL_CONTROLLER_AXIS_LEFTY, 30000), stick);
    assert(down_after_up && down_after_up->direction == Direction::Down);

    assert(!TranslateEvent(Stick(SDL_CONTROLLER_AXIS_RIGHTX, 30000), stick));
}

void TestPointerAndWindow() {
    StickLatch stick;
    SDL_Event click = Blank(SDL_MOUSEBUTTONDOWN);
    click.button.button = SDL_BUTTON_RIGHT;
    click.button.x = 40;
    click.button.y = 70;
    auto down = TranslateEvent(click, stick);
    assert(down && down->type == InputEventType::PointerDown);
    assert(down->button == PointerButton::Secondary);
    assert(down->x == 40 && down->y == 70);

    SDL_Event motion = Blank(SDL_MOUSEMOTION);
    motion.motion.x = 12;
    auto move = TranslateEvent(motion, stick);
    assert(move && move->type == InputEventType::PointerMove && move->x == 12);

    SDL_Event focus = Blank(SDL_WINDOWEVENT);
    focus.window.event = SDL_WINDOWEVENT_FOCUS_LOST;
    auto lost = TranslateEvent(focus, stick);
    assert(lost && lost->type == InputEventType::FocusLost);

    SDL_Event resized = Blank(SDL_WINDOWEVENT);
    resized.window.event = SDL_WINDOWEVENT_RESIZED;
    assert(!TranslateEvent(resized, stick));

    auto quit = TranslateEvent(Blank(SDL_QUIT), stick);
    assert(quit && quit->type == InputEventType::Quit);
}

}  // namespace

int main() {
    TestKeyboardMoves();
    TestKeyboardCommands();
    TestControllerButtons();
    TestStickFiresOncePerPush();
    TestPointerAndWindow();
    std::cout << "All input tests passed.\n";
    return 0;
}
