#pragma once

#include <SDL2/SDL.h>

#include <optional>
#include <vector>

#include "slide/platform/InputEvents.hpp"

namespace slide::platform {

inline constexpr int kStickThreshold = 20000;

// Last direction each stick axis pushed past the threshold. An axis fires a
// move once per push and has to return to centre before it fires again.
struct StickLatch {
    int horizontal = 0;
    int vertical = 0;
};

// Maps one SDL event to a game input. Controller hot-plug and window events
// other than focus loss yield nullopt.
std::optional<InputEvent> TranslateEvent(const SDL_Event& event, StickLatch& stick);

class SdlInput {
public:
    SdlInput() = default;
    ~SdlInput();

    SdlInput(const SdlInput&) = delete;
    SdlInput& operator=(const SdlInput&) = delete;

    bool Initialize();
    void Shutdown();
    std::vector<InputEvent> Poll();
    void RumbleControllers(float strength, Uint32 duration_ms);
    bool HasControllers() const noexcept { return !pads_.empty(); }

private:
    struct Pad {
        SDL_JoystickID id = -1;
        SDL_GameController* controller = nullptr;
    };

    void Attach(int device_index);
    void Detach(SDL_JoystickID id);

    bool initialized_ = false;
    StickLatch stick_;
    std::vector<Pad> pads_;
};

}  // namespace slide::platform
