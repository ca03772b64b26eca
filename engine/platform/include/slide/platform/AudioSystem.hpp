#pragma once

#include <SDL2/SDL_mixer.h>

#include <initializer_list>
#include <string>

namespace slide::platform {

class AudioSystem {
public:
    AudioSystem() = default;
    ~AudioSystem();

    AudioSystem(const AudioSystem&) = delete;
    AudioSystem& operator=(const AudioSystem&) = delete;

    bool Initialize(float volume);
    void Shutdown();
    bool initialized() const noexcept { return initialized_; }

    // |volume| is 0..1 and scales both effects and music.
    void SetVolume(float volume);
    float volume() const noexcept { return volume_; }
    void SetMuted(bool muted);
    bool muted() const noexcept { return muted_; }

    void StartMusicLoop();
    void StopMusic();

    void PlaySlide() const;
    void PlayMerge(int merged_value) const;
    void PlayInvalid() const;
    void PlayClick() const;
    void PlayWin() const;
    void PlayGameOver() const;

private:
    static void FreeChunk(Mix_Chunk*& chunk);
    void Play(Mix_Chunk* chunk) const;
    void ApplyVolume();

    Mix_Chunk* LoadChunk(const std::string& filename);
    Mix_Music* LoadMusic(std::initializer_list<const char*> candidates);

    bool initialized_ = false;
    Mix_Chunk* slide_ = nullptr;
    Mix_Chunk* merge_ = nullptr;
    Mix_Chunk* merge_big_ = nullptr;
    Mix_Chunk* invalid_ = nullptr;
    Mix_Chunk* click_ = nullptr;
    Mix_Chunk* win_ = nullptr;
    Mix_Chunk* game_over_ = nullptr;
    Mix_Music* music_ = nullptr;
    bool music_playing_ = false;
    float volume_ = 0.5f;
    bool muted_ = false;
};

}  // namespace slide::platform
