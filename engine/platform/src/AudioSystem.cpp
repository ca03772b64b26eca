#include "slide/platform/AudioSystem.hpp"

#include <SDL2/SDL.h>

#include <algorithm>

#include "slide/app/AssetFS.hpp"

namespace slide::platform {

namespace {

constexpr int kMixChannels = 16;
constexpr int kBigMergeValue = 256;

}  // namespace

AudioSystem::~AudioSystem() {
    Shutdown();
}

bool AudioSystem::Initialize(float volume) {
    if (initialized_) {
        return true;
    }
    const int mix_flags = MIX_INIT_OGG;
    int init_result = Mix_Init(mix_flags);
    if ((init_result & mix_flags) != mix_flags) {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Mix_Init missing codecs: %s", Mix_GetError());
    }
    if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 1024) != 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Mix_OpenAudio failed: %s", Mix_GetError());
        Mix_Quit();
        return false;
    }
    Mix_AllocateChannels(kMixChannels);

    slide_ = LoadChunk("slide.wav");
    merge_ = LoadChunk("merge.wav");
    merge_big_ = LoadChunk("merge_big.wav");
    invalid_ = LoadChunk("invalid.wav");
    click_ = LoadChunk("click.wav");
    win_ = LoadChunk("win.wav");
    game_over_ = LoadChunk("game_over.wav");
    music_ = LoadMusic({"bg_loop.ogg", "bg_loop.wav"});
    music_playing_ = false;

    initialized_ = true;
    SetVolume(volume);
    return true;
}

void AudioSystem::Shutdown() {
    if (!initialized_) {
        return;
    }
    StopMusic();
    FreeChunk(slide_);
    FreeChunk(merge_);
    FreeChunk(merge_big_);
    FreeChunk(invalid_);
    FreeChunk(click_);
    FreeChunk(win_);
    FreeChunk(game_over_);
    if (music_) {
        Mix_FreeMusic(music_);
        music_ = nullptr;
    }
    Mix_CloseAudio();
    Mix_Quit();
    initialized_ = false;
}

void AudioSystem::SetVolume(float volume) {
    volume_ = std::clamp(volume, 0.0f, 1.0f);
    ApplyVolume();
}

void AudioSystem::SetMuted(bool muted) {
    muted_ = muted;
    ApplyVolume();
}

void AudioSystem::ApplyVolume() {
    if (!initialized_) {
        return;
    }
    const float effective = muted_ ? 0.0f : volume_;
    Mix_Volume(-1, static_cast<int>(MIX_MAX_VOLUME * effective));
    Mix_VolumeMusic(static_cast<int>(MIX_MAX_VOLUME * effective * 0.6f));
}

void AudioSystem::PlaySlide() const {
    Play(slide_);
}

void AudioSystem::PlayMerge(int merged_value) const {
    if (merged_value >= kBigMergeValue && merge_big_) {
        Play(merge_big_);
    } else {
        Play(merge_);
    }
}

void AudioSystem::PlayInvalid() const {
    Play(invalid_);
}

void AudioSystem::PlayClick() const {
    Play(click_);
}

void AudioSystem::PlayWin() const {
    Play(win_);
}

void AudioSystem::PlayGameOver() const {
    Play(game_over_);
}

void AudioSystem::StartMusicLoop() {
    if (!initialized_ || music_playing_ || !music_) {
        return;
    }
    if (Mix_PlayMusic(music_, -1) == 0) {
        music_playing_ = true;
    } else {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Mix_PlayMusic failed: %s", Mix_GetError());
    }
}

void AudioSystem::StopMusic() {
    if (!initialized_ || !music_playing_) {
        return;
    }
    Mix_HaltMusic();
    music_playing_ = false;
}

void AudioSystem::FreeChunk(Mix_Chunk*& chunk) {
    if (chunk) {
        Mix_FreeChunk(chunk);
        chunk = nullptr;
    }
}

void AudioSystem::Play(Mix_Chunk* chunk) const {
    if (!initialized_ || muted_ || !chunk) {
        return;
    }
    Mix_PlayChannel(-1, chunk, 0);
}

Mix_Chunk* AudioSystem::LoadChunk(const std::string& filename) {
    std::filesystem::path path = slide::app::AssetPath("sounds/" + filename);
    if (!slide::app::FileExists(path)) {
        SDL_LogInfo(SDL_LOG_CATEGORY_AUDIO, "Sound %s not found, skipping", filename.c_str());
        return nullptr;
    }
    Mix_Chunk* chunk = Mix_LoadWAV(path.string().c_str());
    if (!chunk) {
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Failed to load %s: %s", filename.c_str(), Mix_GetError());
    }
    return chunk;
}

Mix_Music* AudioSystem::LoadMusic(std::initializer_list<const char*> candidates) {
    for (const char* name : candidates) {
        std::filesystem::path path = slide::app::AssetPath(std::string("sounds/") + name);
        if (!slide::app::FileExists(path)) {
            continue;
        }
        Mix_Music* music = Mix_LoadMUS(path.string().c_str());
        if (music) {
            return music;
        }
        SDL_LogWarn(SDL_LOG_CATEGORY_AUDIO, "Failed to load %s: %s", name, Mix_GetError());
    }
    return nullptr;
}

}  // namespace slide::platform
