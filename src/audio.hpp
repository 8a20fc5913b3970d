//
//  audio.hpp
//  aberred
//
//  Created by the aberred authors on 12/10/2025.
//

#pragma once

#include "channel.hpp"
#include "log.hpp"
#include <string>
#include <variant>
#include <thread>
#include <memory>
#include <chrono>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <optional>
#include <algorithm>

namespace audio_cmd {
    struct LoadMusic { std::string id, path; };
    struct UnloadMusic { std::string id; };
    struct UnloadAllMusic {};
    struct PlayMusic { std::string id; bool looped; };
    struct StopMusic { std::string id; };
    struct StopAllMusic {};
    struct PauseMusic { std::string id; };
    struct ResumeMusic { std::string id; };
    struct VolumeMusic { std::string id; float vol; };
    struct LoadFx { std::string id, path; };
    struct PlayFx { std::string id; };
    struct UnloadFx { std::string id; };
    struct UnloadAllFx {};
    struct Shutdown {};
}

using AudioCmd = std::variant<audio_cmd::LoadMusic, audio_cmd::UnloadMusic, audio_cmd::UnloadAllMusic,
                              audio_cmd::PlayMusic, audio_cmd::StopMusic, audio_cmd::StopAllMusic,
                              audio_cmd::PauseMusic, audio_cmd::ResumeMusic, audio_cmd::VolumeMusic,
                              audio_cmd::LoadFx, audio_cmd::PlayFx, audio_cmd::UnloadFx,
                              audio_cmd::UnloadAllFx, audio_cmd::Shutdown>;

#define AUDIO_MESSAGES              \
    X(MusicLoaded)                  \
    X(MusicUnloaded)                \
    X(MusicUnloadedAll)             \
    X(MusicLoadFailed)              \
    X(MusicPlayStarted)             \
    X(MusicStopped)                 \
    X(MusicFinished)                \
    X(MusicVolumeChanged)           \
    X(FxLoaded)                     \
    X(FxUnloaded)                   \
    X(FxUnloadedAll)                \
    X(FxLoadFailed)

struct AudioMessage {
    enum class Kind {
#define X(NAME) NAME,
        AUDIO_MESSAGES
#undef X
    } kind;
    std::string id;
    std::string error;
    float vol = 0.f;

    static const char* kind_name(Kind kind) {
        switch (kind) {
#define X(NAME) case Kind::NAME: return #NAME;
            AUDIO_MESSAGES
#undef X
        }
        return "Unknown";
    }
};

// Playback backend, only ever touched from the worker thread
class AudioDevice {
public:
    virtual ~AudioDevice() = default;

    virtual bool load_music(const std::string& id, const std::string& path, std::string& error) = 0;
    virtual void unload_music(const std::string& id) = 0;
    virtual void play_music(const std::string& id) = 0;
    virtual void stop_music(const std::string& id) = 0;
    virtual void pause_music(const std::string& id) = 0;
    virtual void resume_music(const std::string& id) = 0;
    virtual void set_music_volume(const std::string& id, float vol) = 0;
    // True once a playing stream has reached its end
    virtual bool music_finished(const std::string& id) = 0;

    virtual bool load_sound(const std::string& id, const std::string& path, std::string& error) = 0;
    virtual void play_sound(const std::string& id) = 0;
    virtual void unload_all_sounds() = 0;

    // Feed the output, called every worker iteration
    virtual void update() {}
};

// Accepts every load and never finishes a track, used when audio is disabled
class SilentAudioDevice: public AudioDevice {
public:
    bool load_music(const std::string&, const std::string&, std::string&) override { return true; }
    void unload_music(const std::string&) override {}
    void play_music(const std::string&) override {}
    void stop_music(const std::string&) override {}
    void pause_music(const std::string&) override {}
    void resume_music(const std::string&) override {}
    void set_music_volume(const std::string&, float) override {}
    bool music_finished(const std::string&) override { return false; }
    bool load_sound(const std::string&, const std::string&, std::string&) override { return true; }
    void play_sound(const std::string&) override {}
    void unload_all_sounds() override {}
};

class AudioWorker {
    std::unique_ptr<AudioDevice> _device;
    Channel<AudioCmd> _commands;
    Channel<AudioMessage> _messages;
    std::thread _thread;
    std::chrono::milliseconds _poll;

    std::unordered_set<std::string> _music;
    std::unordered_set<std::string> _sounds;
    std::unordered_set<std::string> _playing;
    std::unordered_set<std::string> _looped;

    void post(AudioMessage::Kind kind, const std::string& id = "", const std::string& error = "", float vol = 0.f) {
        _messages.send(AudioMessage{kind, id, error, vol});
    }

    void unload_everything() {
        for (const auto& id : _music)
            _device->unload_music(id);
        _music.clear();
        _playing.clear();
        _looped.clear();
        post(AudioMessage::Kind::MusicUnloadedAll);
        _device->unload_all_sounds();
        _sounds.clear();
        post(AudioMessage::Kind::FxUnloadedAll);
    }

    // Returns false on Shutdown
    bool handle(AudioCmd& command) {
        using K = AudioMessage::Kind;
        return std::visit([&](auto& c) -> bool {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, audio_cmd::LoadMusic>) {
                std::string error;
                if (_device->load_music(c.id, c.path, error)) {
                    $Log.info("[Audio] loaded id='{}' path='{}'", c.id, c.path);
                    _music.insert(c.id);
                    post(K::MusicLoaded, c.id);
                } else {
                    $Log.error("[Audio] load failed id='{}' path='{}' error='{}'", c.id, c.path, error);
                    post(K::MusicLoadFailed, c.id, error);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::UnloadMusic>) {
                if (_music.erase(c.id)) {
                    _device->unload_music(c.id);
                    _playing.erase(c.id);
                    _looped.erase(c.id);
                    post(K::MusicUnloaded, c.id);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::UnloadAllMusic>) {
                for (const auto& id : _music)
                    _device->unload_music(id);
                _music.clear();
                _playing.clear();
                _looped.clear();
                post(K::MusicUnloadedAll);
            } else if constexpr (std::is_same_v<T, audio_cmd::PlayMusic>) {
                if (_music.count(c.id)) {
                    $Log.debug("[Audio] play start id='{}' looped={}", c.id, c.looped);
                    _device->play_music(c.id);
                    _playing.insert(c.id);
                    if (c.looped)
                        _looped.insert(c.id);
                    else
                        _looped.erase(c.id);
                    post(K::MusicPlayStarted, c.id);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::StopMusic>) {
                if (_music.count(c.id)) {
                    _device->stop_music(c.id);
                    _playing.erase(c.id);
                    _looped.erase(c.id);
                    post(K::MusicStopped, c.id);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::StopAllMusic>) {
                for (const auto& id : _playing) {
                    _device->stop_music(id);
                    post(K::MusicStopped, id);
                }
                _playing.clear();
                _looped.clear();
            } else if constexpr (std::is_same_v<T, audio_cmd::PauseMusic>) {
                if (_music.count(c.id)) {
                    _device->pause_music(c.id);
                    _playing.erase(c.id);
                    post(K::MusicStopped, c.id);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::ResumeMusic>) {
                if (_music.count(c.id)) {
                    _device->resume_music(c.id);
                    _playing.insert(c.id);
                    post(K::MusicPlayStarted, c.id);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::VolumeMusic>) {
                if (_music.count(c.id)) {
                    float vol = std::clamp(c.vol, 0.f, 1.f);
                    _device->set_music_volume(c.id, vol);
                    post(K::MusicVolumeChanged, c.id, "", vol);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::LoadFx>) {
                std::string error;
                if (_device->load_sound(c.id, c.path, error)) {
                    $Log.info("[Audio] fx loaded id='{}' path='{}'", c.id, c.path);
                    _sounds.insert(c.id);
                    post(K::FxLoaded, c.id);
                } else {
                    $Log.error("[Audio] fx load failed id='{}' path='{}' error='{}'", c.id, c.path, error);
                    post(K::FxLoadFailed, c.id, error);
                }
            } else if constexpr (std::is_same_v<T, audio_cmd::PlayFx>) {
                if (_sounds.count(c.id))
                    _device->play_sound(c.id);
                else
                    $Log.error("[Audio] fx play failed id='{}' reason='not loaded'", c.id);
            } else if constexpr (std::is_same_v<T, audio_cmd::UnloadFx>) {
                // Voices may still reference it, only UnloadAllFx frees sounds
                $Log.debug("[Audio] fx unload id='{}' ignored", c.id);
            } else if constexpr (std::is_same_v<T, audio_cmd::UnloadAllFx>) {
                _device->unload_all_sounds();
                _sounds.clear();
                post(K::FxUnloadedAll);
            } else if constexpr (std::is_same_v<T, audio_cmd::Shutdown>) {
                $Log.info("[Audio] shutdown requested");
                unload_everything();
                return false;
            }
            return true;
        }, command);
    }

    void update_streams() {
        std::vector<std::string> ended;
        for (const auto& id : _playing)
            if (_device->music_finished(id))
                ended.push_back(id);
        for (const auto& id : ended) {
            if (_looped.count(id)) {
                $Log.debug("[Audio] restarting looped id='{}'", id);
                _device->play_music(id);
                post(AudioMessage::Kind::MusicPlayStarted, id);
            } else {
                $Log.debug("[Audio] finished id='{}'", id);
                _device->stop_music(id);
                _playing.erase(id);
                post(AudioMessage::Kind::MusicFinished, id);
            }
        }
    }

    void worker_loop() {
        while (true) {
            auto command = _commands.recv_for(_poll);
            if (command) {
                if (!handle(*command))
                    break;
                // Take whatever else is queued before touching the streams
                bool running = true;
                for (auto& next : _commands.drain())
                    if (running && !handle(next))
                        running = false;
                if (!running)
                    break;
            } else if (_commands.closed())
                break;
            _device->update();
            update_streams();
        }
        _messages.close();
    }

public:
    explicit AudioWorker(std::unique_ptr<AudioDevice> device, std::chrono::milliseconds poll = std::chrono::milliseconds(10))
        : _device(std::move(device)), _poll(poll) {
        if (!_device)
            _device = std::make_unique<SilentAudioDevice>();
        _thread = std::thread([this]() {
            this->worker_loop();
        });
    }

    AudioWorker(const AudioWorker&) = delete;
    AudioWorker& operator=(const AudioWorker&) = delete;

    ~AudioWorker() {
        stop();
    }

    bool send(AudioCmd command) {
        return _commands.send(std::move(command));
    }

    // Messages posted since the last call, pulled once per frame
    std::vector<AudioMessage> poll_messages() {
        return _messages.drain();
    }

    // Blocks for the next message, tests use this to wait on the worker
    template<typename Rep, typename Period>
    std::optional<AudioMessage> wait_message(std::chrono::duration<Rep, Period> timeout) {
        return _messages.recv_for(timeout);
    }

    void stop() {
        if (!_thread.joinable())
            return;
        _commands.send(audio_cmd::Shutdown{});
        _commands.close();
        _thread.join();
    }

    bool running() const {
        return _thread.joinable() && !_messages.closed();
    }
};
