//
//  sokol_audio_device.hpp
//  aberred
//
//  Created by the aberred authors on 17/10/2025.
//

#pragma once

#include "audio.hpp"
#include "sokol/sokol_audio.h"
#include "dr_wav.h"
#include "dr_mp3.h"
#define STB_VORBIS_HEADER_ONLY
#include "stb_vorbis.c"
#include <string>
#include <vector>
#include <unordered_map>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>

#define AUDIO_SAMPLE_RATE 44100
#define AUDIO_CHANNELS 2

// Decoded clip, always interleaved stereo floats
struct PcmClip {
    std::vector<float> samples;
    unsigned int sample_rate = AUDIO_SAMPLE_RATE;

    size_t frames() const { return samples.size() / AUDIO_CHANNELS; }
};

// Decodes WAV, MP3 and OGG by extension, mono is spread to both channels
inline bool decode_audio_file(const std::string& path, PcmClip& clip, std::string& error) {
    size_t dot = path.find_last_of('.');
    std::string ext = dot == std::string::npos ? "" : path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    std::vector<float> raw;
    unsigned int channels = 0;
    if (ext == ".wav") {
        drwav wav;
        if (!drwav_init_file(&wav, path.c_str(), NULL)) {
            error = "failed to open WAV";
            return false;
        }
        channels = wav.channels;
        clip.sample_rate = wav.sampleRate;
        raw.resize((size_t)wav.totalPCMFrameCount * channels);
        drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, raw.data());
        drwav_uninit(&wav);
    } else if (ext == ".mp3") {
        drmp3 mp3;
        if (!drmp3_init_file(&mp3, path.c_str(), NULL)) {
            error = "failed to open MP3";
            return false;
        }
        channels = mp3.channels;
        clip.sample_rate = mp3.sampleRate;
        drmp3_uint64 total_frames = drmp3_get_pcm_frame_count(&mp3);
        raw.resize((size_t)total_frames * channels);
        drmp3_read_pcm_frames_f32(&mp3, total_frames, raw.data());
        drmp3_uninit(&mp3);
    } else if (ext == ".ogg") {
        int ogg_channels, sample_rate;
        short *data;
        int frames = stb_vorbis_decode_filename(path.c_str(), &ogg_channels, &sample_rate, &data);
        if (frames <= 0) {
            error = "failed to decode OGG";
            return false;
        }
        channels = ogg_channels;
        clip.sample_rate = sample_rate;
        raw.resize((size_t)frames * channels);
        for (size_t i = 0; i < raw.size(); i++)
            raw[i] = data[i] / 32768.f;
        free(data);
    } else {
        error = "unsupported audio format '" + ext + "'";
        return false;
    }
    if (channels == 0 || clip.sample_rate == 0) {
        error = "empty stream";
        return false;
    }

    size_t frames = raw.size() / channels;
    clip.samples.resize(frames * AUDIO_CHANNELS);
    for (size_t f = 0; f < frames; f++) {
        float left = raw[f * channels];
        float right = channels > 1 ? raw[f * channels + 1] : left;
        clip.samples[f * 2] = left;
        clip.samples[f * 2 + 1] = right;
    }
    return true;
}

// Mixes music tracks and sound voices into the sokol_audio push stream
class SokolAudioDevice: public AudioDevice {
    struct Track {
        PcmClip clip;
        double cursor = 0.0;
        float volume = 1.f;
        bool playing = false;
    };

    struct Voice {
        const PcmClip *clip;
        double cursor;
    };

    std::unordered_map<std::string, Track> _music;
    std::unordered_map<std::string, PcmClip> _sounds;
    std::vector<Voice> _voices;
    std::vector<float> _mix;

    // Nearest-frame resampling, returns false past the end
    static bool sample(const PcmClip& clip, double& cursor, float& left, float& right) {
        size_t frame = (size_t)cursor;
        if (frame >= clip.frames())
            return false;
        left = clip.samples[frame * 2];
        right = clip.samples[frame * 2 + 1];
        cursor += clip.sample_rate / (double)AUDIO_SAMPLE_RATE;
        return true;
    }

public:
    SokolAudioDevice() {
        saudio_desc desc = {
            .sample_rate = AUDIO_SAMPLE_RATE,
            .num_channels = AUDIO_CHANNELS
        };
        saudio_setup(&desc);
        if (!saudio_isvalid())
            throw std::runtime_error("Failed to initialize audio device");
    }

    ~SokolAudioDevice() override {
        saudio_shutdown();
    }

    bool load_music(const std::string& id, const std::string& path, std::string& error) override {
        Track track;
        if (!decode_audio_file(path, track.clip, error))
            return false;
        _music[id] = std::move(track);
        return true;
    }

    void unload_music(const std::string& id) override {
        _music.erase(id);
    }

    void play_music(const std::string& id) override {
        auto it = _music.find(id);
        if (it == _music.end())
            return;
        it->second.cursor = 0.0;
        it->second.playing = true;
    }

    void stop_music(const std::string& id) override {
        auto it = _music.find(id);
        if (it == _music.end())
            return;
        it->second.cursor = 0.0;
        it->second.playing = false;
    }

    void pause_music(const std::string& id) override {
        auto it = _music.find(id);
        if (it != _music.end())
            it->second.playing = false;
    }

    void resume_music(const std::string& id) override {
        auto it = _music.find(id);
        if (it != _music.end())
            it->second.playing = true;
    }

    void set_music_volume(const std::string& id, float vol) override {
        auto it = _music.find(id);
        if (it != _music.end())
            it->second.volume = vol;
    }

    bool music_finished(const std::string& id) override {
        auto it = _music.find(id);
        return it != _music.end() && it->second.playing && (size_t)it->second.cursor >= it->second.clip.frames();
    }

    bool load_sound(const std::string& id, const std::string& path, std::string& error) override {
        PcmClip clip;
        if (!decode_audio_file(path, clip, error))
            return false;
        _sounds[id] = std::move(clip);
        return true;
    }

    void play_sound(const std::string& id) override {
        auto it = _sounds.find(id);
        if (it != _sounds.end())
            _voices.push_back(Voice{&it->second, 0.0});
    }

    void unload_all_sounds() override {
        _voices.clear();
        _sounds.clear();
    }

    void update() override {
        int frames = saudio_expect();
        if (frames <= 0)
            return;
        _mix.assign((size_t)frames * AUDIO_CHANNELS, 0.f);
        for (auto& [id, track] : _music) {
            if (!track.playing)
                continue;
            for (int f = 0; f < frames; f++) {
                float left, right;
                if (!sample(track.clip, track.cursor, left, right))
                    break;
                _mix[f * 2] += left * track.volume;
                _mix[f * 2 + 1] += right * track.volume;
            }
        }
        for (auto& voice : _voices)
            for (int f = 0; f < frames; f++) {
                float left, right;
                if (!sample(*voice.clip, voice.cursor, left, right))
                    break;
                _mix[f * 2] += left;
                _mix[f * 2 + 1] += right;
            }
        _voices.erase(std::remove_if(_voices.begin(), _voices.end(), [](const Voice& voice) {
            return (size_t)voice.cursor >= voice.clip->frames();
        }), _voices.end());
        for (float& s : _mix)
            s = std::clamp(s, -1.f, 1.f);
        saudio_push(_mix.data(), frames);
    }
};
