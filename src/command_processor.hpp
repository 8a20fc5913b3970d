//
//  command_processor.hpp
//  aberred
//
//  Created by the aberred authors on 14/10/2025.
//

#pragma once

#include "flecs.h"
#include "commands.hpp"
#include "assets.hpp"
#include "audio.hpp"

// Applies queued script records to the world. Only ever called between
// systems, never while a query is iterating.
class CommandProcessor {
    flecs::world& _world;
    AssetLoader& _assets;
    AudioWorker *_audio;

    void send_audio(AudioCmd command);

public:
    CommandProcessor(flecs::world& world, AssetLoader& assets, AudioWorker *audio = nullptr)
        : _world(world), _assets(assets), _audio(audio) {}

    void set_audio(AudioWorker *audio) { _audio = audio; }

    void apply(const AssetCmd& command);
    void apply(const AudioLuaCmd& command);
    void apply(const SignalCmd& command);
    void apply(const PhaseCmd& command);
    void apply(const EntityCmd& command);
    void apply(const GroupCmd& command);
    void apply(const TilemapCmd& command);
    void apply(const CameraCmd& command);
    void apply(const AnimationCmd& command);
    // Returns the new entity, or a null handle when a clone source is missing
    flecs::entity apply(const SpawnCmd& command);

    template<typename T>
    void process(CommandQueue<T>& queue) {
        for (const auto& command : queue.drain())
            apply(command);
    }

    // Frame order: asset, animation, camera, tilemap, group, signal, audio,
    // entity, spawn, then phase
    void drain(CommandQueues& queues);
    // Run after every collision callback
    void drain_collision(CollisionQueues& queues);
};
