//
//  global.hpp
//  aberred
//
//  Created by George Watson on 28/08/2025.
//

#pragma once

#include <memory>
#include <mutex>
#include <utility>

// Process-wide singletons (settings, logging). Engine state is never kept
// here, it lives in the flecs world as singleton components.
template<typename T>
class Global {
    inline static std::unique_ptr<T> _instance = nullptr;
    inline static std::mutex _mutex;

protected:
    Global() = default;

private:
    Global(const Global<T>&) = delete;
    Global& operator=(const Global<T>&) = delete;

public:
    static T& instance() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_instance)
            _instance = std::unique_ptr<T>(new T());
        return *_instance;
    }

    static bool has_instance() {
        std::lock_guard<std::mutex> lock(_mutex);
        return _instance != nullptr;
    }

    // Drops the instance, the next instance() call builds a fresh one
    static void reset() {
        std::lock_guard<std::mutex> lock(_mutex);
        _instance.reset();
    }
};
