#include <spdlog/spdlog.h>
#include <stdexcept>

#include "engine_dispatcher.hpp"


EngineDispatcher::EngineDispatcher(PlaybackEngine & engine)
 : _engine(engine), _commands(), _busy(false), _running(true), _thread([this](){ run(); }) {}

EngineDispatcher::~EngineDispatcher() {
    stop();
    _thread.join();
    spdlog::get("logger")->trace("~EngineDispatcher() done.");
}


void EngineDispatcher::post(std::string const & name, Command command) {
    {
        std::lock_guard lock(_mutex);
        if (!_running) {
            spdlog::get("logger")->warn("Engine command {} dropped, dispatcher stopped", name);
            return;
        }
        _commands.emplace(name, std::move(command));
    }
    _wake.notify_one();
}

void EngineDispatcher::flush() {
    std::unique_lock lock(_mutex);
    _idle.wait(lock, [this](){ return _commands.empty() && !_busy; });
}

void EngineDispatcher::stop() {
    {
        std::lock_guard lock(_mutex);
        _running = false;
    }
    _wake.notify_one();
}


void EngineDispatcher::run() {
    std::unique_lock lock(_mutex);

    // Drain what was queued before stopping, so a handoff is never half-applied
    while (_running || !_commands.empty()) {
        _wake.wait(lock, [this](){ return !_running || !_commands.empty(); });
        if (_commands.empty()) continue;

        auto [name, command] = std::move(_commands.front());
        _commands.pop();
        _busy = true;
        lock.unlock();

        spdlog::get("logger")->trace("Engine command: {}", name);
        try {
            command(_engine);
        } catch (std::exception const & e) {
            spdlog::get("logger")->error("Engine command {} failed: {}", name, e.what());
        }

        lock.lock();
        _busy = false;
        if (_commands.empty()) _idle.notify_all();
    }

    _idle.notify_all();
    spdlog::get("logger")->trace("Engine dispatcher finished running");
}
