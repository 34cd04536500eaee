#ifndef ENGINE_ENGINE_DISPATCHER_HPP
#define ENGINE_ENGINE_DISPATCHER_HPP

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "playback_engine.hpp"


// Runs engine commands one at a time on a dedicated thread. Posting never blocks on the engine,
// and whatever the engine throws stays on this side.
class EngineDispatcher {
public:
    using Command = std::function<void(PlaybackEngine &)>;

private:
    PlaybackEngine & _engine;

    std::mutex _mutex; // Guards everything below
    std::condition_variable _wake;
    std::condition_variable _idle;
    std::queue<std::pair<std::string, Command>> _commands;
    bool _busy;
    bool _running;

    // Must be last, so it gets initialized last
    std::thread _thread;

public:
    EngineDispatcher(PlaybackEngine & engine);
    ~EngineDispatcher();

    void post(std::string const & name, Command command);
    // Blocks until every command posted so far has run
    void flush();
    void stop();

private:
    void run();
};


#endif
