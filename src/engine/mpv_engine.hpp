#ifndef ENGINE_MPV_ENGINE_HPP
#define ENGINE_MPV_ENGINE_HPP


#include <mpv/client.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <type_traits>
#include <vector>

#include "playback_engine.hpp"


template<typename>
struct Format{};
template<>
struct Format<bool> {
    static constexpr mpv_format format = MPV_FORMAT_FLAG;
    using type = int;
};
template<>
struct Format<int64_t> {
    static constexpr mpv_format format = MPV_FORMAT_INT64;
    using type = int64_t;
};
template<>
struct Format<double> {
    static constexpr mpv_format format = MPV_FORMAT_DOUBLE;
    using type = double;
};
template<>
struct Format<mpv_node> {
    static constexpr mpv_format format = MPV_FORMAT_NODE;
    using type = mpv_node;
};

// Plays the local queue through libmpv. Commands come from the `EngineDispatcher`'s thread,
// reports go out from the thread calling `run()`; libmpv's client API is thread-safe.
class MpvEngine : public PlaybackEngine {
public:
    static double constexpr timeout = 0.1;

private:
    std::atomic_bool _running;

    mpv_handle * _mpv;

    std::chrono::milliseconds const _reportInterval;
    std::chrono::steady_clock::time_point _nextReport;
    ReportCallback _onReport;

    std::atomic_bool _active; // Cleared while a remote device drives playback
    std::atomic_bool _reportedIdle; // Set once the core has been told nothing is loaded
    bool _wasPlaying; // Whether we were playing when handed off to a remote device
    // mpv only shuffles the playlist in place, so both of these are tracked here
    std::atomic_bool _shuffle;
    std::atomic<RepeatMode> _repeat;

    template<typename T, typename... Ts>
    int runCommand(T&& name, Ts&&... args) {
        char const * command[] = {
            std::forward<T>(name), std::forward<Ts>(args)..., nullptr
        };
        int retcode = mpv_command(_mpv, command);
        if (retcode < 0) {
            spdlog::get("logger")->error("Error while running MPV command " + std::string(name) + ": " + mpv_error_string(retcode));
        }
        return retcode;
    }

    // Properties are routinely unavailable while nothing is loaded, hence no error log
    template<typename T>
    std::optional<T> getProperty(char const * name) const {
        typename Format<T>::type data;
        int retcode = mpv_get_property(_mpv, name, Format<T>::format, &data);
        if (retcode < 0) {
            spdlog::get("logger")->trace("Could not get MPV property {}: {}", name, mpv_error_string(retcode));
            return std::nullopt;
        }
        return T(data);
    }
    std::optional<std::string> getStringProperty(char const * name) const;

    template<typename T>
    int setProperty(char const * name, T&& data) {
        typename Format<std::decay_t<T>>::type mpvData = std::forward<T>(data);
        int retcode = mpv_set_property(_mpv, name, Format<std::decay_t<T>>::format, &mpvData);
        if (retcode < 0) {
            spdlog::get("logger")->error("Error setting MPV property " + std::string(name) + ": " + mpv_error_string(retcode));
        }
        return retcode;
    }
    int setStringProperty(char const * name, char const * value);


public:
    MpvEngine(std::chrono::milliseconds reportInterval);
    ~MpvEngine();
    // Must be set before `run()` is called
    void onReport(ReportCallback callback) { _onReport = std::move(callback); }
    void run();
    void stop();

    void play(std::optional<std::string> const & trackId) override;
    void pause() override;
    void next() override;
    void prev() override;
    void seek(int64_t positionMs) override;
    void toggleShuffle() override;
    void cycleRepeat() override;
    void enqueue(std::string const & trackId) override;

    void resumeLocal(int64_t positionMs) override;
    void pauseLocal() override;

private:
    bool loaded() const;
    std::vector<std::string> playlist() const;
    void report();
};


#endif
