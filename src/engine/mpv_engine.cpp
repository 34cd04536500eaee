
#include <algorithm>
#include <cmath>
#include <cstring>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "mpv_engine.hpp"


MpvEngine::MpvEngine(std::chrono::milliseconds reportInterval)
 : _running(true), _mpv(mpv_create()), _reportInterval(reportInterval),
   _nextReport(std::chrono::steady_clock::now()), _onReport(),
   _active(true), _reportedIdle(false), _wasPlaying(false), _shuffle(false), _repeat(RepeatMode::OFF) {
    if (_mpv == nullptr) {
        throw std::runtime_error("Failed to create MPV handle (does LC_NUMERIC != \"C\"?)");
    }

    spdlog::get("logger")->trace("Configuring and init-ing MPV player...");

    // Set config options
    mpv_set_option_string(_mpv, "cache", "yes"); // Tracks may be URLs
    mpv_set_option_string(_mpv, "load-scripts", "no"); // Don't load config scripts
    mpv_set_option_string(_mpv, "vid", "no"); // Disable video playback, we're only doing audio!
    mpv_set_option_string(_mpv, "idle", "yes"); // Stay around when the queue runs out

    int retcode = mpv_initialize(_mpv);
    if (retcode < 0) {
        mpv_destroy(_mpv);
        throw std::runtime_error("Failed to initialize MPV: " + std::string(mpv_error_string(retcode)));
    }
}

MpvEngine::~MpvEngine() {
    spdlog::get("logger")->trace("Destroying MPV handle...");
    mpv_destroy(_mpv);
}


void MpvEngine::run() {
    spdlog::get("logger")->trace("MPV player up and running!");

    double const waitTime = std::min(timeout, _reportInterval.count() / 1000.);
    while (_running) {
        mpv_event const * event = mpv_wait_event(_mpv, waitTime);
        if (event->event_id != MPV_EVENT_NONE) {
            spdlog::get("logger")->trace("mpv event: {}", mpv_event_name(event->event_id));
        }
        switch (event->event_id) {
            case MPV_EVENT_SHUTDOWN:
                _running = false;
                break;

            case MPV_EVENT_FILE_LOADED:
            case MPV_EVENT_SEEK:
            case MPV_EVENT_END_FILE:
            case MPV_EVENT_IDLE:
                // Report track changes, seeks and stops right away
                _nextReport = std::chrono::steady_clock::now();
                break;

            default:
                break;
        }

        if (std::chrono::steady_clock::now() >= _nextReport) {
            _nextReport += _reportInterval;
            if (_nextReport < std::chrono::steady_clock::now()) {
                _nextReport = std::chrono::steady_clock::now() + _reportInterval;
            }

            try {
                report();
            } catch (std::exception const & e) {
                spdlog::get("logger")->error("MpvEngine: failed to report state: {}", e.what());
            }
        }
    }

    spdlog::get("logger")->trace("MPV player finished running");
}

void MpvEngine::stop() {
    _running = false;
    mpv_wakeup(_mpv);
}


void MpvEngine::play(std::optional<std::string> const & trackId) {
    if (trackId) {
        std::vector<std::string> const entries = playlist();
        auto iter = std::find(entries.begin(), entries.end(), *trackId);
        if (iter != entries.end()) {
            spdlog::get("logger")->trace("Jumping to queued track {}", *trackId);
            setProperty("playlist-pos", int64_t(iter - entries.begin()));
        } else {
            spdlog::get("logger")->trace("Playing {}", *trackId);
            runCommand("loadfile", trackId->c_str(), "replace");
        }
    }

    spdlog::get("logger")->trace("Unpausing MPV player");
    setProperty("pause", false);
}

void MpvEngine::pause() {
    spdlog::get("logger")->trace("Pausing MPV player");
    setProperty("pause", true);
}

void MpvEngine::next() {
    runCommand("playlist-next", "force");
}

void MpvEngine::prev() {
    runCommand("playlist-prev", "force");
}

void MpvEngine::seek(int64_t positionMs) {
    if (!loaded()) {
        spdlog::get("logger")->debug("Ignoring seek to {}ms, nothing is loaded", positionMs);
        return;
    }
    runCommand("seek", std::to_string(positionMs / 1000.).c_str(), "absolute");
}

void MpvEngine::toggleShuffle() {
    bool shuffle = !_shuffle;
    if (runCommand(shuffle ? "playlist-shuffle" : "playlist-unshuffle") >= 0) {
        _shuffle = shuffle;
    }
}

void MpvEngine::cycleRepeat() {
    RepeatMode repeat;
    switch (_repeat.load()) {
        case RepeatMode::OFF: repeat = RepeatMode::ALL; break;
        case RepeatMode::ALL: repeat = RepeatMode::ONE; break;
        case RepeatMode::ONE: default: repeat = RepeatMode::OFF; break;
    }

    setStringProperty("loop-file", repeat == RepeatMode::ONE ? "inf" : "no");
    setStringProperty("loop-playlist", repeat == RepeatMode::ALL ? "inf" : "no");
    _repeat = repeat;
}

void MpvEngine::enqueue(std::string const & trackId) {
    spdlog::get("logger")->trace("Queuing {}", trackId);
    runCommand("loadfile", trackId.c_str(), "append-play");
}


void MpvEngine::resumeLocal(int64_t positionMs) {
    spdlog::get("logger")->debug("Resuming local playback at {}ms (playing: {})", positionMs, _wasPlaying);
    seek(positionMs);
    setProperty("pause", !_wasPlaying);
    // A remote device drove the state meanwhile, so say again if nothing is loaded
    _reportedIdle = false;
    _active = true;
}

void MpvEngine::pauseLocal() {
    std::optional<bool> paused = getProperty<bool>("pause");
    _wasPlaying = loaded() && paused && !*paused;
    // Stop reporting first, so the last report can't unpause the state seen by remote devices
    _active = false;
    setProperty("pause", true);
    spdlog::get("logger")->debug("Local playback handed off (was playing: {})", _wasPlaying);
}


std::optional<std::string> MpvEngine::getStringProperty(char const * name) const {
    char * data = mpv_get_property_string(_mpv, name);
    if (data == nullptr) {
        return std::nullopt;
    }
    std::string str(data);
    mpv_free(data);
    return str;
}

int MpvEngine::setStringProperty(char const * name, char const * value) {
    int retcode = mpv_set_property_string(_mpv, name, value);
    if (retcode < 0) {
        spdlog::get("logger")->error("Error setting MPV property " + std::string(name) + ": " + mpv_error_string(retcode));
    }
    return retcode;
}


bool MpvEngine::loaded() const {
    std::optional<bool> idle = getProperty<bool>("idle-active");
    return idle && !*idle;
}

std::vector<std::string> MpvEngine::playlist() const {
    std::vector<std::string> entries;

    std::optional<mpv_node> playlist = getProperty<mpv_node>("playlist");
    if (!playlist) {
        return entries;
    }
    if (playlist->format == MPV_FORMAT_NODE_ARRAY) {
        for (int i = 0; i < playlist->u.list->num; i++) {
            mpv_node const & node = playlist->u.list->values[i];
            if (node.format != MPV_FORMAT_NODE_MAP) continue;

            for (int j = 0; j < node.u.list->num; j++) {
                mpv_node const & value = node.u.list->values[j];
                if (!strcmp("filename", node.u.list->keys[j]) && value.format == MPV_FORMAT_STRING) {
                    entries.emplace_back(value.u.string);
                    break;
                }
            }
        }
    }
    mpv_free_node_contents(&*playlist);

    return entries;
}

void MpvEngine::report() {
    if (!_onReport || !_active) {
        return;
    }
    if (!loaded()) {
        // Once is enough, the state stays put until something is loaded again
        if (!_reportedIdle.exchange(true)) {
            _onReport(EngineReport::stopped(playlist(), _shuffle, _repeat));
        }
        return;
    }
    _reportedIdle = false;

    EngineReport report;
    report.trackId = getStringProperty("path");
    report.isPlaying = !getProperty<bool>("pause").value_or(true);
    report.positionMs = std::llround(getProperty<double>("playback-time").value_or(0) * 1000);
    report.durationMs = std::llround(getProperty<double>("duration").value_or(0) * 1000);
    report.queue = playlist();
    report.shuffle = _shuffle;
    report.repeat = _repeat;
    report.playbackRate = getProperty<double>("speed").value_or(1.0);

    _onReport(report);
}
