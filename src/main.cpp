#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <thread>

#include "config_manager.hpp"
#include "engine/engine_dispatcher.hpp"
#include "engine/mpv_engine.hpp"
#include "server.hpp"
#include "sync/clock.hpp"
#include "sync/sync_service.hpp"



// ***WARNING***
// If `%t` is used while `SPDLOG_NO_THREAD_ID` is defined, behavior is undefined
// If `%n` is used while `SPDLOG_NO_NAME` is defined, behavior is undefined
// Remove variables from compilation flags to use those again
static char const * const log_format = "[%Y-%m-%dT%T.%e] [%^%l%$] %v";
int main() {
    // First thing: init logging
    // Create a logger object and register it into spdlog's global logger pool
    spdlog::stderr_color_mt("logger"); // Log to stderr because systemd will handle everything
    spdlog::get("logger")->set_level(spdlog::level::info);
    spdlog::get("logger")->set_pattern(log_format);

    try {
        // Second thing: read config
        ConfigManager config("/etc/playsyncd.ini", "playsyncd.ini");
        spdlog::get("logger")->set_level(spdlog::level::from_str(config.getStr("log_level")));

        SystemClock clock;
        MpvEngine engine(std::chrono::milliseconds(config.getInt("report_interval_ms")));
        EngineDispatcher dispatcher(engine);
        SyncService sync(SyncSettings::fromConfig(config), clock, dispatcher);

        engine.onReport([&sync](EngineReport const & report) { sync.applyEngineReport(report); });
        std::thread engineThread([&engine](){ engine.run(); });

        try {
            // Now, create the server, and run it!
            Server(config, sync).run();
        } catch (...) {
            engine.stop();
            engineThread.join();
            throw;
        }
        engine.stop();
        engineThread.join();
        dispatcher.stop();

        return 0;
    } catch (std::exception const & exception) {
        spdlog::get("logger")->critical("Exception at top level: {}", exception.what());
    } catch (...) {
        spdlog::get("logger")->critical("Unknown exception at top level, aborting");
    }

    return 1;
}
