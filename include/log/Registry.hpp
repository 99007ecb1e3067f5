#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace stratus::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    static void init();
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> stratus()   { return get("stratus"); }
    static std::shared_ptr<spdlog::logger> drive()     { return get("drive"); }
    static std::shared_ptr<spdlog::logger> mount()     { return get("mount"); }
    static std::shared_ptr<spdlog::logger> bridge()    { return get("bridge"); }
    static std::shared_ptr<spdlog::logger> tasks()     { return get("tasks"); }
    static std::shared_ptr<spdlog::logger> transfer()  { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> storage()   { return get("storage"); }
    static std::shared_ptr<spdlog::logger> crypto()    { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> db()        { return get("db"); }

    [[nodiscard]] static bool isInitialized();

    static void reopenMainLog();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // keep the shared sinks so the file sink can be swapped after logrotate
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
