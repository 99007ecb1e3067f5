#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace stratus::config {

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/stratus/config.yaml";

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static void init(const Config& config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace stratus::config
