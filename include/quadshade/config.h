#pragma once

#include <quadshade/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace quadshade {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Load order: built-in defaults, config file (explicit path, else the
    // XDG location if present), QUADSHADE_* environment variables,
    // cmdOverrides.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    // Same order without touching the filesystem or environment
    static Result<Ptr> fromString(const std::string& yaml,
                                  const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "shading.color-decode").
    // Returns nullopt if the key doesn't exist or has the wrong type.
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "QUADSHADE_";

    static constexpr const char* KEY_COLOR_DECODE = "shading.color-decode";
    static constexpr const char* KEY_ANCHOR_X_DIVISOR = "shading.panel-anchor.x-divisor";
    static constexpr const char* KEY_ANCHOR_Y_DIVISOR = "shading.panel-anchor.y-divisor";
    static constexpr const char* KEY_SAMPLER_FILTER = "sampler.filter";
    static constexpr const char* KEY_SAMPLER_ADDRESS = "sampler.address";
    static constexpr const char* KEY_RASTER_BLEND = "raster.blend";
    static constexpr const char* KEY_RASTER_WIDTH = "raster.width";
    static constexpr const char* KEY_RASTER_HEIGHT = "raster.height";

    // Convert dotted path to env var name
    // ("shading.color-decode" -> "QUADSHADE_SHADING_COLOR_DECODE")
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init(bool useEnvironment) noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    Result<void> loadString(const std::string& yaml);
    void applyEnvOverrides();
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
    bool _initialized = false;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace quadshade
