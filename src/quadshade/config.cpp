#include <quadshade/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace quadshade {

static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _configPath(configPath)
    , _cmdOverrides(cmdOverrides) {
}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(true); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<Config::Ptr> Config::fromString(const std::string& yaml,
                                       const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config("", cmdOverrides));
    config->loadDefaults();
    if (auto res = config->loadString(yaml); !res) {
        return Err<Ptr>("Failed to parse config", res);
    }
    if (auto res = config->init(false); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init(bool useEnvironment) noexcept {
    if (_initialized) {
        return Ok();
    }

    if (useEnvironment) {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicit path must load; the XDG fallback is best-effort
                if (!_configPath.empty()) {
                    return Err<void>("Cannot load " + effectivePath, res);
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides();
    }

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }

    _initialized = true;
    return Ok();
}

void Config::loadDefaults() {
    _config = YAML::Node(YAML::NodeType::Map);

    _config["shading"]["color-decode"] = "conventional";
    _config["shading"]["panel-anchor"]["x-divisor"] = 2.0f;
    _config["shading"]["panel-anchor"]["y-divisor"] = 2.5f;

    _config["sampler"]["filter"] = "linear";
    _config["sampler"]["address"] = "clamp";

    _config["raster"]["blend"] = "alpha";
    _config["raster"]["width"] = 800;
    _config["raster"]["height"] = 600;
}

Result<void> Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadString(buffer.str());
}

Result<void> Config::loadString(const std::string& yaml) {
    try {
        YAML::Node loaded = YAML::Load(yaml);
        if (!loaded || loaded.IsNull()) {
            return Ok();
        }
        if (!loaded.IsMap()) {
            return Err<void>("Config root must be a map");
        }
        mergeNodes(_config, loaded);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides() {
    applyEnvOverrides(_config, "");
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> overrides;

    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            overrides.emplace_back(key, val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }

    for (const auto& [key, value] : overrides) {
        node[key] = value;
    }
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    YAML::Node current;
    current.reset(_config);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node parent = current;
        YAML::Node next = parent[part];
        if (!next) {
            return YAML::Node();
        }
        current.reset(next);
    }
    return current;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;

        YAML::Node existing = target[key];
        if (value.IsMap() && existing && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') {
            envVar += '_';
        } else {
            envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else if (const char* home = std::getenv("HOME")) {
        configDir = std::filesystem::path(home) / ".config";
    } else {
        configDir = "/tmp";
    }

    return configDir / "quadshade" / "config.yaml";
}

} // namespace quadshade
