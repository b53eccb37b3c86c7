#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cctype>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace mvx::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error(std::string("Invalid '") + key + "' section in configuration");
}

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Configuration root must be a mapping");

    decodeSection(root, "transfer", cfg.transfer);
    decodeSection(root, "progress", cfg.progress);
    decodeSection(root, "logging", cfg.logging);
    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

uintmax_t parseByteSize(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    size_t idx = 0;
    const auto value = std::stoull(str, &idx);
    const auto suffix = str.substr(idx);

    if (suffix.empty() || suffix == "B" || suffix == "b") return value;

    const auto unit = static_cast<char>(std::toupper(static_cast<unsigned char>(suffix.front())));
    const auto rest = suffix.substr(1);
    if (!rest.empty() && rest != "B" && rest != "b" && rest != "iB" && rest != "ib")
        throw std::invalid_argument("Unrecognised size suffix: " + str);

    switch (unit) {
    case 'K': return value * 1024;
    case 'M': return value * 1024 * 1024;
    case 'G': return value * 1024 * 1024 * 1024;
    default: throw std::invalid_argument("Unrecognised size suffix: " + str);
    }
}

} // namespace mvx::config
