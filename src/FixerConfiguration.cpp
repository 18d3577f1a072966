#include "Dockfix/FixerConfiguration.hpp"

#include <filesystem>

namespace Dockfix
{

std::string normalizePath(const std::string& path)
{
    if (path.empty())
        return path;
    return std::filesystem::path(path).lexically_normal().string();
}

void FixerConfiguration::setFileFixModes(const std::string& path, RuleFixModes modes)
{
    fixModes[normalizePath(path)] = std::move(modes);
}

FixMode FixerConfiguration::fixModeFor(const std::string& path, const std::string& ruleCode) const
{
    auto fileModes = fixModes.find(normalizePath(path));
    if (fileModes == fixModes.end())
        return FixMode::Always;

    auto mode = fileModes->second.find(ruleCode);
    if (mode == fileModes->second.end())
        return FixMode::Always;

    return mode->second;
}

void to_json(nlohmann::json& j, const FixerConfiguration& config)
{
    j = nlohmann::json{
        {"safetyThreshold", config.safetyThreshold},
        {"ruleFilter", config.ruleFilter},
        {"fixModes", config.fixModes},
        {"concurrency", config.concurrency},
        {"resolveStrategy", config.resolveStrategy},
    };
}

void from_json(const nlohmann::json& j, FixerConfiguration& config)
{
    if (j.contains("safetyThreshold"))
        j.at("safetyThreshold").get_to(config.safetyThreshold);
    if (j.contains("ruleFilter"))
        j.at("ruleFilter").get_to(config.ruleFilter);
    if (j.contains("fixModes"))
    {
        // Keys are re-normalized so lookups match however the configuration spelled the path
        for (const auto& [path, modes] : j.at("fixModes").items())
            config.setFileFixModes(path, modes.get<RuleFixModes>());
    }
    if (j.contains("concurrency"))
    {
        auto concurrency = j.at("concurrency").get<long long>();
        config.concurrency = concurrency < 1 ? 1 : static_cast<size_t>(concurrency);
    }
    if (j.contains("resolveStrategy"))
        j.at("resolveStrategy").get_to(config.resolveStrategy);
}

RuleFixModes buildFixModes(const nlohmann::json& rules)
{
    RuleFixModes modes;
    if (!rules.is_object())
        return modes;

    for (const char* ruleNamespace : {"tally", "buildkit", "hadolint"})
    {
        auto section = rules.find(ruleNamespace);
        if (section == rules.end() || !section->is_object())
            continue;

        for (const auto& [name, ruleConfig] : section->items())
        {
            if (!ruleConfig.is_object() || !ruleConfig.contains("fix"))
                continue;

            auto mode = ruleConfig.at("fix");
            if (!mode.is_string() || mode.get<std::string>().empty())
                continue;

            modes[std::string(ruleNamespace) + "/" + name] = mode.get<FixMode>();
        }
    }

    return modes;
}

} // namespace Dockfix
