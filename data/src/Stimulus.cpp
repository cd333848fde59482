/**
 * @file Stimulus.cpp
 * @brief StimulusCatalog implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <phyto/data/Stimulus.hpp>

#include <phyto/core/Log.hpp>

#include <algorithm>
#include <cctype>

namespace phyto::data {

StimulusCatalog::StimulusCatalog(std::vector<Entry> entries)
    : _entries(std::move(entries))
{
}

StimulusCatalog StimulusCatalog::defaults()
{
    return StimulusCatalog({
        {"water",     {"acqua piante"}},
        {"H2SO",      {"h2so"}},
        {"ozone",     {"ozone", "ozono", "o3"}},
        {"NaCL",      {"nacl"}},
        {"light-on",  {"light-on"}},
        {"light-off", {"light-off"}},
    });
}

std::string StimulusCatalog::normalise(std::string_view raw)
{
    std::string name(raw);

    auto end = name.size();
    while (end > 0 && std::isdigit(static_cast<unsigned char>(name[end - 1])))
        --end;
    if (end < name.size()) {
        if (end > 0 && name[end - 1] == '_')
            --end;
        name.resize(end);
    }

    std::ranges::transform(name, name.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::optional<std::string> StimulusCatalog::resolve(std::string_view raw) const
{
    const std::string name = normalise(raw);
    for (const auto &entry : _entries) {
        for (const auto &alias : entry.aliases) {
            if (name.find(alias) != std::string::npos)
                return entry.type;
        }
    }
    return std::nullopt;
}

std::vector<Stimulus> StimulusCatalog::resolveAll(std::span<const RawMark> marks) const
{
    std::vector<Stimulus> stimuli;
    stimuli.reserve(marks.size());
    for (const auto &mark : marks) {
        if (auto type = resolve(mark.name)) {
            stimuli.push_back(Stimulus{std::move(*type), mark.index});
        } else {
            core::Log::debug("data", "ignoring unrecognised mark '" + mark.name + "'");
        }
    }
    return stimuli;
}

std::vector<std::string> StimulusCatalog::types() const
{
    std::vector<std::string> out;
    out.reserve(_entries.size());
    for (const auto &entry : _entries)
        out.push_back(entry.type);
    return out;
}

} // namespace phyto::data
