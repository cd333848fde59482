/**
 * @file Stimulus.hpp
 * @brief Stimulus vocabulary and resolution of raw mark names.
 *
 * Experiment logs name stimuli loosely ("Ozono_3", "acqua piante 2",
 * "H2SO4"...). The catalog maps such raw names onto canonical stimulus
 * types; marks that match no type are discarded.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_DATA_STIMULUS_HPP
    #define PHYTO_DATA_STIMULUS_HPP

    #include <phyto/core/Types.hpp>

    #include <optional>
    #include <span>
    #include <string>
    #include <string_view>
    #include <vector>

namespace phyto::data {

/// Label of datapoints taken away from any stimulus.
inline constexpr std::string_view kNullStimulus = "null";

/** @brief A mark as read from an experiment log. */
struct RawMark {
    std::string name;
    core::usize index = 0;
};

/** @brief A recognised stimulus at a reading index. */
struct Stimulus {
    std::string type;
    core::usize index = 0;

    bool operator==(const Stimulus &) const = default;
};

class StimulusCatalog {
public:
    struct Entry {
        std::string type;
        std::vector<std::string> aliases;
    };

    explicit StimulusCatalog(std::vector<Entry> entries);

    /**
     * @brief The built-in vocabulary: water, H2SO, ozone, NaCL, light-on, light-off.
     */
    [[nodiscard]] static StimulusCatalog defaults();

    /**
     * @brief Removes a trailing "_?digits" suffix and lower-cases.
     *
     * "Ozono_12" becomes "ozono", "NaCl3" becomes "nacl".
     */
    [[nodiscard]] static std::string normalise(std::string_view raw);

    /**
     * @brief Canonical type of @p raw: the first entry, in catalog order,
     *        with an alias contained in the normalised name.
     */
    [[nodiscard]] std::optional<std::string> resolve(std::string_view raw) const;

    /**
     * @brief Resolves every mark, dropping unrecognised ones.
     */
    [[nodiscard]] std::vector<Stimulus> resolveAll(std::span<const RawMark> marks) const;

    /**
     * @brief Canonical types in catalog order.
     */
    [[nodiscard]] std::vector<std::string> types() const;

private:
    std::vector<Entry> _entries;
};

} // namespace phyto::data

#endif // PHYTO_DATA_STIMULUS_HPP
