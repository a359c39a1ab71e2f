#pragma once

#include "../config/LayoutOptions.h"

#include <optional>
#include <string>

namespace pipeviz {

/**
 * @brief Reads and writes LayoutOptions as JSON
 *
 * Keys mirror the LayoutOptions field names. An optional "preset" key
 * ("compact", "balanced", "spacious") selects the base the other keys
 * override. Unknown keys are ignored; a known key with the wrong type
 * raises std::runtime_error.
 */
class OptionsLoader {
public:
    static LayoutOptions fromJson(const std::string& json);
    static LayoutOptions loadFromFile(const std::string& path);
    static std::string toJson(const LayoutOptions& options);

    /// Preset by name; nullopt for unknown names
    static std::optional<LayoutOptions> preset(const std::string& name);
};

}  // namespace pipeviz
