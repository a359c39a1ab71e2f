#pragma once

#include <string>

namespace pipeviz {

class LayoutResult;

/// JSON serialization and file I/O for computed layouts
///
/// Used to hand geometry to an out-of-process renderer and for regression fixtures.
class LayoutSerializer {
public:
    /// Serialize a layout result; nodes and edges are written in ascending id order
    static std::string toJson(const LayoutResult& result);

    /// @throws std::runtime_error if parsing fails
    static LayoutResult layoutResultFromJson(const std::string& json);

    /// @return true if the file was written
    static bool saveToFile(const LayoutResult& result, const std::string& path);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static LayoutResult loadFromFile(const std::string& path);
};

}  // namespace pipeviz
