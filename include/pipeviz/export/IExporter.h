#pragma once

#include <ostream>
#include <string>

namespace pipeviz {

struct DrawList;

/// Abstract interface for draw-list exporters
///
/// All export formats (SVG, PNG, DOT, etc.) should implement this interface
/// to enable polymorphic usage and easy format switching.
class IExporter {
public:
    virtual ~IExporter() = default;

    virtual std::string exportToString(const DrawList& drawList) = 0;
    virtual void exportToStream(const DrawList& drawList, std::ostream& out) = 0;

    /// Export to a file; false if the file cannot be opened
    virtual bool exportToFile(const DrawList& drawList, const std::string& filename) = 0;

    /// Get the file extension for this export format (e.g., "svg", "png", "dot")
    virtual std::string fileExtension() const = 0;

    /// Get the MIME type for this export format (e.g., "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

}  // namespace pipeviz
