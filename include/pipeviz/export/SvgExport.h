#pragma once

#include "DrawList.h"
#include "IExporter.h"

#include <ostream>
#include <string>

namespace pipeviz {

/// Options for SVG export
struct SvgExportOptions {
    std::string backgroundColor = "white";

    // Node styling per kind
    std::string taskFill = "#e8eef7";
    std::string datasetFill = "#f3f3f3";
    std::string parametersFill = "#fdf6e3";
    std::string pipelineFill = "#dde7d5";
    std::string nodeStroke = "#333333";
    float nodeStrokeWidth = 1.5f;
    float nodeCornerRadius = 5.0f;

    // Group boxes
    std::string groupFill = "#f7f7f7";
    std::string groupStroke = "#999999";

    // Interaction
    std::string highlightStroke = "#1f6feb";
    std::string selectedStroke = "#d97706";
    float fadedOpacity = 0.25f;

    // Metric tint, interpolated from low to high
    std::string metricLow = "#deebf7";
    std::string metricHigh = "#08519c";

    // Edge styling
    std::string edgeStroke = "#333333";
    float edgeStrokeWidth = 1.5f;
    std::string syntheticDasharray = "4,3";

    // Text styling
    std::string textFill = "#000000";
    std::string fontFamily = "Arial, sans-serif";
    float fontSize = 12.0f;

    bool showNodeLabels = true;
    bool showGroupLabels = true;

    // Include CSS styling
    bool embedStyles = true;
};

/// Exports draw lists to SVG format
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(const SvgExportOptions& options);
    ~SvgExport() override = default;

    std::string exportToString(const DrawList& drawList) override;
    void exportToStream(const DrawList& drawList, std::ostream& out) override;
    bool exportToFile(const DrawList& drawList, const std::string& filename) override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    void setOptions(const SvgExportOptions& options) { options_ = options; }
    const SvgExportOptions& options() const { return options_; }

    static std::string escapeXml(const std::string& text);

private:
    SvgExportOptions options_;

    void writeHeader(std::ostream& out, const Rect& bounds);
    void writeStyles(std::ostream& out);
    void writeMarkers(std::ostream& out);
    void writeFooter(std::ostream& out);

    void writeGroup(std::ostream& out, const GroupBox& group);
    void writePath(std::ostream& out, const PathPrimitive& path);
    void writeRect(std::ostream& out, const RectPrimitive& rect);
    void writeLabel(std::ostream& out, const LabelPrimitive& label);

    std::string metricColor(double level) const;
};

}  // namespace pipeviz
