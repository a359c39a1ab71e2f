#include "pipeviz/export/SvgExport.h"
#include "pipeviz/common/Logger.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pipeviz {

namespace {

const char* kindClass(NodeKind kind) {
    switch (kind) {
        case NodeKind::Task: return "task";
        case NodeKind::Dataset: return "dataset";
        case NodeKind::Parameters: return "parameters";
        case NodeKind::ModularPipeline: return "pipeline";
    }
    return "task";
}

int hexChannel(const std::string& color, size_t offset) {
    if (color.size() < offset + 2) return 0;
    return static_cast<int>(std::strtol(color.substr(offset, 2).c_str(), nullptr, 16));
}

}  // namespace

SvgExport::SvgExport(const SvgExportOptions& options)
    : options_(options) {}

std::string SvgExport::exportToString(const DrawList& drawList) {
    std::ostringstream out;
    exportToStream(drawList, out);
    return out.str();
}

void SvgExport::exportToStream(const DrawList& drawList, std::ostream& out) {
    writeHeader(out, drawList.bounds);
    writeStyles(out);
    writeMarkers(out);

    for (const auto& group : drawList.groups) {
        writeGroup(out, group);
    }
    // Edges before nodes so nodes are drawn on top
    for (const auto& path : drawList.paths) {
        writePath(out, path);
    }
    for (const auto& rect : drawList.rects) {
        writeRect(out, rect);
    }
    if (options_.showNodeLabels) {
        for (const auto& label : drawList.labels) {
            writeLabel(out, label);
        }
    }

    writeFooter(out);
}

bool SvgExport::exportToFile(const DrawList& drawList, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_WARN("Cannot open '{}' for SVG export", filename);
        return false;
    }
    exportToStream(drawList, file);
    return true;
}

void SvgExport::writeHeader(std::ostream& out, const Rect& bounds) {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
        << "width=\"" << bounds.width << "\" "
        << "height=\"" << bounds.height << "\" "
        << "viewBox=\"" << bounds.x << " " << bounds.y << " "
        << bounds.width << " " << bounds.height << "\">\n";

    out << "  <rect x=\"" << bounds.x << "\" y=\"" << bounds.y << "\" "
        << "width=\"" << bounds.width << "\" height=\"" << bounds.height << "\" "
        << "fill=\"" << options_.backgroundColor << "\"/>\n";
}

void SvgExport::writeStyles(std::ostream& out) {
    if (!options_.embedStyles) return;

    auto nodeRule = [&](const char* cls, const std::string& fill) {
        out << "    ." << cls << " { fill: " << fill << "; "
            << "stroke: " << options_.nodeStroke << "; "
            << "stroke-width: " << options_.nodeStrokeWidth << "; }\n";
    };

    out << "  <style>\n";
    nodeRule("task", options_.taskFill);
    nodeRule("dataset", options_.datasetFill);
    nodeRule("parameters", options_.parametersFill);
    nodeRule("pipeline", options_.pipelineFill);
    out << "    .group { fill: " << options_.groupFill << "; "
        << "stroke: " << options_.groupStroke << "; stroke-width: 1; }\n";
    out << "    .edge { fill: none; "
        << "stroke: " << options_.edgeStroke << "; "
        << "stroke-width: " << options_.edgeStrokeWidth << "; }\n";
    out << "    .synthetic { stroke-dasharray: " << options_.syntheticDasharray << "; }\n";
    out << "    .highlighted { stroke: " << options_.highlightStroke << "; }\n";
    out << "    .focused { stroke: " << options_.highlightStroke << "; stroke-width: 3; }\n";
    out << "    .selected { stroke: " << options_.selectedStroke << "; stroke-width: 3; }\n";
    out << "    .faded { opacity: " << options_.fadedOpacity << "; }\n";
    out << "    .label { fill: " << options_.textFill << "; "
        << "font-family: " << options_.fontFamily << "; "
        << "font-size: " << options_.fontSize << "px; "
        << "text-anchor: middle; dominant-baseline: central; }\n";
    out << "  </style>\n";
}

void SvgExport::writeMarkers(std::ostream& out) {
    out << "  <defs>\n";
    out << "    <marker id=\"arrowhead\" markerWidth=\"10\" markerHeight=\"7\" "
        << "refX=\"9\" refY=\"3.5\" orient=\"auto\">\n";
    out << "      <polygon points=\"0 0, 10 3.5, 0 7\" fill=\""
        << options_.edgeStroke << "\"/>\n";
    out << "    </marker>\n";
    out << "  </defs>\n";
}

void SvgExport::writeFooter(std::ostream& out) {
    out << "</svg>\n";
}

void SvgExport::writeGroup(std::ostream& out, const GroupBox& group) {
    out << "  <rect class=\"group\" data-id=\"" << group.pipeline << "\" "
        << "x=\"" << group.rect.x << "\" "
        << "y=\"" << group.rect.y << "\" "
        << "width=\"" << group.rect.width << "\" "
        << "height=\"" << group.rect.height << "\" "
        << "rx=\"" << options_.nodeCornerRadius << "\"/>\n";

    if (options_.showGroupLabels && !group.label.empty()) {
        out << "  <text class=\"label\" "
            << "x=\"" << group.rect.center().x << "\" "
            << "y=\"" << group.rect.y + options_.fontSize / 2.0f + 2.0f << "\">"
            << escapeXml(group.label) << "</text>\n";
    }
}

void SvgExport::writePath(std::ostream& out, const PathPrimitive& path) {
    if (path.points.size() < 2) return;

    std::string cls = "edge";
    if (path.synthetic) cls += " synthetic";
    if (path.highlighted) cls += " highlighted";
    if (path.faded) cls += " faded";

    out << "  <polyline class=\"" << cls << "\" data-id=\"" << path.edge << "\" points=\"";
    for (size_t i = 0; i < path.points.size(); ++i) {
        if (i > 0) out << " ";
        out << path.points[i].x << "," << path.points[i].y;
    }
    out << "\" marker-end=\"url(#arrowhead)\"/>\n";
}

void SvgExport::writeRect(std::ostream& out, const RectPrimitive& rect) {
    std::string cls = kindClass(rect.kind);
    if (rect.highlighted) cls += " highlighted";
    if (rect.focused) cls += " focused";
    if (rect.selected) cls += " selected";
    if (rect.faded) cls += " faded";

    out << "  <rect class=\"" << cls << "\" data-id=\"" << rect.node << "\" "
        << "x=\"" << rect.rect.x << "\" "
        << "y=\"" << rect.rect.y << "\" "
        << "width=\"" << rect.rect.width << "\" "
        << "height=\"" << rect.rect.height << "\" "
        << "rx=\"" << options_.nodeCornerRadius << "\"";
    if (rect.metricLevel) {
        out << " style=\"fill: " << metricColor(*rect.metricLevel) << "\"";
    }
    out << "/>\n";
}

void SvgExport::writeLabel(std::ostream& out, const LabelPrimitive& label) {
    if (label.text.empty()) return;
    out << "  <text class=\"label" << (label.faded ? " faded" : "") << "\" "
        << "x=\"" << label.anchor.x << "\" "
        << "y=\"" << label.anchor.y << "\">"
        << escapeXml(label.text) << "</text>\n";
}

std::string SvgExport::metricColor(double level) const {
    double t = std::clamp(level, 0.0, 1.0);
    auto mix = [&](size_t offset) {
        int low = hexChannel(options_.metricLow, offset);
        int high = hexChannel(options_.metricHigh, offset);
        return static_cast<int>(low + (high - low) * t + 0.5);
    };
    return fmt::format("#{:02x}{:02x}{:02x}", mix(1), mix(3), mix(5));
}

std::string SvgExport::escapeXml(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c; break;
        }
    }

    return result;
}

}  // namespace pipeviz
