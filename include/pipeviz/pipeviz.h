#pragma once

/// @file pipeviz.h
/// @brief Main header for the pipeviz pipeline flowchart engine
///
/// pipeviz turns a data-pipeline snapshot (tasks, datasets, parameters and
/// nested modular pipelines) into a layered flowchart that can be filtered,
/// focused and collapsed without layout jumps.
///
/// Example usage:
/// @code
/// #include <pipeviz/pipeviz.h>
///
/// pipeviz::FlowchartSession session;
/// auto outcome = session.loadJson(json);
/// session.toggleCollapse("feature_engineering");
///
/// pipeviz::SvgExport svg;
/// svg.exportToFile(session.drawList(), "pipeline.svg");
/// @endcode

// Core module - Pipeline model
#include "core/Types.h"
#include "core/Graph.h"
#include "core/PipelineSnapshot.h"
#include "core/SnapshotReader.h"
#include "core/LoadError.h"
#include "core/FilterState.h"
#include "core/EffectiveGraph.h"
#include "core/PipelineGraph.h"
#include "core/RunMetricStore.h"
#include "core/TaskExecutor.h"

// Layout module - Layered layout and results
#include "layout/config/LayoutEnums.h"
#include "layout/config/LayoutOptions.h"
#include "layout/config/LayoutResult.h"
#include "layout/api/ILayout.h"
#include "layout/api/LayoutInternalError.h"
#include "layout/SugiyamaLayout.h"
#include "layout/CoordinateRelaxation.h"
#include "layout/util/LayoutUtils.h"
#include "layout/util/LayoutSerializer.h"
#include "layout/util/OptionsLoader.h"

// Interaction module - Collapse state, focus and selection
#include "interaction/CollapseController.h"
#include "interaction/SelectionModel.h"

// Export module - Draw lists and output formats
#include "export/DrawList.h"
#include "export/GeometryContract.h"
#include "export/IExporter.h"
#include "export/SvgExport.h"

// Session - Command surface for a UI
#include "session/FlowchartSession.h"
#include "session/SnapshotFetcher.h"

#include <string>

namespace pipeviz {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace pipeviz
