#include "pipeviz/layout/config/LayoutOptions.h"

namespace pipeviz {

LayoutOptions LayoutOptions::compact() {
    LayoutOptions options;
    options.setNodeSeparation(16.0f)
        .setEdgeSeparation(6.0f)
        .setRankSeparation(40.0f)
        .setNodeHeight(28.0f)
        .setSweepPasses(4)
        .setSmoothingIterations(1);
    options.pipelineNodeHeight = 36.0f;
    options.charWidth = 6.0f;
    options.labelPadding = 16.0f;
    options.groupPadding = 8.0f;
    return options;
}

LayoutOptions LayoutOptions::balanced() {
    return LayoutOptions{};
}

LayoutOptions LayoutOptions::spacious() {
    LayoutOptions options;
    options.setNodeSeparation(56.0f)
        .setEdgeSeparation(20.0f)
        .setRankSeparation(96.0f)
        .setNodeHeight(44.0f)
        .setSweepPasses(12)
        .setSmoothingIterations(3);
    options.pipelineNodeHeight = 60.0f;
    options.charWidth = 8.0f;
    options.labelPadding = 32.0f;
    options.groupPadding = 24.0f;
    return options;
}

}  // namespace pipeviz
