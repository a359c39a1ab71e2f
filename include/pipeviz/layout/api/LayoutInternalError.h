#pragma once

#include <stdexcept>
#include <string>

namespace pipeviz {

/// Internal consistency failure of the layout engine (e.g. a cycle reached the ranker)
///
/// Never escapes SugiyamaLayout::layout(); it is logged and replaced by a
/// single-column fallback layout.
class LayoutInternalError : public std::logic_error {
public:
    explicit LayoutInternalError(const std::string& message)
        : std::logic_error(message) {}
};

}  // namespace pipeviz
