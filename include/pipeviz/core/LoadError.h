#pragma once

#include <stdexcept>
#include <string>

namespace pipeviz {

/// Raised when a snapshot cannot become the current pipeline
///
/// Fatal to the snapshot only: the previously loaded model stays untouched.
class LoadError : public std::runtime_error {
public:
    enum class Kind {
        MalformedSnapshot,    ///< Structurally invalid input (missing fields, bad JSON)
        DuplicateId,          ///< Two nodes/pipelines share an id
        DanglingEdge,         ///< Edge endpoint not present in the node list
        UnknownMember,        ///< Modular pipeline lists a member that does not exist
        AmbiguousMembership,  ///< Member listed under two different modular pipelines
        MembershipCycle,      ///< Modular pipelines contain each other
        GraphCycle            ///< Cycle among edges, raw or after collapse substitution
    };

    LoadError(Kind kind, std::string subject, const std::string& message)
        : std::runtime_error(message), kind_(kind), subject_(std::move(subject)) {}

    Kind kind() const { return kind_; }

    /// Id of the offending node, edge endpoint or pipeline (may be empty)
    const std::string& subject() const { return subject_; }

    static const char* kindName(Kind kind) {
        switch (kind) {
            case Kind::MalformedSnapshot: return "MalformedSnapshot";
            case Kind::DuplicateId: return "DuplicateId";
            case Kind::DanglingEdge: return "DanglingEdge";
            case Kind::UnknownMember: return "UnknownMember";
            case Kind::AmbiguousMembership: return "AmbiguousMembership";
            case Kind::MembershipCycle: return "MembershipCycle";
            case Kind::GraphCycle: return "GraphCycle";
        }
        return "Unknown";
    }

private:
    Kind kind_;
    std::string subject_;
};

}  // namespace pipeviz
