#pragma once

#include "PipelineSnapshot.h"

#include <string>

namespace pipeviz {

/**
 * @brief JSON form of a PipelineSnapshot
 *
 * Document layout:
 * @code
 * {
 *   "nodes": [{"id": "a", "name": "A", "type": "task", "tags": [], "pipelines": []}],
 *   "edges": [{"source": "a", "target": "b"}],
 *   "modular_pipelines": [{"id": "m", "name": "M", "members": ["a"], "collapsed": false}],
 *   "pipelines": [{"id": "__default__", "name": "Default"}],
 *   "run_metrics": [{"node": "a", "metric": "loss", "run": "r1", "values": [0.5]}]
 * }
 * @endcode
 * Only "nodes" is required. Dynamic access ends here: everything past this
 * reader works on the typed snapshot.
 */
class SnapshotReader {
public:
    /// @throws LoadError (MalformedSnapshot) on invalid JSON or wrong field types
    static PipelineSnapshot fromJson(const std::string& json);

    /// @throws LoadError (MalformedSnapshot) when the file cannot be read or parsed
    static PipelineSnapshot loadFromFile(const std::string& path);

    static std::string toJson(const PipelineSnapshot& snapshot);
};

}  // namespace pipeviz
