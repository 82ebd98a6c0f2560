#pragma once

#include <functional>

#include <nlohmann/json.hpp>

#include "partialjson/selection.h"

namespace partialjson {

/// Predicate consulted once per candidate path during a serialization walk.
using PathPredicate = std::function<bool(const Path&)>;

/// Pair of predicates driving filter_json.
/// include decides scalar properties; descend decides whether an object or array
/// is emitted at all. An empty descend falls back to include.
struct PathFilter {
  PathPredicate include;
  PathPredicate descend;
};

/// Builds a filter that can be stored past the selection's lifetime.
/// MUST NOT reference the caller's tree after returning; the predicates share a copy.
/// Inputs are selection/case flag; outputs are predicates backed by matches().
PathFilter make_path_filter(const Selection& selection, bool case_insensitive);

/// Copies a JSON document keeping only the paths the filter accepts.
/// MUST always emit the root value and MUST keep array order and object key order.
/// Inputs are JSON values and filters; outputs are new JSON values.
nlohmann::json filter_json(const nlohmann::json& value, const PathFilter& filter);
/// Borrows selection for the duration of the walk; no tree copy is made.
nlohmann::json filter_json(const nlohmann::json& value,
                           const Selection& selection,
                           bool case_insensitive);

}  // namespace partialjson
