#include "partialjson/json_filter.h"

#include <memory>
#include <utility>

namespace partialjson {

namespace {

using nlohmann::json;

/// Walks one JSON value, extending path as it descends.
/// MUST consult the filter once per object member and array element.
class FilterWalker {
 public:
  explicit FilterWalker(const PathFilter& filter) : filter_(filter) {}

  json walk(const json& value) {
    if (value.is_object()) {
      json out = json::object();
      for (auto it = value.begin(); it != value.end(); ++it) {
        path_.push_back(PathSegment::property(it.key()));
        if (accepts(it.value())) {
          out[it.key()] = walk(it.value());
        }
        path_.pop_back();
      }
      return out;
    }
    if (value.is_array()) {
      json out = json::array();
      for (size_t i = 0; i < value.size(); ++i) {
        path_.push_back(PathSegment::element(i));
        if (accepts(value[i])) {
          out.push_back(walk(value[i]));
        }
        path_.pop_back();
      }
      return out;
    }
    return value;
  }

 private:
  bool accepts(const json& value) const {
    if (value.is_structured() && filter_.descend) {
      return filter_.descend(path_);
    }
    return filter_.include(path_);
  }

  const PathFilter& filter_;
  Path path_;
};

}  // namespace

PathFilter make_path_filter(const Selection& selection, bool case_insensitive) {
  auto tree = std::make_shared<const Selection>(selection);
  PathFilter filter;
  filter.include = [tree, case_insensitive](const Path& path) {
    return matches(*tree, path, case_insensitive);
  };
  filter.descend = [tree, case_insensitive](const Path& path) {
    return has_selected_descendant(*tree, path, case_insensitive);
  };
  return filter;
}

nlohmann::json filter_json(const nlohmann::json& value, const PathFilter& filter) {
  if (!filter.include) {
    return value;
  }
  FilterWalker walker(filter);
  return walker.walk(value);
}

nlohmann::json filter_json(const nlohmann::json& value,
                           const Selection& selection,
                           bool case_insensitive) {
  // WHY: an unrestricted tree would accept every path; skip the walk.
  if (selection.empty()) {
    return value;
  }
  // The walk ends before this call returns, so the predicates borrow the tree.
  PathFilter filter;
  filter.include = [&selection, case_insensitive](const Path& path) {
    return matches(selection, path, case_insensitive);
  };
  filter.descend = [&selection, case_insensitive](const Path& path) {
    return has_selected_descendant(selection, path, case_insensitive);
  };
  return filter_json(value, filter);
}

}  // namespace partialjson
