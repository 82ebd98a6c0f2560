#include "partialjson/selection.h"

#include "util/string_util.h"

namespace partialjson {

namespace {

/// Returns the position of the next property segment at or after pos.
/// Array-element segments never consume a selector level.
size_t next_property(const Path& path, size_t pos) {
  while (pos < path.size() && path[pos].is_element()) {
    ++pos;
  }
  return pos;
}

/// Matches path[pos..] against node; pos always names a property segment.
/// MUST return true as soon as the last property segment is found.
bool match_from(const Selection& node, const Path& path, size_t pos, bool case_insensitive) {
  if (node.empty()) return true;
  const std::string& name = path[pos].name;
  size_t after = next_property(path, pos + 1);
  bool last = after == path.size();

  if (!case_insensitive) {
    const Selection* child = node.find(name);
    if (!child) return node.has_wildcard();
    if (last) return true;
    return match_from(*child, path, after, case_insensitive);
  }

  // WHY: stored keys keep their casing; only the probe is folded.
  const std::vector<size_t>* candidates = node.find_folded(util::to_lower(name));
  if (!candidates) return node.has_wildcard();
  if (last) return true;
  for (size_t idx : *candidates) {
    if (match_from(node.entries()[idx].selection, path, after, case_insensitive)) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool matches(const Selection& selection, const Path& path, bool case_insensitive) {
  if (selection.empty()) return true;
  size_t first = next_property(path, 0);
  if (first == path.size()) {
    return selection.has_wildcard();
  }
  return match_from(selection, path, first, case_insensitive);
}

bool has_selected_descendant(const Selection& selection, const Path& path, bool case_insensitive) {
  size_t first = next_property(path, 0);
  if (first == path.size()) {
    // The root container holds every selected path.
    return true;
  }
  return match_from(selection, path, first, case_insensitive);
}

}  // namespace partialjson
