#include "partialjson/selection.h"

#include <utility>

#include "util/string_util.h"

namespace partialjson {

bool Selection::empty() const {
  return entries_.empty() && !has_wildcard_;
}

const Selection* Selection::find(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return nullptr;
  return &entries_[it->second].selection;
}

const std::vector<size_t>* Selection::find_folded(const std::string& folded_name) const {
  auto it = folded_index_.find(folded_name);
  if (it == folded_index_.end()) return nullptr;
  return &it->second;
}

void Selection::add(const std::string& name, Selection sub) {
  auto it = index_.find(name);
  if (it != index_.end()) {
    entries_[it->second].selection.merge(sub);
    return;
  }
  size_t pos = entries_.size();
  entries_.push_back(SelectionEntry{name, std::move(sub)});
  index_.emplace(name, pos);
  folded_index_[util::to_lower(name)].push_back(pos);
}

void Selection::merge(const Selection& other) {
  if (&other == this || empty()) return;
  // WHY: a bare field (empty sub-selection) already selects its whole subtree.
  if (other.empty()) {
    clear();
    return;
  }
  if (other.has_wildcard_) {
    has_wildcard_ = true;
  }
  for (const auto& entry : other.entries_) {
    add(entry.name, entry.selection);
  }
}

bool Selection::operator==(const Selection& other) const {
  if (has_wildcard_ != other.has_wildcard_) return false;
  if (entries_.size() != other.entries_.size()) return false;
  for (const auto& entry : entries_) {
    const Selection* theirs = other.find(entry.name);
    if (!theirs || !(entry.selection == *theirs)) return false;
  }
  return true;
}

void Selection::clear() {
  entries_.clear();
  index_.clear();
  folded_index_.clear();
  has_wildcard_ = false;
}

PathSegment PathSegment::property(std::string name) {
  PathSegment segment;
  segment.kind = Kind::Property;
  segment.name = std::move(name);
  return segment;
}

PathSegment PathSegment::element(size_t index) {
  PathSegment segment;
  segment.kind = Kind::ArrayElement;
  segment.index = index;
  return segment;
}

Path make_path(const std::vector<std::string>& names) {
  Path path;
  path.reserve(names.size());
  for (const auto& name : names) {
    path.push_back(PathSegment::property(name));
  }
  return path;
}

std::string path_to_string(const Path& path) {
  std::string out;
  for (const auto& segment : path) {
    if (segment.is_element()) {
      out += "[" + std::to_string(segment.index) + "]";
      continue;
    }
    if (!out.empty()) out.push_back('.');
    out += segment.name;
  }
  return out;
}

std::string to_string(const Selection& selection) {
  std::string out;
  for (const auto& entry : selection.entries()) {
    if (!out.empty()) out.push_back(',');
    out += entry.name;
    if (!entry.selection.empty()) {
      out.push_back('(');
      out += to_string(entry.selection);
      out.push_back(')');
    }
  }
  if (selection.has_wildcard()) {
    if (!out.empty()) out.push_back(',');
    out.push_back('*');
  }
  return out;
}

}  // namespace partialjson
