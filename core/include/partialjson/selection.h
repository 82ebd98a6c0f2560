#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace partialjson {

struct SelectionEntry;

/// Parsed field selector tree; one node per nesting level of the selector.
/// MUST keep each field name at most once per node and MUST treat an empty node
/// (no entries, no wildcard) as "select everything".
/// Inputs are parser output; the tree is not mutated once parsing completes.
class Selection {
 public:
  /// True when the node places no restriction on its subtree.
  bool empty() const;
  bool has_wildcard() const { return has_wildcard_; }
  const std::vector<SelectionEntry>& entries() const { return entries_; }

  /// Looks up a field by its exact (case-preserved) name.
  /// MUST be O(1) amortized and MUST return nullptr for unknown names.
  /// Inputs are field names; outputs are child nodes owned by this node.
  const Selection* find(const std::string& name) const;
  /// Looks up entry positions whose ASCII-lowercased name equals folded_name.
  /// MUST NOT alter stored names; several entries may fold to the same key.
  /// Inputs are already-lowercased names; outputs are indexes into entries().
  const std::vector<size_t>* find_folded(const std::string& folded_name) const;

  /// Adds a field with its sub-selection, merging with an existing entry of the same name.
  /// MUST union the two sub-selections rather than replace either of them.
  /// Inputs are name/sub-selection; side effects are changes to this node only.
  void add(const std::string& name, Selection sub);
  void set_wildcard() { has_wildcard_ = true; }
  /// Unions another tree into this one, field by field, OR-ing wildcard flags.
  /// MUST keep "select everything" absorbing: either side empty yields empty.
  /// Inputs are another tree; side effects are changes to this tree only.
  void merge(const Selection& other);

  /// Structural equality; entry order does not matter.
  bool operator==(const Selection& other) const;
  bool operator!=(const Selection& other) const { return !(*this == other); }

 private:
  void clear();

  std::vector<SelectionEntry> entries_;
  std::unordered_map<std::string, size_t> index_;
  std::unordered_map<std::string, std::vector<size_t>> folded_index_;
  bool has_wildcard_ = false;
};

struct SelectionEntry {
  std::string name;
  Selection selection;
};

/// One step of a candidate property path produced by a serializer walk.
/// Array elements carry their index for diagnostics only; matching skips them.
struct PathSegment {
  enum class Kind { Property, ArrayElement };
  Kind kind = Kind::Property;
  std::string name;
  size_t index = 0;

  static PathSegment property(std::string name);
  static PathSegment element(size_t index);
  bool is_element() const { return kind == Kind::ArrayElement; }
};

using Path = std::vector<PathSegment>;

/// Builds a property-only path from field names.
Path make_path(const std::vector<std::string>& names);
/// Renders a path as `items[0].title` for diagnostics.
std::string path_to_string(const Path& path);

/// Decides whether a property path is selected by the tree.
/// MUST be total, side-effect free and safe for concurrent calls on one tree.
/// Inputs are tree/path/case flag; outputs are the include decision.
bool matches(const Selection& selection, const Path& path, bool case_insensitive);
/// Decides whether anything at or below path is selected, for container emission.
/// MUST agree with matches() on every non-empty path and MUST accept the empty path
/// whenever the tree selects anything at all.
/// Inputs are tree/path/case flag; outputs are the descend decision.
bool has_selected_descendant(const Selection& selection, const Path& path, bool case_insensitive);

/// Renders the tree back to a canonical selector, e.g. `kind,items(id,title),*`.
/// MUST preserve original field casing and first-seen entry order.
/// Inputs are trees; outputs are selector strings that reparse to an equal tree.
std::string to_string(const Selection& selection);

}  // namespace partialjson
