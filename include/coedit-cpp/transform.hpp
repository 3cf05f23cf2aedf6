/// @file transform.hpp
/// @brief Operational transform for single-authority text editing.

#pragma once

#include <coedit-cpp/edit.hpp>

#include <span>

namespace coedit_cpp {

/// Rewrite `incoming` so that it applies after `applied` has already
/// been applied to the document.
///
/// Position rules by (incoming, applied) kind:
/// - insert/insert: earlier positions are unchanged, later ones shift
///   right by the applied content. Equal positions are ordered by
///   author_id; the lexicographically smaller author keeps its position.
/// - insert/del: positions inside the deleted range collapse to its
///   start, positions past it shift left.
/// - del/insert: a delete starting at or after the insert shifts right.
/// - del/del: positions past the applied delete shift left, and the
///   length drops by the overlap so nothing is deleted twice. A delete
///   fully covered by the applied one becomes a no-op (length 0).
///
/// A replace behaves as a delete when incoming. When applied it counts
/// as its delete followed by its insert at the same position.
///
/// This is a one-directional transform run by the session authority;
/// it is not a symmetric transform pair.
auto transform(const Edit& incoming, const Edit& applied) -> Edit;

/// Transform `incoming` against each edit in `applied`, oldest first.
auto transform_against(Edit incoming, std::span<const Edit> applied) -> Edit;

}  // namespace coedit_cpp
