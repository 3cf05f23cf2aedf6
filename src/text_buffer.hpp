#pragma once

// Internal header — not installed. Authoritative document content for a
// session, mutated only by accepted edits.

#include <coedit-cpp/edit.hpp>

#include <algorithm>
#include <cstddef>
#include <string>

namespace coedit_cpp::detail {

// Clamp an edit to a document of `size` bytes so it can be applied
// verbatim: the position lands inside the document and a removal never
// reaches past its end.
inline auto clamp_to_document(Edit edit, std::size_t size) -> Edit {
    edit.position = std::min(edit.position, size);
    if (edit.kind != EditKind::insert) {
        edit.length = std::min(edit.length, size - edit.position);
    }
    return edit;
}

struct TextBuffer {
    std::string content;

    // `edit` must already be clamped to this buffer.
    void apply(const Edit& edit) {
        switch (edit.kind) {
            case EditKind::insert:
                content.insert(edit.position, edit.content);
                break;
            case EditKind::del:
                content.erase(edit.position, edit.length);
                break;
            case EditKind::replace:
                content.replace(edit.position, edit.length, edit.content);
                break;
        }
    }

    auto size() const -> std::size_t { return content.size(); }
};

}  // namespace coedit_cpp::detail
