#include <coedit-cpp/transform.hpp>

#include <algorithm>

namespace coedit_cpp {

namespace {

auto transform_insert(Edit incoming, const Edit& applied) -> Edit {
    if (applied.kind == EditKind::insert) {
        if (incoming.position < applied.position) return incoming;
        if (incoming.position > applied.position ||
            !(incoming.author_id < applied.author_id)) {
            incoming.position += applied.content.size();
        }
        return incoming;
    }

    // applied is a delete
    const auto del_end = applied.position + applied.length;
    if (incoming.position <= applied.position) return incoming;
    if (incoming.position > del_end) {
        incoming.position -= applied.length;
    } else {
        incoming.position = applied.position;
    }
    return incoming;
}

// Covers both del and replace: the incoming edit removes
// [position, position + length).
auto transform_removal(Edit incoming, const Edit& applied) -> Edit {
    if (applied.kind == EditKind::insert) {
        if (incoming.position >= applied.position) {
            incoming.position += applied.content.size();
        }
        return incoming;
    }

    const auto a_begin = incoming.position;
    const auto a_end = incoming.position + incoming.length;
    const auto b_begin = applied.position;
    const auto b_end = applied.position + applied.length;

    const auto lo = std::max(a_begin, b_begin);
    const auto hi = std::min(a_end, b_end);
    const auto overlap = hi > lo ? hi - lo : std::size_t{0};

    if (incoming.position > applied.position) {
        incoming.position -= std::min(applied.length, incoming.position - applied.position);
    }
    incoming.length -= overlap;
    return incoming;
}

}  // anonymous namespace

auto transform(const Edit& incoming, const Edit& applied) -> Edit {
    if (applied.kind == EditKind::replace) {
        auto removed = applied;
        removed.kind = EditKind::del;
        removed.content.clear();
        auto inserted = applied;
        inserted.kind = EditKind::insert;
        inserted.length = 0;
        return transform(transform(incoming, removed), inserted);
    }

    switch (incoming.kind) {
        case EditKind::insert:
            return transform_insert(incoming, applied);
        case EditKind::del:
        case EditKind::replace:
            return transform_removal(incoming, applied);
    }
    return incoming;
}

auto transform_against(Edit incoming, std::span<const Edit> applied) -> Edit {
    for (const auto& prior : applied) {
        incoming = transform(incoming, prior);
    }
    return incoming;
}

}  // namespace coedit_cpp
