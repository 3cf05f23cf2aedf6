// pair_editing: two users edit the same document concurrently
//
// Demonstrates: create/join, sync on join, concurrent inserts at the same
//               position, a delete made against a stale version, leave
//
// Build: cmake --build build
// Run:   ./build/pair_editing

#include <coedit-cpp/coedit.hpp>
#include <coedit-cpp/json.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace ce = coedit_cpp;

static auto printer(const char* name) -> std::shared_ptr<ce::Transport> {
    return std::make_shared<ce::CallbackTransport>(
        [name](const ce::UserId&, const ce::SessionEvent& event) {
            std::printf("  -> %s: %s\n", name, ce::encode_event(event).c_str());
        });
}

int main() {
    // Inline delivery keeps the printed order deterministic
    auto engine = ce::CollaborationEngine{ce::EngineOptions{.delivery_threads = 0}};
    engine.connect("alice", printer("alice"));
    engine.connect("bob", printer("bob"));

    const auto alice = ce::User{.id = "alice", .display_name = "Alice", .email = "alice@example.com"};
    const auto bob = ce::User{.id = "bob", .display_name = "Bob", .email = "bob@example.com"};

    auto session = engine.create_session("notes.md", alice, ce::SessionSettings{.max_members = 2},
                                          "Hello world");
    std::printf("Session %s created by %s\n", session.id.c_str(), session.owner_id.c_str());

    std::printf("\nbob joins:\n");
    if (auto joined = engine.join_session(session.id, bob); !joined) {
        std::printf("join failed: %s\n", joined.error().message.c_str());
        return 1;
    }

    // Both users saw version 0 and insert at the same spot
    std::printf("\nconcurrent inserts at position 5:\n");
    auto a = engine.apply_edit(session.id, ce::make_insert(5, ",", "alice", 1));
    auto b = engine.apply_edit(session.id, ce::make_insert(5, " there", "bob", 1));
    if (!a || !b) return 1;
    std::printf("alice's edit: v%llu at %zu\n",
                static_cast<unsigned long long>(a->version), a->position);
    std::printf("bob's edit:   v%llu at %zu\n",
                static_cast<unsigned long long>(b->version), b->position);

    // bob deletes "world" without having seen either edit yet
    std::printf("\nbob deletes \"world\" against version 0:\n");
    auto d = engine.apply_edit(session.id, ce::make_delete(6, 5, "bob", 1));
    if (!d) return 1;
    std::printf("delete moved from 6 to %zu\n", d->position);

    const auto doc = engine.get_document(session.id);
    std::printf("\nDocument at v%llu: \"%s\"\n",
                static_cast<unsigned long long>(doc->version), doc->content.c_str());

    // A third user is turned away
    auto carol = engine.join_session(session.id, ce::User{.id = "carol"});
    if (!carol) {
        std::printf("carol: %s (%s)\n",
                    std::string{ce::to_string_view(carol.error().kind)}.c_str(),
                    carol.error().message.c_str());
    }

    std::printf("\nalice leaves:\n");
    engine.leave_session(session.id, "alice");
    std::printf("bob leaves\n");
    engine.leave_session(session.id, "bob");
    std::printf("Sessions left: %zu\n", engine.session_count());

    return 0;
}
