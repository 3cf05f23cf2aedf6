// Fuzz target for the edit pipeline: decodes the input into a sequence of
// edits from two authors with arbitrary base versions and checks that
// every accepted edit gets the next version and stays inside the document.

#include <coedit-cpp/engine.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

struct Reader {
    const uint8_t* data;
    size_t size;

    auto byte() -> uint8_t {
        if (size == 0) return 0;
        --size;
        return *data++;
    }
};

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ce = coedit_cpp;

    auto engine = ce::CollaborationEngine{
        std::make_shared<ce::SequentialIdGenerator>(),
        ce::EngineOptions{.log_capacity = 16, .log_retain = 8,
                          .delivery_threads = 0, .log_level = "off"}};
    const auto session = engine.create_session("doc", ce::User{.id = "a"}, std::nullopt,
                                               "seed text");
    (void)engine.join_session(session.id, ce::User{.id = "b"});

    auto in = Reader{data, size};
    auto expected_version = std::uint64_t{0};
    while (in.size >= 4) {
        const auto op = in.byte();
        const auto author = (op & 0x80) ? std::string{"b"} : std::string{"a"};
        const auto position = static_cast<std::size_t>(in.byte());
        const auto length = static_cast<std::size_t>(in.byte() % 16);
        const auto lag = static_cast<std::uint64_t>(in.byte() % 24);
        const auto base = expected_version + 1 > lag ? expected_version + 1 - lag : 0;
        const auto content = std::string(static_cast<std::size_t>(op % 5), 'z');

        auto edit = ce::Edit{};
        switch (op % 3) {
            case 0: edit = ce::make_insert(position, content, author, base); break;
            case 1: edit = ce::make_delete(position, length, author, base); break;
            default: edit = ce::make_replace(position, length, content, author, base); break;
        }

        const auto before = engine.get_document(session.id)->content.size();
        auto applied = engine.apply_edit(session.id, edit);
        if (!applied) continue;

        if (applied->version != ++expected_version) std::abort();
        if (applied->position > before) std::abort();
        if (applied->position + applied->removed_length() > before) std::abort();
        const auto after = engine.get_document(session.id)->content.size();
        if (after != before - applied->removed_length() + applied->inserted_length()) std::abort();
    }

    return 0;
}
