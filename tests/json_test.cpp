#include <coedit-cpp/json.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace coedit_cpp;
using json = nlohmann::json;

// -- Enums --------------------------------------------------------------------

TEST(Json, edit_kind_uses_wire_names) {
    EXPECT_EQ(json(EditKind::del), "delete");
    EXPECT_EQ(json("replace").get<EditKind>(), EditKind::replace);
    EXPECT_THROW(json("erase").get<EditKind>(), std::runtime_error);
}

TEST(Json, event_type_uses_wire_names) {
    EXPECT_EQ(json(EventType::cursor_moved), "cursor");
    EXPECT_EQ(json(EventType::edit_applied), "edit");
    EXPECT_EQ(json("chat").get<EventType>(), EventType::chat_message);
}

TEST(Json, error_kind_round_trips_by_name) {
    EXPECT_EQ(json(ErrorKind::read_only_violation), "read_only_violation");
    EXPECT_EQ(json("session_full").get<ErrorKind>(), ErrorKind::session_full);
}

// -- Users and sessions -------------------------------------------------------

TEST(Json, user_uses_camel_case_keys) {
    const auto user = User{
        .id = "u1",
        .display_name = "Alice",
        .email = "alice@example.com",
        .avatar = "a.png",
        .color = "#FF6B6B",
        .cursor = CursorPosition{3, 4},
    };
    const auto j = json(user);

    EXPECT_EQ(j["id"], "u1");
    EXPECT_EQ(j["name"], "Alice");
    EXPECT_EQ(j["avatar"], "a.png");
    EXPECT_EQ(j["cursor"]["x"], 3);
    EXPECT_FALSE(j.contains("selection"));
}

TEST(Json, user_decodes_optional_fields) {
    const auto user = json::parse(R"({"id":"u1","name":"Alice"})").get<User>();
    EXPECT_EQ(user.id, "u1");
    EXPECT_EQ(user.display_name, "Alice");
    EXPECT_TRUE(user.email.empty());
    EXPECT_FALSE(user.avatar.has_value());
}

TEST(Json, selection_rejects_end_before_start) {
    EXPECT_THROW(json::parse(R"({"start":5,"end":2})").get<SelectionRange>(),
                 std::runtime_error);
    EXPECT_THROW(json::parse(R"({"start":-1,"end":2})").get<SelectionRange>(),
                 std::runtime_error);
}

TEST(Json, session_settings_max_members_is_at_least_one) {
    const auto s = json::parse(R"({"maxMembers":0})").get<SessionSettings>();
    EXPECT_EQ(s.max_members, 1u);

    const auto o = json::parse(R"({"default_settings":{"max_members":0}})").get<EngineOptions>();
    EXPECT_EQ(o.default_settings.max_members, 1u);
}

TEST(Json, session_settings_defaults_for_missing_keys) {
    const auto s = json::parse(R"({"maxMembers":3})").get<SessionSettings>();
    EXPECT_EQ(s.max_members, 3u);
    EXPECT_TRUE(s.allow_guests);
    EXPECT_FALSE(s.read_only);
}

TEST(Json, session_lists_members_as_array) {
    auto session = Session{.id = "s1", .document_id = "d1", .owner_id = "a"};
    session.members.emplace("a", User{.id = "a", .display_name = "A"});
    session.members.emplace("b", User{.id = "b", .display_name = "B"});

    const auto j = json(session);
    EXPECT_EQ(j["documentId"], "d1");
    EXPECT_EQ(j["owner"], "a");
    ASSERT_TRUE(j["members"].is_array());
    EXPECT_EQ(j["members"].size(), 2u);
    EXPECT_EQ(j["settings"]["maxMembers"], 10);
}

// -- Edits --------------------------------------------------------------------

TEST(Json, insert_omits_length_and_delete_omits_content) {
    const auto ins = json(make_insert(2, "ab", "u1", 4));
    EXPECT_EQ(ins["operation"], "insert");
    EXPECT_EQ(ins["content"], "ab");
    EXPECT_EQ(ins["baseVersion"], 4);
    EXPECT_FALSE(ins.contains("length"));

    const auto del = json(make_delete(2, 3, "u1"));
    EXPECT_EQ(del["operation"], "delete");
    EXPECT_EQ(del["length"], 3);
    EXPECT_FALSE(del.contains("content"));
}

TEST(Json, edit_version_is_last_seen_version_without_base_version) {
    const auto e = json::parse(
        R"({"operation":"insert","position":1,"content":"x","version":7})").get<Edit>();
    EXPECT_EQ(e.base_version, 8u);
    EXPECT_EQ(e.version, 0u);
}

TEST(Json, edit_base_version_takes_precedence) {
    const auto e = json::parse(
        R"({"operation":"delete","position":1,"length":2,"baseVersion":3,"version":9})").get<Edit>();
    EXPECT_EQ(e.kind, EditKind::del);
    EXPECT_EQ(e.base_version, 3u);
    EXPECT_EQ(e.length, 2u);
}

TEST(Json, edit_without_any_version_has_base_one) {
    const auto e = json::parse(R"({"operation":"insert","position":0,"content":"x"})").get<Edit>();
    EXPECT_EQ(e.base_version, 1u);
}

TEST(Json, edit_rejects_negative_position) {
    EXPECT_THROW(json::parse(R"({"operation":"insert","position":-1,"content":"x"})").get<Edit>(),
                 std::runtime_error);
}

// -- Events -------------------------------------------------------------------

TEST(Json, event_envelope) {
    const auto event = SessionEvent{
        .type = EventType::cursor_moved,
        .author_id = "u1",
        .session_id = "s1",
        .payload = CursorPosition{1, 2},
        .timestamp = from_millis(1700000000123),
    };
    const auto j = json(event);

    EXPECT_EQ(j["type"], "cursor");
    EXPECT_EQ(j["userId"], "u1");
    EXPECT_EQ(j["sessionId"], "s1");
    EXPECT_EQ(j["timestamp"], 1700000000123);
    EXPECT_EQ(j["data"]["cursor"]["y"], 2);
}

TEST(Json, chat_event_payload) {
    const auto event = SessionEvent{
        .type = EventType::chat_message,
        .author_id = "u1",
        .session_id = "s1",
        .payload = ChatMessage{.id = "m1", .author_id = "u1", .author_name = "Alice", .text = "hi"},
    };
    const auto data = json(event)["data"];
    EXPECT_EQ(data["message"], "hi");
    EXPECT_EQ(data["userName"], "Alice");
    EXPECT_FALSE(data.contains("userAvatar"));
}

TEST(Json, error_event_payload) {
    const auto event = SessionEvent{
        .type = EventType::error,
        .author_id = "u1",
        .session_id = "s1",
        .payload = ErrorNotice{ErrorKind::session_full, "full"},
    };
    const auto data = json(event)["data"];
    EXPECT_EQ(data["kind"], "session_full");
    EXPECT_EQ(data["message"], "full");
}

TEST(Json, millis_conversion) {
    EXPECT_EQ(to_millis(from_millis(42)), 42);
}

// -- Options ------------------------------------------------------------------

TEST(Json, options_missing_keys_keep_defaults) {
    const auto o = json::parse(R"({"log_capacity":200})").get<EngineOptions>();
    EXPECT_EQ(o.log_capacity, 200u);
    EXPECT_EQ(o.log_retain, OperationLog::default_retain);
    EXPECT_EQ(o.delivery_threads, 1u);
    EXPECT_EQ(o.log_level, "info");
}

TEST(Json, options_round_trip) {
    auto o = EngineOptions{};
    o.default_settings.max_members = 4;
    o.default_settings.allow_guests = false;
    o.default_settings.authorized_users = {"bob"};
    o.delivery_threads = 3;
    o.palette = {"red"};
    o.log_level = "debug";

    EXPECT_EQ(json(o).get<EngineOptions>(), o);
}

TEST(Json, load_options_from_file) {
    const auto path = std::filesystem::temp_directory_path() / "coedit_options_test.json";
    {
        auto out = std::ofstream{path};
        out << R"({"default_settings":{"max_members":2,"read_only":true},"log_level":"warn"})";
    }

    auto o = load_options(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(o.has_value());
    EXPECT_EQ(o->default_settings.max_members, 2u);
    EXPECT_TRUE(o->default_settings.read_only);
    EXPECT_EQ(o->log_level, "warn");
}

TEST(Json, load_options_missing_file) {
    auto o = load_options("/nonexistent/coedit/options.json");
    ASSERT_FALSE(o.has_value());
    EXPECT_EQ(o.error().kind, ErrorKind::invalid_message);
}

TEST(Json, load_options_rejects_bad_values) {
    const auto path = std::filesystem::temp_directory_path() / "coedit_options_bad.json";
    {
        auto out = std::ofstream{path};
        out << R"({"log_capacity":"lots"})";
    }

    auto o = load_options(path);
    std::filesystem::remove(path);

    ASSERT_FALSE(o.has_value());
    EXPECT_EQ(o.error().kind, ErrorKind::invalid_message);
}
