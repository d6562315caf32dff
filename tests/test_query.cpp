#include "minitest.hpp"
#include "ScriptedSnapshot.hpp"
#include "Core/Process/ProcessQuery.hpp"
#include "Core/Process/SnapshotError.hpp"

using namespace FindProcess;

static ScriptedSnapshot scenarioTable() {
    ScriptedSnapshot s;
    s.add(4, u"svchost.exe");
    s.add(812, u"Notepad.EXE");
    return s;
}

TEST(by_name_found_echoes_input) {
    auto s = scenarioTable();
    const auto api = s.api();
    const auto r = ByName("notepad.exe", api);
    ASSERT_EQ(r.subjectName, std::string("notepad.exe"));
    ASSERT_EQ(r.subjectId, 812u);
    ASSERT_TRUE(r.found);
    ASSERT_EQ(s.closes, 1);
}

TEST(by_id_not_found_defaults_name) {
    auto s = scenarioTable();
    const auto api = s.api();
    const auto r = ByID(9999, api);
    ASSERT_EQ(r.subjectName, std::string());
    ASSERT_EQ(r.subjectId, 9999u);
    ASSERT_FALSE(r.found);
}

TEST(by_id_found_returns_exe_name) {
    auto s = scenarioTable();
    const auto api = s.api();
    const auto r = ByID(4, api);
    ASSERT_EQ(r.subjectName, std::string("svchost.exe"));
    ASSERT_EQ(r.subjectId, 4u);
    ASSERT_TRUE(r.found);
}

TEST(by_name_not_found_defaults_id) {
    auto s = scenarioTable();
    const auto api = s.api();
    const auto r = ByName("Ghost.exe", api);
    ASSERT_EQ(r.subjectName, std::string("Ghost.exe"));
    ASSERT_EQ(r.subjectId, 0u);
    ASSERT_FALSE(r.found);
}

TEST(query_on_empty_snapshot_throws) {
    ScriptedSnapshot s;
    const auto api = s.api();
    ASSERT_THROWS((void)ByName("notepad.exe", api), SnapshotError);
    ASSERT_THROWS((void)ByID(4, api), SnapshotError);
    ASSERT_EQ(s.closes, 2);
}

TEST(query_propagates_open_failure_code) {
    ScriptedSnapshot s;
    s.openOk = false;
    s.openErr = 5;
    const auto api = s.api();
    try {
        (void)ByID(4, api);
        throw minitest::AssertionError("expected SnapshotError");
    }
    catch (const SnapshotError& e) {
        ASSERT_TRUE(e.stage() == SnapshotStage::Open);
        ASSERT_EQ(e.code().value(), 5);
    }
}

TEST(by_name_duplicate_names_first_wins) {
    ScriptedSnapshot s;
    s.add(10, u"agent.exe");
    s.add(20, u"agent.exe");
    const auto r = ByName("agent.exe", s.api());
    ASSERT_TRUE(r.found);
    ASSERT_EQ(r.subjectId, 10u);
}

TEST(absence_is_stable_across_calls) {
    auto s = scenarioTable();
    const auto api = s.api();
    for (int i = 0; i < 2; ++i) {
        const auto a = ByName("missing.exe", api);
        ASSERT_FALSE(a.found);
        ASSERT_EQ(a.subjectId, 0u);
        const auto b = ByID(31337, api);
        ASSERT_FALSE(b.found);
        ASSERT_EQ(b.subjectName, std::string());
    }
    ASSERT_EQ(s.opens, 4);
    ASSERT_EQ(s.closes, 4);
}

TEST(by_id_then_by_name_round_trip) {
    auto s = scenarioTable();
    const auto api = s.api();
    const auto byId = ByID(812, api);
    ASSERT_TRUE(byId.found);
    const auto byName = ByName(byId.subjectName, api);
    ASSERT_TRUE(byName.found);
    ASSERT_EQ(byName.subjectId, 812u);
}

TEST(query_sees_table_changes_between_calls) {
    auto s = scenarioTable();
    const auto api = s.api();
    ASSERT_FALSE(ByName("late.exe", api).found);
    s.add(4242, u"late.exe");
    const auto r = ByName("late.exe", api);
    ASSERT_TRUE(r.found);
    ASSERT_EQ(r.subjectId, 4242u);
}

TEST(by_name_non_ascii_name_found) {
    ScriptedSnapshot s;
    s.add(4, u"svchost.exe");
    s.add(812, u"\u00C4rger.EXE");
    const auto api = s.api();

    const auto r = ByName("\xC3\xA4rger.exe", api);
    ASSERT_TRUE(r.found);
    ASSERT_EQ(r.subjectId, 812u);
    ASSERT_EQ(r.subjectName, std::string("\xC3\xA4rger.exe"));   // input verbatim

    const auto back = ByID(812, api);
    ASSERT_EQ(back.subjectName, std::string("\xC3\x84rger.EXE"));
}
