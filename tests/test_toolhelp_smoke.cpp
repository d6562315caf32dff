#include "minitest.hpp"
#include "Core/Process/ToolhelpSnapshot.hpp"
#include <Windows.h>

// Snapshot reale del sistema (solo Windows)

TEST(toolhelp_snapshot_not_empty) {
    const auto procs = FindProcess::EnumerateProcesses();
    ASSERT_TRUE(procs.size() > 1);
}

TEST(toolhelp_finds_current_process_round_trip) {
    const auto self = (uint32_t)GetCurrentProcessId();
    const auto byId = FindProcess::ByID(self);
    ASSERT_TRUE(byId.found);
    ASSERT_EQ(byId.subjectId, self);
    ASSERT_FALSE(byId.subjectName.empty());

    const auto byName = FindProcess::ByName(byId.subjectName);
    ASSERT_TRUE(byName.found);
    ASSERT_EQ(byName.subjectName, byId.subjectName);
}

TEST(toolhelp_unknown_name_not_found) {
    const auto r = FindProcess::ByName("findprocess-no-such-process-7f3a.exe");
    ASSERT_FALSE(r.found);
    ASSERT_EQ(r.subjectId, 0u);
}
