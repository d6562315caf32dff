#include "Core/Process/SnapshotError.hpp"
#include <fmt/core.h>

namespace {
    const char* nativeCallName(FindProcess::SnapshotStage stage) {
        switch (stage) {
        case FindProcess::SnapshotStage::Open:  return "CreateToolhelp32Snapshot";
        case FindProcess::SnapshotStage::First: return "Process32FirstW";
        case FindProcess::SnapshotStage::Next:  return "Process32NextW";
        }
        return "snapshot";
    }
}

FindProcess::SnapshotError::SnapshotError(SnapshotStage stage, unsigned long nativeCode)
    : std::system_error(static_cast<int>(nativeCode), std::system_category(),
                        fmt::format("{} failed", nativeCallName(stage))),
      m_stage(stage) {
}

const char* FindProcess::StageName(SnapshotStage stage) {
    switch (stage) {
    case SnapshotStage::Open:  return "open";
    case SnapshotStage::First: return "first";
    case SnapshotStage::Next:  return "next";
    }
    return "unknown";
}
