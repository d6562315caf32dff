// utils/Log.hpp
#pragma once
#include <fmt/core.h>
#include <cstdio>
#include <string>
#ifdef _WIN32
#include <windows.h>
#endif

// stdout è riservato all'output JSON: i log vanno altrove
inline void LogDebugString(const std::string& s) {
#ifdef _WIN32
    OutputDebugStringA(s.c_str());
    OutputDebugStringA("\n");
#else
    fmt::print(stderr, "{}\n", s);
#endif
}

#if defined(_DEBUG)
#define LOGF(...) do { fmt::print(stderr, __VA_ARGS__); fmt::print(stderr, "\n"); } while(0)
#else
#define LOGF(...) do { auto _s = fmt::format(__VA_ARGS__); LogDebugString(_s); } while(0)
#endif
