// Core/Log.hpp
#pragma once
#include <fmt/core.h>
#include <cstdio>
#include <string>

inline void LogDebugString(const std::string& s) {
    std::fputs(s.c_str(), stderr);
    std::fputc('\n', stderr);
}

#if defined(SERIAL_LINK_DEBUG)
#define LOGF(...) do { fmt::print(__VA_ARGS__); fmt::print("\n"); } while(0)
#define LOGD(...) LOGF(__VA_ARGS__)
#else
#define LOGF(...) do { auto _s = fmt::format(__VA_ARGS__); LogDebugString(_s); } while(0)
#define LOGD(...) do { } while(0)
#endif
