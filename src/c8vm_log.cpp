#include "c8vm_log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace c8vm::log {

namespace {

std::atomic<bool> g_trace_enabled{false};

void vprint(const char* prefix, const char* fmt, va_list argptr)
{
    fprintf(stderr, "%s", prefix);
    vfprintf(stderr, fmt, argptr);
    fprintf(stderr, "\n");
}

} // namespace

void set_trace_enabled(bool enabled) { g_trace_enabled = enabled; }

bool trace_enabled(void) { return g_trace_enabled; }

void info(const char* fmt, ...)
{
    va_list argptr;
    va_start(argptr, fmt);
    vprint("[c8vm] ", fmt, argptr);
    va_end(argptr);
}

void warn(const char* fmt, ...)
{
    va_list argptr;
    va_start(argptr, fmt);
    vprint("[c8vm] warning: ", fmt, argptr);
    va_end(argptr);
}

void error(const char* fmt, ...)
{
    va_list argptr;
    va_start(argptr, fmt);
    vprint("[c8vm] error: ", fmt, argptr);
    va_end(argptr);
}

void trace(const char* fmt, ...)
{
    if (!g_trace_enabled) return;

    va_list argptr;
    va_start(argptr, fmt);
    vprint("[c8vm] ", fmt, argptr);
    va_end(argptr);
}

} // namespace c8vm::log
