#pragma once

namespace c8vm::log {

// trace() is a no-op unless tracing was switched on (see --trace)
void set_trace_enabled(bool enabled);
bool trace_enabled(void);

void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
void trace(const char* fmt, ...);

} // namespace c8vm::log
