#pragma once
#include <cstdarg>

namespace sandbox
{
	/* printf-style diagnostics to stderr, one line per call */
	extern void logf(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
	extern void vlogf(const char* fmt, va_list args);
}
