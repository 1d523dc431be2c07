#include "log.hpp"

#include "settings.hpp"
#include <cstdio>
#include <mutex>

namespace sandbox
{
	static std::mutex log_mtx;

	void vlogf(const char* fmt, va_list args)
	{
		char buffer[LOG_BUFFER_SIZE];
		int len = vsnprintf(buffer, sizeof(buffer), fmt, args);
		if (len < 0)
			return;
		if (len >= (int)sizeof(buffer))
			len = sizeof(buffer) - 1;

		std::lock_guard<std::mutex> lock(log_mtx);
		fwrite(buffer, 1, len, stderr);
		if (len == 0 || buffer[len-1] != '\n')
			fputc('\n', stderr);
		fflush(stderr);
	}

	void logf(const char* fmt, ...)
	{
		va_list va;
		va_start(va, fmt);
		vlogf(fmt, va);
		va_end(va);
	}
} // sandbox
