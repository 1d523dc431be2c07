#pragma once
#include <cstdint>
#include <time.h>

namespace sandbox
{
	template <clockid_t CLK = CLOCK_THREAD_CPUTIME_ID>
	struct ScopedDuration {
		ScopedDuration(double& dest_counter)
			: m_counter(dest_counter), t0(now())  {}
		~ScopedDuration() {
			m_counter += now() - t0;
		}

		static inline double now() noexcept {
			struct timespec ts;

			clock_gettime(CLK, &ts);
			return (ts.tv_sec + 1e-9 * ts.tv_nsec);
		}

	private:
		double& m_counter;
		const double t0;
	};
} // sandbox
