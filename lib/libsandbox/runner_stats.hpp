#pragma once
#include <atomic>
#include <cstdint>

namespace sandbox {

struct EnvironmentStats
{
	std::atomic<uint64_t> instantiations  {0};
	std::atomic<uint64_t> init_failures   {0};
	std::atomic<uint64_t> guest_faults    {0};
	std::atomic<uint64_t> loops_completed {0};

	/* Thread CPU time spent inside the guest message loop */
	std::atomic<double> run_cpu_time {0};
};

struct RunnerStats
{
	std::atomic<uint64_t> runs     {0};
	std::atomic<uint64_t> rejected {0};
	std::atomic<uint64_t> failed   {0};
};

} // sandbox
