#pragma once
#include "artifact_cache.hpp"
#include "capability_bridge.hpp"
#include "execution_guard.hpp"
#include "guest_environment.hpp"
#include "runner_config.hpp"
#include "runner_stats.hpp"
#include "utils/task_queue.hpp"
#include <nlohmann/json_fwd.hpp>

namespace sandbox
{
	/**
	 * Owns one guest and drives its message loop. At most one run is in
	 * flight at any time, and a run attempted while another is active is
	 * rejected immediately with AlreadyRunning.
	 *
	 * The guest executes on a dedicated worker thread owned by the runner.
	 * run() returns a future that completes when the message loop ends,
	 * carrying NotStarted or GuestFault on failure. Destroying the runner
	 * waits for an in-flight run (logging a warning), so its capabilities must eventually
	 * complete every future they hand out.
	**/
	class WasmRunner
	{
	public:
		std::future<void> run();
		bool is_running() const noexcept { return m_guard.is_held(); }
		/* Diagnostic only. Does not cancel a run or release the guest. */
		void close();

		const RunnerConfig& config() const noexcept { return m_config; }
		const RunnerStats& stats() const noexcept { return m_stats; }
		const CacheStats& cache_stats() const noexcept { return m_cache.stats(); }
		const CapabilityStats& capability_stats() const noexcept { return m_bridge.stats(); }
		const EnvironmentStats& environment_stats() const noexcept { return m_guard.peek().stats(); }

		nlohmann::json stats_json() const;

		WasmRunner(RunnerConfig config, std::unique_ptr<Capabilities> caps);
		~WasmRunner();
		WasmRunner(const WasmRunner&) = delete;
		WasmRunner& operator=(const WasmRunner&) = delete;

	private:
		static wasmtime::Engine create_engine(const RunnerConfig&);

		const RunnerConfig m_config;
		std::unique_ptr<Capabilities> m_caps;
		CapabilityBridge  m_bridge;
		wasmtime::Engine  m_engine;
		ArtifactCache     m_cache;
		ExecutionGuard<GuestEnvironment> m_guard;
		RunnerStats       m_stats;
		/* Destroyed first, joining any run still in flight */
		TaskQueue         m_queue;
	};

} // sandbox
