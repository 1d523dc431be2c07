/**
 * @file wasm_runner.cpp
 * @brief Lifecycle of a single sandboxed guest.
 * @version 0.1
 *
 * Construction compiles the guest (or loads its cached artifact) and
 * links it against the host imports. Every configuration problem is
 * raised from here. The guest itself is created on the first run, and
 * re-created on later runs for as long as creating it fails.
 *
**/
#include "wasm_runner.hpp"

#include "common_defs.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>

namespace sandbox
{
	static RunnerConfig validated(RunnerConfig config)
	{
		config.validation();
		return config;
	}

	static std::unique_ptr<Capabilities> required(std::unique_ptr<Capabilities> caps)
	{
		if (UNLIKELY(caps == nullptr))
			throw ConfigurationError("WasmRunner requires capabilities");
		return caps;
	}

	wasmtime::Engine WasmRunner::create_engine(const RunnerConfig& config)
	{
		wasmtime::Config engine_config;
		engine_config.debug_info(config.debug_info);
		engine_config.max_wasm_stack(config.max_wasm_stack);
		return wasmtime::Engine(std::move(engine_config));
	}

	WasmRunner::WasmRunner(RunnerConfig config, std::unique_ptr<Capabilities> caps)
		: m_config(validated(std::move(config))),
		  m_caps(required(std::move(caps))),
		  m_bridge(*m_caps),
		  m_engine(create_engine(m_config)),
		  m_cache(m_engine, m_config.runner_logging),
		  m_guard(m_engine,
			m_cache.resolve(m_config.guest_path, m_config.cache_path, m_config.force_recompile),
			m_bridge, m_config),
		  m_queue(m_config.worker_nice)
	{
		if (m_config.runner_logging)
			logf("WasmRunner: new()");
		if (m_config.inherit_stdio)
			logf("WasmRunner: Debug enabled; inheriting WASM stdio to host");
	}

	WasmRunner::~WasmRunner()
	{
		if (m_config.runner_logging)
			logf("WasmRunner: drop()");
		// The worker is joined below, which waits for the guest to return
		if (is_running()) {
			logf("WasmRunner: %s: dropped while run_msg_loop is in progress, "
				"waiting for the guest to finish", m_config.id_name.c_str());
		}
	}

	std::future<void> WasmRunner::run()
	{
		auto borrow = m_guard.try_acquire();
		if (!borrow.has_value()) {
			m_stats.rejected++;
			if (m_config.runner_logging)
				logf("WasmRunner: run_msg_loop already running");
			throw AlreadyRunning();
		}
		m_stats.runs++;

		return m_queue.enqueue(
		[this, env = std::move(*borrow)] () mutable {
			// Release the guard before the future becomes ready
			auto held = std::move(env);
			try {
				held->instantiate();
				held->run_loop();
			} catch (const std::exception&) {
				m_stats.failed++;
				throw;
			}
		});
	}

	void WasmRunner::close()
	{
		if (m_config.runner_logging)
			logf("WasmRunner: close()");
	}

	nlohmann::json WasmRunner::stats_json() const
	{
		const auto& env = environment_stats();
		const auto& caps = capability_stats();
		const auto& cache = cache_stats();

		return nlohmann::json::object({
			{"id", m_config.id_name},
			{"running", is_running()},
			{"runs",     m_stats.runs.load()},
			{"rejected", m_stats.rejected.load()},
			{"failed",   m_stats.failed.load()},
			{"guest", {
				{"instantiations",  env.instantiations.load()},
				{"init_failures",   env.init_failures.load()},
				{"guest_faults",    env.guest_faults.load()},
				{"loops_completed", env.loops_completed.load()},
				{"run_cpu_time",    env.run_cpu_time.load()},
			}},
			{"capabilities", {
				{"sends",          caps.sends.load()},
				{"bytes_sent",     caps.bytes_sent.load()},
				{"receives",       caps.receives.load()},
				{"bytes_received", caps.bytes_received.load()},
				{"ready_polls",    caps.ready_polls.load()},
				{"log_writes",     caps.log_writes.load()},
				{"failures",       caps.failures.load()},
			}},
			{"cache", {
				{"compiles",       cache.compiles.load()},
				{"loads",          cache.loads.load()},
				{"load_failures",  cache.load_failures.load()},
				{"write_failures", cache.write_failures.load()},
			}},
		});
	}

} // sandbox
