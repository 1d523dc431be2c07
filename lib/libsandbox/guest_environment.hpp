#pragma once
#include "runner_stats.hpp"
#include <memory>
#include <optional>
#include <string>
#include <wasmtime.hh>

namespace sandbox
{
	class CapabilityBridge;
	struct GuestInstance;
	struct RunnerConfig;

	/**
	 * A compiled guest module linked against the host imports. The guest
	 * itself is created lazily by instantiate(), and each attempt gets a
	 * fresh store so that a failed attempt leaves nothing behind.
	**/
	class GuestEnvironment
	{
	public:
		/* Create and initialise the guest, unless it already exists.
		   Failures are logged and retained, never thrown. */
		void instantiate();
		/* Run the guest message loop to completion. Throws NotStarted
		   without a guest, and GuestFault when the loop fails. */
		void run_loop();

		bool is_instantiated() const noexcept { return m_guest != nullptr; }
		/* The reason the most recent instantiation attempt failed */
		const std::string& last_error() const noexcept { return m_last_error; }

		const EnvironmentStats& stats() const noexcept { return m_stats; }

		GuestEnvironment(wasmtime::Engine&, wasmtime::Module, CapabilityBridge&,
			const RunnerConfig&);
		~GuestEnvironment();
	private:
		std::unique_ptr<GuestInstance> create_instance();
		void initialize(GuestInstance&);
		void failed(std::string reason);

		wasmtime::Engine& m_engine;
		wasmtime::Module  m_module;
		wasmtime::Linker  m_linker;
		const RunnerConfig& m_config;

		std::unique_ptr<GuestInstance> m_guest;
		std::string m_last_error;
		EnvironmentStats m_stats;
	};

} // sandbox
