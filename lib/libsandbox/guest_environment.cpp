/**
 * @file guest_environment.cpp
 * @brief Instantiation and entry points of the guest.
 * @version 0.1
 *
 * The guest exports init-exec-env and run-msg-loop, both returning a
 * result discriminant (0 is ok). Instantiation and initialisation
 * failures are absorbed here: they are logged, the reason is kept in
 * last_error() and the environment stays empty, so that the next run
 * attempt starts over with a fresh store.
 *
**/
#include "guest_environment.hpp"

#include "capability_bridge.hpp"
#include "common_defs.hpp"
#include "errors.hpp"
#include "guest_memory.hpp"
#include "host_imports.hpp"
#include "log.hpp"
#include "runner_config.hpp"
#include "scoped_duration.hpp"
#include "settings.hpp"

namespace sandbox
{
	struct GuestInstance
	{
		wasmtime::Store store;
		std::optional<wasmtime::Memory> memory;
		std::optional<wasmtime::Func> realloc;
		std::optional<wasmtime::Func> init_env;
		std::optional<wasmtime::Func> msg_loop;

		GuestInstance(wasmtime::Engine& engine) : store(engine) {}
	};

	template <typename T>
	static T guest_export(wasmtime::Instance& instance,
		wasmtime::Store::Context cx, const char* name)
	{
		auto ext = instance.get(cx, name);
		if (UNLIKELY(!ext))
			throw GuestFault(std::string("Guest does not export '") + name + "'");
		auto* item = std::get_if<T>(&*ext);
		if (UNLIKELY(item == nullptr))
			throw GuestFault(std::string("Guest export '") + name + "' has the wrong kind");
		return *item;
	}

	static int32_t result_discriminant(const std::vector<wasmtime::Val>& values,
		const char* name)
	{
		if (UNLIKELY(values.size() != 1 || values[0].kind() != wasmtime::ValKind::I32))
			throw GuestFault(std::string("Guest export '") + name + "' has the wrong signature");
		return values[0].i32();
	}

	GuestEnvironment::GuestEnvironment(wasmtime::Engine& engine, wasmtime::Module module,
		CapabilityBridge& bridge, const RunnerConfig& config)
		: m_engine(engine), m_module(std::move(module)),
		  m_linker(engine), m_config(config)
	{
		auto wasi = m_linker.define_wasi();
		if (UNLIKELY(!wasi))
			throw ConfigurationError("Failed to link WASI: " + wasi.err().message());

		register_host_imports(m_linker, bridge);
	}
	GuestEnvironment::~GuestEnvironment() {}

	std::unique_ptr<GuestInstance> GuestEnvironment::create_instance()
	{
		auto guest = std::make_unique<GuestInstance>(m_engine);
		auto cx = guest->store.context();

		wasmtime::WasiConfig wasi;
		if (m_config.inherit_stdio) {
			wasi.inherit_stdin();
			wasi.inherit_stdout();
			wasi.inherit_stderr();
		}
		auto ws = cx.set_wasi(std::move(wasi));
		if (UNLIKELY(!ws))
			throw GuestFault("Failed to configure WASI: " + ws.err().message());

		auto result = m_linker.instantiate(cx, m_module);
		if (UNLIKELY(!result))
			throw GuestFault(result.err().message());
		wasmtime::Instance instance = result.ok();

		guest->memory   = guest_export<wasmtime::Memory>(instance, cx, EXPORT_MEMORY);
		guest->realloc  = guest_export<wasmtime::Func>(instance, cx, EXPORT_REALLOC);
		guest->init_env = guest_export<wasmtime::Func>(instance, cx, EXPORT_INIT_ENV);
		guest->msg_loop = guest_export<wasmtime::Func>(instance, cx, EXPORT_MSG_LOOP);
		return guest;
	}

	void GuestEnvironment::initialize(GuestInstance& guest)
	{
		auto cx = guest.store.context();
		GuestMemory memory(cx, *guest.memory, *guest.realloc);

		const auto& id = m_config.id_name;
		const uint32_t id_ptr = memory.push(id.data(), id.size());
		int32_t tags_tag = 0, tags_ptr = 0, tags_len = 0;
		if (m_config.log_tags.has_value()) {
			const auto& tags = *m_config.log_tags;
			tags_tag = 1;
			tags_ptr = memory.push(tags.data(), tags.size());
			tags_len = tags.size();
		}

		auto result = guest.init_env->call(cx, {
			int32_t(id_ptr), int32_t(id.size()), tags_tag, tags_ptr, tags_len
		});
		if (UNLIKELY(!result))
			throw GuestFault(result.err().message());
		if (result_discriminant(result.ok(), EXPORT_INIT_ENV) != 0)
			throw GuestFault("guest returned an error");
	}

	void GuestEnvironment::failed(std::string reason)
	{
		m_stats.init_failures++;
		logf("WasmRunner: %s", reason.c_str());
		m_last_error = std::move(reason);
	}

	void GuestEnvironment::instantiate()
	{
		if (m_guest != nullptr)
			return;

		m_stats.instantiations++;
		if (m_config.runner_logging)
			logf("WasmRunner: instantiating");

		std::unique_ptr<GuestInstance> guest;
		try {
			guest = create_instance();
		} catch (const std::exception& e) {
			this->failed(std::string("failed to instantiate: ") + e.what());
			return;
		}

		if (m_config.runner_logging)
			logf("WasmRunner: calling init_exec_env");
		try {
			this->initialize(*guest);
		} catch (const std::exception& e) {
			this->failed(std::string("init_exec_env failed: ") + e.what());
			return;
		}

		m_guest = std::move(guest);
		m_last_error.clear();
	}

	void GuestEnvironment::run_loop()
	{
		if (m_guest == nullptr) {
			if (m_last_error.empty())
				throw NotStarted("WasmRunner: not started");
			throw NotStarted("WasmRunner: not started (" + m_last_error + ")");
		}
		if (m_config.runner_logging)
			logf("WasmRunner: run_msg_loop()");

		auto cx = m_guest->store.context();
		double cputime = 0.0;
		auto result = [&] {
			ScopedDuration<> duration(cputime);
			return m_guest->msg_loop->call(cx, {});
		}();
		m_stats.run_cpu_time.store(m_stats.run_cpu_time.load() + cputime);

		if (UNLIKELY(!result)) {
			m_stats.guest_faults++;
			if (m_config.runner_logging)
				logf("WasmRunner: run_msg_loop() returned error");
			throw GuestFault("run_msg_loop() trapped: " + result.err().message());
		}
		if (result_discriminant(result.ok(), EXPORT_MSG_LOOP) != 0) {
			m_stats.guest_faults++;
			if (m_config.runner_logging)
				logf("WasmRunner: run_msg_loop() returned error");
			throw GuestFault("run_msg_loop() returned error");
		}

		m_stats.loops_completed++;
		if (m_config.runner_logging)
			logf("WasmRunner: run_msg_loop() finished normally");
	}

} // sandbox
