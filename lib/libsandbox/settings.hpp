#pragma once
#include <cstddef>
#include <cstdint>

namespace sandbox
{
	/* Default locations of the guest binary and its compiled artifact */
	static constexpr const char* DEFAULT_GUEST_PATH = "env.wasm";
	static constexpr const char* DEFAULT_CACHE_PATH = "env.wasm.compiled";
	/* Setting this environment variable to "1" invalidates the cache */
	static constexpr const char* FORCE_RECOMPILE_ENV = "WASMTIME_FORCE_RECOMPILE";

	/* Canonical ABI surface of the guest */
	static constexpr const char* GUEST_IMPORT_MODULE = "$root";
	static constexpr const char* IMPORT_SEND_BYTES  = "send-bytes";
	static constexpr const char* IMPORT_RECV_BYTES  = "recv-bytes";
	static constexpr const char* IMPORT_RECV_READY  = "recv-ready";
	static constexpr const char* IMPORT_WRITE_LOG   = "write-log";
	static constexpr const char* EXPORT_MEMORY      = "memory";
	static constexpr const char* EXPORT_REALLOC     = "cabi_realloc";
	static constexpr const char* EXPORT_INIT_ENV    = "init-exec-env";
	static constexpr const char* EXPORT_MSG_LOOP    = "run-msg-loop";

	static constexpr bool   DEFAULT_INHERIT_STDIO = true;
	static constexpr bool   DEFAULT_RUNNER_LOGGING = false;
	static constexpr size_t DEFAULT_MAX_WASM_STACK = 512UL << 10; /* 512KB */
	static constexpr int    GUEST_THREAD_NICE = 0;

	static constexpr size_t LOG_BUFFER_SIZE = 2048;
}
