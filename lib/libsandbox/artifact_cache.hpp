#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <wasmtime.hh>

namespace sandbox
{
	struct CacheStats
	{
		std::atomic<uint64_t> compiles {0};
		std::atomic<uint64_t> loads {0};
		std::atomic<uint64_t> load_failures {0};
		std::atomic<uint64_t> write_failures {0};
	};

	/**
	 * Loads a guest module from a pre-compiled artifact, or compiles it
	 * from source and refreshes the artifact. A cache problem is never
	 * fatal; only an unusable source is.
	**/
	class ArtifactCache
	{
	public:
		wasmtime::Module resolve(const std::string& source_path,
			const std::string& cache_path, bool force_recompile);

		/* Whether the cache at cache_path must be rebuilt from source_path */
		static bool is_stale(const std::string& source_path,
			const std::string& cache_path, bool force_recompile);
		/* True when WASMTIME_FORCE_RECOMPILE is set to "1" */
		static bool force_from_environment();

		const CacheStats& stats() const noexcept { return m_stats; }

		ArtifactCache(wasmtime::Engine& engine, bool verbose = false)
			: m_engine(engine), m_verbose(verbose) {}
	private:
		wasmtime::Module compile_and_store(const std::string& source_path,
			const std::string& cache_path);

		wasmtime::Engine& m_engine;
		const bool m_verbose;
		CacheStats m_stats;
	};
} // sandbox
