/**
 * @file artifact_cache.cpp
 * @brief Compiled-artifact cache for guest modules.
 * @version 0.1
 *
 * Compiling a guest is expensive, so the native artifact produced by the
 * engine is kept next to the guest binary. The artifact is rebuilt when:
 *   - recompilation is forced (config or WASMTIME_FORCE_RECOMPILE=1)
 *   - the artifact is missing or empty
 *   - the artifact is strictly older than the guest binary
 *   - the engine refuses to load the artifact (corrupt, or produced by
 *     an incompatible engine build or configuration)
 * If a timestamp cannot be read, the artifact is assumed fresh and left
 * to the engine to validate.
 *
**/
#include "artifact_cache.hpp"

#include "common_defs.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "log.hpp"
#include "settings.hpp"
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

namespace sandbox
{
	static bool file_mtime(const std::string& path, struct timespec& mtime)
	{
		struct stat st;
		if (stat(path.c_str(), &st) != 0)
			return false;
		mtime = st.st_mtim;
		return true;
	}

	bool ArtifactCache::force_from_environment()
	{
		const char* value = getenv(FORCE_RECOMPILE_ENV);
		return value != nullptr && strcmp(value, "1") == 0;
	}

	bool ArtifactCache::is_stale(const std::string& source_path,
		const std::string& cache_path, bool force_recompile)
	{
		if (force_recompile)
			return true;

		struct stat cst;
		if (stat(cache_path.c_str(), &cst) != 0)
			return true;
		if (cst.st_size == 0)
			return true;

		struct timespec src_mtime, cache_mtime;
		if (file_mtime(source_path, src_mtime) && file_mtime(cache_path, cache_mtime))
		{
			if (cache_mtime.tv_sec != src_mtime.tv_sec)
				return cache_mtime.tv_sec < src_mtime.tv_sec;
			return cache_mtime.tv_nsec < src_mtime.tv_nsec;
		}
		return false;
	}

	wasmtime::Module ArtifactCache::resolve(const std::string& source_path,
		const std::string& cache_path, bool force_recompile)
	{
		const bool force = force_recompile || force_from_environment();

		if (!is_stale(source_path, cache_path, force))
		{
			auto result = wasmtime::Module::deserialize_file(m_engine, cache_path);
			if (result) {
				m_stats.loads++;
				if (m_verbose)
					logf("ArtifactCache: loaded %s", cache_path.c_str());
				return result.ok();
			}
			m_stats.load_failures++;
			logf("ArtifactCache: rejected %s: %s",
				cache_path.c_str(), result.err().message().c_str());
		}
		return compile_and_store(source_path, cache_path);
	}

	wasmtime::Module ArtifactCache::compile_and_store(
		const std::string& source_path, const std::string& cache_path)
	{
		std::vector<uint8_t> binary;
		try {
			binary = file_loader(source_path);
		} catch (const std::exception& e) {
			throw ConfigurationError(e.what());
		}

		auto compiled = wasmtime::Module::compile(m_engine, binary);
		if (UNLIKELY(!compiled)) {
			throw ConfigurationError("Failed to compile " + source_path
				+ ": " + compiled.err().message());
		}
		wasmtime::Module module = compiled.ok();
		m_stats.compiles++;
		if (m_verbose)
			logf("ArtifactCache: compiled %s", source_path.c_str());

		// Storing the artifact is best-effort. We still have a module.
		auto serialized = module.serialize();
		if (!serialized) {
			m_stats.write_failures++;
			logf("ArtifactCache: could not serialize %s: %s",
				source_path.c_str(), serialized.err().message().c_str());
		}
		else if (!file_writer(cache_path, serialized.ok())) {
			m_stats.write_failures++;
			logf("ArtifactCache: could not write %s", cache_path.c_str());
		}
		return module;
	}

} // sandbox
