#include <gtest/gtest.h>
#include <libsandbox/artifact_cache.hpp>
#include <libsandbox/errors.hpp>
#include "guests.hpp"
#include <chrono>
#include <cstdlib>

using namespace sandbox;
namespace fs = std::filesystem;

class ArtifactCacheTest : public ::testing::Test
{
protected:
	void SetUp() override {
		unsetenv("WASMTIME_FORCE_RECOMPILE");
		source = (dir / "env.wasm").string();
		cache_path = (dir / "env.wasm.compiled").string();
		guests::write_file(source, guests::assemble(guests::echo()));
	}
	void TearDown() override {
		unsetenv("WASMTIME_FORCE_RECOMPILE");
	}

	guests::TempDir dir;
	std::string source;
	std::string cache_path;
	wasmtime::Engine engine;
	ArtifactCache cache {engine};
};

TEST_F(ArtifactCacheTest, FirstResolveCompilesAndWritesCache)
{
	cache.resolve(source, cache_path, false);

	EXPECT_EQ(cache.stats().compiles.load(), 1u);
	EXPECT_EQ(cache.stats().loads.load(), 0u);
	ASSERT_TRUE(fs::exists(cache_path));
	EXPECT_GT(fs::file_size(cache_path), 0u);
	// Only the artifact itself is left next to the source
	size_t entries = 0;
	for (const auto& entry : fs::directory_iterator(dir.path)) {
		(void)entry;
		entries++;
	}
	EXPECT_EQ(entries, 2u);
}

TEST_F(ArtifactCacheTest, UnchangedSourceReusesCache)
{
	cache.resolve(source, cache_path, false);
	cache.resolve(source, cache_path, false);

	EXPECT_EQ(cache.stats().compiles.load(), 1u);
	EXPECT_EQ(cache.stats().loads.load(), 1u);
}

TEST_F(ArtifactCacheTest, TruncatedCacheIsRebuilt)
{
	cache.resolve(source, cache_path, false);
	fs::resize_file(cache_path, 0);

	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().compiles.load(), 2u);
	EXPECT_GT(fs::file_size(cache_path), 0u);
}

TEST_F(ArtifactCacheTest, CacheOlderThanSourceIsRebuilt)
{
	cache.resolve(source, cache_path, false);
	const auto src_time = fs::last_write_time(source);
	fs::last_write_time(cache_path, src_time - std::chrono::hours(1));
	EXPECT_TRUE(ArtifactCache::is_stale(source, cache_path, false));

	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().compiles.load(), 2u);
	EXPECT_FALSE(ArtifactCache::is_stale(source, cache_path, false));
}

TEST_F(ArtifactCacheTest, CacheWithSameTimestampIsFresh)
{
	cache.resolve(source, cache_path, false);
	fs::last_write_time(cache_path, fs::last_write_time(source));

	EXPECT_FALSE(ArtifactCache::is_stale(source, cache_path, false));
	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().compiles.load(), 1u);
}

TEST_F(ArtifactCacheTest, ForceAlwaysRecompiles)
{
	cache.resolve(source, cache_path, true);
	cache.resolve(source, cache_path, true);
	cache.resolve(source, cache_path, true);

	EXPECT_EQ(cache.stats().compiles.load(), 3u);
	EXPECT_EQ(cache.stats().loads.load(), 0u);
}

TEST_F(ArtifactCacheTest, EnvironmentToggleForcesRecompile)
{
	cache.resolve(source, cache_path, false);

	setenv("WASMTIME_FORCE_RECOMPILE", "0", 1);
	EXPECT_FALSE(ArtifactCache::force_from_environment());
	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().compiles.load(), 1u);

	setenv("WASMTIME_FORCE_RECOMPILE", "1", 1);
	EXPECT_TRUE(ArtifactCache::force_from_environment());
	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().compiles.load(), 2u);
}

TEST_F(ArtifactCacheTest, CorruptCacheIsRebuilt)
{
	cache.resolve(source, cache_path, false);
	guests::write_file(cache_path, {'n', 'o', 't', ' ', 'c', 'o', 'd', 'e'});

	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().load_failures.load(), 1u);
	EXPECT_EQ(cache.stats().compiles.load(), 2u);

	// The rebuilt artifact is usable again
	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().loads.load(), 1u);
	EXPECT_EQ(cache.stats().compiles.load(), 2u);
}

TEST_F(ArtifactCacheTest, UnwritableCacheIsNotFatal)
{
	// A regular file in place of the cache directory
	guests::write_file(dir / "blocker", {'x'});
	const std::string bad_cache = (dir / "blocker" / "env.wasm.compiled").string();

	wasmtime::Module module = cache.resolve(source, bad_cache, false);
	EXPECT_EQ(cache.stats().compiles.load(), 1u);
	EXPECT_EQ(cache.stats().write_failures.load(), 1u);

	// The module is still usable without an artifact on disk
	EXPECT_EQ(module.imports().size(), 4u);

	cache.resolve(source, bad_cache, false);
	EXPECT_EQ(cache.stats().compiles.load(), 2u);
}

TEST_F(ArtifactCacheTest, MissingCacheDirectoryIsCreated)
{
	const std::string nested = (dir / "a" / "b" / "env.wasm.compiled").string();
	cache.resolve(source, nested, false);

	EXPECT_TRUE(fs::exists(nested));
	EXPECT_EQ(cache.stats().write_failures.load(), 0u);
}

TEST_F(ArtifactCacheTest, MissingSourceLoadsExistingCache)
{
	cache.resolve(source, cache_path, false);
	fs::remove(source);

	cache.resolve(source, cache_path, false);
	EXPECT_EQ(cache.stats().compiles.load(), 1u);
	EXPECT_EQ(cache.stats().loads.load(), 1u);
}

TEST_F(ArtifactCacheTest, MissingSourceAndCacheIsConfigurationError)
{
	fs::remove(source);
	EXPECT_THROW(cache.resolve(source, cache_path, false), ConfigurationError);
}

TEST_F(ArtifactCacheTest, InvalidSourceIsConfigurationError)
{
	guests::write_file(source, {0x00, 0x61, 0x73, 0x6d, 0xff});
	EXPECT_THROW(cache.resolve(source, cache_path, false), ConfigurationError);
	EXPECT_FALSE(fs::exists(cache_path));
}
