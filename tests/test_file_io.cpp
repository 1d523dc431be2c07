#include <gtest/gtest.h>
#include <libsandbox/file_io.hpp>
#include "guests.hpp"
#include <atomic>
#include <thread>

using namespace sandbox;
namespace fs = std::filesystem;

TEST(FileWriter, ConcurrentWritersNeverMixContents)
{
	guests::TempDir dir;
	const std::string target = (dir / "shared.compiled").string();
	constexpr size_t SIZE = 1UL << 20;

	std::vector<std::thread> writers;
	std::atomic<int> failures {0};
	for (int t = 0; t < 8; t++) {
		writers.emplace_back([&, t] {
			const std::vector<uint8_t> data(SIZE, uint8_t('a' + t));
			for (int i = 0; i < 4; i++) {
				if (!file_writer(target, data))
					failures++;
			}
		});
	}
	for (auto& thr : writers)
		thr.join();

	EXPECT_EQ(failures.load(), 0);
	const auto result = file_loader(target);
	ASSERT_EQ(result.size(), SIZE);
	for (size_t i = 1; i < result.size(); i++) {
		ASSERT_EQ(result[i], result[0]) << "mixed contents at offset " << i;
	}

	// No temporary files are left behind
	size_t entries = 0;
	for (const auto& entry : fs::directory_iterator(dir.path)) {
		(void)entry;
		entries++;
	}
	EXPECT_EQ(entries, 1u);
}

TEST(FileWriter, UnwritableDestinationReturnsFalse)
{
	guests::TempDir dir;
	guests::write_file(dir / "blocker", {'x'});

	EXPECT_FALSE(file_writer((dir / "blocker" / "out").string(), {1, 2, 3}));
}

TEST(FileLoader, MissingFileThrows)
{
	guests::TempDir dir;
	EXPECT_THROW(file_loader((dir / "missing").string()), std::runtime_error);
}
