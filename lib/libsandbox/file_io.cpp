#include "file_io.hpp"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

namespace sandbox
{
	std::vector<uint8_t> file_loader(const std::string& filename)
	{
		FILE* f = fopen(filename.c_str(), "rb");
		if (f == NULL) throw std::runtime_error("Could not open file: " + filename);

		fseek(f, 0, SEEK_END);
		const long size = ftell(f);
		fseek(f, 0, SEEK_SET);
		if (size < 0) {
			fclose(f);
			throw std::runtime_error("Could not determine size of file: " + filename);
		}

		std::vector<uint8_t> result(size);
		if ((size_t)size != fread(result.data(), 1, size, f))
		{
			fclose(f);
			throw std::runtime_error("Error when reading from file: " + filename);
		}
		fclose(f);
		return result;
	}

	bool file_writer(const std::string& filename, const std::vector<uint8_t>& binary)
	{
		std::error_code ec;
		const auto dir = std::filesystem::path(filename).parent_path();
		if (!dir.empty())
			std::filesystem::create_directories(dir, ec);

		// Write next to the destination and rename over it, so that
		// a reader never observes a partially written file.
		// Unique per write, as several runners may share one cache
		static std::atomic<uint64_t> write_counter {0};
		const std::string tmpname = filename + ".tmp." + std::to_string(getpid())
			+ "." + std::to_string(write_counter.fetch_add(1));
		FILE* f = fopen(tmpname.c_str(), "wb");
		if (f == NULL)
			return false;

		const size_t n = fwrite(binary.data(), 1, binary.size(), f);
		const bool flushed = (fflush(f) == 0);
		fclose(f);
		if (n != binary.size() || !flushed) {
			std::filesystem::remove(tmpname, ec);
			return false;
		}

		std::filesystem::rename(tmpname, filename, ec);
		if (ec) {
			std::filesystem::remove(tmpname, ec);
			return false;
		}
		return true;
	}
} // sandbox
