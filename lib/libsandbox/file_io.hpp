#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sandbox
{
	extern std::vector<uint8_t> file_loader(const std::string& filename);
	/* Best-effort atomic write. Returns false on any failure. */
	extern bool file_writer(const std::string& filename, const std::vector<uint8_t>&);
}
