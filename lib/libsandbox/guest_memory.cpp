#include "guest_memory.hpp"

#include "common_defs.hpp"
#include "errors.hpp"
#include "settings.hpp"
#include <cstring>

namespace sandbox
{
	GuestMemory GuestMemory::from_caller(wasmtime::Caller& caller)
	{
		auto mem = caller.get_export(EXPORT_MEMORY);
		auto* memory = mem ? std::get_if<wasmtime::Memory>(&*mem) : nullptr;
		if (UNLIKELY(memory == nullptr))
			throw GuestFault("Guest does not export its memory");

		auto realloc = caller.get_export(EXPORT_REALLOC);
		auto* func = realloc ? std::get_if<wasmtime::Func>(&*realloc) : nullptr;
		if (UNLIKELY(func == nullptr))
			throw GuestFault("Guest does not export cabi_realloc");

		return GuestMemory(wasmtime::Store::Context(caller), *memory, *func);
	}

	wasmtime::Span<uint8_t> GuestMemory::view(uint32_t ptr, size_t len) const
	{
		auto span = m_memory.data(m_cx);
		if (UNLIKELY(uint64_t(ptr) + len > span.size())) {
			throw GuestFault("Guest memory access out of bounds: "
				+ std::to_string(ptr) + " + " + std::to_string(len));
		}
		return wasmtime::Span<uint8_t>(span.data() + ptr, len);
	}

	std::vector<uint8_t> GuestMemory::read(uint32_t ptr, uint32_t len) const
	{
		auto span = view(ptr, len);
		return std::vector<uint8_t>(span.begin(), span.end());
	}

	std::string GuestMemory::read_string(uint32_t ptr, uint32_t len) const
	{
		auto span = view(ptr, len);
		if (UNLIKELY(!is_valid_utf8(span.data(), span.size())))
			throw GuestFault("Guest string is not valid UTF-8");
		return std::string((const char *)span.data(), span.size());
	}

	void GuestMemory::write(uint32_t ptr, const void* data, size_t len)
	{
		auto span = view(ptr, len);
		if (len > 0)
			std::memcpy(span.data(), data, len);
	}

	void GuestMemory::write_u32(uint32_t ptr, uint32_t value)
	{
		const uint8_t le[4] = {
			uint8_t(value), uint8_t(value >> 8),
			uint8_t(value >> 16), uint8_t(value >> 24)
		};
		this->write(ptr, le, sizeof(le));
	}

	uint32_t GuestMemory::allocate(uint32_t align, uint32_t size)
	{
		auto result = m_realloc.call(m_cx, {
			int32_t(0), int32_t(0), int32_t(align), int32_t(size)
		});
		if (UNLIKELY(!result))
			throw GuestFault("cabi_realloc failed: " + result.err().message());
		auto values = result.ok();
		if (UNLIKELY(values.size() != 1 || values[0].kind() != wasmtime::ValKind::I32))
			throw GuestFault("cabi_realloc has the wrong signature");

		const uint32_t ptr = values[0].i32();
		if (UNLIKELY(align > 1 && (ptr & (align - 1)) != 0))
			throw GuestFault("cabi_realloc returned a misaligned pointer");
		// Verifies that the allocation lies inside memory
		view(ptr, size);
		return ptr;
	}

	uint32_t GuestMemory::push(const void* data, size_t len, uint32_t align)
	{
		if (UNLIKELY(len > UINT32_MAX))
			throw GuestFault("Buffer too large for guest memory");
		const uint32_t ptr = allocate(align, len);
		this->write(ptr, data, len);
		return ptr;
	}

	bool is_valid_utf8(const uint8_t* data, size_t len) noexcept
	{
		size_t i = 0;
		while (i < len)
		{
			const uint8_t c = data[i];
			size_t n;
			uint32_t cp;
			if (c < 0x80) { i++; continue; }
			else if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1F; }
			else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0F; }
			else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07; }
			else return false;

			if (i + n >= len)
				return false;
			for (size_t k = 1; k <= n; k++) {
				if ((data[i + k] & 0xC0) != 0x80)
					return false;
				cp = (cp << 6) | (data[i + k] & 0x3F);
			}
			/* Overlong encodings, surrogates and out-of-range */
			if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000))
				return false;
			if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
				return false;
			i += n + 1;
		}
		return true;
	}

} // sandbox
