#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <wasmtime.hh>

namespace sandbox
{
	/**
	 * Bounds-checked access to the linear memory of a guest, plus
	 * allocation through the guest's own cabi_realloc. Pointers into
	 * guest memory must not be held across allocate(), as the memory
	 * may grow and move.
	**/
	class GuestMemory
	{
	public:
		std::vector<uint8_t> read(uint32_t ptr, uint32_t len) const;
		std::string read_string(uint32_t ptr, uint32_t len) const;

		void write(uint32_t ptr, const void* data, size_t len);
		void write_u32(uint32_t ptr, uint32_t value);

		/* Call cabi_realloc(0, 0, align, size) in the guest */
		uint32_t allocate(uint32_t align, uint32_t size);
		/* Allocate and copy, returning the guest address */
		uint32_t push(const void* data, size_t len, uint32_t align = 1);

		static GuestMemory from_caller(wasmtime::Caller&);

		GuestMemory(wasmtime::Store::Context cx, wasmtime::Memory memory, wasmtime::Func realloc)
			: m_cx(cx), m_memory(memory), m_realloc(realloc) {}
	private:
		wasmtime::Span<uint8_t> view(uint32_t ptr, size_t len) const;

		wasmtime::Store::Context m_cx;
		wasmtime::Memory m_memory;
		wasmtime::Func m_realloc;
	};

	extern bool is_valid_utf8(const uint8_t* data, size_t len) noexcept;

} // sandbox
