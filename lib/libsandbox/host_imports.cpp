/**
 * @file host_imports.cpp
 * @brief The four host functions imported by the guest.
 * @version 0.1
 *
 * Every import lowers its arguments from guest memory, forwards to the
 * capability bridge and lifts the result back into guest memory. Any
 * failure, including a failed capability handle, becomes a trap in
 * the guest carrying the failure message.
 *
**/
#include "host_imports.hpp"

#include "capability_bridge.hpp"
#include "errors.hpp"
#include "guest_memory.hpp"
#include "settings.hpp"

namespace sandbox
{
	using wasmtime::Caller;
	using wasmtime::Result;
	using wasmtime::Trap;

	template <typename T, typename F>
	static Result<T, Trap> trapping(F&& func)
	{
		try {
			return func();
		} catch (const std::exception& e) {
			return Trap(e.what());
		} catch (...) {
			return Trap("unknown exception: <error>");
		}
	}

	static void expect(const Result<std::monostate>& result, const char* name)
	{
		if (!result) {
			throw ConfigurationError(std::string("Failed to define host function ")
				+ name + ": " + result.err().message());
		}
	}

	void register_host_imports(wasmtime::Linker& linker, CapabilityBridge& bridge)
	{
		expect(linker.func_wrap(GUEST_IMPORT_MODULE, IMPORT_SEND_BYTES,
			[&bridge] (Caller caller, int32_t ptr, int32_t len) -> Result<std::monostate, Trap>
		{
			return trapping<std::monostate>([&] {
				auto memory = GuestMemory::from_caller(caller);
				bridge.send(memory.read(ptr, len));
				return std::monostate();
			});
		}), IMPORT_SEND_BYTES);

		expect(linker.func_wrap(GUEST_IMPORT_MODULE, IMPORT_RECV_BYTES,
			[&bridge] (Caller caller, int32_t retptr) -> Result<std::monostate, Trap>
		{
			return trapping<std::monostate>([&] {
				auto memory = GuestMemory::from_caller(caller);
				const uint32_t ret = retptr;
				if ((ret & 3) != 0)
					throw GuestFault("recv-bytes: misaligned return pointer");
				// Validate the return area before suspending on the handle
				memory.write_u32(ret, 0);
				memory.write_u32(ret + 4, 0);

				const auto message = bridge.receive();
				const uint32_t ptr = memory.push(message.data(), message.size());
				memory.write_u32(ret, ptr);
				memory.write_u32(ret + 4, message.size());
				return std::monostate();
			});
		}), IMPORT_RECV_BYTES);

		expect(linker.func_wrap(GUEST_IMPORT_MODULE, IMPORT_RECV_READY,
			[&bridge] (Caller) -> Result<int32_t, Trap>
		{
			return trapping<int32_t>([&] {
				return int32_t(bridge.receive_ready() ? 1 : 0);
			});
		}), IMPORT_RECV_READY);

		expect(linker.func_wrap(GUEST_IMPORT_MODULE, IMPORT_WRITE_LOG,
			[&bridge] (Caller caller, int32_t ptr, int32_t len) -> Result<std::monostate, Trap>
		{
			return trapping<std::monostate>([&] {
				auto memory = GuestMemory::from_caller(caller);
				bridge.log(memory.read_string(ptr, len));
				return std::monostate();
			});
		}), IMPORT_WRITE_LOG);
	}

} // sandbox
