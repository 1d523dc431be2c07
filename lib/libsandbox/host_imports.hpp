#pragma once
#include <wasmtime.hh>

namespace sandbox
{
	class CapabilityBridge;

	/* Define send-bytes, recv-bytes, recv-ready and write-log for the guest */
	extern void register_host_imports(wasmtime::Linker&, CapabilityBridge&);
}
