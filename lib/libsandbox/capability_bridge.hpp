#pragma once
#include "capabilities.hpp"
#include <atomic>

namespace sandbox
{
	struct CapabilityStats
	{
		std::atomic<uint64_t> sends {0};
		std::atomic<uint64_t> bytes_sent {0};
		std::atomic<uint64_t> receives {0};
		std::atomic<uint64_t> bytes_received {0};
		std::atomic<uint64_t> ready_polls {0};
		std::atomic<uint64_t> log_writes {0};
		std::atomic<uint64_t> failures {0};
	};

	/**
	 * Host side of the four guest imports. Every operation waits for the
	 * underlying handle to complete, and any failure comes out as a
	 * CapabilityFailure carrying the "Type: message" rendering.
	**/
	class CapabilityBridge
	{
	public:
		void send(std::vector<uint8_t> message);
		std::vector<uint8_t> receive();
		bool receive_ready();
		void log(std::string_view text);

		/* Render a failure as "Type: message". Never throws. */
		std::string describe(std::exception_ptr) noexcept;

		const CapabilityStats& stats() const noexcept { return m_stats; }

		CapabilityBridge(Capabilities& caps) : m_caps(caps) {}
	private:
		[[noreturn]] void fail(std::exception_ptr);

		Capabilities& m_caps;
		CapabilityStats m_stats;
	};

	/* Demangled dynamic type name and what() of an exception */
	extern std::string default_failure_format(std::exception_ptr) noexcept;

} // sandbox
