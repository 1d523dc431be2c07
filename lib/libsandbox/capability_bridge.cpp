#include "capability_bridge.hpp"

#include "errors.hpp"
#include <cxxabi.h>
#include <cstdlib>
#include <typeinfo>

namespace sandbox
{
	static std::string demangle(const char* name)
	{
		int status = 0;
		char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
		if (demangled == nullptr)
			return name;
		std::string result = demangled;
		std::free(demangled);
		return result;
	}

	std::string default_failure_format(std::exception_ptr ep) noexcept
	{
		try {
			try {
				std::rethrow_exception(ep);
			} catch (const std::exception& e) {
				return demangle(typeid(e).name()) + ": " + e.what();
			} catch (...) {
				// Not a standard exception: the payload has no message
				auto* type = abi::__cxa_current_exception_type();
				std::string name = type ? demangle(type->name()) : "unknown exception";
				return name + ": <error>";
			}
		} catch (...) {
			return "unknown exception: <error>";
		}
	}

	std::string CapabilityBridge::describe(std::exception_ptr ep) noexcept
	{
		if (ep == nullptr)
			return "unknown exception: <error>";
		try {
			auto custom = m_caps.format_failure(ep);
			if (custom.has_value())
				return *custom;
		} catch (const std::exception&) {
			// Formatter failed, use the built-in rendering below
		} catch (...) {
			// Same, for a formatter failing with a non-standard exception
		}
		return default_failure_format(ep);
	}

	void CapabilityBridge::fail(std::exception_ptr ep)
	{
		m_stats.failures++;
		throw CapabilityFailure(describe(ep));
	}

	void CapabilityBridge::send(std::vector<uint8_t> message)
	{
		m_stats.sends++;
		const size_t len = message.size();
		try {
			auto fut = m_caps.send_bytes(std::move(message));
			fut.get();
		} catch (...) {
			fail(std::current_exception());
		}
		m_stats.bytes_sent += len;
	}

	std::vector<uint8_t> CapabilityBridge::receive()
	{
		m_stats.receives++;
		std::vector<uint8_t> result;
		try {
			auto fut = m_caps.recv_bytes();
			result = fut.get();
		} catch (...) {
			fail(std::current_exception());
		}
		m_stats.bytes_received += result.size();
		return result;
	}

	bool CapabilityBridge::receive_ready()
	{
		m_stats.ready_polls++;
		try {
			return m_caps.recv_ready();
		} catch (...) {
			fail(std::current_exception());
		}
	}

	void CapabilityBridge::log(std::string_view text)
	{
		m_stats.log_writes++;
		try {
			m_caps.write_log(text);
		} catch (...) {
			fail(std::current_exception());
		}
	}

} // sandbox
