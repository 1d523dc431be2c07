#pragma once
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox
{
	/**
	 * The four handles through which a guest talks to the outside world.
	 * send_bytes and recv_bytes complete asynchronously; the guest is
	 * suspended until the returned future is ready. A handle reports
	 * failure by throwing, or by storing an exception in the future.
	**/
	struct Capabilities
	{
		virtual std::future<void> send_bytes(std::vector<uint8_t> message) = 0;
		virtual std::future<std::vector<uint8_t>> recv_bytes() = 0;
		virtual bool recv_ready() = 0;
		virtual void write_log(std::string_view text) = 0;

		/* Render a handle failure as "Type: message" using the environment's
		   own facility. Returning nullopt selects the built-in rendering. */
		virtual std::optional<std::string> format_failure(std::exception_ptr)
			{ return std::nullopt; }

		virtual ~Capabilities() = default;
	};

	/* Capabilities made from four plain callables */
	struct CallbackCapabilities : public Capabilities
	{
		using send_t  = std::function<std::future<void>(std::vector<uint8_t>)>;
		using recv_t  = std::function<std::future<std::vector<uint8_t>>()>;
		using ready_t = std::function<bool()>;
		using log_t   = std::function<void(std::string_view)>;
		using format_t = std::function<std::optional<std::string>(std::exception_ptr)>;

		CallbackCapabilities(send_t s, recv_t r, ready_t rr, log_t l, format_t f = nullptr)
			: m_send(std::move(s)), m_recv(std::move(r)), m_ready(std::move(rr)),
			  m_log(std::move(l)), m_format(std::move(f)) {}

		std::future<void> send_bytes(std::vector<uint8_t> message) override {
			return m_send(std::move(message));
		}
		std::future<std::vector<uint8_t>> recv_bytes() override {
			return m_recv();
		}
		bool recv_ready() override {
			return m_ready();
		}
		void write_log(std::string_view text) override {
			m_log(text);
		}
		std::optional<std::string> format_failure(std::exception_ptr e) override {
			if (m_format)
				return m_format(e);
			return std::nullopt;
		}

	private:
		send_t  m_send;
		recv_t  m_recv;
		ready_t m_ready;
		log_t   m_log;
		format_t m_format;
	};

	/**
	 * Serializes every handle invocation and every failure rendering
	 * on an externally owned lock. The lock is held only while a handle
	 * is invoked, never while its future is being waited on, so the
	 * owner of the lock is free to complete the future.
	**/
	template <typename Lockable = std::mutex>
	struct LockedCapabilities : public Capabilities
	{
		LockedCapabilities(std::unique_ptr<Capabilities> inner, Lockable& lock)
			: m_inner(std::move(inner)), m_lock(lock) {}

		std::future<void> send_bytes(std::vector<uint8_t> message) override {
			std::lock_guard<Lockable> guard(m_lock);
			return m_inner->send_bytes(std::move(message));
		}
		std::future<std::vector<uint8_t>> recv_bytes() override {
			std::lock_guard<Lockable> guard(m_lock);
			return m_inner->recv_bytes();
		}
		bool recv_ready() override {
			std::lock_guard<Lockable> guard(m_lock);
			return m_inner->recv_ready();
		}
		void write_log(std::string_view text) override {
			std::lock_guard<Lockable> guard(m_lock);
			m_inner->write_log(text);
		}
		std::optional<std::string> format_failure(std::exception_ptr e) override {
			std::lock_guard<Lockable> guard(m_lock);
			return m_inner->format_failure(e);
		}

	private:
		std::unique_ptr<Capabilities> m_inner;
		Lockable& m_lock;
	};

} // sandbox
