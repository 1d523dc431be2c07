#pragma once
#include <atomic>
#include <optional>
#include <utility>

namespace sandbox
{
	/**
	 * An exclusive cell that is only ever acquired with a try. A borrow
	 * gives access to the guarded value and releases the cell when it
	 * is destroyed. Acquisition never blocks and never queues.
	**/
	template <typename T>
	class ExecutionGuard
	{
	public:
		class Borrow {
		public:
			T& operator*() const noexcept { return *m_value; }
			T* operator->() const noexcept { return m_value; }

			Borrow(Borrow&& other) noexcept
				: m_guard(std::exchange(other.m_guard, nullptr)),
				  m_value(other.m_value) {}
			Borrow& operator=(Borrow&&) = delete;
			Borrow(const Borrow&) = delete;
			~Borrow() {
				if (m_guard != nullptr)
					m_guard->m_held.store(false, std::memory_order_release);
			}
		private:
			Borrow(ExecutionGuard* guard, T* value) : m_guard(guard), m_value(value) {}
			ExecutionGuard* m_guard;
			T* m_value;
			friend class ExecutionGuard;
		};

		/* Returns nullopt immediately when the cell is already held */
		std::optional<Borrow> try_acquire() noexcept {
			bool expected = false;
			if (!m_held.compare_exchange_strong(expected, true,
					std::memory_order_acquire, std::memory_order_relaxed))
				return std::nullopt;
			return Borrow(this, &m_value);
		}

		bool is_held() const noexcept {
			return m_held.load(std::memory_order_acquire);
		}

		/* Access without a borrow, for diagnostics only */
		const T& peek() const noexcept { return m_value; }

		template <typename... Args>
		ExecutionGuard(Args&&... args) : m_value(std::forward<Args>(args)...) {}
		ExecutionGuard(const ExecutionGuard&) = delete;
		ExecutionGuard& operator=(const ExecutionGuard&) = delete;

	private:
		T m_value;
		std::atomic<bool> m_held {false};
	};

} // sandbox
