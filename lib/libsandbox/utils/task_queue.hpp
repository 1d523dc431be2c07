#pragma once
#include <blockingconcurrentqueue.h>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <sys/resource.h>

namespace sandbox
{
	/**
	 * A single dedicated worker thread executing tasks in order.
	 * The guest always runs on this thread, and it may block there
	 * while a capability completes.
	**/
	class TaskQueue
	{
	public:
		template <typename F>
		auto enqueue(F&& func) -> std::future<std::invoke_result_t<F>>
		{
			using R = std::invoke_result_t<F>;
			auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
			auto future = task->get_future();
			m_queue.enqueue([task] { (*task)(); });
			return future;
		}

		TaskQueue(int nice = 0)
		{
			m_thread = std::thread([this, nice] {
				if (nice != 0) {
					// Lowering the priority of a thread is best-effort
					(void)setpriority(PRIO_PROCESS, 0, nice);
				}
				this->worker();
			});
		}
		~TaskQueue()
		{
			// An empty task stops the worker after everything before it
			m_queue.enqueue(nullptr);
			if (m_thread.joinable())
				m_thread.join();
		}
		TaskQueue(const TaskQueue&) = delete;
		TaskQueue& operator=(const TaskQueue&) = delete;

	private:
		void worker()
		{
			while (true) {
				std::function<void()> task;
				m_queue.wait_dequeue(task);
				if (!task)
					return;
				task();
			}
		}

		moodycamel::BlockingConcurrentQueue<std::function<void()>> m_queue;
		std::thread m_thread;
	};

} // sandbox
