#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace seocrawler {

	//fixed number of workers; the size is the only admission control
	class ThreadPool {
	public:
		explicit ThreadPool(size_t numThreads);
		~ThreadPool();

		ThreadPool(const ThreadPool&) = delete;
		ThreadPool& operator=(const ThreadPool&) = delete;

		template<class F>
		auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
			using R = std::invoke_result_t<F>;
			auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
			std::future<R> result = task->get_future();
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				if (m_stop)
					throw std::runtime_error("enqueue on stopped ThreadPool");
				m_tasks.emplace([task] { (*task)(); });
			}
			m_condition.notify_one();
			return result;
		}

		size_t size() const { return m_workers.size(); }

	private:
		std::vector<std::thread> m_workers;
		std::queue<std::function<void()>> m_tasks;
		std::mutex m_queueMutex;
		std::condition_variable m_condition;
		bool m_stop = false;
	};

	//wait for every future before rethrowing the first failure, callers share state with the tasks
	template<class T>
	void waitAll(std::vector<std::future<T>>& futures) {
		for (auto& future : futures)
			future.wait();
		for (auto& future : futures)
			future.get();
	}

}
