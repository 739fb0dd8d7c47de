#pragma once

#include <cstdint>
#include <thread>

#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

namespace fedshield
{
	class tmt
	{
	public:
		/** Use:
		 *
		 tmt::ParallelExecution([](uint32_t index, Data& data...)
		 {
			 function body
		 }, Count, data pointer...);
		 *
		 tmt::ParallelExecution(uint32_t worker, [](uint32_t index, Data& data...)
		 {
			 function body
		 }, Count, data pointer...);
		 */
		template <class Function, typename Count, typename ...T>
		static void ParallelExecution(Function func, Count count, T* ...data)
		{
			uint32_t totalThread = std::thread::hardware_concurrency();
			ParallelExecution(totalThread == 0 ? 1 : totalThread, func, count, data...);
		}

		template <class Function, typename Count, typename ...T>
		static void ParallelExecution(uint32_t totalThread, Function func, Count count, T* ...data)
		{
			if (totalThread <= 1)
			{
				for (Count i = 0; i < count; ++i)
				{
					func(static_cast<uint32_t>(i), data[i]...);
				}
				return;
			}

			boost::asio::thread_pool pool(totalThread);
			for (Count i = 0; i < count; ++i)
			{
				boost::asio::post(pool, [&func, i, data...]() {
					func(static_cast<uint32_t>(i), data[i]...);
				});
			}
			pool.join();
		}
	};
}
