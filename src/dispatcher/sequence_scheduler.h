#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include <folly/concurrency/UnboundedQueue.h>

#include "interfaces.h"
#include "event/sequence_key.h"

namespace Cadence {

struct SchedulerOptions {
	// Events one drain unit handles before it re-submits itself to the executor.
	// 0 keeps draining until the queue is empty.
	size_t max_events_per_drain = 0;
};

/**
 * Serial processing queue for a single sequence key.
 *
 * Events appended to the scheduler are handed to the listener one at a time, in
 * append order, by at most one drain unit running on the executor. When the
 * queue runs empty the scheduler terminates for good and reports it through
 * the shutdown callback; later appends are refused and the caller has to
 * obtain a fresh scheduler.
 *
 * Instances must be owned by a std::shared_ptr.
 */
class SequenceScheduler : public std::enable_shared_from_this<SequenceScheduler> {
	public:
		using ShutdownCallback =
			std::function<void(const SequenceKey& key, const std::shared_ptr<SequenceScheduler>& scheduler)>;

		enum class State { IDLE, DRAINING, TERMINATED };

		SequenceScheduler(SequenceKey key,
				std::shared_ptr<EventListener> listener,
				Executor& executor,
				ShutdownCallback shutdown_callback,
				HandlerErrorCallback on_error = nullptr,
				SchedulerOptions options = {});

		~SequenceScheduler();

		SequenceScheduler(const SequenceScheduler&) = delete;
		SequenceScheduler& operator=(const SequenceScheduler&) = delete;

		/**
		 * Add an event to the tail of the queue and make sure a drain unit is running.
		 *
		 * @return true if the event will be handled by this scheduler, false if the
		 *         scheduler has already terminated
		 * @throws ExecutorRejectedError if the first drain unit cannot be scheduled and
		 *         no other event is waiting on it. With events waiting, the queue is
		 *         drained on the calling thread instead.
		 */
		bool Append(EventPtr event);

		State GetState() const;
		const SequenceKey& GetKey() const { return key_; }
		size_t NumHandled() const { return handled_.load(std::memory_order_relaxed); }

	private:
		// pending_ value once the scheduler has terminated
		static constexpr int64_t kTerminated = -1;

		void Drain();
		bool Resubmit();
		void Terminate();
		// Terminates if the caller's event is the only one pending. Returns false
		// when other appends are waiting, which leaves the caller to drain them.
		bool Abandon();

		const SequenceKey key_;
		std::shared_ptr<EventListener> listener_;
		Executor& executor_;
		ShutdownCallback shutdown_callback_;
		HandlerErrorCallback on_error_;
		const SchedulerOptions options_;

		// 0: idle, n > 0: draining with n events appended but not yet handled,
		// kTerminated: refusing appends
		std::atomic<int64_t> pending_{0};
		std::atomic<size_t> handled_{0};

		folly::UMPSCQueue<EventPtr, false> queue_;
};

} // namespace Cadence
