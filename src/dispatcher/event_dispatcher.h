#pragma once

#include <memory>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "interfaces.h"
#include "sequence_manager.h"

namespace Cadence {

/**
 * Asynchronous event bus
 * Every published event is offered to each subscribed listener. Each listener
 * gets its own SequenceManager, so its sequencing policy applies to its own
 * stream only; all of them share one executor.
 */
class EventDispatcher {
	public:
		explicit EventDispatcher(Executor& executor, SequenceManagerOptions options = {});
		~EventDispatcher();

		/**
		 * @return false if the listener was already subscribed
		 */
		bool Subscribe(std::shared_ptr<EventListener> listener);

		/**
		 * Stops delivering new events to the listener. Events already routed to it
		 * are still handled.
		 *
		 * @return false if the listener was not subscribed
		 */
		bool Unsubscribe(const std::shared_ptr<EventListener>& listener);

		/**
		 * Offer the event to every subscribed listener
		 *
		 * @throws ExecutorRejectedError if the executor refuses the work
		 */
		void Publish(EventPtr event);

		size_t NumSubscribers() const;

	private:
		Executor& executor_;
		const SequenceManagerOptions options_;

		mutable absl::Mutex mutex_;
		absl::flat_hash_map<const EventListener*, std::unique_ptr<SequenceManager>> managers_
			ABSL_GUARDED_BY(mutex_);
};

} // namespace Cadence
