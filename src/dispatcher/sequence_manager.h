#ifndef CADENCE_SEQUENCE_MANAGER_H_
#define CADENCE_SEQUENCE_MANAGER_H_

#include <atomic>
#include <cstdint>
#include <memory>

#include <folly/concurrency/ConcurrentHashMap.h>
#include "absl/hash/hash.h"

#include "interfaces.h"
#include "sequence_scheduler.h"
#include "event/sequence_key.h"

namespace Cadence {

struct SequenceManagerOptions {
	SchedulerOptions scheduler;
	// Receives handler failures. Must not throw. Unset: failures are logged.
	HandlerErrorCallback on_handler_error;
};

/**
 * Delegates each incoming event to the SequenceScheduler of its sequence key.
 *
 * Events the listener does not accept are dropped. Events without a key are
 * handed to the executor one by one for fully concurrent processing. Keyed
 * events go to the live scheduler of their key, which is created on demand and
 * removed again once it has drained.
 *
 * The executor must outlive every task submitted through this manager.
 */
class SequenceManager {
	public:
		struct Stats {
			uint64_t events_received = 0;
			uint64_t events_ignored = 0;
			uint64_t events_unsequenced = 0;
			uint64_t events_sequenced = 0;
			uint64_t schedulers_created = 0;
			uint64_t registration_retries = 0;
		};

		/**
		 * Constructor
		 *
		 * @param listener The listener this instance manages events for
		 * @param executor The executor that processes the events
		 * @param options Scheduler tuning and handler failure reporting
		 */
		SequenceManager(std::shared_ptr<EventListener> listener,
				Executor& executor,
				SequenceManagerOptions options = {});

		virtual ~SequenceManager();

		SequenceManager(const SequenceManager&) = delete;
		SequenceManager& operator=(const SequenceManager&) = delete;

		/**
		 * Route an event to the relevant scheduler
		 *
		 * @param event The event to schedule
		 * @throws ExecutorRejectedError if the executor refuses the work
		 */
		void AddEvent(EventPtr event);

		size_t ActiveSequenceCount() const { return schedulers_->size(); }
		bool HasActiveSequence(const SequenceKey& key) const;

		Stats GetStats() const;

	protected:
		/**
		 * Creates the scheduler for a sequence key that has none
		 *
		 * @param key The sequence key the scheduler serves
		 * @return a new scheduler that deregisters itself from this manager on shutdown
		 */
		virtual std::shared_ptr<SequenceScheduler> NewProcessingScheduler(const SequenceKey& key);

		// Removes a terminated scheduler from the registry if it is still the one mapped to its key
		SequenceScheduler::ShutdownCallback NewShutdownCallback() const;

	private:
		using SchedulerMap = folly::ConcurrentHashMap<SequenceKey,
			  std::shared_ptr<SequenceScheduler>,
			  absl::Hash<SequenceKey>>;

		void ScheduleEvent(const EventPtr& event, const SequenceKey& key);

		std::shared_ptr<EventListener> listener_;
		Executor& executor_;
		std::shared_ptr<SequencingPolicy> sequencing_policy_;
		SequenceManagerOptions options_;

		// Shared with the shutdown callbacks, which only hold a weak reference
		std::shared_ptr<SchedulerMap> schedulers_;

		std::atomic<uint64_t> events_received_{0};
		std::atomic<uint64_t> events_ignored_{0};
		std::atomic<uint64_t> events_unsequenced_{0};
		std::atomic<uint64_t> events_sequenced_{0};
		std::atomic<uint64_t> schedulers_created_{0};
		std::atomic<uint64_t> registration_retries_{0};
};

} // namespace Cadence

#endif // CADENCE_SEQUENCE_MANAGER_H_
