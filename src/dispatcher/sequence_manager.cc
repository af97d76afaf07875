#include "sequence_manager.h"
#include <glog/logging.h>

#include "event_invocation.h"

namespace Cadence {

SequenceManager::SequenceManager(std::shared_ptr<EventListener> listener,
		Executor& executor,
		SequenceManagerOptions options) :
	listener_(std::move(listener)),
	executor_(executor),
	options_(std::move(options)),
	schedulers_(std::make_shared<SchedulerMap>()) {
		CHECK(listener_) << "SequenceManager requires a listener";
		sequencing_policy_ = listener_->GetSequencingPolicy();
		CHECK(sequencing_policy_) << "Listener returned no sequencing policy";
		VLOG(3) << "\t[SequenceManager]\t\tConstructed";
	}

SequenceManager::~SequenceManager() {
	VLOG(3) << "\t[SequenceManager]\tDestructed with " << schedulers_->size() << " active sequences";
}

void SequenceManager::AddEvent(EventPtr event) {
	CHECK(event) << "Null event added to SequenceManager";
	events_received_.fetch_add(1, std::memory_order_relaxed);

	if (!listener_->CanHandle(event->Type())) {
		events_ignored_.fetch_add(1, std::memory_order_relaxed);
		VLOG(5) << "Ignoring event of type [" << event->TypeName() << "]";
		return;
	}

	const std::optional<SequenceKey> key = sequencing_policy_->GetSequenceKeyFor(*event);
	if (!key.has_value()) {
		VLOG(4) << "Scheduling event of type [" << event->TypeName()
			<< "] for full concurrent processing";
		executor_.Execute(SingleEventInvocationTask(listener_, std::move(event), options_.on_handler_error));
		events_unsequenced_.fetch_add(1, std::memory_order_relaxed);
		return;
	}

	VLOG(4) << "Scheduling event of type [" << event->TypeName()
		<< "] for sequential processing in group [" << *key << "]";
	ScheduleEvent(event, *key);
	events_sequenced_.fetch_add(1, std::memory_order_relaxed);
}

void SequenceManager::ScheduleEvent(const EventPtr& event, const SequenceKey& key) {
	while (true) {
		std::shared_ptr<SequenceScheduler> scheduler;
		{
			auto it = schedulers_->find(key);
			if (it != schedulers_->cend()) {
				scheduler = it->second;
			}
		}

		if (!scheduler) {
			auto created = NewProcessingScheduler(key);
			if (!schedulers_->insert(key, created).second) {
				// Another thread registered one first, use theirs
				registration_retries_.fetch_add(1, std::memory_order_relaxed);
				continue;
			}
			schedulers_created_.fetch_add(1, std::memory_order_relaxed);
			scheduler = std::move(created);
		}

		if (scheduler->Append(event)) {
			return;
		}

		// The scheduler terminated; drop the mapping unless it was already replaced
		schedulers_->erase_if_equal(key, scheduler);
		registration_retries_.fetch_add(1, std::memory_order_relaxed);
	}
}

std::shared_ptr<SequenceScheduler> SequenceManager::NewProcessingScheduler(const SequenceKey& key) {
	VLOG(4) << "Initializing new processing scheduler for sequence [" << key << "]";
	return std::make_shared<SequenceScheduler>(key, listener_, executor_, NewShutdownCallback(),
			options_.on_handler_error, options_.scheduler);
}

SequenceScheduler::ShutdownCallback SequenceManager::NewShutdownCallback() const {
	std::weak_ptr<SchedulerMap> registry = schedulers_;
	return [registry](const SequenceKey& key, const std::shared_ptr<SequenceScheduler>& scheduler) {
		if (auto schedulers = registry.lock()) {
			VLOG(4) << "Cleaning up processing scheduler for sequence [" << key << "]";
			schedulers->erase_if_equal(key, scheduler);
		}
	};
}

bool SequenceManager::HasActiveSequence(const SequenceKey& key) const {
	return schedulers_->find(key) != schedulers_->cend();
}

SequenceManager::Stats SequenceManager::GetStats() const {
	Stats stats;
	stats.events_received = events_received_.load(std::memory_order_relaxed);
	stats.events_ignored = events_ignored_.load(std::memory_order_relaxed);
	stats.events_unsequenced = events_unsequenced_.load(std::memory_order_relaxed);
	stats.events_sequenced = events_sequenced_.load(std::memory_order_relaxed);
	stats.schedulers_created = schedulers_created_.load(std::memory_order_relaxed);
	stats.registration_retries = registration_retries_.load(std::memory_order_relaxed);
	return stats;
}

} // namespace Cadence
