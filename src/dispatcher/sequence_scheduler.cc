#include "sequence_scheduler.h"
#include <glog/logging.h>

#include "event_invocation.h"

namespace Cadence {

SequenceScheduler::SequenceScheduler(SequenceKey key,
		std::shared_ptr<EventListener> listener,
		Executor& executor,
		ShutdownCallback shutdown_callback,
		HandlerErrorCallback on_error,
		SchedulerOptions options) :
	key_(std::move(key)),
	listener_(std::move(listener)),
	executor_(executor),
	shutdown_callback_(std::move(shutdown_callback)),
	on_error_(std::move(on_error)),
	options_(options) {
		VLOG(4) << "[SequenceScheduler] Created for sequence [" << key_ << "]";
	}

SequenceScheduler::~SequenceScheduler() {
	VLOG(4) << "[SequenceScheduler] Destructed for sequence [" << key_ << "] after "
		<< handled_.load(std::memory_order_relaxed) << " events";
}

bool SequenceScheduler::Append(EventPtr event) {
	int64_t current = pending_.load(std::memory_order_acquire);
	do {
		if (current == kTerminated) {
			return false;
		}
	} while (!pending_.compare_exchange_weak(current, current + 1,
				std::memory_order_acq_rel, std::memory_order_acquire));

	// The reserved slot keeps the drain unit alive until this event is consumed
	queue_.enqueue(std::move(event));

	if (current != 0) {
		return true;
	}

	bool drain_inline = false;
	try {
		executor_.Execute([self = shared_from_this()] { self->Drain(); });
	} catch (const std::exception& e) {
		if (Abandon()) {
			LOG(ERROR) << "[SequenceScheduler] Could not schedule sequence [" << key_ << "]: " << e.what();
			throw;
		}
		// Events accepted by other appends are still owed a drain
		LOG(WARNING) << "[SequenceScheduler] Could not schedule sequence [" << key_
			<< "], draining inline: " << e.what();
		drain_inline = true;
	}
	if (drain_inline) {
		Drain();
	}
	return true;
}

SequenceScheduler::State SequenceScheduler::GetState() const {
	const int64_t pending = pending_.load(std::memory_order_acquire);
	if (pending == kTerminated) {
		return State::TERMINATED;
	}
	return pending == 0 ? State::IDLE : State::DRAINING;
}

void SequenceScheduler::Drain() {
	size_t processed = 0;
	while (true) {
		EventPtr event;
		// A pending count above zero guarantees an element, possibly still being enqueued
		queue_.dequeue(event);
		InvokeEventHandler(*listener_, *event, on_error_);
		event.reset();
		handled_.fetch_add(1, std::memory_order_relaxed);

		// Last pending event handled: terminate unless an append got in first
		int64_t expected = 1;
		if (pending_.compare_exchange_strong(expected, kTerminated,
					std::memory_order_acq_rel, std::memory_order_acquire)) {
			Terminate();
			return;
		}
		// Only appends run concurrently and they only increment, so this stays >= 1
		pending_.fetch_sub(1, std::memory_order_acq_rel);

		if (options_.max_events_per_drain > 0 && ++processed >= options_.max_events_per_drain) {
			if (Resubmit()) {
				return;
			}
			processed = 0;
		}
	}
}

bool SequenceScheduler::Resubmit() {
	try {
		executor_.Execute([self = shared_from_this()] { self->Drain(); });
		VLOG(5) << "[SequenceScheduler] Yielded sequence [" << key_ << "]";
		return true;
	} catch (const std::exception& e) {
		LOG(WARNING) << "[SequenceScheduler] Could not re-submit sequence [" << key_
			<< "], draining inline: " << e.what();
	}
	return false;
}

void SequenceScheduler::Terminate() {
	VLOG(4) << "[SequenceScheduler] Sequence [" << key_ << "] drained, shutting down";
	if (shutdown_callback_) {
		shutdown_callback_(key_, shared_from_this());
	}
}

bool SequenceScheduler::Abandon() {
	// Only the rejected append's own event is buffered and no drain unit is running
	int64_t expected = 1;
	if (!pending_.compare_exchange_strong(expected, kTerminated,
				std::memory_order_acq_rel, std::memory_order_acquire)) {
		return false;
	}
	EventPtr discarded;
	queue_.dequeue(discarded);
	Terminate();
	return true;
}

} // namespace Cadence
