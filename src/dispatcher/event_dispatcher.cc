#include "event_dispatcher.h"
#include <glog/logging.h>

namespace Cadence {

EventDispatcher::EventDispatcher(Executor& executor, SequenceManagerOptions options) :
	executor_(executor),
	options_(std::move(options)) {
		VLOG(3) << "\t[EventDispatcher]\t\tConstructed";
	}

EventDispatcher::~EventDispatcher() {
	VLOG(3) << "\t[EventDispatcher]\tDestructed";
}

bool EventDispatcher::Subscribe(std::shared_ptr<EventListener> listener) {
	CHECK(listener) << "Cannot subscribe a null listener";
	absl::WriterMutexLock lock(&mutex_);
	const EventListener* id = listener.get();
	if (managers_.contains(id)) {
		LOG(WARNING) << "Listener already subscribed, ignoring";
		return false;
	}
	managers_.emplace(id, std::make_unique<SequenceManager>(std::move(listener), executor_, options_));
	LOG(INFO) << "Subscribed listener, " << managers_.size() << " total";
	return true;
}

bool EventDispatcher::Unsubscribe(const std::shared_ptr<EventListener>& listener) {
	absl::WriterMutexLock lock(&mutex_);
	if (managers_.erase(listener.get()) == 0) {
		return false;
	}
	LOG(INFO) << "Unsubscribed listener, " << managers_.size() << " remaining";
	return true;
}

void EventDispatcher::Publish(EventPtr event) {
	CHECK(event) << "Cannot publish a null event";
	absl::ReaderMutexLock lock(&mutex_);
	for (const auto& entry : managers_) {
		entry.second->AddEvent(event);
	}
}

size_t EventDispatcher::NumSubscribers() const {
	absl::ReaderMutexLock lock(&mutex_);
	return managers_.size();
}

} // namespace Cadence
