#pragma once

#include <memory>
#include <string>

#include "interfaces.h"

namespace Cadence {

/**
 * Hands one event to the listener. Anything the handler throws is reported
 * through on_error (or logged when none is set) and goes no further.
 */
void InvokeEventHandler(EventListener& listener, const Event& event,
		const HandlerErrorCallback& on_error);

/**
 * Unit of work for an event that needs no sequencing
 */
class SingleEventInvocationTask {
	public:
		SingleEventInvocationTask(std::shared_ptr<EventListener> listener, EventPtr event,
				HandlerErrorCallback on_error)
			: listener_(std::move(listener)),
			event_(std::move(event)),
			on_error_(std::move(on_error)) {}

		void operator()() const {
			InvokeEventHandler(*listener_, *event_, on_error_);
		}

	private:
		std::shared_ptr<EventListener> listener_;
		EventPtr event_;
		HandlerErrorCallback on_error_;
};

} // namespace Cadence
