#include "event_invocation.h"
#include <glog/logging.h>

namespace Cadence {

namespace {

void ReportHandlerFailure(const Event& event, const HandlerErrorCallback& on_error,
		const std::string& error_msg) {
	if (on_error) {
		on_error(event, error_msg);
	} else {
		LOG(ERROR) << "Handler failed for event of type [" << event.TypeName() << "]: " << error_msg;
	}
}

} // namespace

void InvokeEventHandler(EventListener& listener, const Event& event,
		const HandlerErrorCallback& on_error) {
	try {
		listener.Handle(event);
	} catch (const std::exception& e) {
		ReportHandlerFailure(event, on_error, e.what());
	} catch (...) {
		ReportHandlerFailure(event, on_error, "unknown exception");
	}
}

} // namespace Cadence
