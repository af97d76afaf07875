#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>

#include "event/event.h"
#include "event/sequencing_policy.h"

namespace Cadence {

/**
 * Interface for event listeners
 */
class EventListener {
public:
    virtual ~EventListener() = default;

    // Whether events of the given runtime type are of interest to this listener
    virtual bool CanHandle(std::type_index event_type) const = 0;

    // Process one event. May block and may throw; called at most once per event.
    virtual void Handle(const Event& event) = 0;

    // Read once, when a SequenceManager is created for this listener
    virtual std::shared_ptr<SequencingPolicy> GetSequencingPolicy() const {
        return std::make_shared<SequentialPerAggregatePolicy>();
    }
};

/**
 * Thrown by an Executor that cannot accept more work
 */
class ExecutorRejectedError : public std::runtime_error {
public:
    explicit ExecutorRejectedError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Interface for the worker pool events are processed on
 */
class Executor {
public:
    virtual ~Executor() = default;

    // Run the task on some thread at some later point. Throws ExecutorRejectedError
    // if the task cannot be accepted.
    virtual void Execute(std::function<void()> task) = 0;
};

// Reports an event whose handler threw
using HandlerErrorCallback = std::function<void(const Event& event, const std::string& error_msg)>;

} // namespace Cadence
