#ifndef FILEUTIL_EVENT_ENGINE_HPP
#define FILEUTIL_EVENT_ENGINE_HPP

#include <memory>
#include <unordered_map>
#include <vector>
#include <string>
#include <functional>
#include <typeindex>
#include <mutex>
#include <atomic>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace EventSystem {

// ----------------- Logger interfaces -----------------
class ILogger {
public:
    virtual ~ILogger() = default;
    enum class Level { Debug, Info, Warning, Error, Critical };

    // Logger must not throw.
    virtual void log(Level level, const std::string& message) noexcept = 0;
};

class NullLogger : public ILogger {
public:
    void log(Level, const std::string&) noexcept override {}
};

// ----------------- Events & handlers -----------------
class IEvent {
public:
    virtual ~IEvent() = default;
    virtual std::type_index get_type() const = 0;
};

// Borrows the caller's payload so handlers can write results back into it.
template<typename PayloadType>
class Event : public IEvent {
public:
    using payload_type = PayloadType;

    explicit Event(PayloadType& payload) : payload_(payload) {}

    std::type_index get_type() const override {
        return std::type_index(typeid(PayloadType));
    }

    const PayloadType& payload() const { return payload_; }
    PayloadType& payload() { return payload_; }

private:
    PayloadType& payload_;
};

class IEventHandler {
public:
    virtual ~IEventHandler() = default;
    // Returns false when the event carries a different payload type or the owner is gone.
    virtual bool try_handle_event(IEvent& event) = 0;
    virtual bool is_expired() const = 0;
    virtual void mark_removed() = 0;
    virtual bool is_removed() const = 0;
    virtual uint64_t get_subscription_id() const = 0;
};

template<typename PayloadType, typename HandlerClass>
class EventHandler : public IEventHandler {
public:
    using HandlerFunction = void (HandlerClass::*)(PayloadType&);

    EventHandler(std::shared_ptr<HandlerClass> instance,
                 HandlerFunction function,
                 uint64_t subscription_id)
        : instance_(instance),
          function_(function),
          removed_(false),
          subscription_id_(subscription_id) {
        if (!instance) {
            throw std::invalid_argument("EventHandler: instance cannot be null");
        }
        if (!function) {
            throw std::invalid_argument("EventHandler: function cannot be null");
        }
    }

    bool try_handle_event(IEvent& event) override {
        if (is_removed()) return false;

        auto owner = instance_.lock();
        if (!owner) return false;

        if (event.get_type() != std::type_index(typeid(PayloadType))) return false;

        ((*owner).*function_)(static_cast<Event<PayloadType>&>(event).payload());
        return true;
    }

    bool is_expired() const override { return instance_.expired(); }
    void mark_removed() override { removed_.store(true, std::memory_order_release); }
    bool is_removed() const override { return removed_.load(std::memory_order_acquire); }
    uint64_t get_subscription_id() const override { return subscription_id_; }

private:
    std::weak_ptr<HandlerClass> instance_;
    HandlerFunction function_;
    std::atomic<bool> removed_;
    uint64_t subscription_id_;
};

template<typename PayloadType>
class FunctionEventHandler : public IEventHandler {
public:
    using HandlerFunction = std::function<void(PayloadType&)>;

    FunctionEventHandler(HandlerFunction function, uint64_t subscription_id)
        : function_(std::move(function)),
          removed_(false),
          subscription_id_(subscription_id) {
        if (!function_) {
            throw std::invalid_argument("FunctionEventHandler: function cannot be null");
        }
    }

    bool try_handle_event(IEvent& event) override {
        if (is_removed()) return false;

        if (event.get_type() != std::type_index(typeid(PayloadType))) return false;

        function_(static_cast<Event<PayloadType>&>(event).payload());
        return true;
    }

    bool is_expired() const override { return false; }
    void mark_removed() override { removed_.store(true, std::memory_order_release); }
    bool is_removed() const override { return removed_.load(std::memory_order_acquire); }
    uint64_t get_subscription_id() const override { return subscription_id_; }

private:
    HandlerFunction function_;
    std::atomic<bool> removed_;
    uint64_t subscription_id_;
};

// ----------------- Exceptions -----------------
class EventEngineException : public std::runtime_error {
public:
    explicit EventEngineException(const std::string& message)
        : std::runtime_error(message) {}
};

class MaxHandlersExceededException : public EventEngineException {
public:
    MaxHandlersExceededException()
        : EventEngineException("Maximum handler count exceeded") {}
};

class HandlerIdExhaustedException : public EventEngineException {
public:
    HandlerIdExhaustedException()
        : EventEngineException("Handler ID space exhausted") {}
};

class InvalidArgumentException : public EventEngineException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : EventEngineException("Invalid argument: " + message) {}
};

class NoHandlersException : public EventEngineException {
public:
    explicit NoHandlersException(const std::string& topic)
        : EventEngineException("No handlers for topic '" + topic + "'") {}
};

class PayloadTypeMismatchException : public EventEngineException {
public:
    explicit PayloadTypeMismatchException(const std::string& topic)
        : EventEngineException("No handler on topic '" + topic + "' accepts this payload type") {}
};

// ----------------- Dispatcher -----------------
using HandlerId = uint64_t;

class EventDispatcher {
public:
    static constexpr size_t DEFAULT_MAX_HANDLERS = 10000;
    static constexpr size_t ID_RESERVE = 1000;

    enum class DispatchResult {
        Success,
        NoHandlers,
        PayloadMismatch,
        HandlerException
    };

    using ExceptionCallback = std::function<void(HandlerId handler_id, const std::exception& e)>;

    explicit EventDispatcher(std::shared_ptr<ILogger> logger = nullptr,
                             size_t max_handlers = DEFAULT_MAX_HANDLERS);
    ~EventDispatcher() noexcept;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    template<typename PayloadType, typename HandlerClass>
    HandlerId subscribe(const std::string& topic,
                        std::shared_ptr<HandlerClass> handler,
                        void (HandlerClass::*function)(PayloadType&));

    template<typename PayloadType, typename Function>
    HandlerId subscribe(const std::string& topic, Function&& function);

    bool unsubscribe(HandlerId id) noexcept;
    size_t unsubscribe_topic(const std::string& topic) noexcept;

    // Notification style: handler failures go to the exception callback.
    template<typename PayloadType>
    DispatchResult dispatch(const std::string& topic, PayloadType& payload) noexcept;

    // Request style: handler failures propagate to the caller. Returns the number of handlers run.
    template<typename PayloadType>
    size_t invoke(const std::string& topic, PayloadType& payload);

    void set_exception_callback(ExceptionCallback callback);

    bool has_handlers(const std::string& topic) const noexcept;
    size_t get_handler_count() const noexcept;
    size_t get_handler_count(const std::string& topic) const noexcept;
    std::vector<std::string> get_topics() const;

private:
    struct HandlerEntry {
        HandlerId id;
        std::shared_ptr<IEventHandler> handler;
    };

    HandlerId add_handler_unsafe(const std::string& topic, std::shared_ptr<IEventHandler> handler, HandlerId id);
    void check_subscribe_preconditions_unsafe(const std::string& topic);
    HandlerId generate_handler_id_unsafe();
    std::vector<std::shared_ptr<IEventHandler>> snapshot(const std::string& topic) const;
    void cleanup_inactive_handlers_unsafe() noexcept;
    void log_message(ILogger::Level level, const std::string& message) noexcept;
    void invoke_exception_callback(HandlerId handler_id, const std::exception& e) noexcept;

    std::unordered_map<std::string, std::vector<HandlerEntry>> handlers_;
    mutable std::mutex handlers_mutex_;

    std::atomic<size_t> total_handler_count_{0};
    const size_t max_handlers_;
    std::atomic<HandlerId> next_handler_id_{1};

    const std::shared_ptr<ILogger> logger_;
    ExceptionCallback exception_callback_;
    std::mutex callback_mutex_;
};

// ----------------- ScopedSubscription -----------------
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventDispatcher* dispatcher, HandlerId id);

    ~ScopedSubscription() noexcept;

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ScopedSubscription(ScopedSubscription&& other) noexcept;
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept;

    explicit operator bool() const { return is_valid(); }

    bool unsubscribe() noexcept;
    bool is_valid() const { return dispatcher_ != nullptr && id_ != 0; }
    HandlerId id() const { return id_; }

private:
    EventDispatcher* dispatcher_{nullptr};
    HandlerId id_{0};
};

// ----------------- Template definitions for EventDispatcher -----------------

template<typename PayloadType, typename HandlerClass>
HandlerId EventDispatcher::subscribe(const std::string& topic,
                                     std::shared_ptr<HandlerClass> handler,
                                     void (HandlerClass::*function)(PayloadType&)) {
    if (!handler) {
        throw InvalidArgumentException("handler cannot be null");
    }
    if (!function) {
        throw InvalidArgumentException("handler function cannot be null");
    }

    HandlerId id;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        check_subscribe_preconditions_unsafe(topic);

        id = generate_handler_id_unsafe();
        add_handler_unsafe(topic,
                           std::make_shared<EventHandler<PayloadType, HandlerClass>>(handler, function, id),
                           id);
    }

    log_message(ILogger::Level::Debug, "Handler " + std::to_string(id) + " subscribed to '" + topic + "'");
    return id;
}

template<typename PayloadType, typename Function>
HandlerId EventDispatcher::subscribe(const std::string& topic, Function&& function) {
    typename FunctionEventHandler<PayloadType>::HandlerFunction wrapped(std::forward<Function>(function));
    if (!wrapped) {
        throw InvalidArgumentException("function cannot be null");
    }

    HandlerId id;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        check_subscribe_preconditions_unsafe(topic);

        id = generate_handler_id_unsafe();
        add_handler_unsafe(topic, std::make_shared<FunctionEventHandler<PayloadType>>(std::move(wrapped), id), id);
    }

    log_message(ILogger::Level::Debug, "Lambda handler " + std::to_string(id) + " subscribed to '" + topic + "'");
    return id;
}

template<typename PayloadType>
EventDispatcher::DispatchResult EventDispatcher::dispatch(const std::string& topic, PayloadType& payload) noexcept {
    std::vector<std::shared_ptr<IEventHandler>> handlers;
    try {
        handlers = snapshot(topic);
    } catch (const std::exception& e) {
        log_message(ILogger::Level::Error, std::string("dispatch snapshot failed: ") + e.what());
        return DispatchResult::HandlerException;
    }

    if (handlers.empty()) {
        return DispatchResult::NoHandlers;
    }

    Event<PayloadType> event(payload);
    DispatchResult result = DispatchResult::PayloadMismatch;

    for (auto& h : handlers) {
        try {
            if (h->try_handle_event(event) && result == DispatchResult::PayloadMismatch) {
                result = DispatchResult::Success;
            }
        } catch (const std::exception& ex) {
            result = DispatchResult::HandlerException;
            invoke_exception_callback(h->get_subscription_id(), ex);
            log_message(ILogger::Level::Error,
                        "Handler " + std::to_string(h->get_subscription_id()) + " on '" + topic + "' threw: " + ex.what());
        } catch (...) {
            result = DispatchResult::HandlerException;
            log_message(ILogger::Level::Error,
                        "Handler " + std::to_string(h->get_subscription_id()) + " on '" + topic + "' threw a non-standard exception");
        }
    }

    return result;
}

template<typename PayloadType>
size_t EventDispatcher::invoke(const std::string& topic, PayloadType& payload) {
    auto handlers = snapshot(topic);
    if (handlers.empty()) {
        throw NoHandlersException(topic);
    }

    Event<PayloadType> event(payload);
    size_t handled = 0;
    for (auto& h : handlers) {
        if (h->try_handle_event(event)) {
            ++handled;
        }
    }

    if (handled == 0) {
        throw PayloadTypeMismatchException(topic);
    }
    return handled;
}

}

#endif
