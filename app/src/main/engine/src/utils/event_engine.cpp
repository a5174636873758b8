#include "utils/event_engine.hpp"
#include <algorithm>

namespace EventSystem {

EventDispatcher::EventDispatcher(std::shared_ptr<ILogger> logger, size_t max_handlers)
    : max_handlers_(max_handlers),
      logger_(logger ? logger : std::make_shared<NullLogger>()) {
    if (max_handlers_ == 0) {
        throw InvalidArgumentException("max_handlers must be positive");
    }
}

EventDispatcher::~EventDispatcher() noexcept {
    std::lock_guard<std::mutex> lk(handlers_mutex_);
    for (auto& topic : handlers_) {
        for (auto& entry : topic.second) {
            if (entry.handler) entry.handler->mark_removed();
        }
    }
    handlers_.clear();
}

HandlerId EventDispatcher::generate_handler_id_unsafe() {
    HandlerId id = next_handler_id_.fetch_add(1, std::memory_order_acq_rel);
    if (id >= std::numeric_limits<HandlerId>::max() - ID_RESERVE) {
        throw HandlerIdExhaustedException();
    }
    return id;
}

void EventDispatcher::check_subscribe_preconditions_unsafe(const std::string& topic) {
    if (topic.empty()) {
        throw InvalidArgumentException("topic cannot be empty");
    }
    if (total_handler_count_.load(std::memory_order_acquire) >= max_handlers_) {
        // Handlers whose owner is gone still count until swept.
        cleanup_inactive_handlers_unsafe();
        if (total_handler_count_.load(std::memory_order_acquire) >= max_handlers_) {
            throw MaxHandlersExceededException();
        }
    }
}

HandlerId EventDispatcher::add_handler_unsafe(const std::string& topic,
                                              std::shared_ptr<IEventHandler> handler,
                                              HandlerId id) {
    handlers_[topic].push_back(HandlerEntry{id, std::move(handler)});
    total_handler_count_.fetch_add(1, std::memory_order_acq_rel);
    return id;
}

std::vector<std::shared_ptr<IEventHandler>> EventDispatcher::snapshot(const std::string& topic) const {
    std::vector<std::shared_ptr<IEventHandler>> result;

    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(topic);
    if (it == handlers_.end()) {
        return result;
    }

    result.reserve(it->second.size());
    for (const auto& entry : it->second) {
        if (entry.handler && !entry.handler->is_removed() && !entry.handler->is_expired()) {
            result.push_back(entry.handler);
        }
    }
    return result;
}

void EventDispatcher::log_message(ILogger::Level level, const std::string& message) noexcept {
    logger_->log(level, message);
}

void EventDispatcher::invoke_exception_callback(HandlerId handler_id, const std::exception& e) noexcept {
    ExceptionCallback callback;
    {
        std::lock_guard<std::mutex> lk(callback_mutex_);
        callback = exception_callback_;
    }
    if (!callback) return;

    try {
        callback(handler_id, e);
    } catch (const std::exception& inner) {
        log_message(ILogger::Level::Error, std::string("Exception callback threw: ") + inner.what());
    }
}

bool EventDispatcher::unsubscribe(HandlerId id) noexcept {
    if (id == 0) return false;

    bool found = false;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end() && !found; ++it) {
            auto& entries = it->second;
            auto pos = std::find_if(entries.begin(), entries.end(),
                                    [id](const HandlerEntry& e) { return e.id == id; });
            if (pos != entries.end()) {
                if (pos->handler) pos->handler->mark_removed();
                entries.erase(pos);
                total_handler_count_.fetch_sub(1, std::memory_order_acq_rel);
                if (entries.empty()) {
                    handlers_.erase(it);
                }
                found = true;
            }
        }
    }

    if (found) {
        log_message(ILogger::Level::Debug, "Handler " + std::to_string(id) + " unsubscribed");
    }
    return found;
}

size_t EventDispatcher::unsubscribe_topic(const std::string& topic) noexcept {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(topic);
    if (it == handlers_.end()) return 0;

    size_t removed = it->second.size();
    for (auto& entry : it->second) {
        if (entry.handler) entry.handler->mark_removed();
    }
    handlers_.erase(it);
    total_handler_count_.fetch_sub(removed, std::memory_order_acq_rel);
    return removed;
}

void EventDispatcher::set_exception_callback(ExceptionCallback callback) {
    std::lock_guard<std::mutex> lk(callback_mutex_);
    exception_callback_ = std::move(callback);
}

bool EventDispatcher::has_handlers(const std::string& topic) const noexcept {
    return get_handler_count(topic) > 0;
}

size_t EventDispatcher::get_handler_count() const noexcept {
    return total_handler_count_.load(std::memory_order_acquire);
}

size_t EventDispatcher::get_handler_count(const std::string& topic) const noexcept {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    auto it = handlers_.find(topic);
    if (it == handlers_.end()) return 0;

    return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(), [](const HandlerEntry& e) {
        return e.handler && !e.handler->is_removed() && !e.handler->is_expired();
    }));
}

std::vector<std::string> EventDispatcher::get_topics() const {
    std::vector<std::string> topics;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        topics.reserve(handlers_.size());
        for (const auto& entry : handlers_) {
            topics.push_back(entry.first);
        }
    }
    std::sort(topics.begin(), topics.end());
    return topics;
}

// Drops handlers whose owning object has been destroyed.
void EventDispatcher::cleanup_inactive_handlers_unsafe() noexcept {
    for (auto it = handlers_.begin(); it != handlers_.end();) {
        auto& entries = it->second;
        auto before = entries.size();
        entries.erase(std::remove_if(entries.begin(), entries.end(), [](const HandlerEntry& e) {
                          return !e.handler || e.handler->is_removed() || e.handler->is_expired();
                      }),
                      entries.end());
        total_handler_count_.fetch_sub(before - entries.size(), std::memory_order_acq_rel);

        if (entries.empty()) {
            it = handlers_.erase(it);
        } else {
            ++it;
        }
    }
}

// ----------------- ScopedSubscription -----------------

ScopedSubscription::ScopedSubscription(EventDispatcher* dispatcher, HandlerId id)
    : dispatcher_(dispatcher), id_(id) {}

ScopedSubscription::~ScopedSubscription() noexcept {
    unsubscribe();
}

ScopedSubscription::ScopedSubscription(ScopedSubscription&& other) noexcept
    : dispatcher_(other.dispatcher_), id_(other.id_) {
    other.dispatcher_ = nullptr;
    other.id_ = 0;
}

ScopedSubscription& ScopedSubscription::operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        dispatcher_ = other.dispatcher_;
        id_ = other.id_;
        other.dispatcher_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

bool ScopedSubscription::unsubscribe() noexcept {
    if (!is_valid()) return false;

    bool result = dispatcher_->unsubscribe(id_);
    dispatcher_ = nullptr;
    id_ = 0;
    return result;
}

}
