#ifndef FILEUTIL_METRICS_BASE_HPP
#define FILEUTIL_METRICS_BASE_HPP

#include "utils/metrics_engine.hpp"
#include <chrono>
#include <string>
#include <memory>
#include <functional>
#include <type_traits>
#include <system_error>

class MetricsBase {
protected:
    metrics::MetricsEngine& metrics_;
    std::string component_name_;
    bool metrics_enabled_;

    MetricsBase(const std::string& component_name, bool enabled = true)
        : metrics_(metrics::MetricsEngine::getInstance())
        , component_name_(component_name)
        , metrics_enabled_(enabled) {
    }

public:
    virtual ~MetricsBase() = default;


    class ScopedTimer {
    private:
        MetricsBase& parent_;
        std::string operation_;
        std::chrono::steady_clock::time_point start_;
        nlohmann::json custom_data_;
        bool success_ = true;
        int error_code_ = 0;
        std::string error_message_;

    public:
        ScopedTimer(MetricsBase& parent, const std::string& operation,
                   const nlohmann::json& data = {})
            : parent_(parent), operation_(operation), custom_data_(data) {
            start_ = std::chrono::steady_clock::now();
        }

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

        void setFailed(int error_code = 0, const std::string& error_msg = "") {
            success_ = false;
            error_code_ = error_code;
            error_message_ = error_msg;
        }

        ~ScopedTimer() {
            if (!parent_.metrics_enabled_) return;

            auto end = std::chrono::steady_clock::now();
            double duration = std::chrono::duration<double, std::milli>(end - start_).count();

            if (success_) {
                parent_.metrics_.logOperation(parent_.component_name_, operation_,
                                            true, duration, custom_data_);
            } else {
                parent_.metrics_.log(metrics::LogLevel::ERROR, parent_.component_name_, operation_,
                                     error_message_.empty() ? "Operation failed" : error_message_,
                                     error_code_, custom_data_);
            }
        }
    };


    // Times func and logs the outcome; exceptions are recorded and rethrown.
    template<typename Func>
    auto measure(const std::string& operation, Func&& func,
                const nlohmann::json& context_data = {}) -> std::invoke_result_t<Func> {
        ScopedTimer timer(*this, operation, context_data);

        try {
            return std::invoke(std::forward<Func>(func));
        } catch (const std::system_error& e) {
            timer.setFailed(e.code().value(), e.what());
            throw;
        } catch (const std::exception& e) {
            timer.setFailed(-1, e.what());
            throw;
        }
    }


    void logDebug(const std::string& operation, const std::string& message,
                 const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_.log(metrics::LogLevel::DEBUG, component_name_, operation, message, 0, data);
    }

    void logInfo(const std::string& operation, const std::string& message,
                const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_.log(metrics::LogLevel::INFO, component_name_, operation, message, 0, data);
    }

    void logWarning(const std::string& operation, const std::string& message,
                   const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_.log(metrics::LogLevel::WARNING, component_name_, operation, message, 0, data);
    }

    void logError(const std::string& operation, const std::string& message,
                 int error_code = 0, const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_.log(metrics::LogLevel::ERROR, component_name_, operation, message, error_code, data);
    }

    void logCritical(const std::string& operation, const std::string& message,
                    int error_code = 0, const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_.log(metrics::LogLevel::CRITICAL, component_name_, operation, message, error_code, data);
    }


    void logOperation(const std::string& operation, bool success,
                     double duration_ms, const nlohmann::json& data = {}) {
        if (!metrics_enabled_) return;
        metrics_.logOperation(component_name_, operation, success, duration_ms, data);
    }


    void disableMetrics() { metrics_enabled_ = false; }
    bool isMetricsEnabled() const { return metrics_enabled_; }

    class BatchOperation {
    private:
        MetricsBase& parent_;
        std::string base_operation_;
        size_t total_items_ = 0;
        size_t processed_items_ = 0;
        size_t failed_items_ = 0;
        std::chrono::steady_clock::time_point start_time_;

    public:
        BatchOperation(MetricsBase& parent, const std::string& operation, size_t total_items)
            : parent_(parent), base_operation_(operation), total_items_(total_items) {
            start_time_ = std::chrono::steady_clock::now();
            parent_.logDebug(operation, "Batch operation started",
                            {{"total_items", total_items}});
        }

        BatchOperation(const BatchOperation&) = delete;
        BatchOperation& operator=(const BatchOperation&) = delete;

        void itemProcessed(bool success = true) {
            processed_items_++;
            if (!success) failed_items_++;
        }

        void itemFailed() {
            processed_items_++;
            failed_items_++;
        }

        ~BatchOperation() {
            auto end = std::chrono::steady_clock::now();
            double duration = std::chrono::duration<double, std::milli>(end - start_time_).count();

            bool overall_success = (failed_items_ == 0);
            parent_.logOperation(base_operation_, overall_success, duration,
                               {{"total_items", total_items_},
                                {"processed_items", processed_items_},
                                {"failed_items", failed_items_}});
        }
    };

    std::unique_ptr<BatchOperation> createBatchOperation(const std::string& operation, size_t total_items) {
        return std::make_unique<BatchOperation>(*this, operation, total_items);
    }
};

#endif
