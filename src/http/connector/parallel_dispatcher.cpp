#include "parallel_dispatcher.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include "../error/http_error.hpp"

namespace http::connector {

    namespace {
        struct Completion {
            size_t index_ = 0;
            std::optional<http::model::Response> response_;
            std::exception_ptr error_;
        };

        // Outlives the call that created it when tasks are still running after a failure.
        struct BatchChannel {
            std::mutex mutex_;
            std::condition_variable cv_;
            std::deque<Completion> completions_;
            std::stop_source stop_;

            void push(Completion c) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    completions_.push_back(std::move(c));
                }
                cv_.notify_one();
            }

            Completion pop() {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return !completions_.empty(); });
                Completion c = std::move(completions_.front());
                completions_.pop_front();
                return c;
            }
        };

        template <typename T>
        void check_aligned(const std::vector<T>& list, size_t expected, const char* name) {
            if (!list.empty() && list.size() != expected) {
                throw std::invalid_argument(std::string(name) + " has " + std::to_string(list.size()) + " entries for " + std::to_string(expected) +
                                            " endpoints");
            }
        }
    }  // namespace

    ParallelDispatcher::ParallelDispatcher(const Connector& connector, size_t max_workers, logging::Level log_level)
        : connector_(connector),
          pool_(max_workers == 0 ? concurrency::ThreadPool::default_thread_count() : max_workers),
          logger_("ParallelDispatcher", log_level) {}

    std::vector<http::model::Response> ParallelDispatcher::request_many(http::model::Method method, const std::vector<std::string>& endpoints,
                                                                        const std::vector<http::model::Headers>& headers_list,
                                                                        const std::vector<http::model::Params>& params_list,
                                                                        const Bodies& body_list) const {
        check_aligned(headers_list, endpoints.size(), "headers_list");
        check_aligned(params_list, endpoints.size(), "params_list");
        check_aligned(body_list, endpoints.size(), "body_list");

        std::vector<http::model::RequestSpec> specs;
        specs.reserve(endpoints.size());
        for (size_t i = 0; i < endpoints.size(); ++i) {
            specs.push_back(http::model::RequestSpec{
                .method_ = method,
                .endpoint_ = endpoints[i],
                .params_ = params_list.empty() ? http::model::Params{} : params_list[i],
                .body_ = body_list.empty() ? std::nullopt : body_list[i],
                .headers_ = headers_list.empty() ? http::model::Headers{} : headers_list[i],
            });
        }

        return request_many(specs);
    }

    std::vector<http::model::Response> ParallelDispatcher::request_many(const std::vector<http::model::RequestSpec>& specs) const {
        std::vector<http::model::Response> responses;
        if (specs.empty()) {
            return responses;
        }

        HC_LOG_INFO(logger_, "Making " << specs.size() << " parallel requests");

        auto channel = std::make_shared<BatchChannel>();

        try {
            for (size_t i = 0; i < specs.size(); ++i) {
                pool_.enqueue([this, channel, spec = specs[i], i]() {
                    const std::stop_token stop = channel->stop_.get_token();
                    if (stop.stop_requested()) {
                        return;
                    }

                    Completion c{.index_ = i};
                    try {
                        c.response_ = connector_.request(spec, stop);
                    } catch (...) {
                        c.error_ = std::current_exception();
                    }
                    channel->push(std::move(c));
                });
            }
        } catch (const std::exception&) {
            channel->stop_.request_stop();
            throw;
        }

        responses.reserve(specs.size());
        for (size_t received = 0; received < specs.size(); ++received) {
            Completion c = channel->pop();
            const auto& spec = specs[c.index_];

            if (c.error_) {
                channel->stop_.request_stop();
                http::http_error::BatchError err(c.index_, spec.endpoint_, spec.method_, c.error_);
                HC_LOG_ERROR(logger_, "Failed to complete " << http::model::method_name(spec.method_) << " request to " << spec.endpoint_ << ": "
                                                            << err.what());
                throw err;
            }

            HC_LOG_DEBUG(logger_, "Successfully completed " << http::model::method_name(spec.method_) << " request to: " << spec.endpoint_);
            responses.push_back(std::move(*c.response_));
        }

        return responses;
    }

}  // namespace http::connector
