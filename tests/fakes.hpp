#ifndef HTTP_CONNECTOR_TESTS_FAKES_HPP
#define HTTP_CONNECTOR_TESTS_FAKES_HPP

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "../src/http/client/interface.hpp"
#include "../src/http/error/http_error.hpp"
#include "../src/http/model/model.hpp"

namespace fakes {

    inline http::model::Response status(long code, std::string body = "", http::model::Headers headers = {}) {
        http::model::Response resp;
        resp.status_ = code;
        resp.body_ = std::move(body);
        resp.headers_ = std::move(headers);
        return resp;
    }

    struct NetworkFailure {
        bool transient_ = true;
    };

    using Step = std::variant<http::model::Response, NetworkFailure>;

    // Replays a fixed script of outcomes and records every request it sees.
    // The last step repeats once the script runs out.
    class ScriptedClient : public http::client::IHttpClient {
       public:
        explicit ScriptedClient(std::vector<Step> script) : script_(script.begin(), script.end()) {}

        http::model::Response perform(const http::model::Request& req) override {
            Step step = status(200);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(req);
                if (!script_.empty()) {
                    step = script_.front();
                    if (script_.size() > 1) {
                        script_.pop_front();
                    }
                }
            }

            if (const auto* failure = std::get_if<NetworkFailure>(&step)) {
                throw http::http_error::NetworkError(req.method_, http::model::full_url(req), 7, failure->transient_, "scripted network failure");
            }
            auto resp = std::get<http::model::Response>(step);
            resp.effective_url_ = http::model::full_url(req);
            return resp;
        }

        std::vector<http::model::Request> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

        size_t calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_.size();
        }

       private:
        mutable std::mutex mutex_;
        std::deque<Step> script_;
        std::vector<http::model::Request> requests_;
    };

    // Answers by URL; unrouted URLs get 200 with the URL as body after latency_.
    // A URL given a delay waits that long instead.
    class RoutingClient : public http::client::IHttpClient {
       public:
        explicit RoutingClient(std::chrono::milliseconds latency = std::chrono::milliseconds::zero()) : latency_(latency) {}

        void route(const std::string& url, Step step) {
            std::lock_guard<std::mutex> lock(mutex_);
            routes_.insert_or_assign(url, std::move(step));
        }

        void delay(const std::string& url, std::chrono::milliseconds wait) {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_.insert_or_assign(url, wait);
        }

        http::model::Response perform(const http::model::Request& req) override {
            Step step = status(200, req.url_);
            bool routed = false;
            std::chrono::milliseconds wait = latency_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(req);
                if (auto it = routes_.find(req.url_); it != routes_.end()) {
                    step = it->second;
                    routed = true;
                }
                if (auto it = delays_.find(req.url_); it != delays_.end()) {
                    wait = it->second;
                } else if (routed) {
                    wait = std::chrono::milliseconds::zero();
                }
            }
            if (wait > std::chrono::milliseconds::zero()) {
                std::this_thread::sleep_for(wait);
            }

            if (const auto* failure = std::get_if<NetworkFailure>(&step)) {
                throw http::http_error::NetworkError(req.method_, req.url_, 7, failure->transient_, "routed network failure");
            }
            auto resp = std::get<http::model::Response>(step);
            resp.effective_url_ = http::model::full_url(req);
            return resp;
        }

        std::vector<http::model::Request> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

       private:
        std::chrono::milliseconds latency_;
        mutable std::mutex mutex_;
        std::map<std::string, Step> routes_;
        std::map<std::string, std::chrono::milliseconds> delays_;
        std::vector<http::model::Request> requests_;
    };

    // Delegates every request to a test-supplied function.
    class HandlerClient : public http::client::IHttpClient {
       public:
        using Handler = std::function<http::model::Response(const http::model::Request&)>;

        explicit HandlerClient(Handler handler) : handler_(std::move(handler)) {}

        http::model::Response perform(const http::model::Request& req) override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(req);
            }
            auto resp = handler_(req);
            resp.effective_url_ = http::model::full_url(req);
            return resp;
        }

        std::vector<http::model::Request> requests() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

       private:
        Handler handler_;
        mutable std::mutex mutex_;
        std::vector<http::model::Request> requests_;
    };

    // Records requested delays instead of sleeping.
    class RecordingSleeper {
       public:
        void operator()(std::chrono::milliseconds delay, std::stop_token /*stop*/) {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_.push_back(delay);
        }

        std::vector<std::chrono::milliseconds> delays() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return delays_;
        }

       private:
        mutable std::mutex mutex_;
        std::vector<std::chrono::milliseconds> delays_;
    };

    // std::function needs a copyable callable; the recorder is shared by reference.
    inline std::function<void(std::chrono::milliseconds, std::stop_token)> sleeper_for(RecordingSleeper& recorder) {
        return [&recorder](std::chrono::milliseconds delay, std::stop_token stop) { recorder(delay, std::move(stop)); };
    }

    inline void no_sleep(std::chrono::milliseconds /*delay*/, std::stop_token /*stop*/) {}

}  // namespace fakes

#endif
