#ifndef HTTP_CONNECTOR_PARALLEL_DISPATCHER_HPP
#define HTTP_CONNECTOR_PARALLEL_DISPATCHER_HPP

#include <string>
#include <vector>

#include "../../utils/logger.hpp"
#include "../../utils/thread_pool.hpp"
#include "../model/model.hpp"
#include "connector.hpp"

namespace http::connector {

    // Fail-fast fan-out on top of Connector::request.
    //
    // Each RequestSpec becomes one pool task; completions are read off a shared channel in
    // the order they finish. The first task to fail stops the batch: its exception
    // is rethrown as BatchError, tasks still queued are skipped, tasks waiting out a
    // backoff are woken and abandon their next attempt, and a call already on the
    // wire runs to completion with its result dropped.
    class ParallelDispatcher {
       public:
        ParallelDispatcher(const Connector& connector, size_t max_workers, logging::Level log_level = logging::Level::Warn);

        ~ParallelDispatcher() = default;
        ParallelDispatcher(const ParallelDispatcher&) = delete;
        ParallelDispatcher& operator=(const ParallelDispatcher&) = delete;
        ParallelDispatcher(ParallelDispatcher&&) = delete;
        ParallelDispatcher& operator=(ParallelDispatcher&&) = delete;

        std::vector<http::model::Response> request_many(const std::vector<http::model::RequestSpec>& specs) const;

        // Lists shorter than endpoints must be empty; any other length mismatch
        // throws std::invalid_argument before anything is submitted.
        std::vector<http::model::Response> request_many(http::model::Method method, const std::vector<std::string>& endpoints,
                                                        const std::vector<http::model::Headers>& headers_list,
                                                        const std::vector<http::model::Params>& params_list, const Bodies& body_list) const;

        [[nodiscard]] size_t workers() const { return pool_.size(); }

       private:
        const Connector& connector_;
        mutable concurrency::ThreadPool pool_;
        logging::Logger logger_;
    };

}  // namespace http::connector

#endif
