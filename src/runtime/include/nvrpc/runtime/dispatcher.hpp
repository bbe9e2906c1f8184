#pragma once

#include "nvrpc/runtime/executor.hpp"
#include "nvrpc/runtime/message.hpp"
#include "nvrpc/runtime/result.hpp"
#include "nvrpc/runtime/value.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace nvrpc::runtime
{

using NotifyHandler = std::function<void(const Array& params)>;
using RequestHandler = std::function<Result<Value>(const Array& params)>;

/**
 * @brief Routes inbound requests and notifications to registered handlers.
 *
 * Each invocation is scheduled on the executor so a slow handler never stalls the
 * receive loop. A request handler's outcome is turned into a Response frame and passed
 * to the responder; a failure (an error result or a thrown exception) becomes the
 * response's error string.
 *
 * While held, inbound frames are queued instead of dispatched. `release()` replays them
 * in arrival order.
 *
 * Scheduled handler runs refer back to the dispatcher, so it must outlive them:
 * `shutdown()` (also run by the destructor) stops dispatching and blocks until every
 * scheduled run has finished or been dropped by the executor. It must not be called from
 * a handler.
 */
class Dispatcher
{
public:
    using Responder = std::function<Result<void>(const Frame&)>;

    Dispatcher(std::shared_ptr<Executor> executor, Responder responder);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    Result<void> on_notify(std::string method, NotifyHandler handler);
    Result<void> on_request(std::string method, RequestHandler handler);
    bool has_handler(std::string_view method) const;

    void handle(Frame frame);

    void hold();
    void release();

    void shutdown();
    std::size_t in_flight() const;

private:
    using Handler = std::variant<NotifyHandler, RequestHandler>;
    class TaskToken;

    std::shared_ptr<TaskToken> track_task();
    void task_finished();
    bool shutting_down() const;

    Result<void> add_handler(std::string method, Handler handler);
    void dispatch(Frame frame);
    void run_request(const Handler& handler, Request request);
    void run_notification(const Handler& handler, Notification notification);

    std::shared_ptr<Executor> executor_;
    Responder responder_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const Handler>> handlers_;
    std::condition_variable idle_cv_;
    bool held_ = false;
    bool shutdown_ = false;
    std::size_t in_flight_ = 0;
    std::vector<Frame> backlog_;
};

}  // namespace nvrpc::runtime
