#include "nvrpc/runtime/dispatcher.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <exception>
#include <utility>

namespace nvrpc::runtime
{
namespace
{

Result<Value> call_handler(const NotifyHandler& handler, const Array& params)
{
    try {
        handler(params);
        return Value{};
    } catch (const std::exception& ex) {
        return unexpected_result<Value>(ErrorCode::HandlerError, ex.what());
    } catch (...) {
        return unexpected_result<Value>(ErrorCode::HandlerError, "unknown exception");
    }
}

Result<Value> call_handler(const RequestHandler& handler, const Array& params)
{
    try {
        return handler(params);
    } catch (const std::exception& ex) {
        return unexpected_result<Value>(ErrorCode::HandlerError, ex.what());
    } catch (...) {
        return unexpected_result<Value>(ErrorCode::HandlerError, "unknown exception");
    }
}

}  // namespace

// Held by every scheduled handler run; released when the executor runs or drops the task.
class Dispatcher::TaskToken
{
public:
    explicit TaskToken(Dispatcher& owner)
        : owner_(owner)
    {
    }
    ~TaskToken() { owner_.task_finished(); }

    TaskToken(const TaskToken&) = delete;
    TaskToken& operator=(const TaskToken&) = delete;

private:
    Dispatcher& owner_;
};

Dispatcher::Dispatcher(std::shared_ptr<Executor> executor, Responder responder)
    : executor_(std::move(executor))
    , responder_(std::move(responder))
{
    if (!executor_) {
        executor_ = std::make_shared<InlineExecutor>();
    }
}

Dispatcher::~Dispatcher()
{
    shutdown();
}

Result<void> Dispatcher::on_notify(std::string method, NotifyHandler handler)
{
    return add_handler(std::move(method), Handler{std::in_place_type<NotifyHandler>, std::move(handler)});
}

Result<void> Dispatcher::on_request(std::string method, RequestHandler handler)
{
    return add_handler(std::move(method), Handler{std::in_place_type<RequestHandler>, std::move(handler)});
}

Result<void> Dispatcher::add_handler(std::string method, Handler handler)
{
    std::lock_guard lock(mutex_);
    if (handlers_.contains(method)) {
        return unexpected_result(ErrorCode::DuplicateHandler,
                                 fmt::format("a handler for '{}' is already registered", method));
    }
    handlers_.emplace(std::move(method), std::make_shared<const Handler>(std::move(handler)));
    return {};
}

bool Dispatcher::has_handler(std::string_view method) const
{
    std::lock_guard lock(mutex_);
    return handlers_.contains(std::string(method));
}

void Dispatcher::handle(Frame frame)
{
    {
        std::lock_guard lock(mutex_);
        if (held_) {
            backlog_.push_back(std::move(frame));
            return;
        }
    }
    dispatch(std::move(frame));
}

void Dispatcher::hold()
{
    std::lock_guard lock(mutex_);
    held_ = true;
}

void Dispatcher::release()
{
    while (true) {
        std::vector<Frame> frames;
        {
            std::lock_guard lock(mutex_);
            if (backlog_.empty()) {
                held_ = false;
                return;
            }
            frames.swap(backlog_);
        }
        spdlog::debug("dispatch: replaying {} buffered frame(s)", frames.size());
        for (auto& frame : frames) {
            dispatch(std::move(frame));
        }
    }
}

void Dispatcher::dispatch(Frame frame)
{
    const std::string* method = nullptr;
    if (auto* request = std::get_if<Request>(&frame)) {
        method = &request->method;
    } else if (auto* notification = std::get_if<Notification>(&frame)) {
        method = &notification->method;
    } else {
        spdlog::error("dispatch: response id={} routed to the dispatcher", std::get<Response>(frame).id);
        return;
    }

    auto token = track_task();
    if (!token) {
        spdlog::debug("dispatch: dropping '{}' after shutdown", *method);
        return;
    }

    std::shared_ptr<const Handler> handler;
    {
        std::lock_guard lock(mutex_);
        if (auto it = handlers_.find(*method); it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        spdlog::warn("dispatch: no handler for {} '{}'", to_string(type_of(frame)), *method);
        return;
    }

    if (auto* pending = std::get_if<Request>(&frame)) {
        executor_->schedule([this, token, handler, request = std::move(*pending)]() mutable {
            if (!shutting_down()) {
                run_request(*handler, std::move(request));
            }
        });
    } else {
        executor_->schedule(
            [this, token, handler, notification = std::get<Notification>(std::move(frame))]() mutable {
                if (!shutting_down()) {
                    run_notification(*handler, std::move(notification));
                }
            });
    }
}

std::shared_ptr<Dispatcher::TaskToken> Dispatcher::track_task()
{
    std::lock_guard lock(mutex_);
    if (shutdown_) {
        return nullptr;
    }
    ++in_flight_;
    return std::make_shared<TaskToken>(*this);
}

void Dispatcher::task_finished()
{
    std::lock_guard lock(mutex_);
    if (--in_flight_ == 0) {
        idle_cv_.notify_all();
    }
}

bool Dispatcher::shutting_down() const
{
    std::lock_guard lock(mutex_);
    return shutdown_;
}

void Dispatcher::shutdown()
{
    std::unique_lock lock(mutex_);
    shutdown_ = true;
    backlog_.clear();
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

std::size_t Dispatcher::in_flight() const
{
    std::lock_guard lock(mutex_);
    return in_flight_;
}

void Dispatcher::run_request(const Handler& handler, Request request)
{
    auto outcome = std::visit([&](const auto& fn) { return call_handler(fn, request.params); }, handler);

    Response response{request.id, Value{}, Value{}};
    if (outcome) {
        response.result = std::move(*outcome);
    } else {
        spdlog::warn("dispatch: request '{}' id={} failed: {}", request.method, request.id, outcome.error().message);
        response.error = Value{outcome.error().message};
    }

    if (auto res = responder_(response); !res) {
        spdlog::warn("dispatch: could not send response id={}: {}", request.id, res.error().message);
    }
}

void Dispatcher::run_notification(const Handler& handler, Notification notification)
{
    auto outcome = std::visit([&](const auto& fn) { return call_handler(fn, notification.params); }, handler);
    if (!outcome) {
        spdlog::warn("dispatch: notification '{}' failed: {}", notification.method, outcome.error().message);
    }
}

}  // namespace nvrpc::runtime
