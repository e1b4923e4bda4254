/**
 * @file with.hpp
 * @brief Python-style context manager helpers
 * @brief Python 风格的上下文管理器辅助函数
 *
 * A resource type provides / 资源类型需提供:
 * - With:      Status Enter();  void Exit();
 * - AsyncWith: std::future<Status> AsyncEnter();  std::future<void> AsyncExit();
 *
 * The body runs only after a successful enter, and exit runs exactly once
 * after it, also when the body throws. A failed enter skips both body and
 * exit and its Status is returned.
 * 仅在进入成功后执行主体，之后恰好执行一次退出，即使主体抛出异常也是如此。
 * 进入失败时跳过主体和退出，并返回其 Status。
 *
 * @code
 * Status status = cpputil::py::With(connection, [](Connection& c) {
 *     return c.Send("ping");
 * });
 * @endcode
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"

#if !CPPUTIL_HAS_PY
#error "cpputil/py/with.hpp requires CPPUTIL_FEATURE_PY"
#endif

#include <future>
#include <type_traits>
#include <utility>

#include "cpputil/common.hpp"

namespace cpputil {
namespace py {

namespace detail {

template <typename T>
struct IsFuture : std::false_type {};

template <typename T>
struct IsFuture<std::future<T>> : std::true_type {};

/**
 * @brief Run the body and turn its result into a Status
 * @brief 执行主体并将结果转换为 Status
 *
 * The body may return void, Status (or anything convertible to it), or
 * std::future<Status>.
 * 主体可以返回 void、Status（或可转换为 Status 的类型）或 std::future<Status>。
 */
template <typename Body, typename Resource>
Status RunBody(Body& body, Resource& resource) {
    using Result = std::invoke_result_t<Body&, Resource&>;
    if constexpr (std::is_void_v<Result>) {
        body(resource);
        return Status::Ok();
    } else if constexpr (IsFuture<Result>::value) {
        return body(resource).get();
    } else {
        static_assert(std::is_convertible_v<Result, Status>,
                      "With body must return void, Status or std::future<Status>");
        return body(resource);
    }
}

/// Calls Exit() when leaving scope / 离开作用域时调用 Exit()
template <typename Resource>
class ExitGuard {
public:
    explicit ExitGuard(Resource& resource) : m_resource(resource) {}
    ~ExitGuard() { m_resource.Exit(); }

    ExitGuard(const ExitGuard&) = delete;
    ExitGuard& operator=(const ExitGuard&) = delete;

private:
    Resource& m_resource;
};

}  // namespace detail

/**
 * @brief Enter the resource, run the body, exit the resource
 * @brief 进入资源、执行主体、退出资源
 *
 * Accepts an lvalue or a temporary resource. Exit() must not throw.
 * 接受左值或临时资源。Exit() 不得抛出异常。
 *
 * @return The enter failure, or the body's Status / 进入失败的状态，或主体的状态
 */
template <typename Resource, typename Body>
Status With(Resource&& resource, Body&& body) {
    Status status = resource.Enter();
    if (!status) {
        return status;
    }
    detail::ExitGuard<std::remove_reference_t<Resource>> guard(resource);
    return detail::RunBody(body, resource);
}

/**
 * @brief Asynchronous With: the resource is moved into a task
 * @brief 异步 With：资源被移动到任务中
 *
 * The returned future yields the enter failure or the body's Status. An
 * exception from the body is rethrown by the future after AsyncExit() ran.
 * 返回的 future 给出进入失败的状态或主体的状态。主体抛出的异常会在
 * AsyncExit() 执行后由 future 重新抛出。
 */
template <typename Resource, typename Body>
std::future<Status> AsyncWith(Resource resource, Body body) {
    return std::async(std::launch::async,
                      [resource = std::move(resource), body = std::move(body)]() mutable {
                          Status status = resource.AsyncEnter().get();
                          if (!status) {
                              return status;
                          }
                          Status result;
                          try {
                              result = detail::RunBody(body, resource);
                          } catch (...) {
                              resource.AsyncExit().get();
                              throw;
                          }
                          resource.AsyncExit().get();
                          return result;
                      });
}

}  // namespace py
}  // namespace cpputil
