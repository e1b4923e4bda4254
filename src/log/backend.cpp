/**
 * @file backend.cpp
 * @brief Backend selection
 * @brief 后端选择
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#include "cpputil/log/backend.hpp"

#include <utility>

#include "cpputil/log/logger.hpp"

#if CPPUTIL_HAS_LOG_SPDLOG
#include "cpputil/log/spdlog_backend.hpp"
#endif

namespace cpputil {
namespace log {

Status MakeBackend(const LoggingPlan& plan, std::shared_ptr<Backend>& backend) {
    BackendKind kind = plan.backend;
    if (kind == BackendKind::Auto) {
        kind = features::kLogSpdlog ? BackendKind::Spdlog : BackendKind::Builtin;
    }

    if (kind == BackendKind::Spdlog) {
#if CPPUTIL_HAS_LOG_SPDLOG
        std::shared_ptr<SpdlogBackend> spdlogBackend;
        Status status = SpdlogBackend::Create(plan, spdlogBackend);
        if (status) {
            backend = std::move(spdlogBackend);
        }
        return status;
#else
        return Status(ErrorCode::NotSupported,
                      "backend 'spdlog' requires CPPUTIL_FEATURE_LOG_SPDLOG");
#endif
    }

    std::shared_ptr<Logger> logger;
    Status status = Logger::Create(plan, logger);
    if (status) {
        backend = std::move(logger);
    }
    return status;
}

}  // namespace log
}  // namespace cpputil
