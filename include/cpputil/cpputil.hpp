/**
 * @file cpputil.hpp
 * @brief Main header for cpputil
 * @brief cpputil 主头文件
 *
 * Includes every header whose capability is enabled.
 * 包含所有已启用能力对应的头文件。
 *
 * @copyright Copyright (c) 2024 cpputil
 */

#pragma once

#include "cpputil/features.hpp"
#include "cpputil/common.hpp"

// Logging / 日志
#include "cpputil/log/macros.hpp"

#if CPPUTIL_HAS_LOG
#include "cpputil/log/config.hpp"
#include "cpputil/log/facade.hpp"
#include "cpputil/log/log_cat.hpp"
#endif

#if CPPUTIL_HAS_MACROS
#include "cpputil/macros/enum_extend.hpp"
#endif

#if CPPUTIL_HAS_TYPES
#include "cpputil/types/byte_order.hpp"
#include "cpputil/types/encoding.hpp"
#endif

#if CPPUTIL_HAS_PY
#include "cpputil/py/with.hpp"
#endif
