#pragma once

// c++ headers ------------------------------------------
#include <cstdio>

#include <print>

// Minimal leveled logging to stderr.
//
// Usage: TDCMK3_LOG_WARN("solver did not converge; residual:{}", residual);

#define TDCMK3_LOG_IMPL(level, fmt, ...) \
  std::println(stderr, "[tdcmk3] " level ": " fmt __VA_OPT__(,) __VA_ARGS__)

#define TDCMK3_LOG_INFO(fmt, ...)  TDCMK3_LOG_IMPL("info", fmt __VA_OPT__(,) __VA_ARGS__)
#define TDCMK3_LOG_WARN(fmt, ...)  TDCMK3_LOG_IMPL("warn", fmt __VA_OPT__(,) __VA_ARGS__)
#define TDCMK3_LOG_ERROR(fmt, ...) TDCMK3_LOG_IMPL("error", fmt __VA_OPT__(,) __VA_ARGS__)
