#pragma once

#define TDCMK3_DISALLOW_COPY(T) \
  T(T const& rhs) = delete; \
  T& operator=(T const& rhs) = delete;

#define TDCMK3_DEFAULT_MOVE(T) \
  T(T&& rhs) = default; \
  T& operator=(T&& rhs) = default;

#define TDCMK3_DISALLOW_COPY_DEFAULT_MOVE(T) \
  TDCMK3_DISALLOW_COPY(T) \
  TDCMK3_DEFAULT_MOVE(T)
