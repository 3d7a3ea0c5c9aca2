/** LICENSE TEMPLATE */
#pragma once
#include <common/macros.h>

// stdlib
#include <utility>

// Runs `fn` when the scope ends, however it ends.
template <typename DeferFn> class ScopedDefer
{
public:
  MOVE_ONLY(ScopedDefer);
  explicit ScopedDefer(DeferFn &&fn) noexcept : mDeferFn(std::move(fn)) {}
  ~ScopedDefer() noexcept { mDeferFn(); }

private:
  DeferFn mDeferFn;
};
