/** LICENSE TEMPLATE */
#pragma once

// stdlib
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <type_traits>

// system
#include <sys/types.h>

using u64 = std::uint64_t;
using u32 = std::uint32_t;
using u16 = std::uint16_t;
using u8 = std::uint8_t;

using i64 = std::int64_t;
using i32 = std::int32_t;
using i16 = std::int16_t;
using i8 = std::int8_t;

using Pid = pid_t;

// Identifies one debugging session for the lifetime of the process. Never reused.
using SessionId = u32;
// Handle of an armed timer. 0 is never handed out.
using TimerId = u64;

namespace fs = std::filesystem;
using Path = fs::path;

template <typename T> using Option = std::optional<T>;
template <typename T> using UniquePtr = std::unique_ptr<T>;

// "remove_cvref_t" is a clunky name. `ActualType<T>` signals intent.
template <typename T> using ActualType = std::remove_cvref_t<T>;
