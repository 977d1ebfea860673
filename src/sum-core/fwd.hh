#pragma once

#include <cstddef>
#include <cstdint>


namespace sc
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// sizes and indices are signed: "size - 1" must not wrap around when size is 0
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Utility
//

template <class T, class U>
struct pair;

//
// Sum types
//

struct absent_t;
template <class T>
struct option;

struct never;
template <class T>
struct success_t;
template <class E>
struct failure_t;

struct any_error;
template <class T, class E = any_error>
struct result;

namespace impl
{
template <class T>
constexpr bool is_option = false;
template <class T>
constexpr bool is_option<option<T>> = true;

template <class T>
constexpr bool is_result = false;
template <class T, class E>
constexpr bool is_result<result<T, E>> = true;
} // namespace impl

} // namespace sc
