#pragma once

#include <cstddef>
#include <cstdint>


namespace rc
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
// Sizes, capacities, slot indices and logical offsets are all isize.
// Ring arithmetic subtracts a lot ("head - 1", "length - 1", "capacity - head"),
// which is exactly where unsigned sizes silently wrap into huge values.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;

//
// Views
//

template <class T>
struct span;

//
// Vocabulary
//

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

//
// Container
//

template <class T>
struct unique_array;

struct ring_layout;
template <class T>
struct ring_iter;
template <class T>
struct ring_segments;
template <class T>
struct capacity_exceeded;
template <class T>
struct ringbuffer;

} // namespace rc
