#pragma once

#include <cstddef>
#include <cstdint>


namespace ao
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

// signed size type (sizes and indices are signed throughout)
using isize = i64;

//
// Slots
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class U>
struct couple;

// couple of one type
template <class T>
using pair = couple<T, T>;

// canonical decomposed form: one optional slot per side
template <class L, class R>
using opt2_of = couple<optional<L>, optional<R>>;

//
// Variants
//

enum class side : u8;
enum class any_of_case : u8;

template <class L, class R = L>
struct either_of;
template <class L, class R = L>
struct both_of;
template <class L, class R = L>
struct any_of;

} // namespace ao
