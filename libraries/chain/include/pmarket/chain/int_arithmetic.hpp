#pragma once
#include <pmarket/chain/exceptions.hpp>
#include <pmarket/chain/types.hpp>

#include <limits>
#include <type_traits>

namespace pmarket { namespace chain {
namespace int_arithmetic {

template<typename ToIntType, typename FromIntType>
constexpr bool is_valid_checked_cast =
    std::is_integral<ToIntType>::value &&  // remove overloads where type is not integral
    std::is_integral<FromIntType>::value;  // remove overloads where type is not integral

/**
* Conversion between integer types of matching signedness
*/
template<typename ToIntType, typename FromIntType>
constexpr auto checked_cast(FromIntType val) ->
    std::enable_if_t<is_valid_checked_cast<ToIntType,FromIntType> && std::is_signed<ToIntType>::value == std::is_signed<FromIntType>::value, ToIntType>
{
    PM_ASSERT( val >= std::numeric_limits<ToIntType>::min() && val <= std::numeric_limits<ToIntType>::max(),
               arithmetic_overflow_exception,
               "Integer value ${v} cannot be represented by the target type, valid range is [${min}, ${max}]",
               ("v", val)("min", std::numeric_limits<ToIntType>::min())("max", std::numeric_limits<ToIntType>::max()) );
    return ToIntType(val);
}

/**
* Unsigned to signed conversion, fails instead of wrapping into negative values
*/
template<typename ToIntType, typename FromIntType>
constexpr auto checked_cast(FromIntType val) ->
    std::enable_if_t<is_valid_checked_cast<ToIntType,FromIntType> && std::is_signed<ToIntType>::value && !std::is_signed<FromIntType>::value, ToIntType>
{
    using unsigned_to = std::make_unsigned_t<ToIntType>;
    PM_ASSERT( val <= static_cast<unsigned_to>(std::numeric_limits<ToIntType>::max()), arithmetic_overflow_exception,
               "Unsigned value ${v} cannot be represented as a signed value, maximum is ${max}",
               ("v", val)("max", std::numeric_limits<ToIntType>::max()) );
    return ToIntType(val);
}

/**
* Signed to unsigned conversion, fails on negative values
*/
template<typename ToIntType, typename FromIntType>
constexpr auto checked_cast(FromIntType val) ->
    std::enable_if_t<is_valid_checked_cast<ToIntType,FromIntType> && !std::is_signed<ToIntType>::value && std::is_signed<FromIntType>::value, ToIntType>
{
    PM_ASSERT( val >= 0 && static_cast<std::make_unsigned_t<FromIntType>>(val) <= std::numeric_limits<ToIntType>::max(),
               arithmetic_overflow_exception,
               "Signed value ${v} cannot be represented as an unsigned value", ("v", val) );
    return ToIntType(val);
}

template<typename T>
T checked_add(T a, T b) {
    static_assert(std::is_integral<T>::value, "checked_add requires an integral type");
    T result;
    PM_ASSERT( !__builtin_add_overflow(a, b, &result), arithmetic_overflow_exception,
               "Overflow adding ${a} and ${b}", ("a", a)("b", b) );
    return result;
}

template<typename T>
T checked_sub(T a, T b) {
    static_assert(std::is_integral<T>::value, "checked_sub requires an integral type");
    T result;
    PM_ASSERT( !__builtin_sub_overflow(a, b, &result), arithmetic_overflow_exception,
               "Overflow subtracting ${b} from ${a}", ("a", a)("b", b) );
    return result;
}

template<typename T> struct greater_int_t {};
template<> struct greater_int_t<int64_t>  { using type = int128_t;  };
template<> struct greater_int_t<uint64_t> { using type = uint128_t; };

/// arg * numer / denom, computed without intermediate overflow and truncated toward zero
template<typename T>
T safe_prop(T arg, T numer, T denom) {
    using greater_t = typename greater_int_t<T>::type;
    if( !arg || !numer )
       return T(0);
    const greater_t result = (static_cast<greater_t>(arg) * numer) / denom;
    PM_ASSERT( result <= static_cast<greater_t>(std::numeric_limits<T>::max()), arithmetic_overflow_exception,
               "Proportion of ${arg} by ${n}/${d} overflows", ("arg", arg)("n", numer)("d", denom) );
    return static_cast<T>(result);
}

/// arg * numer / denom, rounded up
template<typename T>
T safe_prop_ceil(T arg, T numer, T denom) {
    static_assert(!std::is_signed<T>::value, "safe_prop_ceil is only defined for unsigned types");
    using greater_t = typename greater_int_t<T>::type;
    if( !arg || !numer )
       return T(0);
    const greater_t mul = static_cast<greater_t>(arg) * numer;
    const greater_t result = mul / denom + ((mul % denom) ? 1 : 0);
    PM_ASSERT( result <= static_cast<greater_t>(std::numeric_limits<T>::max()), arithmetic_overflow_exception,
               "Proportion of ${arg} by ${n}/${d} overflows", ("arg", arg)("n", numer)("d", denom) );
    return static_cast<T>(result);
}

} } }/// pmarket::chain::int_arithmetic
