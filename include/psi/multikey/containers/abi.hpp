////////////////////////////////////////////////////////////////////////////////
/// Argument passing helpers for psi::multikey containers.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <boost/config.hpp>

#include <concepts>
#include <cstddef>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::multikey
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// 'Automatized' boost::call_traits: keys (and values) are taken by value when
// they fit into registers and by const reference otherwise. Lookup functions
// of the two-level map are called on hot paths (per-frame resource lookups)
// with small integral/enum/pointer coordinates, so the by-value case is the
// common one.
////////////////////////////////////////////////////////////////////////////////

template <typename T>
bool constexpr can_be_passed_in_reg
{
    (
        std::is_trivially_copyable_v<T> &&
        ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV (ignoring the MS x64 disaster)
    )
    // users are encouraged to provide specializations for types not detected
    // by the above (e.g. Homogeneous Vector Aggregates)
}; // can_be_passed_in_reg

template <typename T>
using arg_t = std::conditional_t<can_be_passed_in_reg<T>, T, T const &>;


////////////////////////////////////////////////////////////////////////////////
// Null keys
//
// Key types with a null state (raw and smart pointers, type handles...):
// testable as bool and comparable with nullptr. The null state is never stored
// in a container and lookups with it always miss. The explicit bool test keeps
// out string types (which 'compare' with nullptr through char const *).
////////////////////////////////////////////////////////////////////////////////

template <typename T>
concept nullable_key = requires( T const & key )
{
    static_cast<bool>( key );
    { key == nullptr } -> std::convertible_to<bool>;
};

template <typename T>
[[ nodiscard, gnu::pure ]] BOOST_FORCEINLINE
constexpr bool is_null_key( T const & key ) noexcept
{
    if constexpr ( nullable_key<T> )
        return key == nullptr;
    else
        return false;
}

//------------------------------------------------------------------------------
} // namespace psi::multikey
//------------------------------------------------------------------------------
