////////////////////////////////////////////////////////////////////////////////
/// psi::multikey::multi_key — two-component (major, minor) coordinate used as
/// the composite key of multi_key_map.
///
/// Equality is component-wise. Hashing goes through Boost.Hash (hash_value is
/// found by ADL, std::hash is specialized on top of it). No ordering is
/// provided: a 'natural' order of arbitrary (hashable-only) components does
/// not exist.
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

#include "abi.hpp"

#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <functional>
#include <ostream>
//------------------------------------------------------------------------------
namespace psi::multikey
{
//------------------------------------------------------------------------------

template <typename Major, typename Minor>
struct multi_key
{
    using major_type = Major;
    using minor_type = Minor;

    Major major_key;
    Minor minor_key;

    friend constexpr bool operator==( multi_key const &, multi_key const & ) = default;

    friend std::size_t hash_value( multi_key const & key )
    {
        std::size_t seed{ 0 };
        boost::hash_combine( seed, key.major_key );
        boost::hash_combine( seed, key.minor_key );
        return seed;
    }
}; // struct multi_key

template <typename Major, typename Minor>
multi_key( Major, Minor ) -> multi_key<Major, Minor>;


namespace detail
{
    template <typename Component>
    void print_key_component( std::ostream & os, Component const & component )
    {
        if ( is_null_key( component ) )
            os << "NULL";
        else
            os << component;
    }
} // namespace detail

/// Prints as [major,minor] (null pointer-like components print as NULL).
template <typename Major, typename Minor>
requires requires( std::ostream & os, Major const & major, Minor const & minor ) { os << major; os << minor; }
std::ostream & operator<<( std::ostream & os, multi_key<Major, Minor> const & key )
{
    os << '[';
    detail::print_key_component( os, key.major_key );
    os << ',';
    detail::print_key_component( os, key.minor_key );
    return os << ']';
}

//------------------------------------------------------------------------------
} // namespace psi::multikey
//------------------------------------------------------------------------------

template <typename Major, typename Minor>
struct std::hash<psi::multikey::multi_key<Major, Minor>>
{
    std::size_t operator()( psi::multikey::multi_key<Major, Minor> const & key ) const { return hash_value( key ); }
};
