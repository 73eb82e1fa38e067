////////////////////////////////////////////////////////////////////////////////
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

#include "multi_key_map.hpp"

#include <iostream>
#include <ostream>
//------------------------------------------------------------------------------
namespace psi::multikey
{
//------------------------------------------------------------------------------

template <typename Major, typename Minor, typename T, typename MajorHash, typename MajorEqual, typename MinorHash, typename MinorEqual, typename ValueEqual>
void multi_key_map<Major, Minor, T, MajorHash, MajorEqual, MinorHash, MinorEqual, ValueEqual>::print( std::ostream & os ) const
{
    os << "multi_key_map: " << size() << " entries under " << major_key_count() << " major keys"
       << " (" << pooled_table_count() << " pooled tables, version " << version() << ")\n";
    if ( empty() )
        return;

    // One line per major key (inner table), in table order.
    for ( auto const & [ major, inner ] : table_ )
    {
        os << '\t';
        detail::print_key_component( os, major );
        os << " (" << inner.size() << "):";
        for ( auto const & [ minor, value ] : inner )
            os << ' ' << key_type{ major, minor } << '=' << value;
        os << '\n';
    }
}

template <typename Major, typename Minor, typename T, typename MajorHash, typename MajorEqual, typename MinorHash, typename MinorEqual, typename ValueEqual>
void multi_key_map<Major, Minor, T, MajorHash, MajorEqual, MinorHash, MinorEqual, ValueEqual>::print() const { print( std::cout ); }

//------------------------------------------------------------------------------
} // namespace psi::multikey
//------------------------------------------------------------------------------
