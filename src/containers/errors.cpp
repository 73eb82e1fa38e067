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
#include <psi/multikey/containers/errors.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::multikey
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found          ( char const * const msg ) { throw key_not_found          ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_duplicate_key          ( char const * const msg ) { throw duplicate_key          ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_concurrent_modification(                        ) { throw concurrent_modification( "psi::multikey: container modified during iteration" ); }
    [[ noreturn, gnu::cold ]] void throw_unsupported_operation  ( char const * const msg ) { throw unsupported_operation  ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_out_of_range           ( char const * const msg ) { throw std::out_of_range      ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_length_error           ( char const * const msg ) { throw std::length_error      ( msg ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_argument       ( char const * const msg ) { throw std::invalid_argument  ( msg ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::multikey
//------------------------------------------------------------------------------
