////////////////////////////////////////////////////////////////////////////////
/// Exception types reported by psi::multikey containers.
///
///   - key_not_found           — strict lookup (at()) of an absent key
///   - duplicate_key           — must-be-new insertion of a present key
///   - concurrent_modification — an iterator advanced after the container was
///                               structurally modified (fail-fast iteration)
///   - unsupported_operation   — mutation attempted through a read-only view
///
/// Argument validation failures use the plain standard exceptions
/// (std::out_of_range, std::length_error, std::invalid_argument).
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

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::multikey
{
//------------------------------------------------------------------------------

struct key_not_found           : std::out_of_range     { using std::out_of_range    ::out_of_range    ; };
struct duplicate_key           : std::invalid_argument { using std::invalid_argument::invalid_argument; };
struct concurrent_modification : std::logic_error      { using std::logic_error     ::logic_error     ; };
struct unsupported_operation   : std::logic_error      { using std::logic_error     ::logic_error     ; };

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_key_not_found          ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_duplicate_key          ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_concurrent_modification();
    [[ noreturn, gnu::cold ]] void throw_unsupported_operation  ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_out_of_range           ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_length_error           ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_invalid_argument       ( char const * msg );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::multikey
//------------------------------------------------------------------------------
