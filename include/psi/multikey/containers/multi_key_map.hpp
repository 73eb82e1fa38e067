////////////////////////////////////////////////////////////////////////////////
/// psi::multikey::multi_key_map — two-level (major, minor) -> value hash map
///
/// Indexes values by a two component coordinate (e.g. render target array
/// (target, slice), tile grid (x, y), (object, pass) lookups). Stored as a
/// 'hash map of hash maps': an outer table keyed by the major key whose values
/// are inner tables keyed by the minor key.
///
/// Architecture:
///   - inner tables are stored by value in the outer table; an inner table
///     that becomes empty is detached and moved into a pool (free list) from
///     which later insertions under new major keys take their tables, so the
///     remove/re-add hot path reuses already allocated bucket arrays.
///   - invariants:
///       - every inner table reachable from the outer table is non-empty
///       - size() equals the sum of the inner table sizes
///       - every pooled table is empty and unreachable from the outer table
///   - every structural modification bumps a version counter; iterators and
///     views capture it on construction and throw concurrent_modification
///     from any access after the container was modified (fail-fast
///     iteration, not thread safety: the container is single-threaded).
///
/// Lookups by the composite key and by the major key alone are O(1); queries
/// by the minor key alone are O(number of major keys) (there is no reverse
/// index).
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
#include "errors.hpp"
#include "multi_key.hpp"

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/unordered_map.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <iterator>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::multikey
{
//------------------------------------------------------------------------------

template
<
    typename Major,
    typename Minor,
    typename T,
    typename MajorHash  = boost::hash<Major>,
    typename MajorEqual = std::equal_to<Major>,
    typename MinorHash  = boost::hash<Minor>,
    typename MinorEqual = std::equal_to<Minor>,
    typename ValueEqual = std::equal_to<T>
>
class multi_key_map
{
public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using major_key_type  = Major;
    using minor_key_type  = Minor;
    using key_type        = multi_key<Major, Minor>;
    using mapped_type     = T;
    using value_type      = std::pair<key_type, mapped_type>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using version_type    = std::uint64_t;

    using major_hasher    = MajorHash;
    using major_key_equal = MajorEqual;
    using minor_hasher    = MinorHash;
    using minor_key_equal = MinorEqual;
    using value_equal     = ValueEqual;

private:
    using inner_table = boost::unordered_map<Minor, T          , MinorHash, MinorEqual>;
    using outer_table = boost::unordered_map<Major, inner_table, MajorHash, MajorEqual>;

    using major_arg = arg_t<Major>;
    using minor_arg = arg_t<Minor>;

    enum class insert_mode : bool { must_be_new, may_overwrite };

    static bool constexpr nothrow_movable
    {
        std::is_nothrow_move_constructible_v<outer_table> &&
        std::is_nothrow_move_constructible_v<MinorHash  > &&
        std::is_nothrow_move_constructible_v<MinorEqual > &&
        std::is_nothrow_move_constructible_v<ValueEqual >
    };

    //--------------------------------------------------------------------------
    // Full traversal iterator
    //--------------------------------------------------------------------------
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::forward_iterator_tag;
        using iterator_category = std::forward_iterator_tag;
        using value_type        = multi_key_map::value_type;
        using difference_type   = multi_key_map::difference_type;
        using mapped_reference  = std::conditional_t<IsConst, mapped_type const &, mapped_type &>;
        using reference         = std::pair<key_type, mapped_reference>;

        using inner_iterator    = std::conditional_t<IsConst, typename inner_table::const_iterator, typename inner_table::iterator>;

        struct arrow_proxy {
            reference ref;
            constexpr reference       * operator->()       noexcept { return &ref; }
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend multi_key_map;
        friend iterator_impl<!IsConst>;

        using map_ptr        = std::conditional_t<IsConst, multi_key_map const *, multi_key_map *>;
        using outer_iterator = std::conditional_t<IsConst, typename outer_table::const_iterator, typename outer_table::iterator>;

        map_ptr        map_    { nullptr };
        outer_iterator outer_  {};
        inner_iterator inner_  {};
        version_type   version_{ 0 };

        iterator_impl( map_ptr const map, outer_iterator const outer, inner_iterator const inner ) noexcept
            : map_{ map }, outer_{ outer }, inner_{ inner }, version_{ map->version_ } {}

        void check_version() const
        {
            BOOST_ASSERT_MSG( map_, "Using a singular iterator" );
            if ( version_ != map_->version_ ) [[ unlikely ]]
                detail::throw_concurrent_modification();
        }

    public:
        iterator_impl() noexcept = default;

        iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : map_{ other.map_ }, outer_{ other.outer_ }, inner_{ other.inner_ }, version_{ other.version_ } {}

        // Component access without materializing (copying) the composite key
        Major const & major_key() const { check_version(); return outer_->first;  }
        Minor const & minor_key() const { check_version(); return inner_->first;  }
        mapped_reference mapped() const { check_version(); return inner_->second; }

        reference operator*() const
        {
            check_version();
            return { key_type{ outer_->first, inner_->first }, inner_->second };
        }

        arrow_proxy operator->() const { return { **this }; }

        iterator_impl & operator++()
        {
            check_version();
            if ( ++inner_ == outer_->second.end() )
            {
                if ( ++outer_ != map_->table_.end() )
                {
                    inner_ = outer_->second.begin();
                    BOOST_ASSERT_MSG( inner_ != outer_->second.end(), "Empty inner table reachable from the outer table" );
                }
                else
                {
                    inner_ = {};
                }
            }
            return *this;
        }
        iterator_impl operator++( int ) { auto tmp{ *this }; ++*this; return tmp; }

        friend bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept
        {
            return a.outer_ == b.outer_ && a.inner_ == b.inner_;
        }
    }; // iterator_impl

public:
    using iterator       = iterator_impl<false>;
    using const_iterator = iterator_impl<true >;

private:
    //--------------------------------------------------------------------------
    // Fixed-minor projection: (major, value) pairs of all entries with a given
    // minor key. Filters the full traversal.
    //--------------------------------------------------------------------------
    template <bool IsConst>
    class major_key_value_range_impl
    {
        using map_ptr = std::conditional_t<IsConst, multi_key_map const *, multi_key_map *>;

    public:
        class iterator
        {
        public:
            using iterator_concept  = std::forward_iterator_tag;
            using iterator_category = std::forward_iterator_tag;
            using value_type        = std::pair<Major, mapped_type>;
            using difference_type   = multi_key_map::difference_type;
            using reference         = std::pair<Major const &, typename iterator_impl<IsConst>::mapped_reference>;

            iterator() = default;

            reference operator*() const { return { base_.major_key(), base_.mapped() }; }

            iterator & operator++() { ++base_; skip_to_match(); return *this; }
            iterator   operator++( int ) { auto tmp{ *this }; ++*this; return tmp; }

            friend bool operator==( iterator const & a, iterator const & b ) noexcept { return a.base_ == b.base_; }
            friend bool operator==( iterator const & it, std::default_sentinel_t ) noexcept { return it.base_ == it.end_; }

        private:
            friend major_key_value_range_impl;

            iterator( map_ptr const map, Minor const & minor )
                : map_{ map }, base_{ map->begin() }, end_{ map->end() }, minor_{ minor } { skip_to_match(); }

            void skip_to_match()
            {
                while ( base_ != end_ && !map_->minor_key_eq()( base_.minor_key(), minor_ ) )
                    ++base_;
            }

            map_ptr                 map_{ nullptr };
            iterator_impl<IsConst>  base_;
            iterator_impl<IsConst>  end_;
            Minor                   minor_{};
        }; // iterator

        major_key_value_range_impl( map_ptr const map, minor_arg const minor ) : map_{ map }, minor_{ minor } {}

        [[ nodiscard ]] iterator                begin() const { return { map_, minor_ }; }
        [[ nodiscard ]] std::default_sentinel_t end  () const noexcept { return {}; }

        [[ nodiscard ]] size_type size () const { return map_->query_major_key_count( minor_ ); }
        [[ nodiscard ]] bool      empty() const { return size() == 0; }

    private:
        map_ptr map_;
        Minor   minor_;
    }; // major_key_value_range_impl

    //--------------------------------------------------------------------------
    // Fixed-major projection: (minor, value) pairs of a single inner table.
    // The major key is resolved anew by every begin() call (it may have been
    // removed and re-added in the meantime).
    //--------------------------------------------------------------------------
    template <bool IsConst>
    class minor_key_value_range_impl
    {
        using map_ptr        = std::conditional_t<IsConst, multi_key_map const *, multi_key_map *>;
        using inner_iterator = typename iterator_impl<IsConst>::inner_iterator;

    public:
        class iterator
        {
        public:
            using iterator_concept  = std::forward_iterator_tag;
            using iterator_category = std::forward_iterator_tag;
            using value_type        = std::pair<Minor, mapped_type>;
            using difference_type   = multi_key_map::difference_type;
            using reference         = std::pair<Minor const &, typename iterator_impl<IsConst>::mapped_reference>;

            iterator() = default;

            reference operator*() const { check_version(); return { inner_->first, inner_->second }; }

            iterator & operator++() { check_version(); ++inner_; return *this; }
            iterator   operator++( int ) { auto tmp{ *this }; ++*this; return tmp; }

            friend bool operator==( iterator const & a, iterator const & b ) noexcept { return a.inner_ == b.inner_; }
            friend bool operator==( iterator const & it, std::default_sentinel_t ) noexcept { return it.inner_ == it.inner_end_; }

        private:
            friend minor_key_value_range_impl;

            iterator( map_ptr const map, inner_iterator const first, inner_iterator const last ) noexcept
                : map_{ map }, inner_{ first }, inner_end_{ last }, version_{ map->version_ } {}

            void check_version() const
            {
                if ( version_ != map_->version_ ) [[ unlikely ]]
                    detail::throw_concurrent_modification();
            }

            map_ptr        map_      { nullptr };
            inner_iterator inner_    {};
            inner_iterator inner_end_{};
            version_type   version_  { 0 };
        }; // iterator

        minor_key_value_range_impl( map_ptr const map, major_arg const major ) : map_{ map }, major_{ major } {}

        [[ nodiscard ]] iterator begin() const
        {
            if ( auto * const inner{ find_inner( *map_, major_ ) } )
                return { map_, inner->begin(), inner->end() };
            return { map_, {}, {} };
        }
        [[ nodiscard ]] std::default_sentinel_t end() const noexcept { return {}; }

        [[ nodiscard ]] size_type size () const { return map_->query_minor_key_count( major_ ); }
        [[ nodiscard ]] bool      empty() const { return size() == 0; }

    private:
        map_ptr map_;
        Major   major_;
    }; // minor_key_value_range_impl

public:
    using       major_key_value_range = major_key_value_range_impl<false>;
    using const_major_key_value_range = major_key_value_range_impl<true >;
    using       minor_key_value_range = minor_key_value_range_impl<false>;
    using const_minor_key_value_range = minor_key_value_range_impl<true >;

    //--------------------------------------------------------------------------
    // Read-only key and value projections. Stateless: everything is derived
    // from the owning map on demand.
    //--------------------------------------------------------------------------
    class key_collection
    {
    public:
        using value_type = key_type;
        using size_type  = multi_key_map::size_type;

        class iterator
        {
        public:
            using iterator_concept  = std::forward_iterator_tag;
            using iterator_category = std::forward_iterator_tag;
            using value_type        = key_type;
            using difference_type   = multi_key_map::difference_type;
            using reference         = key_type;

            iterator() = default;
            explicit iterator( typename multi_key_map::const_iterator const pos ) noexcept : pos_{ pos } {}

            reference  operator*() const { return { pos_.major_key(), pos_.minor_key() }; }
            iterator & operator++() { ++pos_; return *this; }
            iterator   operator++( int ) { auto tmp{ *this }; ++pos_; return tmp; }

            friend bool operator==( iterator const &, iterator const & ) noexcept = default;

        private:
            typename multi_key_map::const_iterator pos_;
        }; // iterator
        using const_iterator = iterator;

        [[ nodiscard ]] iterator begin() const { return iterator{ map_->cbegin() }; }
        [[ nodiscard ]] iterator end  () const { return iterator{ map_->cend  () }; }

        [[ nodiscard ]] size_type size () const noexcept { return map_->size (); }
        [[ nodiscard ]] bool      empty() const noexcept { return map_->empty(); }

        [[ nodiscard ]] bool contains( key_type const & key ) const { return map_->contains( key ); }

        void copy_to( std::span<key_type> const destination, size_type index = 0 ) const
        {
            validate_copy_destination( destination.size(), index, size() );
            for ( auto const & outer : map_->table_ )
                for ( auto const & inner : outer.second )
                    destination[ index++ ] = key_type{ outer.first, inner.first };
        }

        [[ noreturn ]] void insert( key_type const & ) const { detail::throw_unsupported_operation( "psi::multikey::multi_key_map::key_collection is read-only" ); }
        [[ noreturn ]] void erase ( key_type const & ) const { detail::throw_unsupported_operation( "psi::multikey::multi_key_map::key_collection is read-only" ); }
        [[ noreturn ]] void clear (                  ) const { detail::throw_unsupported_operation( "psi::multikey::multi_key_map::key_collection is read-only" ); }

    private:
        friend multi_key_map;
        explicit key_collection( multi_key_map const & map ) noexcept : map_{ &map } {}

        multi_key_map const * map_;
    }; // key_collection

    class value_collection
    {
    public:
        using value_type = mapped_type;
        using size_type  = multi_key_map::size_type;

        class iterator
        {
        public:
            using iterator_concept  = std::forward_iterator_tag;
            using iterator_category = std::forward_iterator_tag;
            using value_type        = mapped_type;
            using difference_type   = multi_key_map::difference_type;
            using reference         = mapped_type const &;
            using pointer           = mapped_type const *;

            iterator() = default;
            explicit iterator( typename multi_key_map::const_iterator const pos ) noexcept : pos_{ pos } {}

            reference  operator* () const { return  pos_.mapped(); }
            pointer    operator->() const { return &pos_.mapped(); }
            iterator & operator++() { ++pos_; return *this; }
            iterator   operator++( int ) { auto tmp{ *this }; ++pos_; return tmp; }

            friend bool operator==( iterator const &, iterator const & ) noexcept = default;

        private:
            typename multi_key_map::const_iterator pos_;
        }; // iterator
        using const_iterator = iterator;

        [[ nodiscard ]] iterator begin() const { return iterator{ map_->cbegin() }; }
        [[ nodiscard ]] iterator end  () const { return iterator{ map_->cend  () }; }

        [[ nodiscard ]] size_type size () const noexcept { return map_->size (); }
        [[ nodiscard ]] bool      empty() const noexcept { return map_->empty(); }

        [[ nodiscard ]] bool contains( mapped_type const & value ) const { return map_->contains_value( value ); }

        void copy_to( std::span<mapped_type> const destination, size_type index = 0 ) const
        {
            validate_copy_destination( destination.size(), index, size() );
            for ( auto const & outer : map_->table_ )
                for ( auto const & inner : outer.second )
                    destination[ index++ ] = inner.second;
        }

        [[ noreturn ]] void insert( mapped_type const & ) const { detail::throw_unsupported_operation( "psi::multikey::multi_key_map::value_collection is read-only" ); }
        [[ noreturn ]] void erase ( mapped_type const & ) const { detail::throw_unsupported_operation( "psi::multikey::multi_key_map::value_collection is read-only" ); }
        [[ noreturn ]] void clear (                     ) const { detail::throw_unsupported_operation( "psi::multikey::multi_key_map::value_collection is read-only" ); }

    private:
        friend multi_key_map;
        explicit value_collection( multi_key_map const & map ) noexcept : map_{ &map } {}

        multi_key_map const * map_;
    }; // value_collection

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    multi_key_map() = default;

    explicit multi_key_map( size_type const capacity_hint ) { table_.reserve( capacity_hint ); }

    multi_key_map
    (
        size_type  const   capacity_hint,
        MajorHash  const & major_hash,
        MajorEqual const & major_eq,
        MinorHash  const & minor_hash = MinorHash {},
        MinorEqual const & minor_eq   = MinorEqual{},
        ValueEqual const & value_eq   = ValueEqual{}
    )
        : table_( 0, major_hash, major_eq ), minor_hash_{ minor_hash }, minor_eq_{ minor_eq }, value_eq_{ value_eq }
    {
        table_.reserve( capacity_hint );
    }

    // Bulk insertion with add() semantics (a duplicate composite key throws)
    template <std::input_iterator InputIt>
    multi_key_map
    (
        InputIt            first,
        InputIt    const   last,
        size_type  const   capacity_hint = 0,
        MajorHash  const & major_hash    = MajorHash {},
        MajorEqual const & major_eq      = MajorEqual{},
        MinorHash  const & minor_hash    = MinorHash {},
        MinorEqual const & minor_eq      = MinorEqual{},
        ValueEqual const & value_eq      = ValueEqual{}
    )
        : multi_key_map( capacity_hint, major_hash, major_eq, minor_hash, minor_eq, value_eq )
    {
        for ( ; first != last; ++first )
        {
            auto && kv{ *first };
            add( kv.first, kv.second );
        }
        version_ = 0;
    }

    multi_key_map( std::initializer_list<value_type> const il )
        : multi_key_map( il.begin(), il.end(), il.size() ) {}

    // The source's major key count (rather than its element count) sizes the
    // outer table. The pool is not copied.
    multi_key_map( multi_key_map const & other )
        : multi_key_map( other.major_key_count(), other.major_hash_function(), other.major_key_eq(), other.minor_hash_, other.minor_eq_, other.value_eq_ )
    {
        free_tables_.reserve( other.table_.size() );
        for ( auto const & outer : other.table_ )
            table_.emplace( outer.first, outer.second );
        size_ = other.size_;
    }

    multi_key_map( multi_key_map && other ) noexcept( nothrow_movable )
        :
        table_      { std::move( other.table_       ) },
        free_tables_{ std::move( other.free_tables_ ) },
        size_       { std::exchange( other.size_, 0 ) },
        version_    { other.version_ },
        minor_hash_ { std::move( other.minor_hash_ ) },
        minor_eq_   { std::move( other.minor_eq_   ) },
        value_eq_   { std::move( other.value_eq_   ) }
    {
        ++other.version_;
    }

    multi_key_map & operator=( multi_key_map const & other )
    {
        if ( this != &other )
        {
            multi_key_map copy{ other };
            swap( copy );
        }
        return *this;
    }

    multi_key_map & operator=( multi_key_map && other ) noexcept( nothrow_movable )
    {
        if ( this != &other )
        {
            multi_key_map tmp{ std::move( other ) };
            swap( tmp );
        }
        return *this;
    }

    multi_key_map & operator=( std::initializer_list<value_type> const il )
    {
        multi_key_map tmp{ il };
        swap( tmp );
        return *this;
    }

    ~multi_key_map() = default;

    // Both maps get a version newer than either had: iterators into either
    // one are invalidated.
    void swap( multi_key_map & other ) noexcept
    {
        using std::swap;
        swap( table_      , other.table_       );
        swap( free_tables_, other.free_tables_ );
        swap( size_       , other.size_        );
        swap( minor_hash_ , other.minor_hash_  );
        swap( minor_eq_   , other.minor_eq_    );
        swap( value_eq_   , other.value_eq_    );
        version_ = other.version_ = std::max( version_, other.version_ ) + 1;
    }
    friend void swap( multi_key_map & a, multi_key_map & b ) noexcept { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       { return make_begin( *this ); }
    const_iterator begin() const { return make_begin( *this ); }
    iterator       end  ()       noexcept { return { this, table_.end(), {} }; }
    const_iterator end  () const noexcept { return { this, table_.end(), {} }; }

    const_iterator cbegin() const { return begin(); }
    const_iterator cend  () const noexcept { return end(); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty          () const noexcept { return size_ == 0; }
    [[ nodiscard ]] size_type size           () const noexcept { return size_; }
    [[ nodiscard ]] size_type major_key_count() const noexcept { return table_.size(); }

    void reserve( size_type const major_key_capacity ) { table_.reserve( major_key_capacity ); }

    /// Number of empty inner tables held for reuse.
    [[ nodiscard ]] size_type pooled_table_count() const noexcept { return free_tables_.size(); }

    /// Frees the pooled inner tables (and their bucket arrays).
    size_type release_pooled_tables() noexcept
    {
        auto const released{ free_tables_.size() };
        free_tables_.clear();
        return released;
    }

    /// Structural modification stamp (what iterators are validated against).
    [[ nodiscard ]] version_type version() const noexcept { return version_; }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] MajorHash  major_hash_function() const { return table_.hash_function(); }
    [[ nodiscard ]] MajorEqual major_key_eq       () const { return table_.key_eq(); }
    [[ nodiscard ]] MinorHash  minor_hash_function() const { return minor_hash_; }
    [[ nodiscard ]] MinorEqual minor_key_eq       () const { return minor_eq_; }
    [[ nodiscard ]] ValueEqual value_eq           () const { return value_eq_; }

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] mapped_type       * try_get( major_arg const major, minor_arg const minor )       { return try_get_impl( *this, major, minor ); }
    [[ nodiscard ]] mapped_type const * try_get( major_arg const major, minor_arg const minor ) const { return try_get_impl( *this, major, minor ); }
    [[ nodiscard ]] mapped_type       * try_get( key_type const & key )       { return try_get( key.major_key, key.minor_key ); }
    [[ nodiscard ]] mapped_type const * try_get( key_type const & key ) const { return try_get( key.major_key, key.minor_key ); }

    mapped_type       & at( major_arg const major, minor_arg const minor )       { return *checked( try_get( major, minor ) ); }
    mapped_type const & at( major_arg const major, minor_arg const minor ) const { return *checked( try_get( major, minor ) ); }
    mapped_type       & at( key_type const & key )       { return at( key.major_key, key.minor_key ); }
    mapped_type const & at( key_type const & key ) const { return at( key.major_key, key.minor_key ); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    iterator       find( major_arg const major, minor_arg const minor )       { return find_impl( *this, major, minor ); }
    const_iterator find( major_arg const major, minor_arg const minor ) const { return find_impl( *this, major, minor ); }
    iterator       find( key_type const & key )       { return find( key.major_key, key.minor_key ); }
    const_iterator find( key_type const & key ) const { return find( key.major_key, key.minor_key ); }

    [[ nodiscard ]] bool contains( major_arg const major, minor_arg const minor ) const { return try_get( major, minor ) != nullptr; }
    [[ nodiscard ]] bool contains( key_type const & key ) const { return contains( key.major_key, key.minor_key ); }

    /// Key present and mapped to a value equal (value_equal) to kv.second.
    [[ nodiscard ]] bool contains( value_type const & kv ) const
    {
        auto const p_value{ try_get( kv.first ) };
        return p_value && value_eq_( *p_value, kv.second );
    }

    /// Linear scan.
    [[ nodiscard ]] bool contains_value( mapped_type const & value ) const
    {
        for ( auto const & outer : table_ )
            for ( auto const & inner : outer.second )
                if ( value_eq_( inner.second, value ) )
                    return true;
        return false;
    }

    /// Number of minor keys under the given major key.
    [[ nodiscard ]] size_type query_minor_key_count( major_arg const major ) const
    {
        auto const inner{ find_inner( *this, major ) };
        return inner ? inner->size() : 0;
    }

    /// Number of major keys under which the given minor key is present
    /// (tests every inner table).
    [[ nodiscard ]] size_type query_major_key_count( minor_arg const minor ) const
    {
        if ( is_null_key( minor ) )
            return 0;
        return static_cast<size_type>( std::count_if
        (
            table_.begin(), table_.end(),
            [ & ]( auto const & outer ) { return outer.second.count( minor ) != 0; }
        ));
    }

    /// Appends (key, value) of every entry under the major key to
    /// key_value_pairs. Returns whether anything was found (key_value_pairs
    /// is left untouched otherwise).
    bool query_values_with_major_key( major_arg const major, std::vector<value_type> & key_value_pairs ) const
    {
        auto const inner{ find_inner( *this, major ) };
        if ( !inner )
            return false;
        key_value_pairs.reserve( key_value_pairs.size() + inner->size() );
        for ( auto const & [ minor, value ] : *inner )
            key_value_pairs.emplace_back( key_type{ major, minor }, value );
        return true;
    }

    /// Appends (key, value) of every entry with the minor key to
    /// key_value_pairs. Returns whether anything was found.
    bool query_values_with_minor_key( minor_arg const minor, std::vector<value_type> & key_value_pairs ) const
    {
        if ( is_null_key( minor ) )
            return false;
        bool found{ false };
        for ( auto const & outer : table_ )
        {
            auto const pos{ outer.second.find( minor ) };
            if ( pos != outer.second.end() )
            {
                key_value_pairs.emplace_back( key_type{ outer.first, pos->first }, pos->second );
                found = true;
            }
        }
        return found;
    }

    [[ nodiscard ]] std::vector<value_type> query_values_with_major_key( major_arg const major ) const { std::vector<value_type> result; query_values_with_major_key( major, result ); return result; }
    [[ nodiscard ]] std::vector<value_type> query_values_with_minor_key( minor_arg const minor ) const { std::vector<value_type> result; query_values_with_minor_key( minor, result ); return result; }

    //--------------------------------------------------------------------------
    // Projections
    //--------------------------------------------------------------------------
    [[ nodiscard ]]       major_key_value_range major_key_values( minor_arg const minor )       { return { this, minor }; }
    [[ nodiscard ]] const_major_key_value_range major_key_values( minor_arg const minor ) const { return { this, minor }; }
    [[ nodiscard ]]       minor_key_value_range minor_key_values( major_arg const major )       { return { this, major }; }
    [[ nodiscard ]] const_minor_key_value_range minor_key_values( major_arg const major ) const { return { this, major }; }

    [[ nodiscard ]] key_collection   keys  () const noexcept { return key_collection  { *this }; }
    [[ nodiscard ]] value_collection values() const noexcept { return value_collection{ *this }; }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Inserts a new entry; throws duplicate_key (leaving the map unmodified)
    /// if the composite key is already present.
    template <typename V = mapped_type>
    requires std::constructible_from<mapped_type, V &&>
    void add( major_arg const major, minor_arg const minor, V && value ) { insert_impl( major, minor, std::forward<V>( value ), insert_mode::must_be_new ); }

    template <typename V = mapped_type>
    requires std::constructible_from<mapped_type, V &&>
    void add( key_type const & key, V && value ) { add( key.major_key, key.minor_key, std::forward<V>( value ) ); }

    void add( value_type const & kv ) { add( kv.first, kv.second ); }
    void add( value_type      && kv ) { add( kv.first, std::move( kv.second ) ); }

    /// Inserts or overwrites.
    template <typename V = mapped_type>
    requires std::constructible_from<mapped_type, V &&> && std::is_assignable_v<mapped_type &, V &&>
    void insert_or_assign( major_arg const major, minor_arg const minor, V && value ) { insert_impl( major, minor, std::forward<V>( value ), insert_mode::may_overwrite ); }

    template <typename V = mapped_type>
    requires std::constructible_from<mapped_type, V &&> && std::is_assignable_v<mapped_type &, V &&>
    void insert_or_assign( key_type const & key, V && value ) { insert_or_assign( key.major_key, key.minor_key, std::forward<V>( value ) ); }

    bool erase( major_arg const major, minor_arg const minor )
    {
        if ( is_null_key( major ) || is_null_key( minor ) )
            return false;
        auto const outer{ table_.find( major ) };
        if ( outer == table_.end() || outer->second.erase( minor ) == 0 )
            return false;
        --size_;
        ++version_;
        if ( outer->second.empty() )
            release_table( outer );
        return true;
    }
    bool erase( key_type const & key ) { return erase( key.major_key, key.minor_key ); }

    void clear() noexcept
    {
        for ( auto & outer : table_ )
        {
            outer.second.clear();
            pool( std::move( outer.second ) );
        }
        table_.clear();
        size_ = 0;
        ++version_;
        BOOST_ASSERT( verify() );
    }

    /// Removes all entries under the major key. Returns the number of removed
    /// entries.
    size_type clear_major_key( major_arg const major )
    {
        if ( is_null_key( major ) )
            return 0;
        auto const outer{ table_.find( major ) };
        if ( outer == table_.end() )
            return 0;
        auto const removed{ outer->second.size() };
        outer->second.clear();
        release_table( outer );
        size_ -= removed;
        ++version_;
        return removed;
    }

    /// Removes the minor key from every inner table (O(number of major keys)).
    /// Returns the number of removed entries.
    size_type clear_minor_key( minor_arg const minor )
    {
        if ( is_null_key( minor ) )
            return 0;
        // minor may refer to a key stored in (and freed by) the first erase
        Minor const key{ minor };
        size_type removed{ 0 };
        for ( auto outer{ table_.begin() }; outer != table_.end(); )
        {
            if ( outer->second.erase( key ) != 0 )
            {
                ++removed;
                if ( outer->second.empty() )
                {
                    outer = release_table( outer );
                    continue;
                }
            }
            ++outer;
        }
        if ( removed )
        {
            size_ -= removed;
            ++version_;
        }
        BOOST_ASSERT( verify() );
        return removed;
    }

    //--------------------------------------------------------------------------
    // Bulk export
    //--------------------------------------------------------------------------

    /// Copies all entries into destination starting at index. Throws
    /// std::out_of_range for index > destination.size() and std::length_error
    /// if the entries do not fit (nothing is written in either case).
    void copy_to( std::span<value_type> const destination, size_type index = 0 ) const
    {
        validate_copy_destination( destination.size(), index, size() );
        for ( auto const & outer : table_ )
            for ( auto const & inner : outer.second )
                destination[ index++ ] = value_type{ key_type{ outer.first, inner.first }, inner.second };
    }

    //--------------------------------------------------------------------------
    // Debugging
    //--------------------------------------------------------------------------

    /// Checks the structural invariants listed above. O(major_key_count() + pooled_table_count()).
    [[ nodiscard ]] bool verify() const noexcept
    {
        size_type total{ 0 };
        for ( auto const & outer : table_ )
        {
            if ( outer.second.empty() )
                return false;
            total += outer.second.size();
        }
        return
            ( total == size_ ) &&
            std::all_of( free_tables_.begin(), free_tables_.end(), []( inner_table const & table ) noexcept { return table.empty(); } ) &&
            ( free_tables_.capacity() >= free_tables_.size() + table_.size() );
    }

    /// Per major key dump (defined in multi_key_map_print.hpp).
    void print( std::ostream & ) const;
    void print() const;

private:
    template <typename Self>
    static auto * find_inner( Self & self, major_arg const major )
    {
        using result_t = std::conditional_t<std::is_const_v<Self>, inner_table const, inner_table>;
        if ( is_null_key( major ) )
            return static_cast<result_t *>( nullptr );
        auto const outer{ self.table_.find( major ) };
        return ( outer != self.table_.end() ) ? &outer->second : static_cast<result_t *>( nullptr );
    }

    template <typename Self>
    static auto * try_get_impl( Self & self, major_arg const major, minor_arg const minor )
    {
        using result_t = std::conditional_t<std::is_const_v<Self>, mapped_type const, mapped_type>;
        auto const inner{ find_inner( self, major ) };
        if ( !inner || is_null_key( minor ) )
            return static_cast<result_t *>( nullptr );
        auto const pos{ inner->find( minor ) };
        return ( pos != inner->end() ) ? &pos->second : static_cast<result_t *>( nullptr );
    }

    template <typename Self>
    static auto find_impl( Self & self, major_arg const major, minor_arg const minor ) -> decltype( self.end() )
    {
        if ( is_null_key( major ) || is_null_key( minor ) )
            return self.end();
        auto const outer{ self.table_.find( major ) };
        if ( outer == self.table_.end() )
            return self.end();
        auto const inner{ outer->second.find( minor ) };
        if ( inner == outer->second.end() )
            return self.end();
        return { &self, outer, inner };
    }

    template <typename Self>
    static auto make_begin( Self & self ) -> decltype( self.end() )
    {
        auto const outer{ self.table_.begin() };
        if ( outer == self.table_.end() )
            return self.end();
        BOOST_ASSERT_MSG( !outer->second.empty(), "Empty inner table reachable from the outer table" );
        return { &self, outer, outer->second.begin() };
    }

    template <typename Value>
    static Value * checked( Value * const p_value )
    {
        if ( !p_value ) [[ unlikely ]]
            detail::throw_key_not_found( "psi::multikey::multi_key_map::at" );
        return p_value;
    }

    static void validate_copy_destination( size_type const destination_size, size_type const index, size_type const count )
    {
        if ( index > destination_size )
            detail::throw_out_of_range( "psi::multikey::multi_key_map::copy_to: index out of range" );
        if ( destination_size - index < count )
            detail::throw_length_error( "psi::multikey::multi_key_map::copy_to: destination too small" );
    }

    // Single insertion routine: add() and insert_or_assign() differ only in
    // the treatment of an already present key.
    template <typename V>
    void insert_impl( major_arg const major, minor_arg const minor, V && value, insert_mode const mode )
    {
        if ( is_null_key( major ) || is_null_key( minor ) ) [[ unlikely ]]
            detail::throw_invalid_argument( "psi::multikey::multi_key_map: null keys cannot be stored" );

        auto const outer{ table_.find( major ) };
        if ( outer != table_.end() )
        {
            auto & inner{ outer->second };
            BOOST_ASSERT( !inner.empty() );
            auto const pos{ inner.find( minor ) };
            if ( pos != inner.end() )
            {
                if ( mode == insert_mode::must_be_new )
                    detail::throw_duplicate_key( "psi::multikey::multi_key_map::add: key already present" );
                pos->second = std::forward<V>( value );
            }
            else
            {
                inner.emplace( minor, std::forward<V>( value ) );
                ++size_;
            }
        }
        else
        {
            // A fresh table cannot contain the key: fill it first and attach
            // it only then (so that a throwing emplace cannot leave an empty
            // table attached).
            auto inner{ acquire_table() };
            inner.emplace( minor, std::forward<V>( value ) );
            table_.emplace( major, std::move( inner ) );
            ++size_;
        }
        ++version_;
    }

    inner_table acquire_table()
    {
        if ( !free_tables_.empty() )
        {
            auto table{ std::move( free_tables_.back() ) };
            free_tables_.pop_back();
            BOOST_ASSERT( table.empty() );
            return table;
        }
        // Keep room for every existing table in the pool so that releasing
        // one never reallocates (i.e. cannot throw).
        auto const table_count{ table_.size() + 1 };
        if ( free_tables_.capacity() < table_count )
            free_tables_.reserve( std::max( table_count, free_tables_.capacity() * 3U / 2U ) );
        return inner_table( 1, minor_hash_, minor_eq_ );
    }

    void pool( inner_table && table ) noexcept
    {
        BOOST_ASSERT( table.empty() );
        BOOST_ASSERT( free_tables_.size() < free_tables_.capacity() );
        free_tables_.push_back( std::move( table ) );
    }

    // Detaches an (emptied) inner table, moves it into the pool and returns
    // the iterator following it.
    typename outer_table::iterator release_table( typename outer_table::iterator const pos ) noexcept
    {
        pool( std::move( pos->second ) );
        return table_.erase( pos );
    }

private:
    outer_table              table_;
    std::vector<inner_table> free_tables_;
    size_type                size_   { 0 };
    version_type             version_{ 0 };

    [[ no_unique_address ]] MinorHash  minor_hash_;
    [[ no_unique_address ]] MinorEqual minor_eq_;
    [[ no_unique_address ]] ValueEqual value_eq_;
}; // class multi_key_map

//------------------------------------------------------------------------------
} // namespace psi::multikey
//------------------------------------------------------------------------------
