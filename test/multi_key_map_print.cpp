////////////////////////////////////////////////////////////////////////////////
/// psi::multikey::multi_key_map::print() tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/multikey/containers/multi_key_map_print.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
//------------------------------------------------------------------------------
namespace psi::multikey {
//------------------------------------------------------------------------------

TEST( multi_key_map_print, empty_map_prints_summary_only )
{
    multi_key_map<int, std::string, int> const m;
    std::ostringstream os;
    m.print( os );
    EXPECT_EQ( os.str(), "multi_key_map: 0 entries under 0 major keys (0 pooled tables, version 0)\n" );
}

TEST( multi_key_map_print, one_line_per_major_key )
{
    multi_key_map<int, std::string, int> m;
    m.add( 1, "a", 100 );
    m.add( 1, "b", 200 );
    m.add( 2, "a", 300 );
    m.add( 3, "c", 0 );
    m.erase( 3, "c" );

    std::ostringstream os;
    m.print( os );
    auto const dump{ os.str() };

    EXPECT_EQ( dump.find( "multi_key_map: 3 entries under 2 major keys (1 pooled tables, version 5)\n" ), 0U );
    EXPECT_NE( dump.find( "\t1 (2):" ), std::string::npos );
    EXPECT_NE( dump.find( "\t2 (1): [2,a]=300\n" ), std::string::npos );
    EXPECT_NE( dump.find( " [1,a]=100" ), std::string::npos );
    EXPECT_NE( dump.find( " [1,b]=200" ), std::string::npos );
    EXPECT_EQ( dump.find( "[3," ), std::string::npos );
}

//------------------------------------------------------------------------------
} // namespace psi::multikey
//------------------------------------------------------------------------------
