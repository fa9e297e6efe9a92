#include "lockrelease_tester.hpp"

BOOST_AUTO_TEST_SUITE(lockrelease_reentrancy_tests)

BOOST_FIXTURE_TEST_CASE( reentrant_lock_tests, lockrelease_tester ) try {
   setup_bridge( 3 );

   // the token calls lock again from inside the transfer
   set_hook( "lock"_n );
   produce_blocks();

   BOOST_REQUIRE_EQUAL( bridge_error( "InvalidAction", "reentrant call rejected" ),
      lock( ALICE, 100 )
   );
   BOOST_REQUIRE_EQUAL( 1000, balance( ALICE ) );
   BOOST_REQUIRE_EQUAL( 500, balance( ADMIN ) );
   BOOST_REQUIRE_EQUAL( 0, balance( BRIDGE ) );
   BOOST_REQUIRE( get_lockdata().is_null() );
   BOOST_REQUIRE( !is_guarded() );

   clear_hook();
   produce_blocks();

   BOOST_REQUIRE_EQUAL( success(), lock( ALICE, 100 ) );
   BOOST_REQUIRE_EQUAL( 900, balance( ALICE ) );
   BOOST_REQUIRE( !is_guarded() );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( reentrant_release_tests, lockrelease_tester ) try {
   setup_bridge( 3 );

   set_hook( "release"_n );
   produce_blocks();

   BOOST_REQUIRE_EQUAL( bridge_error( "InvalidAction", "reentrant call rejected" ),
      release( 50, BOB )
   );
   BOOST_REQUIRE_EQUAL( 500, balance( ADMIN ) );
   BOOST_REQUIRE_EQUAL( 0, balance( BOB ) );
   BOOST_REQUIRE( !is_guarded() );

   // lock and release share one guard
   BOOST_REQUIRE_EQUAL( bridge_error( "InvalidAction", "reentrant call rejected" ),
      lock( ALICE, 100 )
   );

   clear_hook();
   produce_blocks();

   BOOST_REQUIRE_EQUAL( success(), release( 50, BOB ) );
   BOOST_REQUIRE_EQUAL( 50, balance( BOB ) );

} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE( guard_released_tests, lockrelease_tester ) try {
   setup_bridge( 3 );

   // consecutive calls would fail if any exit path left the guard behind
   BOOST_REQUIRE_EQUAL( success(), lock( ALICE, 10 ) );
   BOOST_REQUIRE_EQUAL( bridge_error( "InvalidAction", "insufficient balance" ),
      lock( ALICE, 5000 )
   );
   BOOST_REQUIRE_EQUAL( bridge_error( "InvalidAction", "amount must be at least 1" ),
      lock( ALICE, 0 )
   );
   BOOST_REQUIRE_EQUAL( success(), release( 10, BOB ) );
   BOOST_REQUIRE_EQUAL( bridge_error( "InvalidAction", "insufficient admin balance" ),
      release( 100000, BOB )
   );
   BOOST_REQUIRE_EQUAL( success(), lock( ALICE, 20 ) );
   BOOST_REQUIRE_EQUAL( success(), release( 20, BOB ) );
   BOOST_REQUIRE( !is_guarded() );

   BOOST_REQUIRE_EQUAL( 970, balance( ALICE ) );
   BOOST_REQUIRE_EQUAL( 30, balance( BOB ) );

} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
