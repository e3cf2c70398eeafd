#include <boost/test/unit_test.hpp>
#include <pmarket/testing/tester.hpp>

using namespace pmarket::chain;
using namespace pmarket::testing;

class token_fixture : private chainbase_fixture<1024*1024>, public token_manager
{
   public:
      token_fixture()
      :chainbase_fixture()
      ,token_manager(*chainbase_fixture::_db)
      {
         add_indices();
         ledger = get_ledger( create_token( "issuer"_n ).id );
      }

      chainbase::database::session start_session() {
         return chainbase_fixture::_db->start_undo_session(true);
      }

      std::shared_ptr<token_ledger> ledger;
};

BOOST_AUTO_TEST_SUITE(token_ledger_tests)

BOOST_FIXTURE_TEST_CASE(issue_and_revoke, token_fixture) try {
   ledger->issue( "issuer"_n, "alice"_n, 500 );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 500u );
   BOOST_REQUIRE_EQUAL( ledger->get_token().supply, 500u );

   ledger->revoke( "issuer"_n, "alice"_n, 200 );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 300u );
   BOOST_REQUIRE_EQUAL( ledger->get_token().supply, 300u );

   BOOST_REQUIRE_EXCEPTION( ledger->issue( "alice"_n, "alice"_n, 1 ), token_authorization_exception,
                            fc_exception_message_is( "alice is not the issuer of token 0" ) );
   BOOST_REQUIRE_EXCEPTION( ledger->revoke( "issuer"_n, "alice"_n, 301 ), insufficient_balance_exception,
                            fc_exception_message_starts_with( "cannot revoke 301 of token 0 from alice" ) );

   // revoking nothing from an account without a balance is a no-op
   ledger->revoke( "issuer"_n, "bob"_n, 0 );
   BOOST_REQUIRE_EQUAL( ledger->get_token().supply, 300u );

   BOOST_REQUIRE_THROW( ledger->issue( "issuer"_n, "bob"_n, std::numeric_limits<share_type>::max() ),
                        arithmetic_overflow_exception );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(transfer_test, token_fixture) try {
   ledger->issue( "issuer"_n, "alice"_n, 100 );

   BOOST_REQUIRE( ledger->transfer( "alice"_n, "bob"_n, 40 ) );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 60u );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "bob"_n ), 40u );

   // failed transfers change nothing
   BOOST_REQUIRE( !ledger->transfer( "alice"_n, "bob"_n, 61 ) );
   BOOST_REQUIRE( !ledger->transfer( "carol"_n, "bob"_n, 1 ) );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 60u );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "bob"_n ), 40u );

   BOOST_REQUIRE( ledger->transfer( "carol"_n, "bob"_n, 0 ) );
   BOOST_REQUIRE( ledger->transfer( "alice"_n, "alice"_n, 60 ) );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 60u );
   BOOST_REQUIRE_EQUAL( ledger->get_token().supply, 100u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(allowance_test, token_fixture) try {
   ledger->issue( "issuer"_n, "alice"_n, 100 );

   BOOST_REQUIRE( !ledger->transfer_from( "market"_n, "alice"_n, "market"_n, 10 ) );

   BOOST_REQUIRE( ledger->approve( "alice"_n, "market"_n, 30 ) );
   BOOST_REQUIRE_EQUAL( ledger->allowance( "alice"_n, "market"_n ), 30u );

   BOOST_REQUIRE( ledger->transfer_from( "market"_n, "alice"_n, "market"_n, 20 ) );
   BOOST_REQUIRE_EQUAL( ledger->allowance( "alice"_n, "market"_n ), 10u );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 80u );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "market"_n ), 20u );

   // beyond the remaining allowance
   BOOST_REQUIRE( !ledger->transfer_from( "market"_n, "alice"_n, "bob"_n, 11 ) );
   BOOST_REQUIRE_EQUAL( ledger->allowance( "alice"_n, "market"_n ), 10u );

   // approve replaces rather than adds
   BOOST_REQUIRE( ledger->approve( "alice"_n, "market"_n, 500 ) );
   BOOST_REQUIRE_EQUAL( ledger->allowance( "alice"_n, "market"_n ), 500u );

   // beyond the balance
   BOOST_REQUIRE( !ledger->transfer_from( "market"_n, "alice"_n, "bob"_n, 81 ) );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 80u );
   BOOST_REQUIRE_EQUAL( ledger->allowance( "alice"_n, "market"_n ), 500u );

   BOOST_REQUIRE( ledger->transfer_from( "market"_n, "alice"_n, "bob"_n, 80 ) );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "bob"_n ), 80u );
   BOOST_REQUIRE_EQUAL( ledger->allowance( "alice"_n, "market"_n ), 420u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(undo_test, token_fixture) try {
   ledger->issue( "issuer"_n, "alice"_n, 100 );
   {
      auto session = start_session();
      BOOST_REQUIRE( ledger->transfer( "alice"_n, "bob"_n, 25 ) );
      BOOST_REQUIRE( ledger->approve( "bob"_n, "alice"_n, 5 ) );
      ledger->issue( "issuer"_n, "carol"_n, 7 );
   }
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "alice"_n ), 100u );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "bob"_n ), 0u );
   BOOST_REQUIRE_EQUAL( ledger->balance_of( "carol"_n ), 0u );
   BOOST_REQUIRE_EQUAL( ledger->allowance( "bob"_n, "alice"_n ), 0u );
   BOOST_REQUIRE_EQUAL( ledger->get_token().supply, 100u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(unknown_token, token_fixture) try {
   BOOST_REQUIRE_THROW( get_ledger( token_id_type(42) ), unknown_token_exception );
   BOOST_REQUIRE_THROW( get_token( token_id_type(42) ), unknown_token_exception );
   BOOST_REQUIRE_THROW( create_token( name() ), token_authorization_exception );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
