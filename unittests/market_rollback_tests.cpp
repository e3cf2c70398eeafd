#include <boost/test/unit_test.hpp>
#include <pmarket/testing/tester.hpp>

#include <stdexcept>

using namespace pmarket::chain;
using namespace pmarket::testing;

namespace {
   constexpr account_name alice = "alice"_n;
}

BOOST_AUTO_TEST_SUITE(market_rollback_tests)

BOOST_FIXTURE_TEST_CASE(signals_follow_commit, market_tester) try {
   vector<market_funding>          fundings;
   vector<outcome_token_purchase>  purchases;
   vector<outcome_token_sale>      sales;
   vector<market_closing>          closings;
   vector<fee_withdrawal>          withdrawals;

   mkt->funded.connect( [&]( const market_funding& f ) { fundings.push_back( f ); } );
   mkt->purchased.connect( [&]( const outcome_token_purchase& p ) {
      // the purchase is already visible when observers run
      BOOST_REQUIRE_EQUAL( outcome_balance( p.buyer, p.index ), p.count );
      purchases.push_back( p );
   });
   mkt->sold.connect( [&]( const outcome_token_sale& s ) { sales.push_back( s ); } );
   mkt->closed.connect( [&]( const market_closing& c ) { closings.push_back( c ); } );
   mkt->fees_withdrawn.connect( [&]( const fee_withdrawal& w ) { withdrawals.push_back( w ); } );

   fund_market( 1000 );
   issue_collateral( alice, 1000 );
   approve_collateral( alice, 1000 );
   mkt->buy( alice, 1, 500, 306 );
   approve_outcome( alice, 1, 100 );
   mkt->sell( alice, 1, 100, 0 );
   mkt->close( creator );
   mkt->withdraw_fees( creator );

   BOOST_REQUIRE_EQUAL( fundings.size(), 1u );
   BOOST_REQUIRE_EQUAL( fundings[0].market, market_account );
   BOOST_REQUIRE_EQUAL( fundings[0].funding, 1000u );

   BOOST_REQUIRE_EQUAL( purchases.size(), 1u );
   BOOST_REQUIRE_EQUAL( purchases[0].buyer, alice );
   BOOST_REQUIRE_EQUAL( purchases[0].index, 1 );
   BOOST_REQUIRE_EQUAL( purchases[0].count, 500u );
   BOOST_REQUIRE_EQUAL( purchases[0].cost, 300u );
   BOOST_REQUIRE_EQUAL( purchases[0].fees, 6u );

   BOOST_REQUIRE_EQUAL( sales.size(), 1u );
   BOOST_REQUIRE_EQUAL( sales[0].seller, alice );
   BOOST_REQUIRE_EQUAL( sales[0].count, 100u );
   BOOST_REQUIRE_EQUAL( sales[0].profit, 50u );
   BOOST_REQUIRE_EQUAL( sales[0].fees, 1u );

   BOOST_REQUIRE_EQUAL( closings.size(), 1u );
   BOOST_REQUIRE_EQUAL( withdrawals.size(), 1u );
   BOOST_REQUIRE_EQUAL( withdrawals[0].fees, 7u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(failed_operations_publish_nothing, market_tester) try {
   unsigned published = 0;
   mkt->funded.connect( [&]( const market_funding& ) { ++published; } );
   mkt->purchased.connect( [&]( const outcome_token_purchase& ) { ++published; } );
   mkt->closed.connect( [&]( const market_closing& ) { ++published; } );

   BOOST_REQUIRE_THROW( mkt->fund( creator, 100 ), transfer_failure_exception );
   BOOST_REQUIRE_THROW( mkt->buy( alice, 0, 10, 0 ), slippage_exceeded_exception );
   BOOST_REQUIRE_THROW( mkt->close( alice ), market_unauthorized_exception );
   BOOST_REQUIRE_EQUAL( published, 0u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(throwing_observer_keeps_operation, market_tester) try {
   mkt->funded.connect( []( const market_funding& ) {
      FC_THROW_EXCEPTION( fc::invalid_operation_exception, "observer failed" );
   });
   mkt->purchased.connect( []( const outcome_token_purchase& ) {
      throw std::runtime_error( "observer failed" );
   });

   fund_market( 1000 );
   BOOST_REQUIRE_EQUAL( mkt->get_state().funding, 1000u );

   issue_collateral( alice, 100 );
   approve_collateral( alice, 100 );
   BOOST_REQUIRE_EQUAL( mkt->buy( alice, 0, 100, 100 ), 61u );
   BOOST_REQUIRE_EQUAL( outcome_balance( alice, 0 ), 100u );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(enclosing_session_undo, market_tester) try {
   issue_collateral( alice, 1000 );
   approve_collateral( alice, 1000 );
   {
      auto session = start_session();
      fund_market( 1000 );
      mkt->buy( alice, 0, 100, 1000 );
      BOOST_REQUIRE_EQUAL( mkt->get_state().funding, 1000u );
      BOOST_REQUIRE_EQUAL( outcome_balance( alice, 0 ), 100u );
      session.undo();
   }

   BOOST_REQUIRE_EQUAL( mkt->get_state().funding, 0u );
   BOOST_REQUIRE_EQUAL( collateral_balance( alice ), 1000u );
   BOOST_REQUIRE_EQUAL( collateral_balance( creator ), 0u );
   BOOST_REQUIRE_EQUAL( outcome_balance( alice, 0 ), 0u );
   BOOST_REQUIRE_EQUAL( outcome_balance( market_account, 0 ), 0u );
   BOOST_REQUIRE( mkt->get_net_outcome_tokens_sold() == vector<exposure_type>({ 0, 0 }) );
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(failure_inside_enclosing_session, market_tester) try {
   issue_collateral( alice, 1000 );
   approve_collateral( alice, 1000 );

   auto session = start_session();
   fund_market( 1000 );
   mkt->buy( alice, 0, 100, 1000 );

   // only the failing operation is reverted, the enclosing session keeps the rest
   BOOST_REQUIRE_THROW( mkt->buy( alice, 1, 100, 1 ), slippage_exceeded_exception );
   BOOST_REQUIRE_THROW( mkt->short_sell( alice, 1, 100, 1000 ), slippage_exceeded_exception );
   session.push();

   BOOST_REQUIRE_EQUAL( mkt->get_state().funding, 1000u );
   BOOST_REQUIRE_EQUAL( outcome_balance( alice, 0 ), 100u );
   BOOST_REQUIRE_EQUAL( outcome_balance( alice, 1 ), 0u );
   BOOST_REQUIRE_EQUAL( collateral_balance( alice ), 939u );
   BOOST_REQUIRE( mkt->get_net_outcome_tokens_sold() == vector<exposure_type>({ 100, 0 }) );
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
