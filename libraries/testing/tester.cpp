#include <boost/test/unit_test.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <pmarket/testing/tester.hpp>

namespace pmarket { namespace testing {

   vector<outcome_price> market_tester::default_prices( outcome_index_type outcome_count ) {
      return vector<outcome_price>( outcome_count, outcome_price{ {6, 10}, {5, 10} } );
   }

   market_tester::market_tester( outcome_index_type outcome_count, fee_type fee )
   :market_tester( default_prices( outcome_count ), fee )
   {
   }

   market_tester::market_tester( vector<outcome_price> prices, fee_type fee )
   :tokens(*_db)
   ,markets(*_db)
   {
      tokens.add_indices();
      markets.add_indices();

      collateral = tokens.get_ledger( tokens.create_token( bank ).id );
      event = std::make_shared<outcome_event>( tokens, event_account, collateral,
                                               static_cast<outcome_index_type>( prices.size() ) );
      oracle = std::make_shared<fixed_price_oracle>( std::move(prices) );
      mkt = &markets.create_market( market_config{ market_account, creator, fee }, event, oracle, fc::time_point::now() );
   }

   void market_tester::issue_collateral( account_name to, share_type amount ) {
      collateral->issue( bank, to, amount );
   }

   void market_tester::approve_collateral( account_name owner, share_type amount ) {
      BOOST_REQUIRE( collateral->approve( owner, market_account, amount ) );
   }

   void market_tester::approve_outcome( account_name owner, outcome_index_type index, share_type amount ) {
      BOOST_REQUIRE( event->outcome_token( index ).approve( owner, market_account, amount ) );
   }

   void market_tester::fund_market( share_type amount ) {
      issue_collateral( creator, amount );
      approve_collateral( creator, amount );
      mkt->fund( creator, amount );
   }

   share_type market_tester::collateral_balance( account_name owner ) {
      return collateral->balance_of( owner );
   }

   share_type market_tester::outcome_balance( account_name owner, outcome_index_type index ) {
      return event->outcome_token( index ).balance_of( owner );
   }

   bool fc_exception_message_is::operator()( const fc::exception& ex ) {
      auto message = ex.get_log().at( 0 ).get_message();
      bool match = (message == expected);
      if( !match ) {
         BOOST_TEST_MESSAGE( "LOG: expected: " << expected << ", actual: " << message );
      }
      return match;
   }

   bool fc_exception_message_starts_with::operator()( const fc::exception& ex ) {
      auto message = ex.get_log().at( 0 ).get_message();
      bool match = boost::algorithm::starts_with( message, expected );
      if( !match ) {
         BOOST_TEST_MESSAGE( "LOG: expected: " << expected << ", actual: " << message );
      }
      return match;
   }

} }  /// pmarket::testing
