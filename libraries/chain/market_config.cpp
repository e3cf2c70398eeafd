#include <pmarket/chain/market_config.hpp>
#include <pmarket/chain/exceptions.hpp>

namespace pmarket { namespace chain {

   void market_config::validate()const {
      PM_ASSERT( !account.empty(), invalid_market_construction, "market account cannot be empty" );
      PM_ASSERT( !creator.empty(), invalid_market_construction, "market creator cannot be empty" );
      PM_ASSERT( fee < config::fee_range, invalid_market_construction,
                 "fee ${fee} must be less than ${range}", ("fee", fee)("range", config::fee_range) );
   }

} } // pmarket::chain
