#include <pmarket/chain/fixed_price_oracle.hpp>
#include <pmarket/chain/market_object.hpp>
#include <pmarket/chain/int_arithmetic.hpp>

namespace pmarket { namespace chain {

fixed_price_oracle::fixed_price_oracle( vector<outcome_price> prices )
:_prices(std::move(prices))
{
   PM_ASSERT( !_prices.empty(), invalid_config_exception, "price table cannot be empty" );
   for( const auto& p : _prices ) {
      PM_ASSERT( p.buy.denominator > 0 && p.sell.denominator > 0, invalid_config_exception,
                 "price denominators must be positive" );
   }
}

const outcome_price& fixed_price_oracle::get_price( const market_object& market, outcome_index_type index )const {
   PM_ASSERT( index < _prices.size(), invalid_outcome_index_exception,
              "no price for outcome ${i} of market ${m}", ("i", index)("m", market.account) );
   return _prices[index];
}

share_type fixed_price_oracle::calc_cost( const market_object& market, outcome_index_type index, share_type count )const {
   const auto& price = get_price( market, index ).buy;
   return int_arithmetic::safe_prop_ceil( count, price.numerator, price.denominator );
}

share_type fixed_price_oracle::calc_profit( const market_object& market, outcome_index_type index, share_type count )const {
   const auto& price = get_price( market, index ).sell;
   return int_arithmetic::safe_prop( count, price.numerator, price.denominator );
}

} } // pmarket::chain
