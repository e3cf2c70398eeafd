#pragma once
#include <pmarket/chain/types.hpp>

namespace pmarket { namespace chain {

   class market_object;

   /**
    *  Prices trades against a market. The formula is opaque to the market; it only
    *  sees the gross amount before fees.
    */
   class pricing_oracle {
      public:
         virtual ~pricing_oracle() = default;

         /// collateral a buyer must pay for `count` tokens of outcome `index`
         virtual share_type calc_cost( const market_object& market, outcome_index_type index, share_type count )const = 0;

         /// collateral a seller receives for `count` tokens of outcome `index`
         virtual share_type calc_profit( const market_object& market, outcome_index_type index, share_type count )const = 0;
   };

} } // pmarket::chain
