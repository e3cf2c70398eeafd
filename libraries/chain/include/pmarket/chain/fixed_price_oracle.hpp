#pragma once
#include <pmarket/chain/pricing_oracle.hpp>

#include <fc/reflect/reflect.hpp>

namespace pmarket { namespace chain {

   /// collateral per outcome token, as numerator / denominator
   struct price_ratio {
      share_type numerator = 0;
      share_type denominator = 1;
   };

   struct outcome_price {
      price_ratio buy;   ///< charged when the market sells to a trader
      price_ratio sell;  ///< paid when the market buys back from a trader
   };

   /**
    *  Quotes every outcome at a constant price regardless of the market's exposure.
    *  Costs round up and profits round down, so the market never pays out a
    *  fraction it did not collect.
    */
   class fixed_price_oracle : public pricing_oracle {
      public:
         explicit fixed_price_oracle( vector<outcome_price> prices );

         share_type calc_cost( const market_object& market, outcome_index_type index, share_type count )const override;
         share_type calc_profit( const market_object& market, outcome_index_type index, share_type count )const override;

         const vector<outcome_price>& prices()const { return _prices; }

      private:
         const outcome_price& get_price( const market_object& market, outcome_index_type index )const;

         vector<outcome_price> _prices;
   };

} } // pmarket::chain

FC_REFLECT( pmarket::chain::price_ratio, (numerator)(denominator) )
FC_REFLECT( pmarket::chain::outcome_price, (buy)(sell) )
