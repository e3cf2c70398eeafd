#pragma once
#include <pmarket/chain/types.hpp>

namespace pmarket { namespace chain {

   struct market_funding {
      account_name   market;
      share_type     funding = 0;
   };

   struct market_closing {
      account_name   market;
   };

   struct fee_withdrawal {
      account_name   market;
      share_type     fees = 0;
   };

   /// `cost` is what the oracle charged; the buyer paid cost + fees
   struct outcome_token_purchase {
      account_name         market;
      account_name         buyer;
      outcome_index_type   index = 0;
      share_type           count = 0;
      share_type           cost = 0;
      share_type           fees = 0;
   };

   /// `profit` is what the oracle paid; the seller received profit - fees
   struct outcome_token_sale {
      account_name         market;
      account_name         seller;
      outcome_index_type   index = 0;
      share_type           count = 0;
      share_type           profit = 0;
      share_type           fees = 0;
   };

   struct outcome_token_short_sale {
      account_name         market;
      account_name         seller;
      outcome_index_type   index = 0;
      share_type           count = 0;
      share_type           cost = 0;
   };

} } // pmarket::chain

FC_REFLECT( pmarket::chain::market_funding, (market)(funding) )
FC_REFLECT( pmarket::chain::market_closing, (market) )
FC_REFLECT( pmarket::chain::fee_withdrawal, (market)(fees) )
FC_REFLECT( pmarket::chain::outcome_token_purchase, (market)(buyer)(index)(count)(cost)(fees) )
FC_REFLECT( pmarket::chain::outcome_token_sale, (market)(seller)(index)(count)(profit)(fees) )
FC_REFLECT( pmarket::chain::outcome_token_short_sale, (market)(seller)(index)(count)(cost) )
