#pragma once
#include <pmarket/chain/asset_ledger.hpp>

namespace pmarket { namespace chain {

   /**
    *  Mints and burns full outcome sets 1:1 against collateral.
    *
    *  buy_all_outcomes() draws `amount` collateral from `buyer` through the allowance
    *  `buyer` granted to account(), then credits `amount` of every outcome token.
    *  sell_all_outcomes() debits `amount` of every outcome token and pays back `amount`
    *  collateral. Both throw when they cannot complete.
    */
   class outcome_set_manager {
      public:
         virtual ~outcome_set_manager() = default;

         virtual account_name        account()const = 0;
         virtual outcome_index_type  outcome_count()const = 0;

         virtual asset_ledger&       collateral_token() = 0;
         virtual asset_ledger&       outcome_token( outcome_index_type index ) = 0;

         virtual void buy_all_outcomes( account_name buyer, share_type amount ) = 0;
         virtual void sell_all_outcomes( account_name seller, share_type amount ) = 0;
   };

} } // pmarket::chain
