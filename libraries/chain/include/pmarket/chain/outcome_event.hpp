#pragma once
#include <pmarket/chain/outcome_set_manager.hpp>
#include <pmarket/chain/token_ledger.hpp>

namespace pmarket { namespace chain {

   /**
    *  Outcome set manager backed by the token ledger. The event account issues one
    *  token per outcome and holds the collateral backing every full set in
    *  circulation.
    *
    *  Resolution and redemption of the winning outcome are handled elsewhere.
    */
   class outcome_event : public outcome_set_manager {
      public:
         outcome_event( token_manager& tokens, account_name account,
                        std::shared_ptr<asset_ledger> collateral, outcome_index_type outcome_count );

         account_name        account()const override { return _account; }
         outcome_index_type  outcome_count()const override;

         asset_ledger&       collateral_token() override { return *_collateral; }
         asset_ledger&       outcome_token( outcome_index_type index ) override;
         token_ledger&       get_outcome_ledger( outcome_index_type index );

         void buy_all_outcomes( account_name buyer, share_type amount ) override;
         void sell_all_outcomes( account_name seller, share_type amount ) override;

      private:
         account_name                               _account;
         std::shared_ptr<asset_ledger>              _collateral;
         vector<std::shared_ptr<token_ledger>>      _outcome_tokens;
   };

} } // pmarket::chain
