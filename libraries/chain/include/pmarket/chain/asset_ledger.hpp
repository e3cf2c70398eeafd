#pragma once
#include <pmarket/chain/types.hpp>

namespace pmarket { namespace chain {

   /**
    *  Balance book of a single asset: the collateral or one outcome token.
    *
    *  Every mutating call reports success with its return value; a ledger never
    *  changes state when it returns false. Callers act on behalf of the first
    *  account argument, the way a contract acts on behalf of its sender.
    */
   class asset_ledger {
      public:
         virtual ~asset_ledger() = default;

         virtual bool transfer( account_name from, account_name to, share_type amount ) = 0;

         /// moves `amount` out of `from`, consuming the allowance `from` granted to `spender`
         virtual bool transfer_from( account_name spender, account_name from, account_name to, share_type amount ) = 0;

         /// sets the allowance `owner` grants to `spender`, replacing any previous allowance
         virtual bool approve( account_name owner, account_name spender, share_type amount ) = 0;

         virtual share_type balance_of( account_name owner )const = 0;
   };

} } // pmarket::chain
