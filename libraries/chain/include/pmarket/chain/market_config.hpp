#pragma once
#include <pmarket/chain/types.hpp>
#include <pmarket/chain/config.hpp>

#include <tuple>

namespace pmarket { namespace chain {

   /**
    *  Parameters a market is created with. None of them change afterwards.
    */
   struct market_config {
      account_name   account;       ///< identity the market holds balances under
      account_name   creator;       ///< the only account allowed to fund, close and withdraw fees
      fee_type       fee = 0;       ///< fee taken on every trade, in parts of config::fee_range

      void validate()const; // throws invalid_market_construction if a market cannot be created with these

      friend inline bool operator ==( const market_config& lhs, const market_config& rhs ) {
         return std::tie(lhs.account, lhs.creator, lhs.fee) == std::tie(rhs.account, rhs.creator, rhs.fee);
      }

      friend inline bool operator !=( const market_config& lhs, const market_config& rhs ) {
         return !(lhs == rhs);
      }
   };

} } // pmarket::chain

FC_REFLECT( pmarket::chain::market_config, (account)(creator)(fee) )
