#pragma once
#include <pmarket/chain/types.hpp>
#include <pmarket/chain/database_utils.hpp>

#include "multi_index_includes.hpp"

namespace pmarket { namespace chain {

   /**
    *  State owned by a market. Balances are not part of it: what the market holds is
    *  whatever the asset ledgers report for `account`.
    */
   class market_object : public chainbase::object<market_object_type, market_object> {
      OBJECT_CTOR(market_object, (net_outcome_tokens_sold))

      id_type                        id;
      account_name                   account; //< identity of the market in the asset ledgers
      account_name                   creator;
      account_name                   event;
      time_point                     created_at;
      fee_type                       fee = 0; //< parts of config::fee_range
      share_type                     funding = 0;

      /// cumulative outcome tokens sold minus bought back, one entry per outcome
      shared_vector<exposure_type>   net_outcome_tokens_sold;

      outcome_index_type outcome_count()const {
         return static_cast<outcome_index_type>( net_outcome_tokens_sold.size() );
      }
   };
   using market_id_type = market_object::id_type;

   using market_index = chainbase::shared_multi_index_container<
      market_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<market_object, market_object::id_type, &market_object::id>>,
         ordered_unique<tag<by_account>, member<market_object, account_name, &market_object::account>>
      >
   >;

} } // pmarket::chain

CHAINBASE_SET_INDEX_TYPE(pmarket::chain::market_object, pmarket::chain::market_index)

FC_REFLECT(pmarket::chain::market_object, (account)(creator)(event)(created_at)(fee)(funding)(net_outcome_tokens_sold))
