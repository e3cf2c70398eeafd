#pragma once
#include <pmarket/chain/types.hpp>
#include <pmarket/chain/database_utils.hpp>

#include "multi_index_includes.hpp"

namespace pmarket { namespace chain {

   class token_object : public chainbase::object<token_object_type, token_object> {
      OBJECT_CTOR(token_object)

      id_type        id;
      account_name   issuer; //< only the issuer may issue or revoke
      share_type     supply = 0;
   };
   using token_id_type = token_object::id_type;

   using token_index = chainbase::shared_multi_index_container<
      token_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<token_object, token_object::id_type, &token_object::id>>
      >
   >;

   class token_balance_object : public chainbase::object<token_balance_object_type, token_balance_object> {
      OBJECT_CTOR(token_balance_object)

      id_type        id;
      token_id_type  token;
      account_name   owner;
      share_type     balance = 0;
   };

   using token_balance_index = chainbase::shared_multi_index_container<
      token_balance_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<token_balance_object, token_balance_object::id_type, &token_balance_object::id>>,
         ordered_unique<tag<by_token_owner>,
            composite_key< token_balance_object,
               member<token_balance_object, token_id_type, &token_balance_object::token>,
               member<token_balance_object, account_name, &token_balance_object::owner>
            >
         >
      >
   >;

   class token_allowance_object : public chainbase::object<token_allowance_object_type, token_allowance_object> {
      OBJECT_CTOR(token_allowance_object)

      id_type        id;
      token_id_type  token;
      account_name   owner;
      account_name   spender;
      share_type     amount = 0;
   };

   using token_allowance_index = chainbase::shared_multi_index_container<
      token_allowance_object,
      indexed_by<
         ordered_unique<tag<by_id>, member<token_allowance_object, token_allowance_object::id_type, &token_allowance_object::id>>,
         ordered_unique<tag<by_token_owner_spender>,
            composite_key< token_allowance_object,
               member<token_allowance_object, token_id_type, &token_allowance_object::token>,
               member<token_allowance_object, account_name, &token_allowance_object::owner>,
               member<token_allowance_object, account_name, &token_allowance_object::spender>
            >
         >
      >
   >;

} } // pmarket::chain

CHAINBASE_SET_INDEX_TYPE(pmarket::chain::token_object, pmarket::chain::token_index)
CHAINBASE_SET_INDEX_TYPE(pmarket::chain::token_balance_object, pmarket::chain::token_balance_index)
CHAINBASE_SET_INDEX_TYPE(pmarket::chain::token_allowance_object, pmarket::chain::token_allowance_index)

FC_REFLECT(pmarket::chain::token_object, (issuer)(supply))
FC_REFLECT(pmarket::chain::token_balance_object, (token)(owner)(balance))
FC_REFLECT(pmarket::chain::token_allowance_object, (token)(owner)(spender)(amount))
