#pragma once
#include <pmarket/chain/asset_ledger.hpp>
#include <pmarket/chain/token_object.hpp>
#include <pmarket/chain/exceptions.hpp>

namespace pmarket { namespace chain {

   /**
    *  Asset ledger of one token kept in the state database, so that every balance
    *  change is covered by the undo session of the operation making it.
    *
    *  Transfers behave like a standard fungible token: moving more than the
    *  balance, or more than the allowance for transfer_from(), returns false and
    *  changes nothing. Zero amounts and transfers to oneself succeed.
    */
   class token_ledger : public asset_ledger {
      public:
         token_ledger( chainbase::database& db, token_id_type token );

         bool transfer( account_name from, account_name to, share_type amount ) override;
         bool transfer_from( account_name spender, account_name from, account_name to, share_type amount ) override;
         bool approve( account_name owner, account_name spender, share_type amount ) override;
         share_type balance_of( account_name owner )const override;

         share_type allowance( account_name owner, account_name spender )const;

         /// mint `amount` to `to`; only the issuer of the token may do this
         void issue( account_name issuer, account_name to, share_type amount );
         /// burn `amount` held by `from`; only the issuer of the token may do this
         void revoke( account_name issuer, account_name from, share_type amount );

         token_id_type        id()const { return _token; }
         const token_object&  get_token()const;

      private:
         void add_balance( account_name owner, share_type amount );
         void sub_balance( account_name owner, share_type amount );

         chainbase::database&  _db;
         token_id_type         _token;
   };

   /**
    *  Registry of the tokens in the state database.
    */
   class token_manager {
      public:
         explicit token_manager( chainbase::database& db )
         :_db(db)
         {
         }

         void add_indices();

         const token_object&            create_token( account_name issuer );
         const token_object&            get_token( token_id_type id )const;
         std::shared_ptr<token_ledger>  get_ledger( token_id_type id );

      private:
         chainbase::database& _db;
   };

} } // pmarket::chain
