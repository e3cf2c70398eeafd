#include <pmarket/chain/token_ledger.hpp>
#include <pmarket/chain/int_arithmetic.hpp>

#include <fc/log/logger.hpp>

namespace pmarket { namespace chain {

using token_index_set = index_set<
   token_index,
   token_balance_index,
   token_allowance_index
>;

void token_manager::add_indices() {
   token_index_set::add_indices(_db);
}

const token_object& token_manager::create_token( account_name issuer ) {
   PM_ASSERT( !issuer.empty(), token_authorization_exception, "token issuer cannot be empty" );
   const auto& token = _db.create<token_object>([&]( token_object& t ) {
      t.issuer = issuer;
   });
   dlog( "created token ${id} issued by ${issuer}", ("id", token.id)("issuer", issuer) );
   return token;
}

const token_object& token_manager::get_token( token_id_type id )const {
   const auto* token = _db.find<token_object>( id );
   PM_ASSERT( token != nullptr, unknown_token_exception, "unknown token ${id}", ("id", id) );
   return *token;
}

std::shared_ptr<token_ledger> token_manager::get_ledger( token_id_type id ) {
   return std::make_shared<token_ledger>( _db, id );
}

token_ledger::token_ledger( chainbase::database& db, token_id_type token )
:_db(db),_token(token)
{
   PM_ASSERT( _db.find<token_object>( _token ) != nullptr, unknown_token_exception, "unknown token ${id}", ("id", _token) );
}

const token_object& token_ledger::get_token()const {
   return _db.get<token_object>( _token );
}

share_type token_ledger::balance_of( account_name owner )const {
   const auto* b = _db.find<token_balance_object, by_token_owner>( boost::make_tuple( _token, owner ) );
   return b ? b->balance : 0;
}

share_type token_ledger::allowance( account_name owner, account_name spender )const {
   const auto* a = _db.find<token_allowance_object, by_token_owner_spender>( boost::make_tuple( _token, owner, spender ) );
   return a ? a->amount : 0;
}

bool token_ledger::transfer( account_name from, account_name to, share_type amount ) {
   if( balance_of( from ) < amount )
      return false;
   if( amount == 0 || from == to )
      return true;

   sub_balance( from, amount );
   add_balance( to, amount );
   return true;
}

bool token_ledger::transfer_from( account_name spender, account_name from, account_name to, share_type amount ) {
   const auto* allowed = _db.find<token_allowance_object, by_token_owner_spender>( boost::make_tuple( _token, from, spender ) );
   const share_type remaining = allowed ? allowed->amount : 0;
   if( remaining < amount || balance_of( from ) < amount )
      return false;
   if( amount == 0 )
      return true;

   _db.modify( *allowed, [&]( token_allowance_object& a ) {
      a.amount -= amount;
   });
   if( from != to ) {
      sub_balance( from, amount );
      add_balance( to, amount );
   }
   return true;
}

bool token_ledger::approve( account_name owner, account_name spender, share_type amount ) {
   const auto* existing = _db.find<token_allowance_object, by_token_owner_spender>( boost::make_tuple( _token, owner, spender ) );
   if( existing == nullptr ) {
      _db.create<token_allowance_object>([&]( token_allowance_object& a ) {
         a.token   = _token;
         a.owner   = owner;
         a.spender = spender;
         a.amount  = amount;
      });
   } else {
      _db.modify( *existing, [&]( token_allowance_object& a ) {
         a.amount = amount;
      });
   }
   return true;
}

void token_ledger::issue( account_name issuer, account_name to, share_type amount ) {
   const auto& token = get_token();
   PM_ASSERT( issuer == token.issuer, token_authorization_exception,
              "${issuer} is not the issuer of token ${id}", ("issuer", issuer)("id", _token) );

   const share_type new_supply = int_arithmetic::checked_add( token.supply, amount );
   _db.modify( token, [&]( token_object& t ) {
      t.supply = new_supply;
   });
   add_balance( to, amount );
}

void token_ledger::revoke( account_name issuer, account_name from, share_type amount ) {
   const auto& token = get_token();
   PM_ASSERT( issuer == token.issuer, token_authorization_exception,
              "${issuer} is not the issuer of token ${id}", ("issuer", issuer)("id", _token) );
   PM_ASSERT( balance_of( from ) >= amount, insufficient_balance_exception,
              "cannot revoke ${amount} of token ${id} from ${from}, balance is ${balance}",
              ("amount", amount)("id", _token)("from", from)("balance", balance_of( from )) );
   if( amount == 0 )
      return;

   _db.modify( token, [&]( token_object& t ) {
      t.supply -= amount;
   });
   sub_balance( from, amount );
}

void token_ledger::add_balance( account_name owner, share_type amount ) {
   const auto* b = _db.find<token_balance_object, by_token_owner>( boost::make_tuple( _token, owner ) );
   if( b == nullptr ) {
      _db.create<token_balance_object>([&]( token_balance_object& row ) {
         row.token   = _token;
         row.owner   = owner;
         row.balance = amount;
      });
   } else {
      const share_type new_balance = int_arithmetic::checked_add( b->balance, amount );
      _db.modify( *b, [&]( token_balance_object& row ) {
         row.balance = new_balance;
      });
   }
}

void token_ledger::sub_balance( account_name owner, share_type amount ) {
   const auto& b = _db.get<token_balance_object, by_token_owner>( boost::make_tuple( _token, owner ) );
   PM_ASSERT( b.balance >= amount, insufficient_balance_exception, "overdrawn balance" );
   _db.modify( b, [&]( token_balance_object& row ) {
      row.balance -= amount;
   });
}

} } // pmarket::chain
