#include <pmarket/chain/outcome_event.hpp>

#include <fc/log/logger.hpp>

namespace pmarket { namespace chain {

outcome_event::outcome_event( token_manager& tokens, account_name account,
                              std::shared_ptr<asset_ledger> collateral, outcome_index_type outcome_count )
:_account(account),_collateral(std::move(collateral))
{
   PM_ASSERT( !_account.empty(), invalid_config_exception, "event account cannot be empty" );
   PM_ASSERT( _collateral != nullptr, invalid_config_exception, "event requires a collateral token" );
   PM_ASSERT( outcome_count >= 2, invalid_config_exception,
              "event requires at least two outcomes, got ${n}", ("n", outcome_count) );

   _outcome_tokens.reserve( outcome_count );
   for( outcome_index_type i = 0; i < outcome_count; ++i ) {
      const auto& token = tokens.create_token( _account );
      _outcome_tokens.emplace_back( tokens.get_ledger( token.id ) );
   }
}

outcome_index_type outcome_event::outcome_count()const {
   return static_cast<outcome_index_type>( _outcome_tokens.size() );
}

asset_ledger& outcome_event::outcome_token( outcome_index_type index ) {
   return get_outcome_ledger( index );
}

token_ledger& outcome_event::get_outcome_ledger( outcome_index_type index ) {
   PM_ASSERT( index < _outcome_tokens.size(), invalid_outcome_index_exception,
              "outcome index ${i} out of range, event has ${n} outcomes", ("i", index)("n", _outcome_tokens.size()) );
   return *_outcome_tokens[index];
}

void outcome_event::buy_all_outcomes( account_name buyer, share_type amount ) {
   PM_ASSERT( _collateral->transfer_from( _account, buyer, _account, amount ), transfer_failure_exception,
              "could not collect ${amount} collateral from ${buyer}", ("amount", amount)("buyer", buyer) );

   for( auto& token : _outcome_tokens )
      token->issue( _account, buyer, amount );

   dlog( "${buyer} bought ${amount} outcome sets of event ${event}", ("buyer", buyer)("amount", amount)("event", _account) );
}

void outcome_event::sell_all_outcomes( account_name seller, share_type amount ) {
   for( auto& token : _outcome_tokens )
      token->revoke( _account, seller, amount );

   PM_ASSERT( _collateral->transfer( _account, seller, amount ), transfer_failure_exception,
              "could not pay out ${amount} collateral to ${seller}", ("amount", amount)("seller", seller) );

   dlog( "${seller} sold ${amount} outcome sets of event ${event}", ("seller", seller)("amount", amount)("event", _account) );
}

} } // pmarket::chain
