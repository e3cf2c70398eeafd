#include <pmarket/chain/market.hpp>
#include <pmarket/chain/int_arithmetic.hpp>

#include <boost/interprocess/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace pmarket { namespace chain {

namespace {

   template<typename Signal, typename Arg>
   void emit( const Signal& s, Arg&& a ) {
      try {
         s( std::forward<Arg>( a ));
      } catch (std::bad_alloc& e) {
         wlog( "std::bad_alloc" );
         throw e;
      } catch (boost::interprocess::bad_alloc& e) {
         wlog( "bad alloc" );
         throw e;
      } catch ( fc::exception& e ) {
         wlog( "${details}", ("details", e.to_detail_string()) );
      } catch ( std::exception& e ) {
         wlog( "${details}", ("details", e.what()) );
      }
   }

} // anonymous

market::market( chainbase::database& db, account_name account,
                std::shared_ptr<outcome_set_manager> event,
                std::shared_ptr<const pricing_oracle> oracle )
:_db(db),_account(account),_event(std::move(event)),_oracle(std::move(oracle))
{
   const auto* state = _db.find<market_object, by_account>( _account );
   PM_ASSERT( state != nullptr, unknown_market_exception, "no state for market ${m}", ("m", _account) );
   PM_ASSERT( _event != nullptr, invalid_market_construction, "market ${m} requires an outcome set manager", ("m", _account) );
   PM_ASSERT( _oracle != nullptr, invalid_market_construction, "market ${m} requires a pricing oracle", ("m", _account) );
   PM_ASSERT( _event->account() == state->event, invalid_market_construction,
              "market ${m} trades outcomes of ${expected}, not ${actual}",
              ("m", _account)("expected", state->event)("actual", _event->account()) );
}

const market_object& market::get_state()const {
   return _db.get<market_object, by_account>( _account );
}

vector<exposure_type> market::get_net_outcome_tokens_sold()const {
   const auto& sold = get_state().net_outcome_tokens_sold;
   return vector<exposure_type>( sold.begin(), sold.end() );
}

share_type market::calc_market_fee( share_type amount )const {
   return int_arithmetic::safe_prop<share_type>( amount, get_state().fee, config::fee_range );
}

void market::require_creator( account_name sender, const char* action )const {
   const auto& state = get_state();
   PM_ASSERT( sender == state.creator, market_unauthorized_exception,
              "${sender} may not ${action} market ${m}, only its creator ${creator} may",
              ("sender", sender)("action", action)("m", _account)("creator", state.creator) );
}

void market::validate_trade( outcome_index_type index, share_type count )const {
   PM_ASSERT( index < get_state().outcome_count(), invalid_outcome_index_exception,
              "outcome index ${i} out of range, market ${m} has ${n} outcomes",
              ("i", index)("m", _account)("n", get_state().outcome_count()) );
   PM_ASSERT( count > 0, non_positive_amount_exception, "trade count must be positive" );
}

void market::mint_outcome_sets( share_type amount ) {
   PM_ASSERT( _event->collateral_token().approve( _account, _event->account(), amount ), transfer_failure_exception,
              "market ${m} could not approve ${amount} collateral to ${event}",
              ("m", _account)("amount", amount)("event", _event->account()) );
   _event->buy_all_outcomes( _account, amount );
}

void market::update_exposure( outcome_index_type index, exposure_type delta ) {
   const auto& state = get_state();
   const exposure_type updated = int_arithmetic::checked_add( state.net_outcome_tokens_sold[index], delta );
   _db.modify( state, [&]( market_object& m ) {
      m.net_outcome_tokens_sold[index] = updated;
   });
}

void market::fund( account_name sender, share_type amount ) {
   require_creator( sender, "fund" );
   PM_ASSERT( amount > 0, non_positive_amount_exception, "funding amount must be positive" );

   auto session = _db.start_undo_session(true);

   PM_ASSERT( _event->collateral_token().transfer_from( _account, sender, _account, amount ), transfer_failure_exception,
              "could not collect ${amount} collateral from ${sender}", ("amount", amount)("sender", sender) );
   mint_outcome_sets( amount );

   const auto& state = get_state();
   const share_type funding = int_arithmetic::checked_add( state.funding, amount );
   _db.modify( state, [&]( market_object& m ) {
      m.funding = funding;
   });

   session.squash();

   dlog( "market ${m} funded with ${amount}, total funding ${funding}", ("m", _account)("amount", amount)("funding", funding) );
   emit( funded, market_funding{ _account, amount } );
}

void market::close( account_name sender ) {
   require_creator( sender, "close" );
   const account_name creator = get_state().creator;

   auto session = _db.start_undo_session(true);

   const auto outcome_count = _event->outcome_count();
   for( outcome_index_type i = 0; i < outcome_count; ++i ) {
      auto& token = _event->outcome_token( i );
      const share_type balance = token.balance_of( _account );
      if( balance == 0 )
         continue;
      PM_ASSERT( token.transfer( _account, creator, balance ), transfer_failure_exception,
                 "could not return ${amount} of outcome ${i} to ${creator}", ("amount", balance)("i", i)("creator", creator) );
   }

   session.squash();

   ilog( "market ${m} closed", ("m", _account) );
   emit( closed, market_closing{ _account } );
}

share_type market::withdraw_fees( account_name sender ) {
   require_creator( sender, "withdraw fees from" );
   const account_name creator = get_state().creator;

   auto session = _db.start_undo_session(true);

   auto& collateral = _event->collateral_token();
   const share_type fees = collateral.balance_of( _account );
   if( fees > 0 ) {
      PM_ASSERT( collateral.transfer( _account, creator, fees ), transfer_failure_exception,
                 "could not pay ${amount} fees to ${creator}", ("amount", fees)("creator", creator) );
   }

   session.squash();

   dlog( "market ${m} paid ${fees} fees to ${creator}", ("m", _account)("fees", fees)("creator", creator) );
   emit( fees_withdrawn, fee_withdrawal{ _account, fees } );
   return fees;
}

outcome_token_purchase market::execute_purchase( account_name buyer, outcome_index_type index,
                                                 share_type count, share_type max_cost ) {
   validate_trade( index, count );

   const share_type outcome_token_cost = _oracle->calc_cost( get_state(), index, count );
   const share_type fees = calc_market_fee( outcome_token_cost );
   const share_type cost = int_arithmetic::checked_add( outcome_token_cost, fees );

   PM_ASSERT( cost > 0, non_positive_amount_exception, "buying ${count} of outcome ${i} would cost nothing",
              ("count", count)("i", index) );
   PM_ASSERT( cost <= max_cost, slippage_exceeded_exception,
              "cost ${cost} exceeds the maximum of ${max}", ("cost", cost)("max", max_cost) );

   PM_ASSERT( _event->collateral_token().transfer_from( _account, buyer, _account, cost ), transfer_failure_exception,
              "could not collect ${cost} collateral from ${buyer}", ("cost", cost)("buyer", buyer) );
   mint_outcome_sets( outcome_token_cost );
   PM_ASSERT( _event->outcome_token( index ).transfer( _account, buyer, count ), transfer_failure_exception,
              "market ${m} cannot deliver ${count} of outcome ${i}", ("m", _account)("count", count)("i", index) );

   update_exposure( index, int_arithmetic::checked_cast<exposure_type>( count ) );

   return outcome_token_purchase{ _account, buyer, index, count, outcome_token_cost, fees };
}

outcome_token_sale market::execute_sale( account_name seller, outcome_index_type index,
                                         share_type count, share_type min_profit, bool settle_with_seller ) {
   validate_trade( index, count );

   const share_type outcome_token_profit = _oracle->calc_profit( get_state(), index, count );
   const share_type fees = calc_market_fee( outcome_token_profit );
   const share_type profit = outcome_token_profit - fees;

   PM_ASSERT( profit > 0, non_positive_amount_exception, "selling ${count} of outcome ${i} would earn nothing",
              ("count", count)("i", index) );
   PM_ASSERT( profit >= min_profit, slippage_exceeded_exception,
              "profit ${profit} is below the minimum of ${min}", ("profit", profit)("min", min_profit) );

   if( settle_with_seller ) {
      PM_ASSERT( _event->outcome_token( index ).transfer_from( _account, seller, _account, count ), transfer_failure_exception,
                 "could not collect ${count} of outcome ${i} from ${seller}", ("count", count)("i", index)("seller", seller) );
   }
   _event->sell_all_outcomes( _account, outcome_token_profit );
   if( settle_with_seller ) {
      PM_ASSERT( _event->collateral_token().transfer( _account, seller, profit ), transfer_failure_exception,
                 "could not pay ${profit} collateral to ${seller}", ("profit", profit)("seller", seller) );
   }

   update_exposure( index, -int_arithmetic::checked_cast<exposure_type>( count ) );

   return outcome_token_sale{ _account, seller, index, count, outcome_token_profit, fees };
}

share_type market::buy( account_name buyer, outcome_index_type index, share_type count, share_type max_cost ) {
   auto session = _db.start_undo_session(true);
   const auto purchase = execute_purchase( buyer, index, count, max_cost );
   session.squash();

   dlog( "${buyer} bought ${count} of outcome ${i} from ${m} for ${cost} plus ${fees} fees",
         ("buyer", buyer)("count", count)("i", index)("m", _account)("cost", purchase.cost)("fees", purchase.fees) );
   emit( purchased, purchase );
   return purchase.cost + purchase.fees;
}

share_type market::sell( account_name seller, outcome_index_type index, share_type count, share_type min_profit ) {
   auto session = _db.start_undo_session(true);
   const auto sale = execute_sale( seller, index, count, min_profit, true );
   session.squash();

   dlog( "${seller} sold ${count} of outcome ${i} to ${m} for ${profit} minus ${fees} fees",
         ("seller", seller)("count", count)("i", index)("m", _account)("profit", sale.profit)("fees", sale.fees) );
   emit( sold, sale );
   return sale.profit - sale.fees;
}

share_type market::short_sell( account_name seller, outcome_index_type index, share_type count, share_type min_profit ) {
   validate_trade( index, count );

   auto session = _db.start_undo_session(true);

   auto& collateral = _event->collateral_token();
   PM_ASSERT( collateral.transfer_from( _account, seller, _account, count ), transfer_failure_exception,
              "could not collect ${count} collateral from ${seller}", ("count", count)("seller", seller) );
   mint_outcome_sets( count );

   // the minted tokens of `index` stay with the market and are sold back on its own account
   const auto sale = execute_sale( _account, index, count, min_profit, false );
   const share_type profit = sale.profit - sale.fees;
   const share_type cost = int_arithmetic::checked_sub( count, profit );

   const auto outcome_count = _event->outcome_count();
   for( outcome_index_type i = 0; i < outcome_count; ++i ) {
      if( i == index )
         continue;
      PM_ASSERT( _event->outcome_token( i ).transfer( _account, seller, count ), transfer_failure_exception,
                 "market ${m} cannot deliver ${count} of outcome ${i}", ("m", _account)("count", count)("i", i) );
   }
   PM_ASSERT( collateral.transfer( _account, seller, profit ), transfer_failure_exception,
              "could not pay ${profit} collateral to ${seller}", ("profit", profit)("seller", seller) );

   session.squash();

   dlog( "${seller} sold ${count} of outcome ${i} short on ${m} for ${cost}",
         ("seller", seller)("count", count)("i", index)("m", _account)("cost", cost) );
   emit( short_sold, outcome_token_short_sale{ _account, seller, index, count, cost } );
   return cost;
}

void market_manager::add_indices() {
   index_set<market_index>::add_indices(_db);
}

market& market_manager::create_market( const market_config& cfg,
                                       std::shared_ptr<outcome_set_manager> event,
                                       std::shared_ptr<const pricing_oracle> oracle,
                                       time_point now ) {
   try {
      cfg.validate();
      PM_ASSERT( event != nullptr, invalid_market_construction, "market requires an outcome set manager" );
      PM_ASSERT( oracle != nullptr, invalid_market_construction, "market requires a pricing oracle" );
      PM_ASSERT( event->outcome_count() > 0, invalid_market_construction, "event ${e} has no outcomes", ("e", event->account()) );
      PM_ASSERT( event->account() != cfg.account, invalid_market_construction,
                 "market and event cannot share the account ${a}", ("a", cfg.account) );
      PM_ASSERT( _db.find<market_object, by_account>( cfg.account ) == nullptr, market_exists_exception,
                 "market ${m} already exists", ("m", cfg.account) );

      auto session = _db.start_undo_session(true);
      const auto& state = _db.create<market_object>([&]( market_object& m ) {
         m.account    = cfg.account;
         m.creator    = cfg.creator;
         m.event      = event->account();
         m.created_at = now;
         m.fee        = cfg.fee;
         m.net_outcome_tokens_sold.resize( event->outcome_count(), 0 );
      });
      auto handle = std::make_unique<market>( _db, cfg.account, std::move(event), std::move(oracle) );
      session.squash();

      // replaces a handle left behind when an enclosing session undid an earlier market under this account
      auto& result = *(_markets[cfg.account] = std::move(handle));

      ilog( "created market ${m} with fee ${fee} for ${creator}", ("m", cfg.account)("fee", cfg.fee)("creator", cfg.creator) );
      emit( market_created, state );
      return result;
   } FC_CAPTURE_AND_RETHROW( (cfg) )
}

market* market_manager::find_market( account_name account ) {
   auto itr = _markets.find( account );
   if( itr == _markets.end() )
      return nullptr;
   if( _db.find<market_object, by_account>( account ) == nullptr ) {
      _markets.erase( itr );
      return nullptr;
   }
   return itr->second.get();
}

market& market_manager::get_market( account_name account ) {
   auto* m = find_market( account );
   if( m == nullptr )
      PM_THROW( unknown_market_exception, "unknown market ${m}", ("m", account) );
   return *m;
}

} } // pmarket::chain
