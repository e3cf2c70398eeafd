#pragma once
#include <pmarket/chain/market_object.hpp>
#include <pmarket/chain/market_config.hpp>
#include <pmarket/chain/market_events.hpp>
#include <pmarket/chain/outcome_set_manager.hpp>
#include <pmarket/chain/pricing_oracle.hpp>
#include <pmarket/chain/exceptions.hpp>

#include <boost/signals2/signal.hpp>

#include <map>

namespace pmarket { namespace chain {

   using boost::signals2::signal;

   /**
    *  A market maker for the outcome tokens of one event.
    *
    *  The market holds collateral and outcome tokens under its own account and
    *  trades them against callers at the prices quoted by its pricing oracle, taking
    *  a proportional fee on every trade. Only the creator may fund the market, close
    *  it and withdraw the fees.
    *
    *  Every public operation either completes or leaves the state database exactly as
    *  it found it: the work runs inside an undo session that is only squashed once the
    *  last transfer has succeeded. Signals fire after the changes are committed.
    */
   class market {
      public:
         market( chainbase::database& db, account_name account,
                 std::shared_ptr<outcome_set_manager> event,
                 std::shared_ptr<const pricing_oracle> oracle );

         market( const market& ) = delete;
         market& operator=( const market& ) = delete;

         void        fund( account_name sender, share_type amount );
         void        close( account_name sender );
         share_type  withdraw_fees( account_name sender );

         /// @return cost plus fees paid by the buyer
         share_type  buy( account_name buyer, outcome_index_type index, share_type count, share_type max_cost );
         /// @return profit net of fees paid to the seller
         share_type  sell( account_name seller, outcome_index_type index, share_type count, share_type min_profit );
         /// @return collateral the seller spent to end up short `count` tokens of `index`
         share_type  short_sell( account_name seller, outcome_index_type index, share_type count, share_type min_profit );

         share_type  calc_market_fee( share_type amount )const;

         account_name           account()const { return _account; }
         const market_object&   get_state()const;
         vector<exposure_type>  get_net_outcome_tokens_sold()const;

         signal<void(const market_funding&)>             funded;
         signal<void(const market_closing&)>             closed;
         signal<void(const fee_withdrawal&)>             fees_withdrawn;
         signal<void(const outcome_token_purchase&)>     purchased;
         signal<void(const outcome_token_sale&)>         sold;
         signal<void(const outcome_token_short_sale&)>   short_sold;

      private:
         void require_creator( account_name sender, const char* action )const;
         void validate_trade( outcome_index_type index, share_type count )const;

         void mint_outcome_sets( share_type amount );
         void update_exposure( outcome_index_type index, exposure_type delta );

         outcome_token_purchase  execute_purchase( account_name buyer, outcome_index_type index,
                                                   share_type count, share_type max_cost );
         /// without `settle_with_seller` no tokens are collected and no profit paid, the caller settles
         outcome_token_sale      execute_sale( account_name seller, outcome_index_type index,
                                               share_type count, share_type min_profit, bool settle_with_seller );

         chainbase::database&                    _db;
         account_name                            _account;
         std::shared_ptr<outcome_set_manager>    _event;
         std::shared_ptr<const pricing_oracle>   _oracle;
   };

   /**
    *  Creates markets and keeps the runtime handles of the markets in the state
    *  database.
    */
   class market_manager {
      public:
         explicit market_manager( chainbase::database& db )
         :_db(db)
         {
         }

         void add_indices();

         market& create_market( const market_config& cfg,
                                std::shared_ptr<outcome_set_manager> event,
                                std::shared_ptr<const pricing_oracle> oracle,
                                time_point now = time_point() );

         market& get_market( account_name account );
         market* find_market( account_name account );

         signal<void(const market_object&)> market_created;

      private:
         chainbase::database&                            _db;
         std::map<account_name, std::unique_ptr<market>> _markets;
   };

} } // pmarket::chain
