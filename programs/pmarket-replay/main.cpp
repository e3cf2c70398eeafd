#include <pmarket/chain/market.hpp>
#include <pmarket/chain/outcome_event.hpp>
#include <pmarket/chain/token_ledger.hpp>
#include <pmarket/chain/fixed_price_oracle.hpp>
#include <pmarket/chain/config.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <iostream>
#include <limits>

using namespace pmarket::chain;
namespace bfs = boost::filesystem;
namespace bpo = boost::program_options;
using bpo::options_description;
using bpo::variables_map;

struct initial_balance {
   account_name   owner;
   share_type     amount = 0;
};

/**
 *  One call against the market. `amount` is the funding or the token count, `limit`
 *  is the maximum cost of a buy or the minimum profit of a sale. Approvals are made
 *  by `sender` in favour of the market.
 */
struct scenario_action {
   string               type;
   account_name         sender;
   outcome_index_type   index = 0;
   share_type           amount = 0;
   share_type           limit = 0;
};

struct scenario {
   market_config              market;
   account_name               event = "event"_n;
   account_name               collateral_issuer = "bank"_n;
   vector<outcome_price>      prices;    ///< one entry per outcome
   vector<initial_balance>    balances;  ///< collateral issued before the replay starts
   vector<scenario_action>    actions;

   void validate()const;
};

FC_REFLECT( initial_balance, (owner)(amount) )
FC_REFLECT( scenario_action, (type)(sender)(index)(amount)(limit) )
FC_REFLECT( scenario, (market)(event)(collateral_issuer)(prices)(balances)(actions) )

namespace {

   const flat_set<string> action_types = {
      "fund", "buy", "sell", "short_sell", "close", "withdraw_fees", "approve_collateral", "approve_outcome"
   };

   fc::variant apply_action( market& mkt, outcome_set_manager& event, const scenario_action& a ) {
      if( a.type == "fund" ) {
         mkt.fund( a.sender, a.amount );
         return fc::variant();
      } else if( a.type == "buy" ) {
         return fc::variant( mkt.buy( a.sender, a.index, a.amount, a.limit ) );
      } else if( a.type == "sell" ) {
         return fc::variant( mkt.sell( a.sender, a.index, a.amount, a.limit ) );
      } else if( a.type == "short_sell" ) {
         return fc::variant( mkt.short_sell( a.sender, a.index, a.amount, a.limit ) );
      } else if( a.type == "close" ) {
         mkt.close( a.sender );
         return fc::variant();
      } else if( a.type == "withdraw_fees" ) {
         return fc::variant( mkt.withdraw_fees( a.sender ) );
      } else if( a.type == "approve_collateral" ) {
         PM_ASSERT( event.collateral_token().approve( a.sender, mkt.account(), a.amount ), transfer_failure_exception,
                    "${sender} could not approve ${amount} collateral", ("sender", a.sender)("amount", a.amount) );
         return fc::variant();
      } else if( a.type == "approve_outcome" ) {
         PM_ASSERT( event.outcome_token( a.index ).approve( a.sender, mkt.account(), a.amount ), transfer_failure_exception,
                    "${sender} could not approve ${amount} of outcome ${i}", ("sender", a.sender)("amount", a.amount)("i", a.index) );
         return fc::variant();
      }
      PM_THROW( invalid_config_exception, "unknown action type ${t}", ("t", a.type) );
   }

} // anonymous

void scenario::validate()const {
   market.validate();
   PM_ASSERT( prices.size() >= 2 && prices.size() <= std::numeric_limits<outcome_index_type>::max(),
              invalid_config_exception, "scenario needs between 2 and ${max} outcome prices, got ${n}",
              ("max", std::numeric_limits<outcome_index_type>::max())("n", prices.size()) );
   PM_ASSERT( !collateral_issuer.empty(), invalid_config_exception, "scenario needs a collateral issuer" );
   for( size_t i = 0; i < actions.size(); ++i ) {
      PM_ASSERT( action_types.count( actions[i].type ), invalid_config_exception,
                 "action ${i} has unknown type \"${t}\"", ("i", i)("t", actions[i].type) );
   }
}

struct replay {
   replay()
   {}

   void set_program_options(options_description& cli);
   void initialize(const variables_map& options);
   void run();

   bfs::path                        scenario_file;
   bfs::path                        state_dir;
   bfs::path                        logging_conf;
   uint64_t                         state_size_mb = config::default_state_size / config::_MB;
   bool                             no_pretty_print = false;
   bool                             verbose = false;
   bool                             help = false;
};

void replay::set_program_options(options_description& cli)
{
   cli.add_options()
         ("scenario,s", bpo::value<bfs::path>(),
          "the JSON scenario to replay")
         ("state-dir", bpo::value<bfs::path>(),
          "the location of the state database, must not hold a database yet (default is a temporary directory)")
         ("state-size", bpo::value<uint64_t>(&state_size_mb)->default_value(state_size_mb),
          "size of the state database in MiB")
         ("logconf", bpo::value<bfs::path>(),
          "fc logging configuration file")
         ("no-pretty-print", bpo::bool_switch(&no_pretty_print)->default_value(false),
          "Print the final market summary on a single line.")
         ("verbose,v", bpo::bool_switch(&verbose)->default_value(false),
          "Log every committed market operation.")
         ("help,h", bpo::bool_switch(&help)->default_value(false), "Print this help message and exit.")
         ;
}

void replay::initialize(const variables_map& options) {
   try {
      PM_ASSERT( options.count( "scenario" ), invalid_config_exception, "a scenario file is required" );
      scenario_file = options.at( "scenario" ).as<bfs::path>();
      PM_ASSERT( bfs::exists( scenario_file ), invalid_config_exception,
                 "scenario file ${f} does not exist", ("f", scenario_file.generic_string()) );

      if( options.count( "state-dir" ) ) {
         auto sd = options.at( "state-dir" ).as<bfs::path>();
         state_dir = sd.is_relative() ? bfs::current_path() / sd : sd;
         PM_ASSERT( !bfs::exists( state_dir / "shared_memory.bin" ), invalid_config_exception,
                    "${d} already holds a state database", ("d", state_dir.generic_string()) );
      }

      if( options.count( "logconf" ) ) {
         logging_conf = options.at( "logconf" ).as<bfs::path>();
         PM_ASSERT( bfs::exists( logging_conf ), invalid_config_exception,
                    "logging configuration ${f} does not exist", ("f", logging_conf.generic_string()) );
         fc::configure_logging( logging_conf );
      }
      if( verbose )
         fc::logger::get(DEFAULT_LOGGER).set_log_level(fc::log_level::debug);
   } FC_LOG_AND_RETHROW()
}

void replay::run() {
   const auto s = fc::json::from_file( scenario_file ).as<scenario>();
   s.validate();

   fc::temp_directory tempdir;
   bfs::path dir = tempdir.path();
   if( !state_dir.empty() )
      dir = state_dir;

   chainbase::database db( dir, chainbase::database::read_write, state_size_mb * config::_MB );
   token_manager tokens( db );
   market_manager markets( db );
   tokens.add_indices();
   markets.add_indices();

   auto collateral = tokens.get_ledger( tokens.create_token( s.collateral_issuer ).id );
   for( const auto& b : s.balances )
      collateral->issue( s.collateral_issuer, b.owner, b.amount );

   auto event  = std::make_shared<outcome_event>( tokens, s.event, collateral,
                                                  static_cast<outcome_index_type>( s.prices.size() ) );
   auto oracle = std::make_shared<fixed_price_oracle>( s.prices );
   auto& mkt   = markets.create_market( s.market, event, oracle, fc::time_point::now() );

   uint32_t failed = 0;
   for( size_t i = 0; i < s.actions.size(); ++i ) {
      const auto& a = s.actions[i];
      fc::mutable_variant_object result;
      result( "action", i )( "type", a.type )( "sender", a.sender );
      try {
         result( "result", apply_action( mkt, *event, a ) );
      } catch( const fc::exception& e ) {
         ++failed;
         result( "error", fc::mutable_variant_object()( "code", e.code() )( "name", e.name() )( "message", e.top_message() ) );
      }
      std::cout << fc::json::to_string( fc::variant( result ), fc::time_point::maximum() ) << '\n';
   }

   fc::mutable_variant_object balances;
   for( const auto& b : s.balances )
      balances( b.owner.to_string(), collateral->balance_of( b.owner ) );

   const auto summary = fc::mutable_variant_object()
      ( "market", mkt.account() )
      ( "funding", mkt.get_state().funding )
      ( "net_outcome_tokens_sold", mkt.get_net_outcome_tokens_sold() )
      ( "market_collateral", collateral->balance_of( mkt.account() ) )
      ( "collateral_balances", balances )
      ( "failed_actions", failed );

   const auto v = fc::variant( summary );
   std::cout << ( no_pretty_print ? fc::json::to_string( v, fc::time_point::maximum() )
                                  : fc::json::to_pretty_string( v ) ) << std::endl;

   ilog( "replayed ${n} actions, ${f} failed", ("n", s.actions.size())("f", failed) );
}

int main(int argc, char** argv) {
   options_description cli ("pmarket-replay command line options");
   try {
      replay r;
      r.set_program_options(cli);
      variables_map vmap;
      bpo::store(bpo::parse_command_line(argc, argv, cli), vmap);
      bpo::notify(vmap);

      if (r.help) {
         cli.print(std::cerr);
         return 0;
      }

      r.initialize(vmap);
      r.run();
   } catch( const fc::exception& e ) {
      elog( "${e}", ("e", e.to_detail_string()));
      return -1;
   } catch( const boost::exception& e ) {
      elog("${e}", ("e",boost::diagnostic_information(e)));
      return -1;
   } catch( const std::exception& e ) {
      elog("${e}", ("e",e.what()));
      return -1;
   }

   return 0;
}
