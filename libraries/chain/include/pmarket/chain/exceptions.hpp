#pragma once

#include <fc/exception/exception.hpp>


#define PM_ASSERT( expr, exc_type, FORMAT, ... )                      \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

#define PM_THROW( exc_type, FORMAT, ... ) \
    throw exc_type( FC_LOG_MESSAGE( error, FORMAT, __VA_ARGS__ ) );

namespace pmarket { namespace chain {

   FC_DECLARE_DERIVED_EXCEPTION( chain_exception, fc::exception,
                                 3000000, "prediction market exception" )
   /**
    *  chain_exception
    *   |- chain_type_exception
    *   |- market_exception
    *   |- token_exception
    *   |- arithmetic_exception
    *   |- config_exception
    */

   FC_DECLARE_DERIVED_EXCEPTION( chain_type_exception, chain_exception,
                                 3005000, "chain type exception" )

      FC_DECLARE_DERIVED_EXCEPTION( name_type_exception,                  chain_type_exception,
                                    3005001, "Invalid name" )


   FC_DECLARE_DERIVED_EXCEPTION( market_exception, chain_exception,
                                 3010000, "Market exception" )

      FC_DECLARE_DERIVED_EXCEPTION( invalid_market_construction,         market_exception,
                                    3010001, "Invalid market construction" )
      FC_DECLARE_DERIVED_EXCEPTION( market_unauthorized_exception,       market_exception,
                                    3010002, "Sender is not authorized for this market action" )
      FC_DECLARE_DERIVED_EXCEPTION( non_positive_amount_exception,       market_exception,
                                    3010003, "Amount must be positive" )
      FC_DECLARE_DERIVED_EXCEPTION( slippage_exceeded_exception,         market_exception,
                                    3010004, "Trade price is outside of the accepted limit" )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_outcome_index_exception,     market_exception,
                                    3010005, "Invalid outcome index" )
      FC_DECLARE_DERIVED_EXCEPTION( market_exists_exception,             market_exception,
                                    3010006, "Market already exists" )
      FC_DECLARE_DERIVED_EXCEPTION( unknown_market_exception,            market_exception,
                                    3010007, "Unknown market" )


   FC_DECLARE_DERIVED_EXCEPTION( token_exception, chain_exception,
                                 3020000, "Token exception" )

      FC_DECLARE_DERIVED_EXCEPTION( transfer_failure_exception,          token_exception,
                                    3020001, "Asset transfer failed" )
      FC_DECLARE_DERIVED_EXCEPTION( unknown_token_exception,             token_exception,
                                    3020002, "Unknown token" )
      FC_DECLARE_DERIVED_EXCEPTION( token_authorization_exception,       token_exception,
                                    3020003, "Only the token issuer may issue or revoke" )
      FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance_exception,      token_exception,
                                    3020004, "Insufficient token balance" )


   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_exception, chain_exception,
                                 3030000, "Arithmetic exception" )

      FC_DECLARE_DERIVED_EXCEPTION( arithmetic_overflow_exception,       arithmetic_exception,
                                    3030001, "Integer overflow" )


   FC_DECLARE_DERIVED_EXCEPTION( config_exception, chain_exception,
                                 3040000, "Configuration exception" )

      FC_DECLARE_DERIVED_EXCEPTION( invalid_config_exception,            config_exception,
                                    3040001, "Invalid configuration" )

} } // pmarket::chain
