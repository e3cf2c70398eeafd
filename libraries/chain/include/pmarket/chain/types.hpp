#pragma once
#include <pmarket/chain/name.hpp>

#include <chainbase/chainbase.hpp>

#include <fc/interprocess/container.hpp>
#include <fc/container/flat.hpp>
#include <fc/time.hpp>

#include <boost/preprocessor/facilities/overload.hpp>
#include <boost/preprocessor/seq/for_each.hpp>

#include <memory>
#include <vector>
#include <cstdint>

#define OBJECT_CTOR1(NAME) \
    NAME() = delete; \
    public: \
    template<typename Constructor, typename Allocator> \
    NAME(Constructor&& c, chainbase::allocator<Allocator>) \
    { c(*this); }
#define OBJECT_CTOR2_MACRO(x, y, field) ,field(a)
#define OBJECT_CTOR2(NAME, FIELDS) \
    NAME() = delete; \
    public: \
    template<typename Constructor, typename Allocator> \
    NAME(Constructor&& c, chainbase::allocator<Allocator> a) \
    : id(0) BOOST_PP_SEQ_FOR_EACH(OBJECT_CTOR2_MACRO, _, FIELDS) \
    { c(*this); }
#define OBJECT_CTOR(...) BOOST_PP_OVERLOAD(OBJECT_CTOR, __VA_ARGS__)(__VA_ARGS__)

namespace pmarket { namespace chain {
   using                               std::vector;
   using                               std::string;
   using                               std::shared_ptr;
   using                               std::unique_ptr;
   using                               std::move;

   using                               fc::time_point;
   using                               fc::flat_set;

   using chainbase::allocator;
   template<typename T>
   using shared_vector = boost::interprocess::vector<T, allocator<T>>;

   using account_name       = name;

   /**
    * List all object types from all namespaces here so they can
    * be easily reflected and displayed in debug output.
    *
    * The offsets in this enumeration are potentially shared_memory breaking
    */
   enum object_type
   {
      null_object_type = 0,
      token_object_type,
      token_balance_object_type,
      token_allowance_object_type,
      market_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   /**
    *  Quantities of collateral and outcome tokens. Token amounts are never negative.
    */
   using share_type          = uint64_t;

   /**
    *  Signed running total of outcome tokens sold by a market.
    */
   using exposure_type       = int64_t;

   using outcome_index_type  = uint8_t;
   using fee_type            = uint32_t;
   using int128_t            = __int128;
   using uint128_t           = unsigned __int128;

} }  // pmarket::chain

FC_REFLECT_ENUM(pmarket::chain::object_type,
                (null_object_type)(token_object_type)(token_balance_object_type)(token_allowance_object_type)
                (market_object_type)(OBJECT_TYPE_COUNT) )
