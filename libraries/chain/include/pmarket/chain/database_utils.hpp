#pragma once

#include <pmarket/chain/types.hpp>
#include <fc/variant.hpp>

namespace pmarket { namespace chain {

   /**
    *  Registers a group of chainbase indices with a database in one call.
    */
   template<typename ...Indices>
   class index_set;

   template<typename Index>
   class index_set<Index> {
   public:
      static void add_indices( chainbase::database& db ) {
         db.add_index<Index>();
      }
   };

   template<typename FirstIndex, typename ...RemainingIndices>
   class index_set<FirstIndex, RemainingIndices...> {
   public:
      static void add_indices( chainbase::database& db ) {
         index_set<FirstIndex>::add_indices(db);
         index_set<RemainingIndices...>::add_indices(db);
      }
   };

} }

namespace fc {

   // object ids appear in log and error messages as their integer value
   template<typename OidType>
   void to_variant( const chainbase::oid<OidType>& oid, variant& v ) {
      v = variant(oid._id);
   }

   template<typename OidType>
   void from_variant( const variant& v, chainbase::oid<OidType>& oid ) {
      from_variant(v, oid._id);
   }

}
