#include <pmarket/chain/name.hpp>
#include <pmarket/chain/exceptions.hpp>
#include <fc/variant.hpp>

#include <algorithm>
#include <ostream>

namespace pmarket::chain {

   namespace name_encoding {

      bool is_valid( std::string_view str ) {
         if( str.size() > max_length )
            return false;
         const auto in_alphabet = []( char c ) { return c == '.' || symbol_of( c ) != 0; };
         if( !std::all_of( str.begin(), str.end(), in_alphabet ) )
            return false;
         // only 4 bits are left for a 13th symbol
         return str.size() < max_length || symbol_of( str.back() ) <= 0x0F;
      }

   }

   name::name( std::string_view str ) {
      PM_ASSERT( name_encoding::is_valid( str ), name_type_exception, "Name not properly normalized (name: ${name})",
                 ("name", std::string(str)) );
      value = name_encoding::encode( str );
   }

   std::string name::to_string()const {
      std::string str( name_encoding::max_length, '.' );

      uint64_t v = value;
      str[name_encoding::max_length - 1] = name_encoding::alphabet[v & 0x0F];
      v >>= 4;
      for( size_t i = name_encoding::max_length - 1; i > 0; --i ) {
         str[i - 1] = name_encoding::alphabet[v & 0x1F];
         v >>= 5;
      }

      str.erase( str.find_last_not_of( '.' ) + 1 );
      return str;
   }

   std::ostream& operator << ( std::ostream& out, const name& n ) {
      return out << n.to_string();
   }

} // pmarket::chain

namespace fc {
  void to_variant(const pmarket::chain::name& n, fc::variant& v) { v = n.to_string(); }
  void from_variant(const fc::variant& v, pmarket::chain::name& n) { n = pmarket::chain::name( v.get_string() ); }
} // fc
