#pragma once
#include <fc/reflect/reflect.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>

namespace pmarket::chain {
  struct name;
}
namespace fc {
  class variant;
  void to_variant(const pmarket::chain::name& n, fc::variant& v);
  void from_variant(const fc::variant& v, pmarket::chain::name& n);
} // fc

namespace pmarket::chain {

   /**
    *  Account names pack up to 13 characters into 64 bits: twelve 5 bit symbols
    *  from the top, then a 4 bit thirteenth symbol in the low nibble. Symbol 0 is
    *  '.', 1-5 are the digits '1'-'5' and 6-31 are 'a'-'z'.
    */
   namespace name_encoding {
      constexpr size_t   max_length = 13;
      constexpr char     alphabet[] = ".12345abcdefghijklmnopqrstuvwxyz";

      constexpr uint64_t symbol_of( char c ) {
         return ( c >= 'a' && c <= 'z' ) ? uint64_t(c - 'a') + 6
              : ( c >= '1' && c <= '5' ) ? uint64_t(c - '1') + 1
              : 0;
      }

      constexpr uint64_t encode( std::string_view str ) {
         uint64_t v = 0;
         for( size_t i = 0; i < str.size() && i < max_length - 1; ++i )
            v |= symbol_of( str[i] ) << ( 59 - 5 * i );
         if( str.size() == max_length )
            v |= symbol_of( str[max_length - 1] ) & 0x0F;
         return v;
      }

      /// at most 13 symbols from the alphabet, a 13th symbol among the first 16
      bool is_valid( std::string_view str );
   }

   /// account identity in the asset ledgers and markets
   struct name {
   private:
      uint64_t value = 0;

      friend struct fc::reflector<name>;

   public:
      constexpr name() = default;
      constexpr explicit name( uint64_t v ) : value(v) {}
      /// throws name_type_exception for strings outside the name alphabet
      explicit name( std::string_view str );

      constexpr bool empty()const { return value == 0; }
      constexpr uint64_t to_uint64_t()const { return value; }
      std::string to_string()const;

      friend constexpr bool operator == ( name a, name b ) { return a.value == b.value; }
      friend constexpr bool operator != ( name a, name b ) { return a.value != b.value; }
      friend constexpr bool operator <  ( name a, name b ) { return a.value <  b.value; }

      friend std::ostream& operator << ( std::ostream& out, const name& n );
   };

   inline namespace literals {
#if defined(__clang__)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
      template <typename T, T... Str>
      constexpr name operator""_n() {
         constexpr const char buf[] = {Str...};
         return name{ std::integral_constant<uint64_t, name_encoding::encode( std::string_view{buf, sizeof(buf)} )>::value };
      }
#if defined(__clang__)
# pragma clang diagnostic pop
#endif
   } // literals

} // pmarket::chain

FC_REFLECT( pmarket::chain::name, (value) )
