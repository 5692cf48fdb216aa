#pragma once

// Standard library includes
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace elicitor {

  // Index of the chosen variant of a OneOf question
  struct ChosenVariant {
    std::size_t index = 0;
  };

  // Indices of the chosen variants of an AnyOf question, in selection order
  struct ChosenVariants {
    std::vector< std::size_t > indices;
  };

  inline bool operator==( const ChosenVariant& a, const ChosenVariant& b ) {
    return a.index == b.index;
  }
  inline bool operator!=( const ChosenVariant& a, const ChosenVariant& b ) {
    return !( a == b );
  }
  inline bool operator==( const ChosenVariants& a, const ChosenVariants& b ) {
    return a.indices == b.indices;
  }
  inline bool operator!=( const ChosenVariants& a, const ChosenVariants& b ) {
    return !( a == b );
  }

  // Answers to list questions
  using StringList = std::vector< std::string >;
  using IntList = std::vector< std::int64_t >;
  using FloatList = std::vector< double >;

  // One collected answer. The active alternative is the value's tag.
  using Value = std::variant< std::string, std::int64_t, double, bool,
    ChosenVariant, ChosenVariants, StringList, IntList, FloatList >;

  // Tag names used in diagnostics
  inline const char* type_name( const Value& v ) {
    return std::visit( []( const auto& x ) -> const char* {
      using T = std::decay_t< decltype(x) >;
      if constexpr ( std::is_same_v< T, std::string > ) return "Text";
      else if constexpr ( std::is_same_v< T, std::int64_t > ) return "Int";
      else if constexpr ( std::is_same_v< T, double > ) return "Float";
      else if constexpr ( std::is_same_v< T, bool > ) return "Bool";
      else if constexpr ( std::is_same_v< T, ChosenVariant > ) {
        return "ChosenVariant";
      }
      else if constexpr ( std::is_same_v< T, ChosenVariants > ) {
        return "ChosenVariants";
      }
      else if constexpr ( std::is_same_v< T, StringList > ) return "StringList";
      else if constexpr ( std::is_same_v< T, IntList > ) return "IntList";
      else return "FloatList";
    }, v );
  }

  inline std::string to_display( const Value& v ) {
    std::ostringstream oss;
    std::visit( [&oss]( const auto& x ) {
      using T = std::decay_t< decltype(x) >;
      if constexpr ( std::is_same_v< T, bool > ) {
        oss << ( x ? "true" : "false" );
      }
      else if constexpr ( std::is_same_v< T, ChosenVariant > ) {
        oss << '#' << x.index;
      }
      else if constexpr ( std::is_same_v< T, ChosenVariants > ) {
        oss << '{';
        for ( std::size_t i = 0; i < x.indices.size(); ++i ) {
          if ( i ) oss << ", ";
          oss << x.indices[ i ];
        }
        oss << '}';
      }
      else if constexpr ( std::is_same_v< T, StringList >
        || std::is_same_v< T, IntList > || std::is_same_v< T, FloatList > )
      {
        oss << '[';
        for ( std::size_t i = 0; i < x.size(); ++i ) {
          if ( i ) oss << ", ";
          oss << x[ i ];
        }
        oss << ']';
      }
      else {
        oss << x;
      }
    }, v );
    return oss.str();
  }

  // Convenience constructors that pin the alternative. A bare string
  // literal would otherwise select bool.
  inline Value text( std::string s ) { return Value( std::move(s) ); }
  inline Value integer( std::int64_t i ) { return Value( i ); }
  inline Value real( double d ) { return Value( d ); }
  inline Value boolean( bool b ) { return Value( b ); }
  inline Value chosen( std::size_t index ) {
    return Value( ChosenVariant{ index } );
  }
  inline Value chosen_set( std::vector< std::size_t > indices ) {
    return Value( ChosenVariants{ std::move(indices) } );
  }
  inline Value string_list( StringList items ) {
    return Value( std::move(items) );
  }
  inline Value int_list( IntList items ) { return Value( std::move(items) ); }
  inline Value float_list( FloatList items ) {
    return Value( std::move(items) );
  }

} // namespace elicitor
