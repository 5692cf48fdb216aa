#pragma once

// Standard library includes
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "elicitor/path.hh"
#include "elicitor/value.hh"

namespace elicitor {

  struct Question;
  struct Variant;

  // No data to collect (unit variants, unit structs)
  struct UnitQuestion {};

  // Single-line text
  struct InputQuestion {
    std::optional< std::string > default_value;
  };

  // Multi-line text (editor or textarea)
  struct MultilineQuestion {
    std::optional< std::string > default_value;
  };

  // Text whose echo is hidden behind a mask character
  struct MaskedQuestion {
    char mask = '*';
  };

  struct IntQuestion {
    std::optional< std::int64_t > default_value;
    std::optional< std::int64_t > min;
    std::optional< std::int64_t > max;
  };

  struct FloatQuestion {
    std::optional< double > default_value;
    std::optional< double > min;
    std::optional< double > max;
  };

  // Yes/no
  struct ConfirmQuestion {
    bool default_value = false;
  };

  // Element types a list question collects, with optional per-item bounds
  struct TextElements {};
  struct IntElements {
    std::optional< std::int64_t > min;
    std::optional< std::int64_t > max;
  };
  struct FloatElements {
    std::optional< double > min;
    std::optional< double > max;
  };

  using ListElementKind = std::variant< TextElements, IntElements,
    FloatElements >;

  // Several values of one element type, answered as a single list
  struct ListQuestion {
    ListElementKind element;
    std::optional< std::size_t > min_items;
    std::optional< std::size_t > max_items;
  };

  // Unconditional group: every child is asked, in declaration order
  struct AllOfQuestion {
    std::vector< Question > questions;
  };

  // Pick exactly one variant, then answer its data
  struct OneOfQuestion {
    std::vector< Variant > variants;
    std::optional< std::size_t > default_index;
  };

  // Pick any number of variants, then answer each one's data
  struct AnyOfQuestion {
    std::vector< Variant > variants;
    std::vector< std::size_t > default_indices;
  };

  using QuestionKind = std::variant< UnitQuestion, InputQuestion,
    MultilineQuestion, MaskedQuestion, IntQuestion, FloatQuestion,
    ConfirmQuestion, ListQuestion, AllOfQuestion, OneOfQuestion,
    AnyOfQuestion >;

  // One named option of a OneOf/AnyOf. Its identity is its ordinal position
  // in the enclosing list, never its display name.
  struct Variant {
    std::string name;
    QuestionKind kind;

    static Variant unit( std::string name ) {
      return Variant{ std::move(name), UnitQuestion{} };
    }
  };

  // A question's effective default
  class DefaultValue {
  public:
    enum class Mode { None, Suggested, Assumed };

    DefaultValue() = default;

    static DefaultValue suggested( Value v ) {
      return DefaultValue( Mode::Suggested, std::move(v) );
    }
    static DefaultValue assumed( Value v ) {
      return DefaultValue( Mode::Assumed, std::move(v) );
    }

    Mode mode() const { return mode_; }
    bool is_none() const { return mode_ == Mode::None; }
    bool is_suggested() const { return mode_ == Mode::Suggested; }
    bool is_assumed() const { return mode_ == Mode::Assumed; }

    // The suggested or assumed value, if any
    const Value* value() const { return value_ ? &*value_ : nullptr; }

    friend bool operator==( const DefaultValue& a, const DefaultValue& b ) {
      return a.mode_ == b.mode_ && a.value_ == b.value_;
    }
    friend bool operator!=( const DefaultValue& a, const DefaultValue& b ) {
      return !( a == b );
    }

  private:
    DefaultValue( Mode m, Value v ) : mode_( m ), value_( std::move(v) ) {}

    Mode mode_ = Mode::None;
    std::optional< Value > value_;
  };

  // One thing to ask. The path is relative to the enclosing node and unique
  // among its siblings.
  struct Question {

    Question( Path path, std::string ask, QuestionKind kind )
      : path_( std::move(path) ), ask_( std::move(ask) ),
      kind_( std::move(kind) ) {}

    const Path& path() const { return path_; }
    const std::string& ask() const { return ask_; }
    const QuestionKind& kind() const { return kind_; }
    QuestionKind& kind_mut() { return kind_; }
    const DefaultValue& default_value() const { return default_; }

    void set_suggestion( Value v ) { default_ = DefaultValue::suggested( std::move(v) ); }
    void set_assumption( Value v ) { default_ = DefaultValue::assumed( std::move(v) ); }
    void clear_default() { default_ = DefaultValue(); }

    // Assumed questions are skipped by collection surfaces
    bool is_assumed() const { return default_.is_assumed(); }

  private:
    Path path_;
    std::string ask_;
    QuestionKind kind_;
    DefaultValue default_;
  };

  // Top-level question tree plus optional messages shown around collection
  struct SurveyDefinition {
    std::optional< std::string > prelude;
    std::vector< Question > questions;
    std::optional< std::string > epilogue;

    bool empty() const { return questions.empty(); }
    std::size_t size() const { return questions.size(); }
  };

  // Structural equality for every tree type
  bool operator==( const Question& a, const Question& b );
  bool operator==( const Variant& a, const Variant& b );

  inline bool operator==( const UnitQuestion&, const UnitQuestion& ) {
    return true;
  }
  inline bool operator==( const InputQuestion& a, const InputQuestion& b ) {
    return a.default_value == b.default_value;
  }
  inline bool operator==( const MultilineQuestion& a,
    const MultilineQuestion& b )
  {
    return a.default_value == b.default_value;
  }
  inline bool operator==( const MaskedQuestion& a, const MaskedQuestion& b ) {
    return a.mask == b.mask;
  }
  inline bool operator==( const IntQuestion& a, const IntQuestion& b ) {
    return a.default_value == b.default_value && a.min == b.min
      && a.max == b.max;
  }
  inline bool operator==( const FloatQuestion& a, const FloatQuestion& b ) {
    return a.default_value == b.default_value && a.min == b.min
      && a.max == b.max;
  }
  inline bool operator==( const ConfirmQuestion& a, const ConfirmQuestion& b ) {
    return a.default_value == b.default_value;
  }
  inline bool operator==( const TextElements&, const TextElements& ) {
    return true;
  }
  inline bool operator==( const IntElements& a, const IntElements& b ) {
    return a.min == b.min && a.max == b.max;
  }
  inline bool operator==( const FloatElements& a, const FloatElements& b ) {
    return a.min == b.min && a.max == b.max;
  }
  inline bool operator==( const ListQuestion& a, const ListQuestion& b ) {
    return a.element == b.element && a.min_items == b.min_items
      && a.max_items == b.max_items;
  }
  inline bool operator==( const AllOfQuestion& a, const AllOfQuestion& b ) {
    return a.questions == b.questions;
  }
  inline bool operator==( const OneOfQuestion& a, const OneOfQuestion& b ) {
    return a.variants == b.variants && a.default_index == b.default_index;
  }
  inline bool operator==( const AnyOfQuestion& a, const AnyOfQuestion& b ) {
    return a.variants == b.variants && a.default_indices == b.default_indices;
  }
  inline bool operator==( const Variant& a, const Variant& b ) {
    return a.name == b.name && a.kind == b.kind;
  }
  inline bool operator==( const Question& a, const Question& b ) {
    return a.path() == b.path() && a.ask() == b.ask() && a.kind() == b.kind()
      && a.default_value() == b.default_value();
  }
  inline bool operator==( const SurveyDefinition& a,
    const SurveyDefinition& b )
  {
    return a.prelude == b.prelude && a.questions == b.questions
      && a.epilogue == b.epilogue;
  }
  inline bool operator!=( const SurveyDefinition& a,
    const SurveyDefinition& b )
  {
    return !( a == b );
  }

  // Kind helpers

  inline bool is_unit( const QuestionKind& k ) {
    return std::holds_alternative< UnitQuestion >( k );
  }

  inline bool is_structural( const QuestionKind& k ) {
    return std::holds_alternative< AllOfQuestion >( k )
      || std::holds_alternative< OneOfQuestion >( k )
      || std::holds_alternative< AnyOfQuestion >( k );
  }

  // Stable names for each kind, shared with the YAML documents
  inline const char* kind_name( const QuestionKind& k ) {
    static const char* const names[] = { "unit", "input", "multiline",
      "masked", "int", "float", "confirm", "list", "all_of", "one_of",
      "any_of" };
    return names[ k.index() ];
  }

  // Questions carried by a variant, relative to the variant base. Struct
  // variants (AllOf) contribute their fields, unit variants nothing, and any
  // other kind is single positional data under POSITIONAL.
  inline std::vector< Question > variant_data_questions( const Variant& v ) {
    if ( const auto* all = std::get_if< AllOfQuestion >( &v.kind ) ) {
      return all->questions;
    }
    if ( is_unit(v.kind) ) return {};
    return { Question( Path::root(POSITIONAL), v.name, v.kind ) };
  }

  // Base path for a variant's data: a OneOf shares its own path, an AnyOf
  // namespaces each selected variant under its ordinal so that two selected
  // variants carrying data cannot collide
  inline Path variant_base( const Path& question_path, const QuestionKind& k,
    std::size_t ordinal )
  {
    if ( std::holds_alternative< AnyOfQuestion >( k ) ) {
      return question_path.child( ordinal );
    }
    return question_path;
  }

namespace internal {

  // Message for a value outside [min, max], if it is
  template < typename T >
  std::optional< std::string > range_message( T value,
    const std::optional< T >& min, const std::optional< T >& max )
  {
    std::ostringstream oss;
    if ( min && value < *min ) {
      oss << "value must be at least " << *min;
      return oss.str();
    }
    if ( max && value > *max ) {
      oss << "value must be at most " << *max;
      return oss.str();
    }
    return std::nullopt;
  }

  template < typename T, typename Bounds >
  std::optional< std::string > list_message( const std::vector< T >& items,
    const Bounds& bounds )
  {
    for ( std::size_t i = 0; i < items.size(); ++i ) {
      if ( auto msg = range_message(items[i], bounds.min, bounds.max) ) {
        return "item " + std::to_string( i ) + ": " + *msg;
      }
    }
    return std::nullopt;
  }

} // namespace elicitor::internal

  // Built-in checks for Int/Float answers and list answers. Returns a
  // message when a value falls outside [min, max] or a list holds too few
  // or too many items.
  inline std::optional< std::string > check_bounds( const QuestionKind& k,
    const Value& v )
  {
    if ( const auto* iq = std::get_if< IntQuestion >( &k ) ) {
      const auto* i = std::get_if< std::int64_t >( &v );
      if ( i ) return internal::range_message( *i, iq->min, iq->max );
    }
    else if ( const auto* fq = std::get_if< FloatQuestion >( &k ) ) {
      const auto* f = std::get_if< double >( &v );
      if ( f ) return internal::range_message( *f, fq->min, fq->max );
    }
    else if ( const auto* lq = std::get_if< ListQuestion >( &k ) ) {
      std::size_t count = 0;
      std::visit( [&count]( const auto& x ) {
        using T = std::decay_t< decltype(x) >;
        if constexpr ( std::is_same_v< T, StringList >
          || std::is_same_v< T, IntList > || std::is_same_v< T, FloatList > )
        {
          count = x.size();
        }
      }, v );

      std::ostringstream oss;
      if ( lq->min_items && count < *lq->min_items ) {
        oss << "at least " << *lq->min_items << " items are required";
        return oss.str();
      }
      if ( lq->max_items && count > *lq->max_items ) {
        oss << "at most " << *lq->max_items << " items are allowed";
        return oss.str();
      }

      const auto* ie = std::get_if< IntElements >( &lq->element );
      const auto* is = std::get_if< IntList >( &v );
      if ( ie && is ) return internal::list_message( *is, *ie );

      const auto* fe = std::get_if< FloatElements >( &lq->element );
      const auto* fs = std::get_if< FloatList >( &v );
      if ( fe && fs ) return internal::list_message( *fs, *fe );
    }
    return std::nullopt;
  }

  // Depth-first walk in declaration order over every question reachable
  // without a variant choice (descends into AllOf only). The callback
  // receives each question's absolute path.
  inline void for_each_question( const std::vector< Question >& questions,
    const Path& base,
    const std::function< void( const Path&, const Question& ) >& fn )
  {
    for ( const auto& q : questions ) {
      const Path abs = base.join( q.path() );
      fn( abs, q );
      if ( const auto* all = std::get_if< AllOfQuestion >( &q.kind() ) ) {
        for_each_question( all->questions, abs, fn );
      }
    }
  }

  // Locate a reachable question by absolute path
  inline const Question* find_question( const SurveyDefinition& def,
    const Path& abs_path )
  {
    const Question* found = nullptr;
    for_each_question( def.questions, Path(),
      [&]( const Path& p, const Question& q ) {
        if ( !found && p == abs_path ) found = &q;
      } );
    return found;
  }

} // namespace elicitor
