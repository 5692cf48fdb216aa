#pragma once

// Standard library includes
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "elicitor/backend.hh"
#include "elicitor/merge.hh"
#include "elicitor/path.hh"
#include "elicitor/question.hh"
#include "elicitor/responses.hh"
#include "elicitor/value.hh"

namespace elicitor {

  // Specialized version of the fkYAML basic_node template. The choice of
  // fkyaml::ordered_map preserves the lexical order of the input, which is
  // the declaration order of questions and variants.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Nested mappings <-> flat response store. Mapping keys become path
  // segments (integer keys become ordinal segments). A sequence under
  // selected_variants is a ChosenVariants, an integer under
  // selected_variant is a ChosenVariant, and any other sequence a list.
  ResponseStore store_from_yaml( const ordered_node& node );

  // As above, but each value is read as the kind of the question in shape
  // that answers its path, so "zip: 12345" is text for an input question
  ResponseStore store_from_yaml( const ordered_node& node,
    const SurveyDefinition& shape );
  ordered_node store_to_yaml( const ResponseStore& store );

  // Question tree documents
  SurveyDefinition survey_from_yaml( const ordered_node& node );
  ordered_node survey_to_yaml( const SurveyDefinition& def );

  // Command-line document: survey + optional suggestions, assumptions,
  // answers and cancel_at. Progress notes go to log when it is non-null.
  ordered_node process_document( const ordered_node& doc,
    std::ostream* log = nullptr );

namespace internal {

  // Keys used in the YAML documents
  inline const std::string DOC_ROOT = "root";
  inline const std::string PRELUDE = "prelude";
  inline const std::string EPILOGUE = "epilogue";
  inline const std::string QUESTIONS = "questions";
  inline const std::string PATH = "path";
  inline const std::string ASK = "ask";
  inline const std::string KIND = "kind";
  inline const std::string NAME = "name";
  inline const std::string VARIANTS = "variants";
  inline const std::string DEFAULT = "default";
  inline const std::string DEFAULTS = "defaults";
  inline const std::string MIN = "min";
  inline const std::string MAX = "max";
  inline const std::string MASK = "mask";
  inline const std::string ELEMENT = "element";
  inline const std::string MIN_ITEMS = "min_items";
  inline const std::string MAX_ITEMS = "max_items";
  inline const std::string SUGGESTED = "suggested";
  inline const std::string ASSUMED = "assumed";
  inline const std::string SURVEY = "survey";
  inline const std::string SUGGESTIONS = "suggestions";
  inline const std::string ASSUMPTIONS = "assumptions";
  inline const std::string ANSWERS = "answers";
  inline const std::string CANCEL_AT = "cancel_at";
  inline const std::string RESPONSES = "responses";
  inline const std::string SEEDED = "seeded";

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Scalars used as mapping keys or path segments
  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return std::to_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Append a numerical index to the end of a location segment
  inline std::string seq_indexed( const std::string& base, std::size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  inline ordered_node value_to_node( const Value& v ) {
    if ( const auto* s = std::get_if< std::string >( &v ) ) {
      return make_node_from( *s );
    }
    if ( const auto* i = std::get_if< std::int64_t >( &v ) ) {
      return make_node_from( *i );
    }
    if ( const auto* d = std::get_if< double >( &v ) ) {
      return make_node_from( *d );
    }
    if ( const auto* b = std::get_if< bool >( &v ) ) {
      return make_node_from( *b );
    }
    if ( const auto* c = std::get_if< ChosenVariant >( &v ) ) {
      return make_node_from( static_cast< std::int64_t >( c->index ) );
    }

    std::vector< ordered_node > seq;
    if ( const auto* cs = std::get_if< ChosenVariants >( &v ) ) {
      for ( std::size_t idx : cs->indices ) {
        seq.push_back( make_node_from(static_cast< std::int64_t >( idx )) );
      }
    }
    else if ( const auto* ss = std::get_if< StringList >( &v ) ) {
      for ( const auto& s : *ss ) seq.push_back( make_node_from(s) );
    }
    else if ( const auto* is = std::get_if< IntList >( &v ) ) {
      for ( std::int64_t i : *is ) seq.push_back( make_node_from(i) );
    }
    else {
      for ( double d : std::get< FloatList >( v ) ) {
        seq.push_back( make_node_from(d) );
      }
    }
    return make_node_from( seq );
  }

  // Tracks the document location for error messages,
  // e.g., ["root", "questions[2]", "kind"]
  class DocCursor {
  public:
    DocCursor() : path_stack_{ DOC_ROOT } {}

    void push( const std::string& seg ) { path_stack_.push_back( seg ); }
    void pop() { path_stack_.pop_back(); }

    // Compose "root.questions[2].kind: message"
    [[noreturn]] void fail( const std::string& msg ) const {
      std::ostringstream oss;
      for ( std::size_t i = 0; i < path_stack_.size(); ++i ) {
        const std::string& seg = path_stack_[ i ];
        // Sequence indices attach to the preceding key
        if ( i && ( seg.empty() || seg.front() != '[' ) ) oss << PATH_DELIMITER;
        oss << seg;
      }
      oss << ": " << msg;
      throw std::runtime_error( oss.str() );
    }

  private:
    std::vector< std::string > path_stack_;
  };

  // Pushes on construction, pops on scope exit
  class CursorGuard {
  public:
    CursorGuard( DocCursor& c, const std::string& seg ) : c_( c ) {
      c_.push( seg );
    }
    ~CursorGuard() { c_.pop(); }

    CursorGuard( const CursorGuard& ) = delete;
    CursorGuard& operator=( const CursorGuard& ) = delete;

  private:
    DocCursor& c_;
  };

  inline std::size_t to_index( const ordered_node& n, DocCursor& cur ) {
    if ( !n.is_integer() ) cur.fail( "expected a variant index" );
    const std::int64_t i = to_native_checked< std::int64_t >( n );
    if ( i < 0 ) cur.fail( "variant index must not be negative" );
    return static_cast< std::size_t >( i );
  }

  inline std::vector< std::size_t > to_index_list( const ordered_node& n,
    DocCursor& cur )
  {
    if ( !n.is_sequence() ) cur.fail( "expected a sequence of variant indices" );
    std::vector< std::size_t > out;
    for ( std::size_t i = 0; i < n.size(); ++i ) {
      CursorGuard g( cur, seq_indexed("", i) );
      out.push_back( to_index(n.at(i), cur) );
    }
    return out;
  }

  // Untyped scalar: the YAML tag decides
  inline Value scalar_value( const ordered_node& n, DocCursor& cur ) {
    if ( n.is_boolean() ) return boolean( n.get_value< bool >() );
    if ( n.is_integer() ) {
      return integer( to_native_checked< std::int64_t >(n) );
    }
    if ( n.is_float_number() ) return real( to_native_checked< double >(n) );
    if ( n.is_string() ) return text( to_native_checked< std::string >(n) );
    cur.fail( "expected a scalar value" );
  }

  inline double to_double( const ordered_node& n, DocCursor& cur ) {
    if ( n.is_integer() ) {
      return static_cast< double >( to_native_checked< std::int64_t >(n) );
    }
    if ( n.is_float_number() ) return to_native_checked< double >( n );
    cur.fail( "expected a number" );
  }

  inline std::int64_t to_int( const ordered_node& n, DocCursor& cur ) {
    if ( !n.is_integer() ) cur.fail( "expected an integer" );
    return to_native_checked< std::int64_t >( n );
  }

  inline std::string to_text( const ordered_node& n, DocCursor& cur ) {
    if ( !n.is_scalar() || n.is_null() ) cur.fail( "expected a string" );
    return to_string_any( n );
  }

  // Untyped sequence: strings make a StringList, otherwise any float makes
  // a FloatList, otherwise the items are integers
  inline Value sequence_value( const ordered_node& n, DocCursor& cur ) {
    bool any_text = false;
    bool any_float = false;
    for ( std::size_t i = 0; i < n.size(); ++i ) {
      CursorGuard g( cur, seq_indexed("", i) );
      const ordered_node& item = n.at( i );
      if ( item.is_string() ) any_text = true;
      else if ( item.is_float_number() ) any_float = true;
      else if ( !item.is_integer() ) {
        cur.fail( "list items must be strings or numbers" );
      }
    }

    if ( any_text || n.size() == 0 ) {
      StringList out;
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        out.push_back( to_string_any(n.at(i)) );
      }
      return string_list( std::move(out) );
    }
    if ( any_float ) {
      FloatList out;
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        out.push_back( to_double(n.at(i), cur) );
      }
      return float_list( std::move(out) );
    }
    IntList out;
    for ( std::size_t i = 0; i < n.size(); ++i ) {
      out.push_back( to_int(n.at(i), cur) );
    }
    return int_list( std::move(out) );
  }

  inline Value list_for_kind( const ordered_node& n, const ListQuestion& lq,
    DocCursor& cur )
  {
    if ( !n.is_sequence() ) cur.fail( "expected a sequence" );
    if ( std::holds_alternative< IntElements >( lq.element ) ) {
      IntList out;
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        CursorGuard g( cur, seq_indexed("", i) );
        out.push_back( to_int(n.at(i), cur) );
      }
      return int_list( std::move(out) );
    }
    if ( std::holds_alternative< FloatElements >( lq.element ) ) {
      FloatList out;
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        CursorGuard g( cur, seq_indexed("", i) );
        out.push_back( to_double(n.at(i), cur) );
      }
      return float_list( std::move(out) );
    }
    StringList out;
    for ( std::size_t i = 0; i < n.size(); ++i ) {
      CursorGuard g( cur, seq_indexed("", i) );
      out.push_back( to_text(n.at(i), cur) );
    }
    return string_list( std::move(out) );
  }

  // Overlay values are typed by the kind they apply to, so a plain integer
  // on a one_of is a variant index and a sequence on an any_of a set
  inline Value value_for_kind( const ordered_node& n, const QuestionKind& k,
    DocCursor& cur )
  {
    if ( std::holds_alternative< OneOfQuestion >( k ) ) {
      return chosen( to_index(n, cur) );
    }
    if ( std::holds_alternative< AnyOfQuestion >( k ) ) {
      return chosen_set( to_index_list(n, cur) );
    }
    if ( const auto* lq = std::get_if< ListQuestion >( &k ) ) {
      return list_for_kind( n, *lq, cur );
    }
    if ( std::holds_alternative< IntQuestion >( k ) ) {
      return integer( to_int(n, cur) );
    }
    if ( std::holds_alternative< FloatQuestion >( k ) ) {
      return real( to_double(n, cur) );
    }
    if ( std::holds_alternative< ConfirmQuestion >( k ) ) {
      if ( !n.is_boolean() ) cur.fail( "expected true or false" );
      return boolean( n.get_value< bool >() );
    }
    if ( std::holds_alternative< InputQuestion >( k )
      || std::holds_alternative< MultilineQuestion >( k )
      || std::holds_alternative< MaskedQuestion >( k ) )
    {
      return text( to_text(n, cur) );
    }
    if ( n.is_sequence() ) return sequence_value( n, cur );
    return scalar_value( n, cur );
  }

  // Kind of the question that answers target, looking through variant
  // data of every variant. The first declared match wins.
  inline std::optional< QuestionKind > kind_at(
    const std::vector< Question >& questions, const Path& base,
    const Path& target )
  {
    for ( const auto& q : questions ) {
      const Path abs = base.join( q.path() );
      if ( !target.starts_with(abs) ) continue;
      if ( abs == target && !is_structural(q.kind()) ) return q.kind();

      std::optional< QuestionKind > found;
      if ( const auto* all = std::get_if< AllOfQuestion >( &q.kind() ) ) {
        found = kind_at( all->questions, abs, target );
      }
      else if ( const auto* one = std::get_if< OneOfQuestion >( &q.kind() ) ) {
        for ( const auto& v : one->variants ) {
          if ( found ) break;
          found = kind_at( variant_data_questions(v), abs, target );
        }
      }
      else if ( const auto* any = std::get_if< AnyOfQuestion >( &q.kind() ) ) {
        for ( std::size_t i = 0; i < any->variants.size() && !found; ++i ) {
          found = kind_at( variant_data_questions(any->variants[i]),
            abs.child(i), target );
        }
      }
      if ( found ) return found;
    }
    return std::nullopt;
  }

  // shape, when given, types each leaf by the question answering it
  void store_from_mapping( const ordered_node& node, const Path& base,
    const SurveyDefinition* shape, ResponseStore& out, DocCursor& cur );

  QuestionKind kind_from_yaml( const ordered_node& node, DocCursor& cur );
  Question question_from_yaml( const ordered_node& node, DocCursor& cur );
  std::vector< Variant > variants_from_yaml( const ordered_node& node,
    DocCursor& cur );

  void kind_to_yaml( const QuestionKind& k, ordered_node& out );
  ordered_node question_to_yaml( const Question& q );

} // namespace elicitor::internal

} // namespace elicitor

inline void elicitor::internal::store_from_mapping( const ordered_node& node,
  const Path& base, const SurveyDefinition* shape, ResponseStore& out,
  DocCursor& cur )
{
  if ( !node.is_mapping() ) cur.fail( "expected a mapping" );

  for ( const auto& [mk, mv] : node.map_items() ) {
    const std::string key = to_string_any( mk );
    CursorGuard g( cur, key );
    const Path p = base.child( key );

    if ( key == SELECTED_VARIANTS ) {
      out.insert( p, chosen_set(to_index_list(mv, cur)) );
    }
    else if ( key == SELECTED_VARIANT ) {
      out.insert( p, chosen(to_index(mv, cur)) );
    }
    else if ( mv.is_mapping() ) {
      store_from_mapping( mv, p, shape, out, cur );
    }
    else if ( mv.is_null() ) {
      cur.fail( "missing value" );
    }
    else {
      std::optional< QuestionKind > kind;
      if ( shape ) kind = kind_at( shape->questions, Path(), p );
      if ( kind && !is_unit(*kind) ) {
        out.insert( p, value_for_kind(mv, *kind, cur) );
      }
      else if ( mv.is_sequence() ) {
        out.insert( p, sequence_value(mv, cur) );
      }
      else {
        out.insert( p, scalar_value(mv, cur) );
      }
    }
  }
}

inline elicitor::ResponseStore elicitor::store_from_yaml(
  const ordered_node& node )
{
  ResponseStore out;
  if ( node.is_null() ) return out;
  internal::DocCursor cur;
  internal::store_from_mapping( node, Path(), nullptr, out, cur );
  return out;
}

inline elicitor::ResponseStore elicitor::store_from_yaml(
  const ordered_node& node, const SurveyDefinition& shape )
{
  ResponseStore out;
  if ( node.is_null() ) return out;
  internal::DocCursor cur;
  internal::store_from_mapping( node, Path(), &shape, out, cur );
  return out;
}

inline elicitor::ordered_node elicitor::store_to_yaml(
  const ResponseStore& store )
{
  ordered_node root = ordered_node::mapping();
  for ( const Path& p : store.sorted_paths() ) {
    if ( p.empty() ) {
      throw std::runtime_error( "cannot write a value at the root path" );
    }

    ordered_node* cur = &root;
    const auto& segs = p.segments();
    for ( std::size_t i = 0; i + 1 < segs.size(); ++i ) {
      if ( !cur->contains(segs[i]) ) {
        ( *cur )[ segs[i] ] = ordered_node::mapping();
      }
      cur = &( *cur )[ segs[i] ];
      if ( !cur->is_mapping() ) {
        throw std::runtime_error( "response at '" + p.display()
          + "' lies beneath another response" );
      }
    }
    if ( cur->contains(segs.back()) ) {
      throw std::runtime_error( "response at '" + p.display()
        + "' would replace nested responses" );
    }
    ( *cur )[ segs.back() ] = internal::value_to_node( *store.get(p) );
  }
  return root;
}

inline std::vector< elicitor::Variant > elicitor::internal::variants_from_yaml(
  const ordered_node& node, DocCursor& cur )
{
  if ( !node.contains(VARIANTS) ) cur.fail( "missing '" + VARIANTS + "'" );
  CursorGuard g( cur, VARIANTS );
  const ordered_node& seq = node.at( VARIANTS );
  if ( !seq.is_sequence() ) cur.fail( "expected a sequence" );

  std::vector< Variant > out;
  for ( std::size_t i = 0; i < seq.size(); ++i ) {
    CursorGuard gi( cur, seq_indexed("", i) );
    const ordered_node& vn = seq.at( i );
    if ( !vn.is_mapping() || !vn.contains(NAME) ) {
      cur.fail( "a variant needs a '" + NAME + "'" );
    }
    std::string name;
    {
      CursorGuard gn( cur, NAME );
      name = to_text( vn.at(NAME), cur );
    }
    // A variant without a kind carries no data
    QuestionKind kind = vn.contains( KIND ) ? kind_from_yaml( vn, cur )
      : QuestionKind( UnitQuestion{} );
    out.push_back( Variant{ std::move(name), std::move(kind) } );
  }
  return out;
}

inline elicitor::QuestionKind elicitor::internal::kind_from_yaml(
  const ordered_node& node, DocCursor& cur )
{
  if ( !node.contains(KIND) ) cur.fail( "missing '" + KIND + "'" );
  std::string kind;
  {
    CursorGuard g( cur, KIND );
    kind = to_text( node.at(KIND), cur );
  }

  auto opt = [&]( const std::string& key ) -> const ordered_node* {
    if ( !node.contains(key) || node.at(key).is_null() ) return nullptr;
    return &node.at( key );
  };

  if ( kind == "unit" ) return UnitQuestion{};

  if ( kind == "input" || kind == "multiline" ) {
    std::optional< std::string > dflt;
    if ( const ordered_node* d = opt(DEFAULT) ) {
      CursorGuard g( cur, DEFAULT );
      dflt = to_text( *d, cur );
    }
    if ( kind == "input" ) return InputQuestion{ dflt };
    return MultilineQuestion{ dflt };
  }

  if ( kind == "masked" ) {
    MaskedQuestion q;
    if ( const ordered_node* m = opt(MASK) ) {
      CursorGuard g( cur, MASK );
      const std::string s = to_text( *m, cur );
      if ( s.size() != 1 ) cur.fail( "mask must be a single character" );
      q.mask = s[ 0 ];
    }
    return q;
  }

  if ( kind == "int" ) {
    IntQuestion q;
    if ( const ordered_node* d = opt(DEFAULT) ) {
      CursorGuard g( cur, DEFAULT );
      q.default_value = to_int( *d, cur );
    }
    if ( const ordered_node* m = opt(MIN) ) {
      CursorGuard g( cur, MIN );
      q.min = to_int( *m, cur );
    }
    if ( const ordered_node* m = opt(MAX) ) {
      CursorGuard g( cur, MAX );
      q.max = to_int( *m, cur );
    }
    return q;
  }

  if ( kind == "float" ) {
    FloatQuestion q;
    if ( const ordered_node* d = opt(DEFAULT) ) {
      CursorGuard g( cur, DEFAULT );
      q.default_value = to_double( *d, cur );
    }
    if ( const ordered_node* m = opt(MIN) ) {
      CursorGuard g( cur, MIN );
      q.min = to_double( *m, cur );
    }
    if ( const ordered_node* m = opt(MAX) ) {
      CursorGuard g( cur, MAX );
      q.max = to_double( *m, cur );
    }
    return q;
  }

  if ( kind == "confirm" ) {
    ConfirmQuestion q;
    if ( const ordered_node* d = opt(DEFAULT) ) {
      CursorGuard g( cur, DEFAULT );
      if ( !d->is_boolean() ) cur.fail( "expected true or false" );
      q.default_value = d->get_value< bool >();
    }
    return q;
  }

  if ( kind == "list" ) {
    ListQuestion q;
    std::string element = "text";
    if ( const ordered_node* e = opt(ELEMENT) ) {
      CursorGuard g( cur, ELEMENT );
      element = to_text( *e, cur );
    }

    if ( element == "text" ) q.element = TextElements{};
    else if ( element == "int" ) {
      IntElements ie;
      if ( const ordered_node* m = opt(MIN) ) {
        CursorGuard g( cur, MIN );
        ie.min = to_int( *m, cur );
      }
      if ( const ordered_node* m = opt(MAX) ) {
        CursorGuard g( cur, MAX );
        ie.max = to_int( *m, cur );
      }
      q.element = ie;
    }
    else if ( element == "float" ) {
      FloatElements fe;
      if ( const ordered_node* m = opt(MIN) ) {
        CursorGuard g( cur, MIN );
        fe.min = to_double( *m, cur );
      }
      if ( const ordered_node* m = opt(MAX) ) {
        CursorGuard g( cur, MAX );
        fe.max = to_double( *m, cur );
      }
      q.element = fe;
    }
    else {
      CursorGuard g( cur, ELEMENT );
      cur.fail( "unknown list element '" + element + "'" );
    }

    auto item_count = [&]( const std::string& key ) {
      CursorGuard g( cur, key );
      const std::int64_t n = to_int( node.at(key), cur );
      if ( n < 0 ) cur.fail( "item count must not be negative" );
      return static_cast< std::size_t >( n );
    };
    if ( opt(MIN_ITEMS) ) q.min_items = item_count( MIN_ITEMS );
    if ( opt(MAX_ITEMS) ) q.max_items = item_count( MAX_ITEMS );
    return q;
  }

  if ( kind == "all_of" ) {
    AllOfQuestion q;
    if ( const ordered_node* qs = opt(QUESTIONS) ) {
      CursorGuard g( cur, QUESTIONS );
      if ( !qs->is_sequence() ) cur.fail( "expected a sequence" );
      for ( std::size_t i = 0; i < qs->size(); ++i ) {
        CursorGuard gi( cur, seq_indexed("", i) );
        q.questions.push_back( question_from_yaml(qs->at(i), cur) );
      }
    }
    return q;
  }

  if ( kind == "one_of" ) {
    OneOfQuestion q;
    q.variants = variants_from_yaml( node, cur );
    if ( const ordered_node* d = opt(DEFAULT) ) {
      CursorGuard g( cur, DEFAULT );
      q.default_index = to_index( *d, cur );
      if ( *q.default_index >= q.variants.size() ) {
        cur.fail( "default variant out of range" );
      }
    }
    return q;
  }

  if ( kind == "any_of" ) {
    AnyOfQuestion q;
    q.variants = variants_from_yaml( node, cur );
    if ( const ordered_node* d = opt(DEFAULTS) ) {
      CursorGuard g( cur, DEFAULTS );
      q.default_indices = to_index_list( *d, cur );
      for ( std::size_t idx : q.default_indices ) {
        if ( idx >= q.variants.size() ) {
          cur.fail( "default variant out of range" );
        }
      }
    }
    return q;
  }

  CursorGuard g( cur, KIND );
  cur.fail( "unknown question kind '" + kind + "'" );
}

inline elicitor::Question elicitor::internal::question_from_yaml(
  const ordered_node& node, DocCursor& cur )
{
  if ( !node.is_mapping() ) cur.fail( "expected a mapping" );

  // A question without a path sits at its parent's path (top-level enums)
  Path path;
  if ( node.contains(PATH) && !node.at(PATH).is_null() ) {
    CursorGuard g( cur, PATH );
    const ordered_node& pn = node.at( PATH );
    if ( pn.is_sequence() ) {
      std::vector< std::string > segs;
      for ( std::size_t i = 0; i < pn.size(); ++i ) {
        segs.push_back( to_text(pn.at(i), cur) );
      }
      path = Path::from_segments( segs );
    }
    else {
      path = Path::root( to_text(pn, cur) );
    }
    for ( const auto& seg : path.segments() ) {
      if ( seg == SELECTED_VARIANT || seg == SELECTED_VARIANTS ) {
        cur.fail( "'" + seg + "' is reserved for variant selections" );
      }
    }
  }

  std::string ask;
  if ( node.contains(ASK) ) {
    CursorGuard g( cur, ASK );
    ask = to_text( node.at(ASK), cur );
  }

  Question q( std::move(path), std::move(ask), kind_from_yaml(node, cur) );

  if ( node.contains(ASSUMED) ) {
    CursorGuard g( cur, ASSUMED );
    q.set_assumption( value_for_kind(node.at(ASSUMED), q.kind(), cur) );
  }
  else if ( node.contains(SUGGESTED) ) {
    CursorGuard g( cur, SUGGESTED );
    q.set_suggestion( value_for_kind(node.at(SUGGESTED), q.kind(), cur) );
  }
  return q;
}

inline elicitor::SurveyDefinition elicitor::survey_from_yaml(
  const ordered_node& node )
{
  using namespace internal;

  DocCursor cur;
  if ( !node.is_mapping() ) cur.fail( "a survey must be a mapping" );

  SurveyDefinition def;
  if ( node.contains(PRELUDE) && !node.at(PRELUDE).is_null() ) {
    CursorGuard g( cur, PRELUDE );
    def.prelude = to_text( node.at(PRELUDE), cur );
  }
  if ( node.contains(EPILOGUE) && !node.at(EPILOGUE).is_null() ) {
    CursorGuard g( cur, EPILOGUE );
    def.epilogue = to_text( node.at(EPILOGUE), cur );
  }

  if ( !node.contains(QUESTIONS) ) cur.fail( "missing '" + QUESTIONS + "'" );
  CursorGuard g( cur, QUESTIONS );
  const ordered_node& qs = node.at( QUESTIONS );
  if ( !qs.is_sequence() ) cur.fail( "expected a sequence" );
  for ( std::size_t i = 0; i < qs.size(); ++i ) {
    CursorGuard gi( cur, seq_indexed("", i) );
    def.questions.push_back( question_from_yaml(qs.at(i), cur) );
  }
  return def;
}

inline void elicitor::internal::kind_to_yaml( const QuestionKind& k,
  ordered_node& out )
{
  out[ KIND ] = make_node_from( std::string(kind_name(k)) );

  if ( const auto* q = std::get_if< InputQuestion >( &k ) ) {
    if ( q->default_value ) out[ DEFAULT ] = make_node_from( *q->default_value );
  }
  else if ( const auto* q = std::get_if< MultilineQuestion >( &k ) ) {
    if ( q->default_value ) out[ DEFAULT ] = make_node_from( *q->default_value );
  }
  else if ( const auto* q = std::get_if< MaskedQuestion >( &k ) ) {
    out[ MASK ] = make_node_from( std::string(1, q->mask) );
  }
  else if ( const auto* q = std::get_if< IntQuestion >( &k ) ) {
    if ( q->default_value ) out[ DEFAULT ] = make_node_from( *q->default_value );
    if ( q->min ) out[ MIN ] = make_node_from( *q->min );
    if ( q->max ) out[ MAX ] = make_node_from( *q->max );
  }
  else if ( const auto* q = std::get_if< FloatQuestion >( &k ) ) {
    if ( q->default_value ) out[ DEFAULT ] = make_node_from( *q->default_value );
    if ( q->min ) out[ MIN ] = make_node_from( *q->min );
    if ( q->max ) out[ MAX ] = make_node_from( *q->max );
  }
  else if ( const auto* q = std::get_if< ConfirmQuestion >( &k ) ) {
    out[ DEFAULT ] = make_node_from( q->default_value );
  }
  else if ( const auto* q = std::get_if< ListQuestion >( &k ) ) {
    if ( const auto* ie = std::get_if< IntElements >( &q->element ) ) {
      out[ ELEMENT ] = make_node_from( std::string("int") );
      if ( ie->min ) out[ MIN ] = make_node_from( *ie->min );
      if ( ie->max ) out[ MAX ] = make_node_from( *ie->max );
    }
    else if ( const auto* fe = std::get_if< FloatElements >( &q->element ) ) {
      out[ ELEMENT ] = make_node_from( std::string("float") );
      if ( fe->min ) out[ MIN ] = make_node_from( *fe->min );
      if ( fe->max ) out[ MAX ] = make_node_from( *fe->max );
    }
    else {
      out[ ELEMENT ] = make_node_from( std::string("text") );
    }
    if ( q->min_items ) {
      out[ MIN_ITEMS ] = make_node_from(
        static_cast< std::int64_t >( *q->min_items ) );
    }
    if ( q->max_items ) {
      out[ MAX_ITEMS ] = make_node_from(
        static_cast< std::int64_t >( *q->max_items ) );
    }
  }
  else if ( const auto* q = std::get_if< AllOfQuestion >( &k ) ) {
    std::vector< ordered_node > qs;
    for ( const auto& child : q->questions ) {
      qs.push_back( question_to_yaml(child) );
    }
    out[ QUESTIONS ] = make_node_from( qs );
  }
  else if ( is_structural(k) ) {
    const std::vector< Variant >* variants = nullptr;
    if ( const auto* one = std::get_if< OneOfQuestion >( &k ) ) {
      variants = &one->variants;
      if ( one->default_index ) {
        out[ DEFAULT ] = make_node_from(
          static_cast< std::int64_t >( *one->default_index ) );
      }
    }
    else {
      const auto& any = std::get< AnyOfQuestion >( k );
      variants = &any.variants;
      if ( !any.default_indices.empty() ) {
        out[ DEFAULTS ] = value_to_node( chosen_set(any.default_indices) );
      }
    }

    std::vector< ordered_node > vs;
    for ( const auto& v : *variants ) {
      ordered_node vn = ordered_node::mapping();
      vn[ NAME ] = make_node_from( v.name );
      kind_to_yaml( v.kind, vn );
      vs.push_back( vn );
    }
    out[ VARIANTS ] = make_node_from( vs );
  }
}

inline elicitor::ordered_node elicitor::internal::question_to_yaml(
  const Question& q )
{
  ordered_node out = ordered_node::mapping();
  if ( q.path().size() == 1 ) {
    out[ PATH ] = make_node_from( *q.path().first() );
  }
  else if ( !q.path().empty() ) {
    std::vector< ordered_node > segs;
    for ( const auto& s : q.path().segments() ) {
      segs.push_back( make_node_from(s) );
    }
    out[ PATH ] = make_node_from( segs );
  }
  out[ ASK ] = make_node_from( q.ask() );
  kind_to_yaml( q.kind(), out );

  const DefaultValue& d = q.default_value();
  if ( d.is_suggested() ) out[ SUGGESTED ] = value_to_node( *d.value() );
  if ( d.is_assumed() ) out[ ASSUMED ] = value_to_node( *d.value() );
  return out;
}

inline elicitor::ordered_node elicitor::survey_to_yaml(
  const SurveyDefinition& def )
{
  using namespace internal;

  ordered_node out = ordered_node::mapping();
  if ( def.prelude ) out[ PRELUDE ] = make_node_from( *def.prelude );

  std::vector< ordered_node > qs;
  for ( const auto& q : def.questions ) qs.push_back( question_to_yaml(q) );
  out[ QUESTIONS ] = make_node_from( qs );

  if ( def.epilogue ) out[ EPILOGUE ] = make_node_from( *def.epilogue );
  return out;
}

inline elicitor::ordered_node elicitor::process_document(
  const ordered_node& doc, std::ostream* log )
{
  using namespace internal;

  if ( !doc.is_mapping() || !doc.contains(SURVEY) ) {
    throw std::runtime_error( "root: expected a mapping with a '" + SURVEY
      + "' key" );
  }

  SurveyDefinition fresh = survey_from_yaml( doc.at(SURVEY) );

  // Every store is read against the unmerged tree, which still holds the
  // questions that assumptions are about to prune
  Overrides overrides;
  if ( doc.contains(SUGGESTIONS) ) {
    for ( const auto& [p, v] : store_from_yaml(doc.at(SUGGESTIONS), fresh) ) {
      overrides.suggest( p, v );
    }
  }
  if ( doc.contains(ASSUMPTIONS) ) {
    for ( const auto& [p, v] : store_from_yaml(doc.at(ASSUMPTIONS), fresh) ) {
      overrides.assume( p, v );
    }
  }
  std::optional< ResponseStore > answers;
  if ( doc.contains(ANSWERS) ) {
    answers = store_from_yaml( doc.at(ANSWERS), fresh );
  }
  if ( log ) {
    *log << "[elicitor] " << fresh.size() << " top-level questions, "
      << overrides.suggestions.size() << " suggestions, "
      << overrides.assumptions.size() << " assumptions\n";
  }

  MergeResult merged = merge_overrides( std::move(fresh), overrides );

  ordered_node out = ordered_node::mapping();
  out[ SURVEY ] = survey_to_yaml( merged.definition );

  if ( !answers ) {
    out[ SEEDED ] = store_to_yaml( merged.seeded );
    return out;
  }

  ScriptedBackend backend( std::move(*answers) );
  if ( doc.contains(CANCEL_AT) ) {
    const ordered_node& c = doc.at( CANCEL_AT );
    std::vector< std::string > segs;
    if ( c.is_sequence() ) {
      for ( std::size_t i = 0; i < c.size(); ++i ) {
        segs.push_back( to_string_any(c.at(i)) );
      }
    }
    else {
      segs.push_back( to_string_any(c) );
    }
    backend.cancel_at( Path::from_segments(segs) );
  }

  ResponseStore full = merged.seeded;
  full.extend( backend.collect(merged.definition, Validators{}) );
  if ( log ) {
    *log << "[elicitor] collected " << full.size() << " responses\n";
  }
  out[ RESPONSES ] = store_to_yaml( full );
  return out;
}
