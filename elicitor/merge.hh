#pragma once

// Standard library includes
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "elicitor/path.hh"
#include "elicitor/question.hh"
#include "elicitor/responses.hh"
#include "elicitor/value.hh"

namespace elicitor {

  // Caller-supplied defaults keyed by absolute path. Ordered maps keep the
  // merge deterministic.
  struct Overrides {
    std::map< Path, Value > suggestions;
    std::map< Path, Value > assumptions;

    void suggest( const Path& p, Value v ) { suggestions[ p ] = std::move( v ); }
    void assume( const Path& p, Value v ) { assumptions[ p ] = std::move( v ); }

    bool empty() const { return suggestions.empty() && assumptions.empty(); }
  };

  // Tree exposed to a collection surface plus the assumed values that were
  // injected into the store ahead of collection
  struct MergeResult {
    SurveyDefinition definition;
    ResponseStore seeded;
  };

  // Overlay suggestions and assumptions onto a freshly produced tree
  MergeResult merge_overrides( SurveyDefinition fresh,
    const Overrides& overrides );

namespace internal {

  // Walks one sibling group. Children are evaluated first and pruned
  // afterwards so that dropping one never disturbs traversal of the rest.
  class Merger {
  public:
    Merger( const Overrides& ov, ResponseStore& seeded )
      : ov_( ov ), seeded_( seeded ) {}

    void merge_list( std::vector< Question >& questions, const Path& base );

  private:
    // Returns false when the question must be pruned
    bool merge_question( Question& q, const Path& abs );

    // Selection is known: replace the choice with the chosen data
    bool lower_one_of( Question& q, const Path& abs, const Value& selection );
    bool lower_any_of( Question& q, const Path& abs, const Value& selection );

    // Tag, range and uniqueness of a selection value destined for the
    // choice q. what names the override kind for the message.
    static void check_selection( const Question& q, const Path& sel,
      const Value& selection, const char* what );

    const Value* assumption_at( const Path& p ) const {
      auto it = ov_.assumptions.find( p );
      return it == ov_.assumptions.end() ? nullptr : &it->second;
    }

    const Value* suggestion_at( const Path& p ) const {
      auto it = ov_.suggestions.find( p );
      return it == ov_.suggestions.end() ? nullptr : &it->second;
    }

    [[noreturn]] static void throw_selection_error( const char* what,
      const Path& sel, const std::string& msg );

    const Overrides& ov_;
    ResponseStore& seeded_;
  };

} // namespace elicitor::internal

} // namespace elicitor

inline void elicitor::internal::Merger::merge_list(
  std::vector< Question >& questions, const Path& base )
{
  std::vector< bool > keep( questions.size(), true );
  for ( std::size_t i = 0; i < questions.size(); ++i ) {
    keep[ i ] = this->merge_question( questions[i],
      base.join(questions[i].path()) );
  }

  std::vector< Question > kept;
  kept.reserve( questions.size() );
  for ( std::size_t i = 0; i < questions.size(); ++i ) {
    if ( keep[i] ) kept.push_back( std::move(questions[i]) );
  }
  questions = std::move( kept );
}

inline bool elicitor::internal::Merger::merge_question( Question& q,
  const Path& abs )
{
  // "We already know this" beats "here's a hint"
  if ( const Value* assumed = this->assumption_at(abs) ) {
    q.set_assumption( *assumed );
    return false;
  }

  // An assumption the tree already carries is honoured like an override
  std::optional< Value > preset;
  if ( q.is_assumed() ) preset = *q.default_value().value();
  else if ( const Value* suggested = this->suggestion_at(abs) ) {
    q.set_suggestion( *suggested );
  }

  QuestionKind& kind = q.kind_mut();

  if ( std::holds_alternative< OneOfQuestion >( kind )
    || std::holds_alternative< AnyOfQuestion >( kind ) )
  {
    const bool one = std::holds_alternative< OneOfQuestion >( kind );
    const Path sel = abs.child( one ? SELECTED_VARIANT : SELECTED_VARIANTS );

    const Value* assumed = this->assumption_at( sel );
    if ( !assumed && preset ) {
      this->check_selection( q, sel, *preset, "assumption" );
      seeded_.insert( sel, *preset );
      assumed = &*preset;
    }
    if ( assumed ) {
      return one ? this->lower_one_of( q, abs, *assumed )
        : this->lower_any_of( q, abs, *assumed );
    }

    // The selection key is where a choice's default lives, so a
    // suggestion there replaces any suggestion at the question itself
    if ( const Value* suggested = this->suggestion_at(sel) ) {
      q.set_suggestion( *suggested );
    }
    if ( q.default_value().is_suggested() ) {
      this->check_selection( q, sel, *q.default_value().value(),
        "suggestion" );
    }
    return true;
  }

  if ( preset ) {
    seeded_.insert( abs, *preset );
    return false;
  }

  if ( auto* all = std::get_if< AllOfQuestion >( &kind ) ) {
    this->merge_list( all->questions, abs );
    return !all->questions.empty();
  }

  // Leaf questions stay unless assumed
  return true;
}

inline void elicitor::internal::Merger::check_selection( const Question& q,
  const Path& sel, const Value& selection, const char* what )
{
  std::size_t count = 0;
  std::vector< std::size_t > indices;
  if ( const auto* one = std::get_if< OneOfQuestion >( &q.kind() ) ) {
    const auto* choice = std::get_if< ChosenVariant >( &selection );
    if ( !choice ) {
      throw_selection_error( what, sel,
        std::string( "expected ChosenVariant, got " ) + type_name(selection) );
    }
    count = one->variants.size();
    indices.push_back( choice->index );
  }
  else {
    const auto* choices = std::get_if< ChosenVariants >( &selection );
    if ( !choices ) {
      throw_selection_error( what, sel,
        std::string( "expected ChosenVariants, got " )
        + type_name(selection) );
    }
    count = std::get< AnyOfQuestion >( q.kind() ).variants.size();
    indices = choices->indices;
  }

  std::vector< bool > seen( count, false );
  for ( std::size_t idx : indices ) {
    std::ostringstream oss;
    if ( idx >= count ) {
      oss << "variant index " << idx << " out of range (" << count
        << " variants)";
      throw_selection_error( what, sel, oss.str() );
    }
    if ( seen[idx] ) {
      oss << "variant index " << idx << " selected twice";
      throw_selection_error( what, sel, oss.str() );
    }
    seen[ idx ] = true;
  }
}

inline bool elicitor::internal::Merger::lower_one_of( Question& q,
  const Path& abs, const Value& selection )
{
  this->check_selection( q, abs.child(SELECTED_VARIANT), selection,
    "assumption" );
  const std::size_t idx = std::get< ChosenVariant >( selection ).index;

  // Data of a OneOf variant lives directly under the question's path
  std::vector< Question > data = variant_data_questions(
    std::get< OneOfQuestion >( q.kind() ).variants[idx] );
  q.kind_mut() = AllOfQuestion{ std::move(data) };
  q.clear_default();

  auto& all = std::get< AllOfQuestion >( q.kind_mut() );
  this->merge_list( all.questions, abs );
  return !all.questions.empty();
}

inline bool elicitor::internal::Merger::lower_any_of( Question& q,
  const Path& abs, const Value& selection )
{
  this->check_selection( q, abs.child(SELECTED_VARIANTS), selection,
    "assumption" );

  const auto& any_of = std::get< AnyOfQuestion >( q.kind() );
  std::vector< Question > groups;
  for ( std::size_t idx : std::get< ChosenVariants >( selection ).indices ) {
    const Variant& v = any_of.variants[ idx ];
    std::vector< Question > data = variant_data_questions( v );
    if ( data.empty() ) continue;

    // Each selected variant is namespaced under its ordinal
    groups.emplace_back( Path().child(idx), v.name,
      AllOfQuestion{ std::move(data) } );
  }
  q.kind_mut() = AllOfQuestion{ std::move(groups) };
  q.clear_default();

  auto& all = std::get< AllOfQuestion >( q.kind_mut() );
  this->merge_list( all.questions, abs );
  return !all.questions.empty();
}

[[noreturn]] inline void elicitor::internal::Merger::throw_selection_error(
  const char* what, const Path& sel, const std::string& msg )
{
  std::ostringstream oss;
  oss << what << " at '" << sel.display() << "': " << msg;
  throw std::invalid_argument( oss.str() );
}

inline elicitor::MergeResult elicitor::merge_overrides(
  SurveyDefinition fresh, const Overrides& overrides )
{
  MergeResult result;

  // Every assumption is injected, including ones that target data no
  // reachable question asks for
  for ( const auto& [p, v] : overrides.assumptions ) {
    result.seeded.insert( p, v );
  }

  // Assumptions carried by the tree itself are seeded during the walk
  internal::Merger merger( overrides, result.seeded );
  merger.merge_list( fresh.questions, Path() );
  result.definition = std::move( fresh );
  return result;
}
