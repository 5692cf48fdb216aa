#pragma once

// Standard library includes
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "elicitor/path.hh"
#include "elicitor/question.hh"
#include "elicitor/responses.hh"

namespace elicitor {

  // Path-keyed validation messages, ordered for stable reporting
  using ErrorMap = std::map< Path, std::string >;

  // Judges the value at path. The full store is passed as context so that a
  // validator may compare against sibling fields. Returns a message on
  // failure.
  using FieldValidator = std::function<
    std::optional< std::string >( const Path&, const ResponseStore& ) >;

  // Judges the whole survey at once; may report any number of failures
  using CompositeValidator = std::function< ErrorMap( const ResponseStore& ) >;

  // Both validator shapes, used identically by wizard-style and form-style
  // surfaces. Validators only read the store.
  struct Validators {
    FieldValidator field;
    CompositeValidator composite;

    std::optional< std::string > check_field( const Path& path,
      const ResponseStore& store ) const
    {
      if ( !field ) return std::nullopt;
      return field( path, store );
    }

    ErrorMap check_all( const ResponseStore& store ) const {
      if ( !composite ) return {};
      return composite( store );
    }

    // One validation pass: field validators first (for every listed path
    // present in the store), then the composite validator. Composite
    // results overwrite field results for the same path.
    ErrorMap dispatch( const ResponseStore& store,
      const std::vector< Path >& paths ) const;
  };

  // Absolute paths a form-style surface validates per pass: every leaf
  // question reachable without a variant choice, plus the selection key of
  // each OneOf/AnyOf, in traversal order
  inline std::vector< Path > answerable_paths( const SurveyDefinition& def ) {
    std::vector< Path > out;
    for_each_question( def.questions, Path(),
      [&out]( const Path& abs, const Question& q ) {
        const QuestionKind& k = q.kind();
        if ( std::holds_alternative< OneOfQuestion >( k ) ) {
          out.push_back( abs.child(SELECTED_VARIANT) );
        }
        else if ( std::holds_alternative< AnyOfQuestion >( k ) ) {
          out.push_back( abs.child(SELECTED_VARIANTS) );
        }
        else if ( !is_structural(k) && !is_unit(k) ) {
          out.push_back( abs );
        }
      } );
    return out;
  }

} // namespace elicitor

inline elicitor::ErrorMap elicitor::Validators::dispatch(
  const ResponseStore& store, const std::vector< Path >& paths ) const
{
  ErrorMap errors;
  for ( const auto& p : paths ) {
    if ( !store.contains(p) ) continue;
    if ( auto msg = this->check_field(p, store) ) errors[ p ] = *msg;
  }

  // Last write wins on the error map
  for ( auto& [p, msg] : this->check_all(store) ) {
    errors[ p ] = msg;
  }
  return errors;
}
