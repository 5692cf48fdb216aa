#pragma once

// Standard library includes
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "elicitor/backend.hh"
#include "elicitor/merge.hh"
#include "elicitor/path.hh"
#include "elicitor/question.hh"
#include "elicitor/responses.hh"
#include "elicitor/validation.hh"

namespace elicitor {

  // A describable schema type T provides, as static members:
  //
  //   static SurveyDefinition survey();
  //   static T from_responses( const ResponseStore& );
  //   static std::optional< std::string > validate_field( const Path&,
  //     const ResponseStore& );
  //   static ErrorMap validate_all( const ResponseStore& );
  //
  // and, to seed overrides from an existing instance,
  //
  //   static void to_responses( const T&, ResponseStore& );
  //
  // from_responses is a pure projection: it may assume every non-assumed
  // question was answered and every assumed path was seeded.
  //
  // Types without validators can inherit these no-op versions.
  struct SurveyDefaults {
    static std::optional< std::string > validate_field( const Path&,
      const ResponseStore& )
    {
      return std::nullopt;
    }

    static ErrorMap validate_all( const ResponseStore& ) { return {}; }
  };

  // Collects suggestions and assumptions, then runs T's survey through a
  // backend and reconstructs the result
  template < typename T >
  class SurveyBuilder {
  public:

    SurveyBuilder& suggest( const Path& p, Value v ) {
      overrides_.suggest( p, std::move(v) );
      return *this;
    }

    SurveyBuilder& assume( const Path& p, Value v ) {
      overrides_.assume( p, std::move(v) );
      return *this;
    }

    // Every field of instance becomes an editable default
    SurveyBuilder& with_suggestions( const T& instance ) {
      ResponseStore flat;
      T::to_responses( instance, flat );
      for ( const auto& [p, v] : flat ) overrides_.suggest( p, v );
      return *this;
    }

    // Every field of instance becomes fixed; nothing is left to ask
    SurveyBuilder& with_assumptions( const T& instance ) {
      ResponseStore flat;
      T::to_responses( instance, flat );
      for ( const auto& [p, v] : flat ) overrides_.assume( p, v );
      return *this;
    }

    const Overrides& overrides() const { return overrides_; }

    // Fresh tree with the overrides applied, without collecting anything
    MergeResult prepare() const {
      return merge_overrides( T::survey(), overrides_ );
    }

    // Throws Cancelled or BackendFailure when the run does not complete
    T run( const SurveyBackend& backend ) const;

  private:
    Overrides overrides_;
  };

  template < typename T >
  SurveyBuilder< T > builder() {
    return SurveyBuilder< T >();
  }

  // Reconstruction helpers for enum-shaped data

  // Selected variant of the OneOf at path
  inline std::size_t read_one_of( const ResponseStore& store,
    const Path& path )
  {
    return store.get_chosen_variant( path.child(SELECTED_VARIANT) );
  }

  // Selected variants of the AnyOf at path
  inline const std::vector< std::size_t >& read_any_of(
    const ResponseStore& store, const Path& path )
  {
    return store.get_chosen_variant_set( path.child(SELECTED_VARIANTS) );
  }

  // Sub-store a OneOf variant's data is read from (fields by name, single
  // positional data under POSITIONAL)
  inline ResponseStore one_of_responses( const ResponseStore& store,
    const Path& path )
  {
    return store.filter_prefix( path );
  }

  // Sub-store of one selected AnyOf variant, namespaced by its ordinal
  inline ResponseStore any_of_responses( const ResponseStore& store,
    const Path& path, std::size_t ordinal )
  {
    return store.filter_prefix( path.child(ordinal) );
  }

} // namespace elicitor

template < typename T >
T elicitor::SurveyBuilder< T >::run( const SurveyBackend& backend ) const {
  const MergeResult merged = this->prepare();
  const ResponseStore& seeded = merged.seeded;

  // Validators see assumed values layered under the in-progress answers
  Validators validators;
  validators.field = [&seeded]( const Path& p, const ResponseStore& partial ) {
    ResponseStore view = seeded;
    view.extend( partial );
    return T::validate_field( p, view );
  };
  validators.composite = [&seeded]( const ResponseStore& partial ) {
    ResponseStore view = seeded;
    view.extend( partial );
    return T::validate_all( view );
  };

  ResponseStore full = seeded;
  full.extend( backend.collect(merged.definition, validators) );
  return T::from_responses( full );
}
