#pragma once

// Standard library includes
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "elicitor/errors.hh"
#include "elicitor/path.hh"
#include "elicitor/question.hh"
#include "elicitor/responses.hh"
#include "elicitor/validation.hh"

namespace elicitor {

  // A presentation surface (wizard, form, ...) that walks a possibly pruned
  // tree and returns a store answering every remaining question.
  // Validation failures stay inside the surface's retry loop; only
  // Cancelled and BackendFailure escape.
  class SurveyBackend {
  public:
    virtual ~SurveyBackend() = default;

    virtual ResponseStore collect( const SurveyDefinition& definition,
      const Validators& validators ) const = 0;
  };

  // Non-interactive surface answering from pre-configured responses keyed
  // by absolute path. A scripted answer cannot be retried, so a rejected
  // answer fails the run.
  class ScriptedBackend : public SurveyBackend {
  public:
    ScriptedBackend() = default;
    explicit ScriptedBackend( ResponseStore answers )
      : answers_( std::move(answers) ) {}

    ScriptedBackend& answer( const Path& path, Value value ) {
      answers_.insert( path, std::move(value) );
      return *this;
    }

    // Simulate the user aborting when this path is reached
    ScriptedBackend& cancel_at( const Path& path ) {
      cancel_at_ = path;
      return *this;
    }

    ResponseStore collect( const SurveyDefinition& definition,
      const Validators& validators ) const override;

  private:

    // State of one collect() call
    struct Run {
      const Validators& validators;
      ResponseStore out;
      std::vector< Path > answered;
    };

    void walk( Run& run, const std::vector< Question >& questions,
      const Path& base ) const;
    void ask_leaf( Run& run, const Question& q, const Path& abs ) const;
    void ask_one_of( Run& run, const Question& q, const Path& abs ) const;
    void ask_any_of( Run& run, const Question& q, const Path& abs ) const;

    // Scripted answer, else the question's suggestion, else nothing. The
    // kind's presentation defaults are never used: an unscripted question
    // fails the run.
    std::optional< Value > lookup( const Path& p, const Question& q ) const;

    void record( Run& run, const Path& p, Value v ) const;
    void check_cancel( const Path& p ) const;

    ResponseStore answers_;
    std::optional< Path > cancel_at_;
  };

namespace internal {

  // Tag a leaf kind expects, or nullptr when the kind takes no answer
  inline const char* expected_tag( const QuestionKind& k ) {
    if ( std::holds_alternative< InputQuestion >( k )
      || std::holds_alternative< MultilineQuestion >( k )
      || std::holds_alternative< MaskedQuestion >( k ) ) return "Text";
    if ( std::holds_alternative< IntQuestion >( k ) ) return "Int";
    if ( std::holds_alternative< FloatQuestion >( k ) ) return "Float";
    if ( std::holds_alternative< ConfirmQuestion >( k ) ) return "Bool";
    if ( const auto* lq = std::get_if< ListQuestion >( &k ) ) {
      if ( std::holds_alternative< IntElements >( lq->element ) ) {
        return "IntList";
      }
      if ( std::holds_alternative< FloatElements >( lq->element ) ) {
        return "FloatList";
      }
      return "StringList";
    }
    return nullptr;
  }

} // namespace elicitor::internal

} // namespace elicitor

inline elicitor::ResponseStore elicitor::ScriptedBackend::collect(
  const SurveyDefinition& definition, const Validators& validators ) const
{
  Run run{ validators, ResponseStore(), {} };
  try {
    this->walk( run, definition.questions, Path() );
  }
  catch ( const SurveyError& ) {
    throw;
  }
  catch ( const std::runtime_error& ) {
    throw BackendFailure::wrap_current( "scripted collection failed" );
  }

  // Submission-time pass over everything answered
  ErrorMap errors = validators.dispatch( run.out, run.answered );
  if ( !errors.empty() ) {
    std::ostringstream oss;
    oss << "validation failed:";
    for ( const auto& [p, msg] : errors ) {
      oss << " '" << p.display() << "': " << msg << ";";
    }
    throw BackendFailure( oss.str() );
  }
  return run.out;
}

inline void elicitor::ScriptedBackend::walk( Run& run,
  const std::vector< Question >& questions, const Path& base ) const
{
  for ( const auto& q : questions ) {
    if ( q.is_assumed() ) continue;
    const Path abs = base.join( q.path() );
    const QuestionKind& k = q.kind();

    if ( is_unit(k) ) continue;
    if ( const auto* all = std::get_if< AllOfQuestion >( &k ) ) {
      this->walk( run, all->questions, abs );
    }
    else if ( std::holds_alternative< OneOfQuestion >( k ) ) {
      this->ask_one_of( run, q, abs );
    }
    else if ( std::holds_alternative< AnyOfQuestion >( k ) ) {
      this->ask_any_of( run, q, abs );
    }
    else {
      this->ask_leaf( run, q, abs );
    }
  }
}

inline void elicitor::ScriptedBackend::ask_leaf( Run& run, const Question& q,
  const Path& abs ) const
{
  this->check_cancel( abs );

  std::optional< Value > v = this->lookup( abs, q );
  if ( !v ) {
    throw BackendFailure( "no scripted answer for '" + abs.display() + "'" );
  }

  // Whole numbers are acceptable answers to a float question
  if ( std::holds_alternative< FloatQuestion >( q.kind() ) ) {
    if ( const auto* i = std::get_if< std::int64_t >( &*v ) ) {
      v = real( static_cast< double >( *i ) );
    }
  }
  else if ( const auto* lq = std::get_if< ListQuestion >( &q.kind() ) ) {
    const auto* is = std::get_if< IntList >( &*v );
    if ( is && std::holds_alternative< FloatElements >( lq->element ) ) {
      v = float_list( FloatList(is->begin(), is->end()) );
    }
  }

  const char* expected = internal::expected_tag( q.kind() );
  if ( expected && std::string( type_name(*v) ) != expected ) {
    std::ostringstream oss;
    oss << "scripted answer for '" << abs.display() << "' is "
      << type_name( *v ) << ", expected " << expected;
    throw BackendFailure( oss.str() );
  }

  if ( auto msg = check_bounds(q.kind(), *v) ) {
    throw BackendFailure( "answer for '" + abs.display() + "' rejected: "
      + *msg );
  }
  this->record( run, abs, std::move(*v) );
}

inline void elicitor::ScriptedBackend::ask_one_of( Run& run,
  const Question& q, const Path& abs ) const
{
  const Path sel = abs.child( SELECTED_VARIANT );
  this->check_cancel( sel );

  const auto& one_of = std::get< OneOfQuestion >( q.kind() );
  std::optional< Value > v = this->lookup( sel, q );
  const auto* choice = v ? std::get_if< ChosenVariant >( &*v ) : nullptr;
  if ( !choice ) {
    throw BackendFailure( "no variant chosen for '" + abs.display() + "'" );
  }
  if ( choice->index >= one_of.variants.size() ) {
    std::ostringstream oss;
    oss << "variant " << choice->index << " chosen for '" << abs.display()
      << "' does not exist";
    throw BackendFailure( oss.str() );
  }

  const std::size_t idx = choice->index;
  this->record( run, sel, std::move(*v) );
  this->walk( run, variant_data_questions(one_of.variants[idx]),
    variant_base(abs, q.kind(), idx) );
}

inline void elicitor::ScriptedBackend::ask_any_of( Run& run,
  const Question& q, const Path& abs ) const
{
  const Path sel = abs.child( SELECTED_VARIANTS );
  this->check_cancel( sel );

  const auto& any_of = std::get< AnyOfQuestion >( q.kind() );
  std::optional< Value > v = this->lookup( sel, q );
  const auto* choices = v ? std::get_if< ChosenVariants >( &*v ) : nullptr;
  if ( !choices ) {
    throw BackendFailure( "no variant set chosen for '" + abs.display()
      + "'" );
  }
  std::vector< bool > seen( any_of.variants.size(), false );
  for ( std::size_t idx : choices->indices ) {
    std::ostringstream oss;
    if ( idx >= any_of.variants.size() ) {
      oss << "variant " << idx << " chosen for '" << abs.display()
        << "' does not exist";
      throw BackendFailure( oss.str() );
    }
    if ( seen[idx] ) {
      oss << "variant " << idx << " chosen twice for '" << abs.display()
        << "'";
      throw BackendFailure( oss.str() );
    }
    seen[ idx ] = true;
  }

  const std::vector< std::size_t > indices = choices->indices;
  this->record( run, sel, std::move(*v) );
  for ( std::size_t idx : indices ) {
    this->walk( run, variant_data_questions(any_of.variants[idx]),
      variant_base(abs, q.kind(), idx) );
  }
}

inline std::optional< elicitor::Value > elicitor::ScriptedBackend::lookup(
  const Path& p, const Question& q ) const
{
  if ( const Value* v = answers_.get(p) ) return *v;
  if ( q.default_value().is_suggested() ) return *q.default_value().value();
  return std::nullopt;
}

inline void elicitor::ScriptedBackend::record( Run& run, const Path& p,
  Value v ) const
{
  // Validators judge the value in place, with every earlier answer visible
  run.out.insert( p, std::move(v) );
  if ( auto msg = run.validators.check_field(p, run.out) ) {
    throw BackendFailure( "answer for '" + p.display() + "' rejected: "
      + *msg );
  }
  run.answered.push_back( p );
}

inline void elicitor::ScriptedBackend::check_cancel( const Path& p ) const {
  if ( cancel_at_ && *cancel_at_ == p ) {
    throw Cancelled( "survey cancelled at '" + p.display() + "'" );
  }
}
