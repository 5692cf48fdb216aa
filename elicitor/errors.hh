#pragma once

// Standard library includes
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

#include "elicitor/path.hh"

namespace elicitor {

  // Run-level failures surfaced to the caller of a collection surface
  class SurveyError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // The run ended before every question was answered
  class Cancelled : public SurveyError {
  public:
    Cancelled() : SurveyError( "survey cancelled by user" ) {}
    explicit Cancelled( const std::string& msg ) : SurveyError( msg ) {}
  };

  // I/O or presentation fault unrelated to input validity
  class BackendFailure : public SurveyError {
  public:
    explicit BackendFailure( const std::string& msg,
      std::exception_ptr cause = nullptr )
      : SurveyError( "backend failure: " + msg ), cause_( cause ) {}

    // Wrap the exception currently being handled
    static BackendFailure wrap_current( const std::string& context );

    std::exception_ptr cause() const { return cause_; }

  private:
    std::exception_ptr cause_;
  };

  // Store accessor misuse. These indicate a bug in reconstruction logic or
  // in how the store was populated, not a user-facing condition.
  class ResponseError : public std::logic_error {
  public:
    ResponseError( const std::string& msg, const Path& path )
      : std::logic_error( msg ), path_( path ) {}

    const Path& path() const { return path_; }

  private:
    Path path_;
  };

  class MissingResponse : public ResponseError {
  public:
    explicit MissingResponse( const Path& path )
      : ResponseError( "missing response for path '" + path.display() + "'",
        path ) {}
  };

  class TypeMismatch : public ResponseError {
  public:
    TypeMismatch( const Path& path, const std::string& expected,
      const std::string& actual )
      : ResponseError( compose(path, expected, actual), path ),
      expected_( expected ), actual_( actual ) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

  private:
    static std::string compose( const Path& path, const std::string& expected,
      const std::string& actual )
    {
      std::ostringstream oss;
      oss << "type mismatch at path '" << path.display() << "': expected "
        << expected << ", got " << actual;
      return oss.str();
    }

    std::string expected_;
    std::string actual_;
  };

} // namespace elicitor

inline elicitor::BackendFailure elicitor::BackendFailure::wrap_current(
  const std::string& context )
{
  std::exception_ptr ep = std::current_exception();
  std::string detail;
  try {
    if ( ep ) std::rethrow_exception( ep );
  }
  catch ( const std::exception& ex ) {
    detail = ex.what();
  }
  catch ( ... ) {
    detail = "unknown error";
  }
  if ( detail.empty() ) return BackendFailure( context, ep );
  return BackendFailure( context + " (" + detail + ")", ep );
}
