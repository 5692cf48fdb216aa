#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "elicitor/validation.hh"
#include "schemas.hh"

using namespace elicitor;
using schemas::OrderForm;

namespace {

  Validators order_validators() {
    Validators v;
    v.field = &OrderForm::validate_field;
    v.composite = &OrderForm::validate_all;
    return v;
  }

} // anonymous namespace

TEST_CASE( "composite messages overwrite field messages for the same path",
  "[validation]" )
{
  const Path pw = Path::root( "password" );
  ResponseStore store;
  store.insert( pw, text("abc") );
  store.insert( Path::root("password_confirm"), text("abcdefgh") );

  const Validators v = order_validators();
  REQUIRE( v.check_field(pw, store) == std::optional< std::string >(
    "too short") );

  const ErrorMap errors = v.dispatch( store,
    { pw, Path::root("password_confirm") } );
  REQUIRE( errors.size() == 1 );
  REQUIRE( errors.at(pw) == "must match sibling" );
}

TEST_CASE( "field messages survive when the composite is silent",
  "[validation]" )
{
  const Path pw = Path::root( "password" );
  ResponseStore store;
  store.insert( pw, text("abc") );
  store.insert( Path::root("password_confirm"), text("abc") );

  const ErrorMap errors = order_validators().dispatch( store, { pw } );
  REQUIRE( errors.size() == 1 );
  REQUIRE( errors.at(pw) == "too short" );
}

TEST_CASE( "dispatch skips paths with no response", "[validation]" ) {
  const Path number = schemas::payment_path().child( "number" );
  ResponseStore store;

  // The field validator would throw MissingResponse if it were called
  const ErrorMap errors = order_validators().dispatch( store,
    { Path::root("password"), number } );
  REQUIRE( errors.empty() );
}

TEST_CASE( "field validators may compare against sibling responses",
  "[validation]" )
{
  Validators v;
  v.field = []( const Path& p, const ResponseStore& store )
    -> std::optional< std::string >
  {
    if ( p != Path::root("max") ) return std::nullopt;
    if ( store.get_int(p) < store.get_int(Path::root("min")) ) {
      return std::string( "max must not be below min" );
    }
    return std::nullopt;
  };

  ResponseStore store;
  store.insert( Path::root("min"), integer(10) );
  store.insert( Path::root("max"), integer(5) );
  REQUIRE( v.check_field(Path::root("max"), store) );
  REQUIRE_FALSE( v.check_field(Path::root("min"), store) );
}

TEST_CASE( "empty validators report nothing", "[validation]" ) {
  ResponseStore store;
  store.insert( Path::root("a"), integer(1) );

  const Validators v;
  REQUIRE_FALSE( v.check_field(Path::root("a"), store) );
  REQUIRE( v.check_all(store).empty() );
  REQUIRE( v.dispatch(store, { Path::root("a") }).empty() );
}

TEST_CASE( "answerable paths list leaves and selections in order",
  "[validation]" )
{
  const std::vector< Path > expected{
    Path::root( "customer" ),
    Path::root( "address" ).child( "street" ),
    Path::root( "address" ).child( "city" ),
    Path::root( "quantity" ),
    schemas::payment_path().child( SELECTED_VARIANT ),
    Path::root( "password" ),
    Path::root( "password_confirm" ),
  };
  REQUIRE( answerable_paths(OrderForm::survey()) == expected );

  const std::vector< Path > settings = answerable_paths(
    schemas::Settings::survey() );
  REQUIRE( settings.back()
    == schemas::features_path().child(SELECTED_VARIANTS) );
}
