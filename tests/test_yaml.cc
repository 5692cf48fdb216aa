#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "elicitor/yaml.hh"
#include "schemas.hh"

using namespace elicitor;

namespace {

  ordered_node parse( const std::string& text ) {
    return ordered_node::deserialize( text );
  }

  const char* const SURVEY_DOC = R"(
survey:
  prelude: Tell us about yourself
  questions:
    - path: name
      ask: What is your name?
      kind: input
    - path: age
      ask: How old are you?
      kind: int
      min: 0
      max: 150
    - path: contact
      ask: How can we reach you?
      kind: one_of
      default: 0
      variants:
        - name: Nobody
        - name: Email
          kind: input
        - name: Phone
          kind: all_of
          questions:
            - path: number
              ask: Number?
              kind: input
            - path: evenings
              ask: Evenings ok?
              kind: confirm
)";

} // anonymous namespace

TEST_CASE( "nested mappings become path segments", "[yaml]" ) {
  const ResponseStore store = store_from_yaml( parse(R"(
name: Ada
age: 36
ratio: 0.5
admin: false
features:
  selected_variants: [0, 1]
  1:
    email: true
payment:
  selected_variant: 2
  0: SPRING24
)") );

  const Path features = schemas::features_path();
  REQUIRE( store.size() == 8 );
  REQUIRE( store.get_text(Path::root("name")) == "Ada" );
  REQUIRE( store.get_int(Path::root("age")) == 36 );
  REQUIRE( store.get_float(Path::root("ratio")) == Approx(0.5) );
  REQUIRE_FALSE( store.get_bool(Path::root("admin")) );
  REQUIRE( store.get_chosen_variant_set(features.child(SELECTED_VARIANTS))
    == std::vector< std::size_t >{ 0, 1 } );
  REQUIRE( store.get_bool(features.child(std::size_t(1)).child("email")) );
  REQUIRE( store.get_chosen_variant(
    schemas::payment_path().child(SELECTED_VARIANT)) == 2 );
  REQUIRE( store.get_text(schemas::payment_path().child(POSITIONAL))
    == "SPRING24" );
}

TEST_CASE( "sequences in store documents become lists", "[yaml]" ) {
  const ResponseStore store = store_from_yaml( parse(R"(
tags: [a, 7]
scores: [1, 2]
ratios: [1, 2.5]
)") );
  REQUIRE( store.get_string_list(Path::root("tags"))
    == StringList{ "a", "7" } );
  REQUIRE( store.get_int_list(Path::root("scores")) == IntList{ 1, 2 } );
  REQUIRE( store.get_float_list(Path::root("ratios"))
    == FloatList{ 1.0, 2.5 } );

  REQUIRE_THROWS_WITH( store_from_yaml(parse("tags: [[a]]\n")),
    Catch::Matchers::Contains("root.tags[0]") );
  REQUIRE_THROWS_WITH( store_from_yaml(parse("flags: [true]\n")),
    Catch::Matchers::Contains("root.flags[0]") );
}

TEST_CASE( "a store written to YAML reads back unchanged", "[yaml]" ) {
  ResponseStore store;
  schemas::Settings s;
  s.name = "Grace";
  s.age = 85;
  s.notifications = schemas::Settings::Notifications{ true, false };
  s.custom_theme = "solarized";
  schemas::Settings::to_responses( s, store );
  store.insert( Path::root("tags"), string_list({ "x", "y" }) );
  store.insert( Path::root("scores"), int_list({ 4, 5 }) );

  const ordered_node node = store_to_yaml( store );
  REQUIRE( node.at("features").at("1").at("email").get_value< bool >() );
  REQUIRE( store_from_yaml(node) == store );
}

TEST_CASE( "a store whose paths overlap cannot be written", "[yaml]" ) {
  ResponseStore store;
  store.insert( Path::root("a"), integer(1) );
  store.insert( Path::root("a").child("b"), integer(2) );
  REQUIRE_THROWS_AS( store_to_yaml(store), std::runtime_error );
}

TEST_CASE( "survey documents describe the question tree", "[yaml]" ) {
  const SurveyDefinition def = survey_from_yaml(
    parse(SURVEY_DOC).at("survey") );

  REQUIRE( def.prelude == std::optional< std::string >(
    "Tell us about yourself") );
  REQUIRE_FALSE( def.epilogue );
  REQUIRE( def.size() == 3 );

  const auto& age = std::get< IntQuestion >( def.questions[1].kind() );
  REQUIRE( age.min == std::optional< std::int64_t >(0) );
  REQUIRE( age.max == std::optional< std::int64_t >(150) );

  const auto& contact = std::get< OneOfQuestion >( def.questions[2].kind() );
  REQUIRE( contact.variants.size() == 3 );
  REQUIRE( contact.default_index == std::optional< std::size_t >(0) );
  REQUIRE( is_unit(contact.variants[0].kind) );
  REQUIRE( std::holds_alternative< InputQuestion >(contact.variants[1].kind) );
  REQUIRE( std::get< AllOfQuestion >(contact.variants[2].kind)
    .questions.size() == 2 );
}

TEST_CASE( "survey documents read back unchanged", "[yaml]" ) {
  const SurveyDefinition orders = schemas::OrderForm::survey();
  REQUIRE( survey_from_yaml(survey_to_yaml(orders)) == orders );

  const SurveyDefinition settings = schemas::Settings::survey();
  REQUIRE( survey_from_yaml(survey_to_yaml(settings)) == settings );

  Overrides ov;
  ov.suggest( Path::root("age"), integer(30) );
  ov.assume( Path::root("name"), text("Ada") );
  ov.suggest( schemas::features_path().child(SELECTED_VARIANTS),
    chosen_set({ 1 }) );
  const SurveyDefinition merged = merge_overrides( settings, ov ).definition;
  REQUIRE( survey_from_yaml(survey_to_yaml(merged)) == merged );
}

TEST_CASE( "malformed survey documents name the offending location",
  "[yaml]" )
{
  SECTION( "unknown kind" ) {
    REQUIRE_THROWS_WITH( survey_from_yaml(parse(R"(
questions:
  - path: a
    kind: input
  - path: b
    kind: bogus
)")), "root.questions[1].kind: unknown question kind 'bogus'" );
  }

  SECTION( "missing kind" ) {
    REQUIRE_THROWS_WITH( survey_from_yaml(parse(R"(
questions:
  - path: a
)")), Catch::Matchers::Contains("root.questions[0]: missing 'kind'") );
  }

  SECTION( "default variant out of range" ) {
    REQUIRE_THROWS_WITH( survey_from_yaml(parse(R"(
questions:
  - path: a
    kind: one_of
    default: 3
    variants:
      - name: X
)")), Catch::Matchers::Contains("root.questions[0].default") );
  }

  SECTION( "reserved path segment" ) {
    REQUIRE_THROWS_WITH( survey_from_yaml(parse(R"(
questions:
  - path: selected_variant
    kind: input
)")), Catch::Matchers::Contains("reserved") );
  }
}

TEST_CASE( "documents without answers report the pruned tree and seeds",
  "[yaml]" )
{
  const std::string doc = std::string( SURVEY_DOC ) + R"(
assumptions:
  name: Ada
  contact:
    selected_variant: 1
suggestions:
  age: 36
)";

  std::ostringstream log;
  const ordered_node out = process_document( parse(doc), &log );

  REQUIRE( out.contains("seeded") );
  REQUIRE_FALSE( out.contains("responses") );
  REQUIRE( out.at("seeded").at("name").get_value< std::string >() == "Ada" );
  REQUIRE( out.at("seeded").at("contact").at("selected_variant")
    .get_value< std::int64_t >() == 1 );

  const SurveyDefinition pruned = survey_from_yaml( out.at("survey") );
  REQUIRE( find_question(pruned, Path::root("name")) == nullptr );
  REQUIRE( find_question(pruned, Path::root("contact").child(POSITIONAL))
    != nullptr );
  REQUIRE( find_question(pruned, Path::root("age"))
    ->default_value().is_suggested() );
  REQUIRE_FALSE( log.str().empty() );
}

TEST_CASE( "documents with answers run a scripted collection", "[yaml]" ) {
  const std::string doc = std::string( SURVEY_DOC ) + R"(
answers:
  name: Ada
  age: 36
  contact:
    selected_variant: 2
    number: "555-0100"
    evenings: true
)";

  const ordered_node out = process_document( parse(doc) );
  const ResponseStore responses = store_from_yaml( out.at("responses") );
  REQUIRE( responses.get_text(Path::root("name")) == "Ada" );
  REQUIRE( responses.get_text(Path::root("contact").child("number"))
    == "555-0100" );
  REQUIRE( responses.get_bool(Path::root("contact").child("evenings")) );
}

TEST_CASE( "an unanswered question fails a scripted document", "[yaml]" ) {
  const std::string doc = std::string( SURVEY_DOC ) + R"(
answers:
  name: Ada
  age: 36
  contact:
    selected_variant: 2
    number: "555-0100"
)";
  REQUIRE_THROWS_WITH( process_document(parse(doc)),
    Catch::Matchers::Contains("'contact.evenings'") );
}

TEST_CASE( "document values are read as the kind of their question",
  "[yaml]" )
{
  SurveyDefinition shape;
  shape.questions.emplace_back( Path::root("zip"), "Zip code?",
    InputQuestion{} );
  shape.questions.emplace_back( Path::root("count"), "How many?",
    IntQuestion{} );

  SECTION( "a numeric-looking answer to an input question is text" ) {
    const ResponseStore store = store_from_yaml( parse("zip: 12345\n"),
      shape );
    REQUIRE( store.get_text(Path::root("zip")) == "12345" );
    REQUIRE( store_from_yaml(parse("zip: 12345\n"))
      .get_int(Path::root("zip")) == 12345 );
  }

  SECTION( "a value the kind cannot hold is located" ) {
    REQUIRE_THROWS_WITH( store_from_yaml(parse("count: many\n"), shape),
      "root.count: expected an integer" );
  }

  SECTION( "paths no question answers stay untyped" ) {
    const ResponseStore store = store_from_yaml( parse("other: 7\n"),
      shape );
    REQUIRE( store.get_int(Path::root("other")) == 7 );
  }

  SECTION( "variant data is typed by the variant's question" ) {
    const SurveyDefinition contact = survey_from_yaml(
      parse(SURVEY_DOC).at("survey") );
    const ResponseStore store = store_from_yaml( parse(R"(
contact:
  selected_variant: 1
  0: 5550100
)"), contact );
    REQUIRE( store.get_text(Path::root("contact").child(POSITIONAL))
      == "5550100" );
  }

  SECTION( "overrides and answers in a document" ) {
    const std::string doc = std::string( SURVEY_DOC ) + R"(
assumptions:
  name: 42
answers:
  age: 36
  contact:
    selected_variant: 1
    0: 5550100
)";
    const ordered_node out = process_document( parse(doc) );
    const ordered_node& responses = out.at( "responses" );
    REQUIRE( responses.at("name").get_value< std::string >() == "42" );
    REQUIRE( responses.at("contact").at("0").get_value< std::string >()
      == "5550100" );
  }
}

TEST_CASE( "list questions in documents", "[yaml]" ) {
  const char* const LIST_DOC = R"(
survey:
  questions:
    - path: tags
      ask: Tags?
      kind: list
      min_items: 1
    - path: scores
      ask: Scores?
      kind: list
      element: int
      min: 0
      max: 10
      max_items: 3
)";

  const SurveyDefinition def = survey_from_yaml(
    parse(LIST_DOC).at("survey") );
  REQUIRE( def.size() == 2 );
  const auto& tags = std::get< ListQuestion >( def.questions[0].kind() );
  REQUIRE( std::holds_alternative< TextElements >(tags.element) );
  REQUIRE( tags.min_items == std::optional< std::size_t >(1) );
  REQUIRE_FALSE( tags.max_items );
  const auto& scores = std::get< ListQuestion >( def.questions[1].kind() );
  REQUIRE( std::get< IntElements >(scores.element).max
    == std::optional< std::int64_t >(10) );
  REQUIRE( survey_from_yaml(survey_to_yaml(def)) == def );

  SECTION( "answers are typed by element" ) {
    const std::string doc = std::string( LIST_DOC ) + R"(
answers:
  tags: [red, 7]
  scores: [1, 2]
)";
    const ResponseStore responses = store_from_yaml(
      process_document(parse(doc)).at("responses") );
    REQUIRE( responses.get_string_list(Path::root("tags"))
      == StringList{ "red", "7" } );
    REQUIRE( responses.get_int_list(Path::root("scores")) == IntList{ 1, 2 } );
  }

  SECTION( "element bounds apply to every item" ) {
    const std::string doc = std::string( LIST_DOC ) + R"(
answers:
  tags: [red]
  scores: [1, 20]
)";
    REQUIRE_THROWS_WITH( process_document(parse(doc)),
      Catch::Matchers::Contains("item 1: value must be at most 10") );
  }

  SECTION( "unknown element kind" ) {
    REQUIRE_THROWS_WITH( survey_from_yaml(parse(R"(
questions:
  - path: a
    kind: list
    element: date
)")), "root.questions[0].element: unknown list element 'date'" );
  }
}

TEST_CASE( "documents can script a cancellation", "[yaml]" ) {
  const std::string doc = std::string( SURVEY_DOC ) + R"(
answers:
  name: Ada
cancel_at: age
)";
  REQUIRE_THROWS_AS( process_document(parse(doc)), Cancelled );
}

TEST_CASE( "documents need a survey", "[yaml]" ) {
  REQUIRE_THROWS_AS( process_document(parse("answers: {}\n")),
    std::runtime_error );
}

TEST_CASE( "an assumed value in the survey document is seeded", "[yaml]" ) {
  const ordered_node out = process_document( parse(R"(
survey:
  questions:
    - path: name
      ask: Name?
      kind: input
      assumed: Ada
    - path: age
      ask: Age?
      kind: int
answers:
  age: 36
)") );

  const SurveyDefinition pruned = survey_from_yaml( out.at("survey") );
  REQUIRE( find_question(pruned, Path::root("name")) == nullptr );
  const ResponseStore responses = store_from_yaml( out.at("responses") );
  REQUIRE( responses.get_text(Path::root("name")) == "Ada" );
  REQUIRE( responses.get_int(Path::root("age")) == 36 );
}
