#pragma once

// Standard library includes
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "elicitor/errors.hh"
#include "elicitor/path.hh"
#include "elicitor/value.hh"

namespace elicitor {

  // All collected answers for one survey run, keyed structurally by Path.
  // Inserting the same path twice overwrites; an absent path is distinct
  // from a path holding empty text.
  class ResponseStore {
  public:

    using map_type = std::unordered_map< Path, Value >;
    using const_iterator = map_type::const_iterator;

    ResponseStore() = default;

    void insert( const Path& path, Value value );

    const Value* get( const Path& path ) const;

    bool contains( const Path& path ) const {
      return values_.count( path ) > 0;
    }

    bool erase( const Path& path ) { return values_.erase( path ) > 0; }

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // Merge another store into this one. Entries of other win on conflicts.
    void extend( const ResponseStore& other );

    // Entries whose path starts with prefix, with that prefix removed from
    // each retained key. Hands a nested schema exactly its own namespace.
    ResponseStore filter_prefix( const Path& prefix ) const;

    // Typed accessors. These are the only sanctioned way validators and
    // reconstruction logic read the store. Absent paths throw
    // MissingResponse, a different tag throws TypeMismatch.
    const std::string& get_text( const Path& path ) const;
    std::int64_t get_int( const Path& path ) const;
    double get_float( const Path& path ) const;
    bool get_bool( const Path& path ) const;
    std::size_t get_chosen_variant( const Path& path ) const;
    const std::vector< std::size_t >& get_chosen_variant_set(
      const Path& path ) const;
    const StringList& get_string_list( const Path& path ) const;
    const IntList& get_int_list( const Path& path ) const;
    const FloatList& get_float_list( const Path& path ) const;

    // False if absent or if the stored text is empty (optional fields)
    bool has_value( const Path& path ) const;

    // Keys in path order, for deterministic output
    std::vector< Path > sorted_paths() const;

    const_iterator begin() const { return values_.begin(); }
    const_iterator end() const { return values_.end(); }

    friend bool operator==( const ResponseStore& a, const ResponseStore& b ) {
      return a.values_ == b.values_;
    }
    friend bool operator!=( const ResponseStore& a, const ResponseStore& b ) {
      return !( a == b );
    }

  private:

    template < typename T >
    const T& typed_get( const Path& path, const char* expected ) const;

    map_type values_;
  };

} // namespace elicitor

inline void elicitor::ResponseStore::insert( const Path& path, Value value ) {
  values_[ path ] = std::move( value );
}

inline const elicitor::Value* elicitor::ResponseStore::get(
  const Path& path ) const
{
  auto it = values_.find( path );
  if ( it == values_.end() ) return nullptr;
  return &it->second;
}

inline void elicitor::ResponseStore::extend( const ResponseStore& other ) {
  for ( const auto& [p, v] : other.values_ ) {
    values_[ p ] = v;
  }
}

inline elicitor::ResponseStore elicitor::ResponseStore::filter_prefix(
  const Path& prefix ) const
{
  ResponseStore filtered;
  for ( const auto& [p, v] : values_ ) {
    if ( auto stripped = p.strip_prefix(prefix) ) {
      filtered.values_[ *stripped ] = v;
    }
  }
  return filtered;
}

template < typename T >
inline const T& elicitor::ResponseStore::typed_get( const Path& path,
  const char* expected ) const
{
  const Value* v = this->get( path );
  if ( !v ) throw MissingResponse( path );
  const T* typed = std::get_if< T >( v );
  if ( !typed ) throw TypeMismatch( path, expected, type_name(*v) );
  return *typed;
}

inline const std::string& elicitor::ResponseStore::get_text(
  const Path& path ) const
{
  return typed_get< std::string >( path, "Text" );
}

inline std::int64_t elicitor::ResponseStore::get_int( const Path& path ) const
{
  return typed_get< std::int64_t >( path, "Int" );
}

inline double elicitor::ResponseStore::get_float( const Path& path ) const {
  return typed_get< double >( path, "Float" );
}

inline bool elicitor::ResponseStore::get_bool( const Path& path ) const {
  return typed_get< bool >( path, "Bool" );
}

inline std::size_t elicitor::ResponseStore::get_chosen_variant(
  const Path& path ) const
{
  return typed_get< ChosenVariant >( path, "ChosenVariant" ).index;
}

inline const std::vector< std::size_t >&
  elicitor::ResponseStore::get_chosen_variant_set( const Path& path ) const
{
  return typed_get< ChosenVariants >( path, "ChosenVariants" ).indices;
}

inline const elicitor::StringList& elicitor::ResponseStore::get_string_list(
  const Path& path ) const
{
  return typed_get< StringList >( path, "StringList" );
}

inline const elicitor::IntList& elicitor::ResponseStore::get_int_list(
  const Path& path ) const
{
  return typed_get< IntList >( path, "IntList" );
}

inline const elicitor::FloatList& elicitor::ResponseStore::get_float_list(
  const Path& path ) const
{
  return typed_get< FloatList >( path, "FloatList" );
}

inline bool elicitor::ResponseStore::has_value( const Path& path ) const {
  const Value* v = this->get( path );
  if ( !v ) return false;
  if ( const auto* s = std::get_if< std::string >( v ) ) return !s->empty();
  return true;
}

inline std::vector< elicitor::Path >
  elicitor::ResponseStore::sorted_paths() const
{
  std::vector< Path > out;
  out.reserve( values_.size() );
  for ( const auto& kv : values_ ) out.push_back( kv.first );
  std::sort( out.begin(), out.end() );
  return out;
}
