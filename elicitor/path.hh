#pragma once

// Standard library includes
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace elicitor {

  // Reserved segments layered on top of the generic addressing scheme.
  // A OneOf at path p stores its selection at p.selected_variant, an AnyOf
  // stores its selections at p.selected_variants, and data carried by a
  // single-field variant lives under p.0
  inline const std::string SELECTED_VARIANT = "selected_variant";
  inline const std::string SELECTED_VARIANTS = "selected_variants";
  inline const std::string POSITIONAL = "0";

  // Used only when rendering paths for diagnostics
  inline constexpr char PATH_DELIMITER = '.';

  // Immutable ordered sequence of segments naming one response. The empty
  // path (no segments) is the survey root.
  class Path {
  public:

    Path() = default;

    // Single-segment path. An empty name yields the root path.
    static Path root( const std::string& name );

    // Build a path from an explicit segment list (empty segments are
    // skipped)
    static Path from_segments( const std::vector< std::string >& segs );

    // Returns a new path with one more segment. Appending an empty name
    // returns an unchanged copy.
    Path child( const std::string& name ) const;
    Path child( std::size_t ordinal ) const;

    // Append every segment of another path
    Path join( const Path& other ) const;

    const std::vector< std::string >& segments() const { return segs_; }

    std::size_t size() const { return segs_.size(); }
    bool empty() const { return segs_.empty(); }

    std::optional< std::string > first() const;
    std::optional< std::string > last() const;

    // Drops the last segment (the root is its own parent)
    Path parent() const;

    bool starts_with( const Path& prefix ) const;

    // Leading segment removed iff it equals name
    std::optional< Path > strip_prefix( const std::string& name ) const;

    // Leading path removed iff every one of its segments matches
    std::optional< Path > strip_prefix( const Path& prefix ) const;

    // Dot-joined rendering for diagnostics. Never parse this back.
    std::string display() const;

    friend bool operator==( const Path& a, const Path& b ) {
      return a.segs_ == b.segs_;
    }
    friend bool operator!=( const Path& a, const Path& b ) {
      return !( a == b );
    }
    friend bool operator<( const Path& a, const Path& b ) {
      return a.segs_ < b.segs_;
    }

  private:
    std::vector< std::string > segs_;
  };

  inline std::ostream& operator<<( std::ostream& os, const Path& p ) {
    return os << p.display();
  }

} // namespace elicitor

namespace std {

  template <>
  struct hash< elicitor::Path > {
    std::size_t operator()( const elicitor::Path& p ) const noexcept {
      // boost::hash_combine style mixing over the segment sequence
      std::size_t seed = p.size();
      std::hash< std::string > h;
      for ( const auto& s : p.segments() ) {
        seed ^= h( s ) + 0x9e3779b97f4a7c15ULL + ( seed << 6 ) + ( seed >> 2 );
      }
      return seed;
    }
  };

} // namespace std

// Path member function definitions
inline elicitor::Path elicitor::Path::root( const std::string& name ) {
  Path p;
  if ( !name.empty() ) p.segs_.push_back( name );
  return p;
}

inline elicitor::Path elicitor::Path::from_segments(
  const std::vector< std::string >& segs )
{
  Path p;
  for ( const auto& s : segs ) {
    if ( !s.empty() ) p.segs_.push_back( s );
  }
  return p;
}

inline elicitor::Path elicitor::Path::child( const std::string& name ) const {
  Path p = *this;
  if ( !name.empty() ) p.segs_.push_back( name );
  return p;
}

inline elicitor::Path elicitor::Path::child( std::size_t ordinal ) const {
  return this->child( std::to_string(ordinal) );
}

inline elicitor::Path elicitor::Path::join( const Path& other ) const {
  Path p = *this;
  p.segs_.insert( p.segs_.end(), other.segs_.begin(), other.segs_.end() );
  return p;
}

inline std::optional< std::string > elicitor::Path::first() const {
  if ( segs_.empty() ) return std::nullopt;
  return segs_.front();
}

inline std::optional< std::string > elicitor::Path::last() const {
  if ( segs_.empty() ) return std::nullopt;
  return segs_.back();
}

inline elicitor::Path elicitor::Path::parent() const {
  Path p = *this;
  if ( !p.segs_.empty() ) p.segs_.pop_back();
  return p;
}

inline bool elicitor::Path::starts_with( const Path& prefix ) const {
  if ( prefix.segs_.size() > segs_.size() ) return false;
  for ( std::size_t i = 0; i < prefix.segs_.size(); ++i ) {
    if ( segs_[ i ] != prefix.segs_[ i ] ) return false;
  }
  return true;
}

inline std::optional< elicitor::Path > elicitor::Path::strip_prefix(
  const std::string& name ) const
{
  if ( segs_.empty() || segs_.front() != name ) return std::nullopt;
  Path p;
  p.segs_.assign( segs_.begin() + 1, segs_.end() );
  return p;
}

inline std::optional< elicitor::Path > elicitor::Path::strip_prefix(
  const Path& prefix ) const
{
  if ( !this->starts_with(prefix) ) return std::nullopt;
  Path p;
  p.segs_.assign( segs_.begin() + prefix.segs_.size(), segs_.end() );
  return p;
}

inline std::string elicitor::Path::display() const {
  std::string s;
  for ( std::size_t i = 0; i < segs_.size(); ++i ) {
    if ( i ) s += PATH_DELIMITER;
    s += segs_[ i ];
  }
  return s;
}
