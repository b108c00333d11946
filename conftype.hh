//  conftype: typed decoding of YAML/JSON configuration trees
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the conftype authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace conftype {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Absolute instant, normalized to UTC
  using Timestamp = std::chrono::time_point< std::chrono::system_clock,
    std::chrono::microseconds >;

  // Relative calendar span. Weeks are folded into days.
  struct CalendarDuration {
    std::int64_t years = 0;
    std::int64_t months = 0;
    std::int64_t days = 0;
    std::int64_t hours = 0;
    std::int64_t minutes = 0;
    std::int64_t seconds = 0;

    bool operator==( const CalendarDuration& o ) const {
      return years == o.years && months == o.months && days == o.days
        && hours == o.hours && minutes == o.minutes && seconds == o.seconds;
    }
    bool operator!=( const CalendarDuration& o ) const { return !(*this == o); }
  };

  // Error taxonomy. Every diagnostic carries the path at which it was raised.
  enum class ErrorKind {
    Parse, // scalar literal could not be interpreted
    MalformedConfig, // tree shape does not match the descriptor
    MissingType, // descriptor itself is incomplete
    UnexpectedKeys, // strict mode rejected leftover mapping keys
    TypeConfig, // no union variant / subclass matched
    AmbiguousSubclass // more than one subclass matched
  };

  class ConfigException;
  using ConfigExceptionPtr = std::shared_ptr< const ConfigException >;

  class ConfigException : public std::runtime_error {
  public:
    ConfigException( ErrorKind kind, std::string path,
      const std::string& message,
      std::vector< ConfigExceptionPtr > causes = {} );

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& path() const noexcept { return path_; }

    // Per-candidate causes for composite diagnostics, in declaration or
    // registration order. Empty for leaf diagnostics.
    const std::vector< ConfigExceptionPtr >& causes() const noexcept {
      return causes_;
    }

    // Copy preserving the dynamic type, used when aggregating candidates
    virtual ConfigExceptionPtr clone() const;

  private:
    ErrorKind kind_;
    std::string path_;
    std::vector< ConfigExceptionPtr > causes_;
  };

  class ParseException : public ConfigException {
  public:
    ParseException( std::string path, const std::string& message )
      : ConfigException( ErrorKind::Parse, std::move(path), message ) {}

    ConfigExceptionPtr clone() const override {
      return std::make_shared< ParseException >( *this );
    }
  };

  class MalformedConfigException : public ConfigException {
  public:
    MalformedConfigException( std::string path, const std::string& message )
      : ConfigException( ErrorKind::MalformedConfig, std::move(path), message )
    {}

    ConfigExceptionPtr clone() const override {
      return std::make_shared< MalformedConfigException >( *this );
    }
  };

  class MissingTypeException : public ConfigException {
  public:
    explicit MissingTypeException( const std::string& message,
      std::string path = std::string() )
      : ConfigException( ErrorKind::MissingType, std::move(path), message ) {}

    ConfigExceptionPtr clone() const override {
      return std::make_shared< MissingTypeException >( *this );
    }
  };

  class UnexpectedKeysException : public ConfigException {
  public:
    UnexpectedKeysException( std::string path, const std::string& type_name,
      std::vector< std::string > keys );

    // Offending keys, sorted
    const std::vector< std::string >& keys() const noexcept { return keys_; }

    ConfigExceptionPtr clone() const override {
      return std::make_shared< UnexpectedKeysException >( *this );
    }

  private:
    std::vector< std::string > keys_;
  };

  class TypeConfigException : public ConfigException {
  public:
    TypeConfigException( std::string path, const std::string& message,
      std::vector< ConfigExceptionPtr > causes = {} )
      : ConfigException( ErrorKind::TypeConfig, std::move(path), message,
          std::move(causes) ) {}

    ConfigExceptionPtr clone() const override {
      return std::make_shared< TypeConfigException >( *this );
    }
  };

  class AmbiguousSubclassException : public ConfigException {
  public:
    AmbiguousSubclassException( std::string path, const std::string& base_name,
      std::vector< std::string > matches );

    // Names of every matching subclass in registration order
    const std::vector< std::string >& matches() const noexcept {
      return matches_;
    }

    ConfigExceptionPtr clone() const override {
      return std::make_shared< AmbiguousSubclassException >( *this );
    }

  private:
    std::vector< std::string > matches_;
  };

  // Self-describing result of a decode. Records keep the name of the type
  // they were decoded as so that unions and open bases can be bound later.
  class Value {
  public:
    using List = std::vector< Value >;
    using Map = std::vector< std::pair< std::string, Value > >;

    struct Enum {
      std::string type;
      std::string member;

      bool operator==( const Enum& o ) const {
        return type == o.type && member == o.member;
      }
    };

    struct Record {
      std::string type;
      Map fields; // declaration order
      bool tagged = false; // selected through an open polymorphic base

      const Value* find( const std::string& name ) const;

      // The tag is rendering metadata and does not take part in equality
      bool operator==( const Record& o ) const;
    };

    // Kept in the same order as the alternatives of data_
    enum class Kind { Null, Bool, Integer, Float, String, Timestamp, Duration,
      Enum, List, Map, Record };

    Value() = default;

    static Value from_bool( bool b );
    static Value from_int( std::int64_t i );
    static Value from_float( double d );
    static Value from_string( std::string s );
    static Value from_timestamp( Timestamp t );
    static Value from_duration( CalendarDuration d );
    static Value from_enum( std::string type, std::string member );
    static Value from_list( List items );
    static Value from_map( Map entries );
    static Value from_record( Record record );

    Kind kind() const noexcept { return static_cast< Kind >( data_.index() ); }
    bool is_null() const noexcept { return kind() == Kind::Null; }

    bool as_bool() const { return std::get< bool >( data_ ); }
    std::int64_t as_int() const { return std::get< std::int64_t >( data_ ); }
    double as_float() const { return std::get< double >( data_ ); }
    const std::string& as_string() const {
      return std::get< std::string >( data_ );
    }
    const Timestamp& as_timestamp() const {
      return std::get< Timestamp >( data_ );
    }
    const CalendarDuration& as_duration() const {
      return std::get< CalendarDuration >( data_ );
    }
    const Enum& as_enum() const { return std::get< Enum >( data_ ); }
    const List& as_list() const { return std::get< List >( data_ ); }
    const Map& as_map() const { return std::get< Map >( data_ ); }
    const Record& as_record() const { return std::get< Record >( data_ ); }

    // Indices of the alternatives picked by the tagged unions this value
    // was decoded through, innermost first. Excluded from equality.
    const std::vector< std::size_t >& union_choices() const noexcept {
      return union_choices_;
    }
    void push_union_choice( std::size_t index ) {
      union_choices_.push_back( index );
    }
    std::size_t pop_union_choice();

    friend bool operator==( const Value& a, const Value& b ) {
      return a.data_ == b.data_;
    }
    friend bool operator!=( const Value& a, const Value& b ) {
      return !( a == b );
    }

  private:
    std::variant< std::monostate, bool, std::int64_t, double, std::string,
      Timestamp, CalendarDuration, Enum, List, Map, Record > data_;
    std::vector< std::size_t > union_choices_;
  };

  enum class PrimitiveKind { Boolean, Integer, Float, String };

  class Descriptor;
  using DescriptorPtr = std::shared_ptr< const Descriptor >;

  // Deferred default, invoked only when a field is truly absent
  using DefaultFactory = std::function< Value() >;

  struct Field {
    std::string name;
    DescriptorPtr type;
    bool required = true; // absence is an error when no default exists
    std::optional< Value > default_value;
    DefaultFactory default_factory;

    // Required unless the type is Optional
    static Field make( std::string name, DescriptorPtr type );
    static Field with_default( std::string name, DescriptorPtr type,
      Value fallback );
    static Field with_factory( std::string name, DescriptorPtr type,
      DefaultFactory factory );

    bool has_default() const {
      return default_value.has_value() || static_cast< bool >( default_factory );
    }
  };

  struct EnumMember {
    std::string name;
    std::optional< Value > raw; // present for value-backed enumerations
  };

  // Immutable description of a decode target
  class Descriptor {
  public:
    enum class Kind { Primitive, Temporal, CalendarDuration, Optional,
      Sequence, Mapping, Record, Enumeration, TaggedUnion, OpenPolymorphic,
      Dynamic, Reference };

    static DescriptorPtr boolean();
    static DescriptorPtr integer();
    static DescriptorPtr integer_range( std::int64_t min, std::int64_t max );
    static DescriptorPtr floating();
    static DescriptorPtr string();
    static DescriptorPtr temporal();
    static DescriptorPtr calendar_duration();
    static DescriptorPtr optional( DescriptorPtr inner );
    static DescriptorPtr sequence( DescriptorPtr item );
    static DescriptorPtr mapping( DescriptorPtr value );
    static DescriptorPtr record( std::string name, std::vector< Field > fields );
    static DescriptorPtr enumeration( std::string name,
      std::vector< EnumMember > members );
    static DescriptorPtr tagged_union( std::vector< DescriptorPtr > variants );
    static DescriptorPtr open_polymorphic( std::string base );
    static DescriptorPtr dynamic();

    // Stand-in for a type whose descriptor is still being built, e.g., a
    // record that holds a list of itself. The target is looked up on use.
    static DescriptorPtr reference( std::string name,
      std::function< DescriptorPtr() > resolve );

    Kind kind() const noexcept { return kind_; }
    PrimitiveKind primitive() const noexcept { return primitive_; }
    bool is_optional() const noexcept { return kind_ == Kind::Optional; }

    // Optional inner type, sequence item type or mapping value type
    const DescriptorPtr& inner() const noexcept { return inner_; }

    // Record, enumeration or open base name
    const std::string& name() const noexcept { return name_; }

    const std::vector< Field >& fields() const noexcept { return fields_; }
    const std::vector< EnumMember >& members() const noexcept {
      return members_;
    }
    const std::vector< DescriptorPtr >& variants() const noexcept {
      return variants_;
    }

    // Inclusive bounds for integer primitives narrower than 64 bits
    const std::optional< std::pair< std::int64_t, std::int64_t > >&
      range() const noexcept { return range_; }

    // Descriptor a Reference stands for, null for every other kind
    DescriptorPtr target() const;

    // Rendering used in diagnostics, e.g., "List[Optional[string]]"
    std::string display_name() const;

  private:
    explicit Descriptor( Kind kind ) : kind_( kind ) {}

    static DescriptorPtr primitive_of( PrimitiveKind kind );

    Kind kind_;
    PrimitiveKind primitive_ = PrimitiveKind::String;
    DescriptorPtr inner_;
    std::string name_;
    std::vector< Field > fields_;
    std::vector< EnumMember > members_;
    std::vector< DescriptorPtr > variants_;
    std::optional< std::pair< std::int64_t, std::int64_t > > range_;
    std::function< DescriptorPtr() > resolve_;
  };

  // One concrete implementation of an open base
  struct Candidate {
    std::string name;
    DescriptorPtr record;
  };

  // Process-wide map from an open base name to its concrete record-shaped
  // descendants, in registration order. Lookups take a shared lock so that
  // late registrations cannot race concurrent decodes.
  class SubclassRegistry {
  public:
    static SubclassRegistry& global();

    void add( const std::string& base, Candidate candidate );

    // Snapshot of the current candidates for a base
    std::vector< Candidate > candidates( const std::string& base ) const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map< std::string, std::vector< Candidate > > table_;
  };

  // Process-wide cache of per-type entries (descriptors and binding
  // schemas). Each entry is built once, under a lock, and never evicted.
  class TypeCache {
  public:
    static TypeCache& global();

    // A request for a descriptor that is already under construction on this
    // thread yields a Reference to it instead of failing
    DescriptorPtr descriptor( std::type_index key, const std::string& label,
      const std::function< DescriptorPtr() >& build );

    template < typename Entry >
    std::shared_ptr< const Entry > entry( std::type_index key,
      const std::string& label,
      const std::function< std::shared_ptr< const Entry >() >& build )
    {
      return std::static_pointer_cast< const Entry >( lookup_or_build( key,
        label, [&build]() -> std::shared_ptr< const void > {
          return build();
        } ) );
    }

  private:
    DescriptorPtr resolve( std::type_index key, const std::string& label );

    std::shared_ptr< const void > lookup_or_build( std::type_index key,
      const std::string& label,
      const std::function< std::shared_ptr< const void >() >& build );

    std::recursive_mutex mutex_;
    std::unordered_map< std::type_index, std::shared_ptr< const void > >
      entries_;

    // Keys whose construction is in progress on the current call chain
    std::unordered_set< std::type_index > building_;
  };

  struct Options {
    // Default recursion-depth guard for deeply nested input
    static constexpr std::size_t DEFAULT_MAX_DEPTH = 256;

    // Unconsumed mapping keys raise UnexpectedKeysException when true and
    // are dropped silently when false
    bool strict_unexpected_keys = true;
    std::size_t max_depth = DEFAULT_MAX_DEPTH;
  };

  // Either a decoded value or the diagnostic that prevented it
  struct Result {
    std::optional< Value > value;
    ConfigExceptionPtr error;

    bool ok() const noexcept { return value.has_value(); }
  };

  class Decoder {
  public:
    explicit Decoder( Options options = Options(),
      const SubclassRegistry& registry = SubclassRegistry::global() )
      : options_( options ), registry_( &registry ) {}

    // Throws a ConfigException subclass on failure
    Value decode( const ordered_node& root, const DescriptorPtr& target ) const;

    // Same as decode(...), but returns the diagnostic instead of throwing it
    Result try_decode( const ordered_node& root,
      const DescriptorPtr& target ) const;

    const Options& options() const noexcept { return options_; }

  private:
    Options options_;
    const SubclassRegistry* registry_;

    Value decode_node( const ordered_node& node, const Descriptor& d,
      const std::string& path, std::size_t depth ) const;

    Value decode_primitive( const ordered_node& node, const Descriptor& d,
      const std::string& path ) const;
    Value decode_temporal( const ordered_node& node,
      const std::string& path ) const;
    Value decode_duration( const ordered_node& node,
      const std::string& path ) const;
    Value decode_sequence( const ordered_node& node, const Descriptor& d,
      const std::string& path, std::size_t depth ) const;
    Value decode_mapping( const ordered_node& node, const Descriptor& d,
      const std::string& path, std::size_t depth ) const;
    Value::Record decode_record( const ordered_node& node, const Descriptor& d,
      const std::string& path, std::size_t depth ) const;
    Value decode_enumeration( const ordered_node& node, const Descriptor& d,
      const std::string& path ) const;
    Value decode_union( const ordered_node& node, const Descriptor& d,
      const std::string& path, std::size_t depth ) const;
    Value decode_open( const ordered_node& node, const Descriptor& d,
      const std::string& path, std::size_t depth ) const;
    Value decode_dynamic( const ordered_node& node, const std::string& path,
      std::size_t depth ) const;

    // Default, "no value" or missing-required error for an absent field
    Value absent_field( const Field& field, const Descriptor& record,
      const std::string& path ) const;

    void check_depth( const std::string& path, std::size_t depth ) const;
  };

  // Parse YAML/JSON text into a value tree. Whitespace-only text yields an
  // empty mapping.
  ordered_node parse( const std::string& text );

  // Encode a decoded value back into a value tree
  ordered_node value_to_node( const Value& value );

namespace internal {

  // Reserved disambiguation key for open polymorphic decoding
  inline const std::string TYPE_KEY = "_type";
  inline constexpr char PATH_DELIMITER = '.';
  inline const std::string ROOT_LABEL = "<root>";

  // Append a record field or mapping key to a path
  inline std::string field_path( const std::string& base,
    const std::string& name )
  {
    return base + PATH_DELIMITER + name;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  // Paths are empty at the root, which reads badly inside a message
  inline const std::string& display_path( const std::string& path ) {
    return path.empty() ? ROOT_LABEL : path;
  }

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

  // Shortest text that reads back as the same double. A fractional part is
  // kept so that 1.0 and 1 stay distinct.
  inline std::string float_text( double d ) {
    if ( std::isnan(d) ) return ".nan";
    if ( std::isinf(d) ) return d < 0 ? "-.inf" : ".inf";
    char buf[ 32 ];
    auto [ptr, ec] = std::to_chars( buf, buf + sizeof(buf), d );
    if ( ec != std::errc() ) return std::to_string( d );
    std::string out( buf, ptr );
    if ( out.find_first_of(".e") == std::string::npos ) out += ".0";
    return out;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return float_text(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Shape name of a value tree node, used in "expected X, found Y" messages
  inline std::string node_kind( const ordered_node& n ) {
    if ( n.is_null() ) return "null";
    if ( n.is_boolean() ) return "boolean";
    if ( n.is_integer() ) return "integer";
    if ( n.is_float_number() ) return "float";
    if ( n.is_string() ) return "string";
    if ( n.is_sequence() ) return "sequence";
    if ( n.is_mapping() ) return "mapping";
    return "unknown";
  }

  inline std::string lowercase( std::string s ) {
    std::transform( s.begin(), s.end(), s.begin(), []( unsigned char c ) {
      return static_cast< char >( std::tolower(c) );
    } );
    return s;
  }

  inline std::optional< bool > parse_bool_literal( const std::string& s ) {
    const std::string lower = lowercase( s );
    if ( lower == "true" ) return true;
    if ( lower == "false" ) return false;
    return std::nullopt;
  }

  inline std::optional< std::int64_t > parse_int_literal( const std::string& s )
  {
    std::int64_t out = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars( s.data(), end, out );
    if ( s.empty() || ec != std::errc() || ptr != end ) return std::nullopt;
    return out;
  }

  inline std::optional< double > parse_float_literal( const std::string& s ) {
    if ( s.empty() ) return std::nullopt;
    char* end = nullptr;
    const double out = std::strtod( s.c_str(), &end );
    if ( end != s.c_str() + s.size() ) return std::nullopt;
    return out;
  }

  // Quote and join names for messages: "a", "b"
  inline std::string quoted_list( const std::vector< std::string >& names ) {
    std::ostringstream oss;
    for ( size_t i = 0; i < names.size(); ++i ) {
      if ( i ) oss << ", ";
      oss << '"' << names[ i ] << '"';
    }
    return oss.str();
  }

  // Header followed by one "- " line per item. Continuation lines of a
  // multi-line item are indented so nested composites stay readable.
  inline std::string bullet_lines( const std::string& header,
    const std::vector< std::string >& items )
  {
    std::string out = header;
    for ( const auto& item : items ) {
      out += "\n- ";
      for ( char c : item ) {
        out += c;
        if ( c == '\n' ) out += "  ";
      }
    }
    return out;
  }

  inline std::string shape_mismatch( const std::string& expected,
    const std::string& path, const ordered_node& found )
  {
    return "expected " + expected + " at " + display_path( path )
      + ", found " + node_kind( found );
  }

  // Civil calendar conversions (proleptic Gregorian, days relative to
  // 1970-01-01)
  inline std::int64_t days_from_civil( std::int64_t y, unsigned m, unsigned d )
  {
    y -= m <= 2;
    const std::int64_t era = ( y >= 0 ? y : y - 399 ) / 400;
    const unsigned yoe = static_cast< unsigned >( y - era * 400 );
    const unsigned doy = ( 153 * ( m > 2 ? m - 3 : m + 9 ) + 2 ) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast< std::int64_t >( doe ) - 719468;
  }

  struct CivilDate {
    std::int64_t year;
    unsigned month;
    unsigned day;
  };

  inline CivilDate civil_from_days( std::int64_t z ) {
    z += 719468;
    const std::int64_t era = ( z >= 0 ? z : z - 146096 ) / 146097;
    const unsigned doe = static_cast< unsigned >( z - era * 146097 );
    const unsigned yoe
      = ( doe - doe / 1460 + doe / 36524 - doe / 146096 ) / 365;
    const std::int64_t y = static_cast< std::int64_t >( yoe ) + era * 400;
    const unsigned doy = doe - ( 365 * yoe + yoe / 4 - yoe / 100 );
    const unsigned mp = ( 5 * doy + 2 ) / 153;
    const unsigned d = doy - ( 153 * mp + 2 ) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{ y + ( m <= 2 ), m, d };
  }

  inline unsigned days_in_month( std::int64_t y, unsigned m ) {
    static const unsigned table[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31,
      30, 31 };
    const bool leap = ( y % 4 == 0 && y % 100 != 0 ) || y % 400 == 0;
    return ( m == 2 && leap ) ? 29 : table[ m - 1 ];
  }

  // ISO-8601 date-time with a mandatory offset:
  // YYYY-MM-DD(T|t| )HH:MM:SS[.fraction](Z|z|+HH:MM|-HH:MM|+HHMM|-HHMM)
  inline std::optional< Timestamp > parse_timestamp( const std::string& text ) {
    std::size_t pos = 0;

    auto digits = [&]( std::size_t count, int& out ) -> bool {
      if ( pos + count > text.size() ) return false;
      int v = 0;
      for ( std::size_t i = 0; i < count; ++i ) {
        const char c = text[ pos + i ];
        if ( c < '0' || c > '9' ) return false;
        v = v * 10 + ( c - '0' );
      }
      pos += count;
      out = v;
      return true;
    };

    auto expect = [&]( char c ) -> bool {
      if ( pos < text.size() && text[pos] == c ) { ++pos; return true; }
      return false;
    };

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if ( !digits(4, year) || !expect('-') || !digits(2, month)
      || !expect('-') || !digits(2, day) ) return std::nullopt;

    if ( pos >= text.size() ) return std::nullopt;
    const char sep = text[ pos ];
    if ( sep != 'T' && sep != 't' && sep != ' ' ) return std::nullopt;
    ++pos;

    if ( !digits(2, hour) || !expect(':') || !digits(2, minute)
      || !expect(':') || !digits(2, second) ) return std::nullopt;

    // Fractional seconds are kept to microsecond resolution
    std::int64_t micros = 0;
    if ( expect('.') ) {
      std::size_t count = 0;
      std::int64_t scale = 100000;
      while ( pos < text.size()
        && std::isdigit( static_cast< unsigned char >(text[pos]) ) )
      {
        if ( count < 6 ) {
          micros += ( text[pos] - '0' ) * scale;
          scale /= 10;
        }
        ++count;
        ++pos;
      }
      if ( count == 0 ) return std::nullopt;
    }

    // The offset is mandatory
    if ( pos >= text.size() ) return std::nullopt;
    int offset_minutes = 0;
    if ( text[pos] == 'Z' || text[pos] == 'z' ) {
      ++pos;
    }
    else if ( text[pos] == '+' || text[pos] == '-' ) {
      const int sign = ( text[pos] == '-' ) ? -1 : 1;
      ++pos;
      int oh = 0, om = 0;
      if ( !digits(2, oh) ) return std::nullopt;
      expect( ':' );
      if ( !digits(2, om) ) return std::nullopt;
      if ( oh > 23 || om > 59 ) return std::nullopt;
      offset_minutes = sign * ( oh * 60 + om );
    }
    else {
      return std::nullopt;
    }
    if ( pos != text.size() ) return std::nullopt;

    if ( month < 1 || month > 12 ) return std::nullopt;
    if ( day < 1 || static_cast< unsigned >( day )
      > days_in_month( year, static_cast< unsigned >(month) ) )
      return std::nullopt;
    if ( hour > 23 || minute > 59 || second > 59 ) return std::nullopt;

    const std::int64_t days = days_from_civil( year,
      static_cast< unsigned >(month), static_cast< unsigned >(day) );
    const std::int64_t secs = days * 86400 + hour * 3600 + minute * 60
      + second - static_cast< std::int64_t >( offset_minutes ) * 60;
    return Timestamp( std::chrono::microseconds( secs * 1000000 + micros ) );
  }

  // Canonical UTC rendering, e.g., "1997-07-16T18:20:07Z". Fractional
  // seconds are printed only when present.
  inline std::string format_timestamp( const Timestamp& ts ) {
    constexpr std::int64_t US_PER_DAY = 86400LL * 1000000LL;
    const std::int64_t us = ts.time_since_epoch().count();
    std::int64_t days = us / US_PER_DAY;
    std::int64_t rem = us % US_PER_DAY;
    if ( rem < 0 ) { rem += US_PER_DAY; --days; }

    const CivilDate date = civil_from_days( days );
    const std::int64_t secs = rem / 1000000;
    const std::int64_t frac = rem % 1000000;

    std::ostringstream oss;
    oss << std::setfill( '0' ) << std::setw( 4 ) << date.year << '-'
      << std::setw( 2 ) << date.month << '-' << std::setw( 2 ) << date.day
      << 'T' << std::setw( 2 ) << secs / 3600 << ':'
      << std::setw( 2 ) << ( secs / 60 ) % 60 << ':'
      << std::setw( 2 ) << secs % 60;
    if ( frac ) oss << '.' << std::setw( 6 ) << frac;
    oss << 'Z';
    return oss.str();
  }

  // acc += n * scale, refusing results outside the int64 range
  inline bool accumulate_checked( std::int64_t& acc, std::int64_t n,
    std::int64_t scale = 1 )
  {
    using limits = std::numeric_limits< std::int64_t >;
    if ( n > 0 && n > limits::max() / scale ) return false;
    if ( n < 0 && n < limits::min() / scale ) return false;
    const std::int64_t term = n * scale;
    if ( term > 0 && acc > limits::max() - term ) return false;
    if ( term < 0 && acc < limits::min() - term ) return false;
    acc += term;
    return true;
  }

  // False for an unknown unit or a total that does not fit
  inline bool add_duration_component( CalendarDuration& d,
    const std::string& unit, std::int64_t n )
  {
    if ( unit == "s" || unit == "sec" || unit == "secs" || unit == "second"
      || unit == "seconds" ) return accumulate_checked( d.seconds, n );
    if ( unit == "m" || unit == "min" || unit == "mins" || unit == "minute"
      || unit == "minutes" ) return accumulate_checked( d.minutes, n );
    if ( unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour"
      || unit == "hours" ) return accumulate_checked( d.hours, n );
    if ( unit == "d" || unit == "day" || unit == "days" ) {
      return accumulate_checked( d.days, n );
    }
    if ( unit == "w" || unit == "week" || unit == "weeks" ) {
      return accumulate_checked( d.days, n, 7 );
    }
    if ( unit == "mo" || unit == "month" || unit == "months" ) {
      return accumulate_checked( d.months, n );
    }
    if ( unit == "y" || unit == "yr" || unit == "yrs" || unit == "year"
      || unit == "years" ) return accumulate_checked( d.years, n );
    return false;
  }

  // One or more "<integer><unit>" groups, e.g., "2d", "3 hours", "1y6mo"
  inline std::optional< CalendarDuration > parse_duration(
    const std::string& text )
  {
    CalendarDuration out;
    const std::size_t n = text.size();
    std::size_t pos = 0;
    bool any = false;

    auto skip_spaces = [&]() {
      while ( pos < n && std::isspace( static_cast< unsigned char >(text[pos]) ) )
        ++pos;
    };

    skip_spaces();
    while ( pos < n ) {
      const std::size_t sign_at = pos;
      if ( text[pos] == '-' || text[pos] == '+' ) ++pos;
      const std::size_t digits_at = pos;
      while ( pos < n && std::isdigit( static_cast< unsigned char >(text[pos]) ) )
        ++pos;
      if ( pos == digits_at ) return std::nullopt;

      // from_chars accepts a leading '-' but not a leading '+'
      const char* first = text.data()
        + ( text[sign_at] == '+' ? digits_at : sign_at );
      const char* last = text.data() + pos;
      std::int64_t magnitude = 0;
      auto [ptr, ec] = std::from_chars( first, last, magnitude );
      if ( ec != std::errc() || ptr != last ) return std::nullopt;

      skip_spaces();
      const std::size_t unit_at = pos;
      while ( pos < n && std::isalpha( static_cast< unsigned char >(text[pos]) ) )
        ++pos;
      if ( pos == unit_at ) return std::nullopt;
      const std::string unit = lowercase( text.substr(unit_at, pos - unit_at) );
      if ( !add_duration_component(out, unit, magnitude) ) return std::nullopt;

      any = true;
      skip_spaces();
    }
    if ( !any ) return std::nullopt;
    return out;
  }

  // Compact rendering accepted by parse_duration(...)
  inline std::string format_duration( const CalendarDuration& d ) {
    std::ostringstream oss;
    auto put = [&]( std::int64_t v, const char* unit ) {
      if ( v != 0 ) oss << v << unit;
    };
    put( d.years, "y" );
    put( d.months, "mo" );
    put( d.days, "d" );
    put( d.hours, "h" );
    put( d.minutes, "m" );
    put( d.seconds, "s" );
    const std::string s = oss.str();
    return s.empty() ? "0s" : s;
  }

  // Does a scalar node denote the raw value backing an enumeration member?
  // String nodes are reinterpreted as the raw value's kind, so "2" matches
  // a member backed by the integer 2. The reverse never happens: string raw
  // values only match string nodes.
  inline bool raw_value_matches( const ordered_node& node, const Value& raw ) {
    switch ( raw.kind() ) {
      case Value::Kind::Bool:
        if ( node.is_boolean() ) return node.get_value< bool >() == raw.as_bool();
        if ( node.is_string() ) {
          auto b = parse_bool_literal( to_native_checked< std::string >(node) );
          return b && *b == raw.as_bool();
        }
        return false;
      case Value::Kind::Integer:
        if ( node.is_integer() ) {
          return node.get_value< std::int64_t >() == raw.as_int();
        }
        if ( node.is_string() ) {
          auto i = parse_int_literal( to_native_checked< std::string >(node) );
          return i && *i == raw.as_int();
        }
        return false;
      case Value::Kind::Float:
        if ( node.is_float_number() ) {
          return node.get_value< double >() == raw.as_float();
        }
        if ( node.is_integer() ) {
          return static_cast< double >( node.get_value< std::int64_t >() )
            == raw.as_float();
        }
        if ( node.is_string() ) {
          auto f = parse_float_literal( to_native_checked< std::string >(node) );
          return f && *f == raw.as_float();
        }
        return false;
      case Value::Kind::String:
        return node.is_string()
          && to_native_checked< std::string >( node ) == raw.as_string();
      default:
        return false;
    }
  }

  // Can a non-string scalar node be compared against this raw value at all?
  inline bool raw_kind_accepts( const ordered_node& node, const Value& raw ) {
    switch ( raw.kind() ) {
      case Value::Kind::Bool: return node.is_boolean();
      case Value::Kind::Integer: return node.is_integer();
      case Value::Kind::Float:
        return node.is_float_number() || node.is_integer();
      default: return false;
    }
  }

  // Deep merge of an overlay node onto a base node. Executes simple
  // replacement for scalars and sequences. An explicit null overlay clears
  // the corresponding base node. For an overlay and base that are both
  // mappings, deep merge the contents with an "overlay wins" policy. Keys of
  // merged mappings are rewritten as strings, so 1 and "1" are one key.
  inline ordered_node deep_merge( const ordered_node& base,
    const ordered_node& overlay )
  {
    // An explicit null clears the corresponding prior entry
    if ( overlay.is_null() ) return ordered_node();

    // Non-mapping overlays (scalars and sequences) replace prior base values
    if ( !overlay.is_mapping() ) return overlay;

    // If the overlay is a mapping but the base isn't, the overlay replaces it
    if ( !base.is_mapping() ) return overlay;

    ordered_node result = ordered_node::mapping();
    for ( const auto& [bk, bv] : base.map_items() ) {
      result[ to_string_any(bk) ] = bv;
    }
    for ( const auto& [mk, mv] : overlay.map_items() ) {
      const std::string k = to_string_any( mk );
      if ( result.contains(k) ) {
        result[ k ] = deep_merge( result.at(k), mv );
      } else {
        result[ k ] = mv;
      }
    }
    return result;
  }

  inline std::string union_name(
    const std::vector< DescriptorPtr >& variants );

} // namespace conftype::internal

} // namespace conftype

// ConfigException member function definitions

inline conftype::ConfigException::ConfigException( ErrorKind kind,
  std::string path, const std::string& message,
  std::vector< ConfigExceptionPtr > causes )
  : std::runtime_error( message ), kind_( kind ), path_( std::move(path) ),
    causes_( std::move(causes) )
{
}

inline conftype::ConfigExceptionPtr conftype::ConfigException::clone() const {
  return std::make_shared< ConfigException >( *this );
}

namespace conftype::internal {

  inline std::vector< std::string > sorted( std::vector< std::string > v ) {
    std::sort( v.begin(), v.end() );
    return v;
  }

  inline std::string unexpected_keys_message( const std::string& path,
    const std::string& type_name, const std::vector< std::string >& keys )
  {
    return "unexpected key(s) " + quoted_list( keys ) + " detected for type "
      + type_name + " at " + display_path( path );
  }

  inline std::string ambiguous_message( const std::string& path,
    const std::string& base_name, const std::vector< std::string >& matches )
  {
    return bullet_lines( "multiple subtypes of " + base_name + " matched at "
      + display_path( path ) + ", use '" + TYPE_KEY + "' to disambiguate:",
      matches );
  }

} // namespace conftype::internal

inline conftype::UnexpectedKeysException::UnexpectedKeysException(
  std::string path, const std::string& type_name,
  std::vector< std::string > keys )
  : ConfigException( ErrorKind::UnexpectedKeys, path,
      internal::unexpected_keys_message( path, type_name,
        internal::sorted( keys ) ) ),
    keys_( internal::sorted( std::move(keys) ) )
{
}

inline conftype::AmbiguousSubclassException::AmbiguousSubclassException(
  std::string path, const std::string& base_name,
  std::vector< std::string > matches )
  : ConfigException( ErrorKind::AmbiguousSubclass, path,
      internal::ambiguous_message( path, base_name, matches ) ),
    matches_( std::move(matches) )
{
}

// Value member function definitions

inline conftype::Value conftype::Value::from_bool( bool b ) {
  Value v;
  v.data_.emplace< bool >( b );
  return v;
}

inline conftype::Value conftype::Value::from_int( std::int64_t i ) {
  Value v;
  v.data_.emplace< std::int64_t >( i );
  return v;
}

inline conftype::Value conftype::Value::from_float( double d ) {
  Value v;
  v.data_.emplace< double >( d );
  return v;
}

inline conftype::Value conftype::Value::from_string( std::string s ) {
  Value v;
  v.data_.emplace< std::string >( std::move(s) );
  return v;
}

inline conftype::Value conftype::Value::from_timestamp( Timestamp t ) {
  Value v;
  v.data_.emplace< Timestamp >( t );
  return v;
}

inline conftype::Value conftype::Value::from_duration( CalendarDuration d ) {
  Value v;
  v.data_.emplace< CalendarDuration >( d );
  return v;
}

inline conftype::Value conftype::Value::from_enum( std::string type,
  std::string member )
{
  Value v;
  v.data_.emplace< Enum >( Enum{ std::move(type), std::move(member) } );
  return v;
}

inline conftype::Value conftype::Value::from_list( List items ) {
  Value v;
  v.data_.emplace< List >( std::move(items) );
  return v;
}

inline conftype::Value conftype::Value::from_map( Map entries ) {
  Value v;
  v.data_.emplace< Map >( std::move(entries) );
  return v;
}

inline conftype::Value conftype::Value::from_record( Record record ) {
  Value v;
  v.data_.emplace< Record >( std::move(record) );
  return v;
}

inline std::size_t conftype::Value::pop_union_choice() {
  if ( union_choices_.empty() ) {
    throw std::logic_error( "value was not decoded through a union" );
  }
  const std::size_t index = union_choices_.back();
  union_choices_.pop_back();
  return index;
}

inline const conftype::Value* conftype::Value::Record::find(
  const std::string& name ) const
{
  for ( const auto& [k, v] : fields ) {
    if ( k == name ) return &v;
  }
  return nullptr;
}

inline bool conftype::Value::Record::operator==( const Record& o ) const {
  return type == o.type && fields == o.fields;
}

// Field factories

inline conftype::Field conftype::Field::make( std::string name,
  DescriptorPtr type )
{
  Field f;
  f.name = std::move( name );
  f.required = !( type && type->is_optional() );
  f.type = std::move( type );
  return f;
}

inline conftype::Field conftype::Field::with_default( std::string name,
  DescriptorPtr type, Value fallback )
{
  Field f;
  f.name = std::move( name );
  f.type = std::move( type );
  f.required = false;
  f.default_value = std::move( fallback );
  return f;
}

inline conftype::Field conftype::Field::with_factory( std::string name,
  DescriptorPtr type, DefaultFactory factory )
{
  Field f;
  f.name = std::move( name );
  f.type = std::move( type );
  f.required = false;
  f.default_factory = std::move( factory );
  return f;
}

// Descriptor factories. Incomplete shapes fail here, before any decoding.

inline conftype::DescriptorPtr conftype::Descriptor::primitive_of(
  PrimitiveKind kind )
{
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Primitive) );
  d->primitive_ = kind;
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::boolean() {
  return primitive_of( PrimitiveKind::Boolean );
}

inline conftype::DescriptorPtr conftype::Descriptor::integer() {
  return primitive_of( PrimitiveKind::Integer );
}

inline conftype::DescriptorPtr conftype::Descriptor::integer_range(
  std::int64_t min, std::int64_t max )
{
  if ( min > max ) {
    std::ostringstream oss;
    oss << "integer range [" << min << ", " << max << "] is empty";
    throw MissingTypeException( oss.str() );
  }
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Primitive) );
  d->primitive_ = PrimitiveKind::Integer;
  d->range_ = std::make_pair( min, max );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::floating() {
  return primitive_of( PrimitiveKind::Float );
}

inline conftype::DescriptorPtr conftype::Descriptor::string() {
  return primitive_of( PrimitiveKind::String );
}

inline conftype::DescriptorPtr conftype::Descriptor::temporal() {
  return DescriptorPtr( new Descriptor(Kind::Temporal) );
}

inline conftype::DescriptorPtr conftype::Descriptor::calendar_duration() {
  return DescriptorPtr( new Descriptor(Kind::CalendarDuration) );
}

inline conftype::DescriptorPtr conftype::Descriptor::optional(
  DescriptorPtr inner )
{
  if ( !inner ) throw MissingTypeException(
    "Optional descriptor requires an inner type" );
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Optional) );
  d->inner_ = std::move( inner );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::sequence(
  DescriptorPtr item )
{
  if ( !item ) throw MissingTypeException(
    "expected a fully specified item type for List" );
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Sequence) );
  d->inner_ = std::move( item );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::mapping(
  DescriptorPtr value )
{
  if ( !value ) throw MissingTypeException(
    "expected a fully specified value type for Dict" );
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Mapping) );
  d->inner_ = std::move( value );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::record( std::string name,
  std::vector< Field > fields )
{
  if ( name.empty() ) throw MissingTypeException( "record type has no name" );

  std::unordered_set< std::string > seen;
  for ( const Field& f : fields ) {
    std::ostringstream oss;
    if ( !f.type ) {
      oss << "field " << f.name << " of " << name << " has no type";
      throw MissingTypeException( oss.str() );
    }
    if ( f.name == internal::TYPE_KEY ) {
      oss << "field name '" << f.name << "' of " << name
        << " is reserved for subtype disambiguation";
      throw MissingTypeException( oss.str() );
    }
    if ( !seen.insert(f.name).second ) {
      oss << "duplicate field " << f.name << " in " << name;
      throw MissingTypeException( oss.str() );
    }
  }

  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Record) );
  d->name_ = std::move( name );
  d->fields_ = std::move( fields );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::enumeration(
  std::string name, std::vector< EnumMember > members )
{
  if ( members.empty() ) {
    throw MissingTypeException( "enumeration " + name + " has no members" );
  }
  std::unordered_set< std::string > seen;
  for ( const EnumMember& m : members ) {
    if ( !seen.insert(m.name).second ) {
      throw MissingTypeException( "duplicate member " + m.name
        + " in enumeration " + name );
    }
  }

  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Enumeration) );
  d->name_ = std::move( name );
  d->members_ = std::move( members );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::tagged_union(
  std::vector< DescriptorPtr > variants )
{
  if ( variants.empty() ) {
    throw MissingTypeException( "Union descriptor requires variants" );
  }
  for ( const auto& v : variants ) {
    if ( !v ) throw MissingTypeException( "Union variant has no type" );
  }
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::TaggedUnion) );
  d->variants_ = std::move( variants );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::open_polymorphic(
  std::string base )
{
  if ( base.empty() ) throw MissingTypeException( "open base has no name" );
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::OpenPolymorphic) );
  d->name_ = std::move( base );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::dynamic() {
  return DescriptorPtr( new Descriptor(Kind::Dynamic) );
}

inline conftype::DescriptorPtr conftype::Descriptor::reference(
  std::string name, std::function< DescriptorPtr() > resolve )
{
  if ( !resolve ) {
    throw MissingTypeException( "reference to " + name
      + " cannot be resolved" );
  }
  std::shared_ptr< Descriptor > d( new Descriptor(Kind::Reference) );
  d->name_ = std::move( name );
  d->resolve_ = std::move( resolve );
  return d;
}

inline conftype::DescriptorPtr conftype::Descriptor::target() const {
  if ( kind_ != Kind::Reference ) return nullptr;
  return resolve_();
}

inline std::string conftype::internal::union_name(
  const std::vector< DescriptorPtr >& variants )
{
  std::string out = "Union[";
  for ( size_t i = 0; i < variants.size(); ++i ) {
    if ( i ) out += ", ";
    out += variants[ i ]->display_name();
  }
  return out + "]";
}

inline std::string conftype::Descriptor::display_name() const {
  switch ( kind_ ) {
    case Kind::Primitive:
      switch ( primitive_ ) {
        case PrimitiveKind::Boolean: return "boolean";
        case PrimitiveKind::Integer: return "integer";
        case PrimitiveKind::Float: return "float";
        case PrimitiveKind::String: return "string";
      }
      break;
    case Kind::Temporal: return "timestamp";
    case Kind::CalendarDuration: return "duration";
    case Kind::Optional: return "Optional[" + inner_->display_name() + "]";
    case Kind::Sequence: return "List[" + inner_->display_name() + "]";
    case Kind::Mapping: return "Dict[string, " + inner_->display_name() + "]";
    case Kind::TaggedUnion: return internal::union_name( variants_ );
    case Kind::Dynamic: return "Any";
    case Kind::Record:
    case Kind::Enumeration:
    case Kind::OpenPolymorphic:
    case Kind::Reference:
      break;
  }
  return name_;
}

// SubclassRegistry member function definitions

inline conftype::SubclassRegistry& conftype::SubclassRegistry::global() {
  static SubclassRegistry registry;
  return registry;
}

inline void conftype::SubclassRegistry::add( const std::string& base,
  Candidate candidate )
{
  if ( !candidate.record
    || candidate.record->kind() != Descriptor::Kind::Record )
  {
    throw MissingTypeException( "subtype " + candidate.name + " of " + base
      + " must be described by a record" );
  }

  std::unique_lock< std::shared_mutex > lock( mutex_ );
  auto& bucket = table_[ base ];
  for ( const auto& existing : bucket ) {
    if ( existing.name != candidate.name ) continue;

    // Registering the same type twice is harmless
    if ( existing.record == candidate.record ) return;

    std::ostringstream oss;
    oss << "Duplicate subtype '" << candidate.name << "' for base '" << base
      << "'";
    throw std::runtime_error( oss.str() );
  }
  bucket.push_back( std::move(candidate) );
}

inline std::vector< conftype::Candidate > conftype::SubclassRegistry
  ::candidates( const std::string& base ) const
{
  std::shared_lock< std::shared_mutex > lock( mutex_ );
  auto it = table_.find( base );
  if ( it == table_.end() ) return {};
  return it->second;
}

// TypeCache member function definitions

inline conftype::TypeCache& conftype::TypeCache::global() {
  static TypeCache cache;
  return cache;
}

inline conftype::DescriptorPtr conftype::TypeCache::descriptor(
  std::type_index key, const std::string& label,
  const std::function< DescriptorPtr() >& build )
{
  {
    std::lock_guard< std::recursive_mutex > lock( mutex_ );
    if ( !entries_.count(key) && building_.count(key) ) {
      return Descriptor::reference( label, [this, key, label]() {
        return resolve( key, label );
      } );
    }
  }
  return entry< Descriptor >( key, label, build );
}

inline conftype::DescriptorPtr conftype::TypeCache::resolve(
  std::type_index key, const std::string& label )
{
  std::lock_guard< std::recursive_mutex > lock( mutex_ );
  auto it = entries_.find( key );
  if ( it == entries_.end() ) {
    throw MissingTypeException( "type " + label
      + " is referenced but its description never completed" );
  }
  return std::static_pointer_cast< const Descriptor >( it->second );
}

inline std::shared_ptr< const void > conftype::TypeCache::lookup_or_build(
  std::type_index key, const std::string& label,
  const std::function< std::shared_ptr< const void >() >& build )
{
  // Builders call back into the cache for nested types on the same thread,
  // hence the recursive mutex
  std::lock_guard< std::recursive_mutex > lock( mutex_ );

  auto it = entries_.find( key );
  if ( it != entries_.end() ) return it->second;

  if ( building_.count(key) ) {
    throw MissingTypeException( "type " + label
      + " refers to itself and cannot be described" );
  }

  building_.insert( key );
  std::shared_ptr< const void > built;
  try {
    built = build();
  }
  catch ( ... ) {
    building_.erase( key );
    throw;
  }
  building_.erase( key );

  entries_.emplace( key, built );
  return built;
}

// Decoder member function definitions

inline conftype::Value conftype::Decoder::decode( const ordered_node& root,
  const DescriptorPtr& target ) const
{
  if ( !target ) throw MissingTypeException( "no target descriptor given" );
  return decode_node( root, *target, std::string(), 0 );
}

inline conftype::Result conftype::Decoder::try_decode(
  const ordered_node& root, const DescriptorPtr& target ) const
{
  Result result;
  try {
    result.value = decode( root, target );
  }
  catch ( const ConfigException& e ) {
    result.error = e.clone();
  }
  return result;
}

inline void conftype::Decoder::check_depth( const std::string& path,
  std::size_t depth ) const
{
  if ( depth <= options_.max_depth ) return;
  std::ostringstream oss;
  oss << "maximum nesting depth of " << options_.max_depth
    << " exceeded at " << internal::display_path( path );
  throw MalformedConfigException( path, oss.str() );
}

// Dispatch by descriptor variant
inline conftype::Value conftype::Decoder::decode_node( const ordered_node& node,
  const Descriptor& d, const std::string& path, std::size_t depth ) const
{
  check_depth( path, depth );

  switch ( d.kind() ) {
    case Descriptor::Kind::Primitive:
      return decode_primitive( node, d, path );
    case Descriptor::Kind::Temporal:
      return decode_temporal( node, path );
    case Descriptor::Kind::CalendarDuration:
      return decode_duration( node, path );
    case Descriptor::Kind::Optional:
      // Explicit null means "no value"; absence is handled by the record
      if ( node.is_null() ) return Value();
      return decode_node( node, *d.inner(), path, depth );
    case Descriptor::Kind::Sequence:
      return decode_sequence( node, d, path, depth );
    case Descriptor::Kind::Mapping:
      return decode_mapping( node, d, path, depth );
    case Descriptor::Kind::Record:
      return Value::from_record( decode_record(node, d, path, depth) );
    case Descriptor::Kind::Enumeration:
      return decode_enumeration( node, d, path );
    case Descriptor::Kind::TaggedUnion:
      return decode_union( node, d, path, depth );
    case Descriptor::Kind::OpenPolymorphic:
      return decode_open( node, d, path, depth );
    case Descriptor::Kind::Dynamic:
      return decode_dynamic( node, path, depth );
    case Descriptor::Kind::Reference:
      return decode_node( node, *d.target(), path, depth );
  }
  throw MissingTypeException( "unsupported descriptor", path );
}

inline conftype::Value conftype::Decoder::decode_primitive(
  const ordered_node& node, const Descriptor& d, const std::string& path ) const
{
  switch ( d.primitive() ) {
    case PrimitiveKind::Boolean: {
      if ( node.is_boolean() ) return Value::from_bool( node.get_value< bool >() );
      if ( node.is_string() || node.is_integer() || node.is_float_number() ) {
        const std::string literal = internal::to_string_any( node );
        if ( node.is_string() ) {
          if ( auto b = internal::parse_bool_literal(literal) ) {
            return Value::from_bool( *b );
          }
        }
        throw ParseException( path, "invalid boolean literal \"" + literal
          + "\" at " + internal::display_path( path )
          + ", expected true or false" );
      }
      throw MalformedConfigException( path,
        internal::shape_mismatch( "boolean", path, node ) );
    }

    case PrimitiveKind::Integer: {
      if ( !node.is_integer() ) {
        throw MalformedConfigException( path,
          internal::shape_mismatch( "integer", path, node ) );
      }
      const std::int64_t i = node.get_value< std::int64_t >();
      if ( d.range() && ( i < d.range()->first || i > d.range()->second ) ) {
        std::ostringstream oss;
        oss << "value " << i << " at " << internal::display_path( path )
          << " is out of range [" << d.range()->first << ", "
          << d.range()->second << "]";
        throw ParseException( path, oss.str() );
      }
      return Value::from_int( i );
    }

    case PrimitiveKind::Float:
      // Integer literals widen to float; the reverse is not allowed
      if ( node.is_float_number() ) {
        return Value::from_float( node.get_value< double >() );
      }
      if ( node.is_integer() ) {
        return Value::from_float(
          static_cast< double >( node.get_value< std::int64_t >() ) );
      }
      throw MalformedConfigException( path,
        internal::shape_mismatch( "float", path, node ) );

    case PrimitiveKind::String:
      if ( node.is_string() ) {
        return Value::from_string(
          internal::to_native_checked< std::string >( node ) );
      }
      throw MalformedConfigException( path,
        internal::shape_mismatch( "string", path, node ) );
  }
  throw MissingTypeException( "unsupported primitive", path );
}

inline conftype::Value conftype::Decoder::decode_temporal(
  const ordered_node& node, const std::string& path ) const
{
  if ( !node.is_string() ) {
    throw MalformedConfigException( path,
      internal::shape_mismatch( "timestamp string", path, node ) );
  }
  const std::string text = internal::to_native_checked< std::string >( node );
  auto ts = internal::parse_timestamp( text );
  if ( !ts ) {
    throw ParseException( path, "invalid timestamp \"" + text + "\" at "
      + internal::display_path( path )
      + ", expected ISO-8601 date-time with UTC offset" );
  }
  return Value::from_timestamp( *ts );
}

inline conftype::Value conftype::Decoder::decode_duration(
  const ordered_node& node, const std::string& path ) const
{
  if ( !node.is_string() ) {
    throw MalformedConfigException( path,
      internal::shape_mismatch( "duration string", path, node ) );
  }
  const std::string text = internal::to_native_checked< std::string >( node );
  auto d = internal::parse_duration( text );
  if ( !d ) {
    throw ParseException( path, "invalid duration \"" + text + "\" at "
      + internal::display_path( path )
      + ", expected <integer><unit> such as 2d or 3h" );
  }
  return Value::from_duration( *d );
}

inline conftype::Value conftype::Decoder::decode_sequence(
  const ordered_node& node, const Descriptor& d, const std::string& path,
  std::size_t depth ) const
{
  if ( !node.is_sequence() ) {
    throw MalformedConfigException( path,
      internal::shape_mismatch( d.display_name(), path, node ) );
  }
  Value::List items;
  items.reserve( node.size() );
  for ( std::size_t i = 0; i < node.size(); ++i ) {
    items.push_back( decode_node( node.at(i), *d.inner(),
      internal::seq_indexed( path, i ), depth + 1 ) );
  }
  return Value::from_list( std::move(items) );
}

inline conftype::Value conftype::Decoder::decode_mapping(
  const ordered_node& node, const Descriptor& d, const std::string& path,
  std::size_t depth ) const
{
  if ( !node.is_mapping() ) {
    throw MalformedConfigException( path,
      internal::shape_mismatch( d.display_name(), path, node ) );
  }
  Value::Map entries;
  for ( const auto& [mk, mv] : node.map_items() ) {
    const std::string key = internal::to_string_any( mk );
    entries.emplace_back( key, decode_node( mv, *d.inner(),
      internal::field_path( path, key ), depth + 1 ) );
  }
  return Value::from_map( std::move(entries) );
}

inline conftype::Value::Record conftype::Decoder::decode_record(
  const ordered_node& node, const Descriptor& d, const std::string& path,
  std::size_t depth ) const
{
  if ( !node.is_mapping() ) {
    throw MalformedConfigException( path,
      internal::shape_mismatch( "type " + d.name(), path, node ) );
  }

  Value::Record out;
  out.type = d.name();

  // Fields resolve in declaration order; the first failure aborts the record
  std::unordered_set< std::string > consumed;
  for ( const Field& f : d.fields() ) {
    consumed.insert( f.name );
    if ( node.contains(f.name) ) {
      out.fields.emplace_back( f.name, decode_node( node.at(f.name), *f.type,
        internal::field_path( path, f.name ), depth + 1 ) );
    }
    else {
      out.fields.emplace_back( f.name, absent_field( f, d, path ) );
    }
  }

  // Leftover keys, excluding the reserved disambiguation key
  std::vector< std::string > leftover;
  for ( const auto& [mk, mv] : node.map_items() ) {
    const std::string key = internal::to_string_any( mk );
    if ( key == internal::TYPE_KEY || consumed.count(key) ) continue;
    leftover.push_back( key );
  }
  if ( !leftover.empty() && options_.strict_unexpected_keys ) {
    throw UnexpectedKeysException( path, d.name(), std::move(leftover) );
  }

  return out;
}

inline conftype::Value conftype::Decoder::absent_field( const Field& field,
  const Descriptor& record, const std::string& path ) const
{
  // Factories run per decode so that results never share state
  if ( field.default_factory ) return field.default_factory();
  if ( field.default_value ) return *field.default_value;
  if ( !field.required ) return Value();

  throw MalformedConfigException( internal::field_path( path, field.name ),
    "expected type " + record.name() + " at " + internal::display_path( path )
      + ", no " + field.name + " found" );
}

// Name match first, then raw backing value
inline conftype::Value conftype::Decoder::decode_enumeration(
  const ordered_node& node, const Descriptor& d, const std::string& path ) const
{
  // Strings always qualify; other scalars only when some member is backed
  // by a raw value of that kind
  bool accepted = node.is_string();
  for ( const EnumMember& m : d.members() ) {
    if ( m.raw && internal::raw_kind_accepts( node, *m.raw ) ) accepted = true;
  }
  if ( !accepted ) {
    throw MalformedConfigException( path,
      internal::shape_mismatch( "enumeration " + d.name(), path, node ) );
  }

  if ( node.is_string() ) {
    const std::string name = internal::to_native_checked< std::string >( node );
    for ( const EnumMember& m : d.members() ) {
      if ( m.name == name ) return Value::from_enum( d.name(), m.name );
    }
  }

  for ( const EnumMember& m : d.members() ) {
    if ( m.raw && internal::raw_value_matches( node, *m.raw ) ) {
      return Value::from_enum( d.name(), m.name );
    }
  }

  std::ostringstream oss;
  oss << "invalid value \"" << internal::to_string_any( node ) << "\" for "
    << d.name() << " at " << internal::display_path( path )
    << ", expected one of: ";
  for ( size_t i = 0; i < d.members().size(); ++i ) {
    if ( i ) oss << ", ";
    oss << d.members()[ i ].name;
  }
  throw ParseException( path, oss.str() );
}

// First matching variant wins; failures are only reported when every
// variant failed
inline conftype::Value conftype::Decoder::decode_union( const ordered_node& node,
  const Descriptor& d, const std::string& path, std::size_t depth ) const
{
  std::vector< ConfigExceptionPtr > causes;
  for ( std::size_t i = 0; i < d.variants().size(); ++i ) {
    try {
      Value v = decode_node( node, *d.variants()[ i ], path, depth );
      v.push_union_choice( i );
      return v;
    }
    catch ( const ConfigException& e ) {
      causes.push_back( e.clone() );
    }
  }

  std::vector< std::string > lines;
  for ( const auto& c : causes ) lines.push_back( c->what() );
  throw TypeConfigException( path, internal::bullet_lines( "expected type "
    + d.display_name() + " at " + internal::display_path( path )
    + ", failed variants:", lines ), std::move(causes) );
}

// Exactly one registered subclass must match, unless '_type' names one
inline conftype::Value conftype::Decoder::decode_open( const ordered_node& node,
  const Descriptor& d, const std::string& path, std::size_t depth ) const
{
  const std::string& where = internal::display_path( path );
  const std::vector< Candidate > candidates = registry_->candidates( d.name() );

  if ( node.is_mapping() && node.contains(internal::TYPE_KEY) ) {
    const ordered_node& tag = node.at( internal::TYPE_KEY );
    const std::string tag_path = internal::field_path( path, internal::TYPE_KEY );
    if ( !tag.is_string() ) {
      throw MalformedConfigException( tag_path,
        internal::shape_mismatch( "subtype name", tag_path, tag ) );
    }
    const std::string wanted = internal::to_native_checked< std::string >( tag );

    for ( const Candidate& c : candidates ) {
      if ( c.name != wanted ) continue;
      try {
        Value::Record rec = decode_record( node, *c.record, path, depth );
        rec.tagged = true;
        return Value::from_record( std::move(rec) );
      }
      catch ( const ConfigException& e ) {
        std::vector< ConfigExceptionPtr > causes{ e.clone() };
        throw TypeConfigException( path, internal::bullet_lines( "subtype "
          + wanted + " of " + d.name() + " selected at " + where
          + " failed:", { e.what() } ), std::move(causes) );
      }
    }

    std::vector< std::string > known;
    for ( const Candidate& c : candidates ) known.push_back( c.name );
    throw TypeConfigException( path, internal::bullet_lines( "unknown subtype \""
      + wanted + "\" of " + d.name() + " at " + where + ", registered subtypes:",
      known ) );
  }

  if ( candidates.empty() ) {
    throw TypeConfigException( path, "expected type " + d.name() + " at "
      + where + ", but no subtypes of " + d.name() + " are registered" );
  }

  std::vector< Value::Record > successes;
  std::vector< std::string > matched;
  std::vector< ConfigExceptionPtr > causes;
  for ( const Candidate& c : candidates ) {
    try {
      successes.push_back( decode_record( node, *c.record, path, depth ) );
      matched.push_back( c.name );
    }
    catch ( const ConfigException& e ) {
      causes.push_back( e.clone() );
    }
  }

  if ( successes.size() == 1 ) {
    Value::Record rec = std::move( successes.front() );
    rec.tagged = true;
    return Value::from_record( std::move(rec) );
  }

  if ( successes.size() > 1 ) {
    throw AmbiguousSubclassException( path, d.name(), std::move(matched) );
  }

  std::vector< std::string > lines;
  for ( const auto& c : causes ) lines.push_back( c->what() );
  throw TypeConfigException( path, internal::bullet_lines( "expected type "
    + d.name() + " at " + where + ", failed subclasses:", lines ),
    std::move(causes) );
}

// Structural conversion with no interpretation. Null becomes "no value".
inline conftype::Value conftype::Decoder::decode_dynamic(
  const ordered_node& node, const std::string& path, std::size_t depth ) const
{
  check_depth( path, depth );

  if ( node.is_null() ) return Value();
  if ( node.is_boolean() ) return Value::from_bool( node.get_value< bool >() );
  if ( node.is_integer() ) {
    return Value::from_int( node.get_value< std::int64_t >() );
  }
  if ( node.is_float_number() ) {
    return Value::from_float( node.get_value< double >() );
  }
  if ( node.is_string() ) {
    return Value::from_string(
      internal::to_native_checked< std::string >( node ) );
  }

  if ( node.is_sequence() ) {
    Value::List items;
    items.reserve( node.size() );
    for ( std::size_t i = 0; i < node.size(); ++i ) {
      items.push_back( decode_dynamic( node.at(i),
        internal::seq_indexed( path, i ), depth + 1 ) );
    }
    return Value::from_list( std::move(items) );
  }

  Value::Map entries;
  for ( const auto& [mk, mv] : node.map_items() ) {
    const std::string key = internal::to_string_any( mk );
    entries.emplace_back( key, decode_dynamic( mv,
      internal::field_path( path, key ), depth + 1 ) );
  }
  return Value::from_map( std::move(entries) );
}

// Value tree collaborators

inline conftype::ordered_node conftype::parse( const std::string& text ) {
  const bool blank = std::all_of( text.begin(), text.end(),
    []( unsigned char c ) { return std::isspace(c) != 0; } );
  if ( blank ) return ordered_node::mapping();

  try {
    return ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& ex ) {
    throw ParseException( std::string(),
      std::string( "could not parse configuration text: " ) + ex.what() );
  }
}

inline conftype::ordered_node conftype::value_to_node( const Value& value ) {
  using internal::make_node_from;

  switch ( value.kind() ) {
    case Value::Kind::Null:
      return ordered_node();
    case Value::Kind::Bool:
      return make_node_from( value.as_bool() );
    case Value::Kind::Integer:
      return make_node_from( value.as_int() );
    case Value::Kind::Float:
      return make_node_from( value.as_float() );
    case Value::Kind::String:
      return make_node_from( value.as_string() );
    case Value::Kind::Timestamp:
      return make_node_from( internal::format_timestamp(value.as_timestamp()) );
    case Value::Kind::Duration:
      return make_node_from( internal::format_duration(value.as_duration()) );
    case Value::Kind::Enum:
      return make_node_from( value.as_enum().member );
    case Value::Kind::List: {
      std::vector< ordered_node > out;
      out.reserve( value.as_list().size() );
      for ( const Value& item : value.as_list() ) {
        out.push_back( value_to_node(item) );
      }
      return make_node_from( out );
    }
    case Value::Kind::Map: {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [k, v] : value.as_map() ) out[ k ] = value_to_node( v );
      return out;
    }
    case Value::Kind::Record: {
      const Value::Record& rec = value.as_record();
      ordered_node out = ordered_node::mapping();
      if ( rec.tagged ) out[ internal::TYPE_KEY ] = make_node_from( rec.type );
      for ( const auto& [k, v] : rec.fields ) out[ k ] = value_to_node( v );
      return out;
    }
  }
  return ordered_node();
}

#include "conftype_binding.hh"
