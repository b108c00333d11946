//  conftype: typed configuration decoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the conftype authors
#pragma once

// Typed layer on top of the runtime Decoder. C++ types describe themselves
// through trait specializations, and decoded Values are bound back onto them.
//
//   namespace conftype {
//     template <> struct record_traits< Conn > {
//       static constexpr const char* name = "Conn";
//       static void describe( RecordBuilder< Conn >& b ) {
//         b.field( "host", &Conn::host );
//         b.field( "port", &Conn::port, 5432 );
//       }
//     };
//   }
//
//   Conn c = conftype::loads< Conn >( "host: db" );

#include "conftype.hh"

#include <map>
#include <typeinfo>

namespace conftype {

  // Specialize with a static name and describe( RecordBuilder< T >& )
  template < typename T > struct record_traits {};

  // Specialize with a static name and describe( EnumBuilder< E >& )
  template < typename E > struct enum_traits {};

  // Specialize with a static name for a polymorphic base held by shared_ptr
  template < typename B > struct open_base_traits {};

  // Describe, bind and encode one C++ type. Only the specializations below
  // exist; unsupported types fail to compile.
  template < typename T, typename Enable = void > struct shape;

  template < typename T > DescriptorPtr descriptor_of();

  template < typename T > class RecordBuilder;
  template < typename E > class EnumBuilder;

namespace internal {

  template < typename T, typename = void >
  struct is_record : std::false_type {};

  template < typename T >
  struct is_record< T, std::void_t< decltype(record_traits< T >::name) > >
    : std::true_type {};

  template < typename T, typename = void >
  struct is_enum_type : std::false_type {};

  template < typename T >
  struct is_enum_type< T, std::void_t< decltype(enum_traits< T >::name) > >
    : std::true_type {};

  template < typename T, typename = void >
  struct is_open_base : std::false_type {};

  template < typename T >
  struct is_open_base< T, std::void_t< decltype(open_base_traits< T >::name) > >
    : std::true_type {};

  // Blocks deduction so that a literal default converts to the member type
  template < typename T > struct identity { using type = T; };

  // Human-readable name used in recursion diagnostics
  template < typename T >
  std::string type_label() {
    if constexpr ( is_record< T >::value ) return record_traits< T >::name;
    else if constexpr ( is_enum_type< T >::value ) return enum_traits< T >::name;
    else return typeid( T ).name();
  }

  // Per-record binding schema, cached once per type
  template < typename T >
  struct RecordSchema {
    DescriptorPtr descriptor;
    std::vector< std::string > names;
    std::vector< std::function< void(T&, const Value&) > > binders;
    std::vector< std::function< Value(const T&) > > encoders;

    static std::shared_ptr< const RecordSchema > get();

    T bind( const Value::Record& rec ) const {
      T out{};
      for ( size_t i = 0; i < names.size(); ++i ) {
        const Value* v = rec.find( names[i] );
        if ( v ) binders[ i ]( out, *v );
      }
      return out;
    }

    Value::Record encode( const T& in ) const {
      Value::Record rec;
      rec.type = descriptor->name();
      for ( size_t i = 0; i < names.size(); ++i ) {
        rec.fields.emplace_back( names[i], encoders[i]( in ) );
      }
      return rec;
    }
  };

  template < typename E >
  struct EnumSchema {
    DescriptorPtr descriptor;
    std::vector< std::pair< std::string, E > > values;

    static std::shared_ptr< const EnumSchema > get();
  };

  // Constructors and encoders for the registered subclasses of one open
  // base, keyed both by subtype name and by dynamic type
  template < typename B >
  class PolymorphicBindings {
  public:
    struct Entry {
      std::string name;
      std::type_index type;
      std::function< std::shared_ptr< B >(const Value::Record&) > factory;
      std::function< Value::Record(const B&) > encoder;
    };

    static PolymorphicBindings& instance() {
      static PolymorphicBindings bindings;
      return bindings;
    }

    void add( Entry entry ) {
      std::unique_lock< std::shared_mutex > lock( mutex_ );
      for ( const auto& e : entries_ ) {
        if ( e.name == entry.name ) return;
      }
      entries_.push_back( std::move(entry) );
    }

    std::optional< Entry > by_name( const std::string& name ) const {
      std::shared_lock< std::shared_mutex > lock( mutex_ );
      for ( const auto& e : entries_ ) {
        if ( e.name == name ) return e;
      }
      return std::nullopt;
    }

    std::optional< Entry > by_type( std::type_index type ) const {
      std::shared_lock< std::shared_mutex > lock( mutex_ );
      for ( const auto& e : entries_ ) {
        if ( e.type == type ) return e;
      }
      return std::nullopt;
    }

  private:
    mutable std::shared_mutex mutex_;
    std::vector< Entry > entries_;
  };

} // namespace conftype::internal

  // Collects the fields of a record type, in declaration order
  template < typename T >
  class RecordBuilder {
  public:
    // Required unless F is std::optional
    template < typename F >
    RecordBuilder& field( const std::string& name, F T::* member ) {
      return add( Field::make( name, descriptor_of< F >() ), member );
    }

    // Literal default used when the key is absent
    template < typename F >
    RecordBuilder& field( const std::string& name, F T::* member,
      const typename internal::identity< F >::type& fallback )
    {
      return add( Field::with_default( name, descriptor_of< F >(),
        shape< F >::encode( fallback ) ), member );
    }

    // Default produced by calling factory() each time the key is absent
    template < typename F, typename Factory >
    RecordBuilder& field_factory( const std::string& name, F T::* member,
      Factory factory )
    {
      return add( Field::with_factory( name, descriptor_of< F >(),
        [factory]() { return shape< F >::encode( F(factory()) ); } ), member );
    }

  private:
    friend struct internal::RecordSchema< T >;

    template < typename F >
    RecordBuilder& add( Field f, F T::* member ) {
      fields_.push_back( std::move(f) );
      binders_.push_back( [member]( T& out, const Value& v ) {
        out.*member = shape< F >::bind( v );
      } );
      encoders_.push_back( [member]( const T& in ) {
        return shape< F >::encode( in.*member );
      } );
      return *this;
    }

    std::vector< Field > fields_;
    std::vector< std::function< void(T&, const Value&) > > binders_;
    std::vector< std::function< Value(const T&) > > encoders_;
  };

  // Collects the members of an enumeration, in declaration order
  template < typename E >
  class EnumBuilder {
  public:
    EnumBuilder& member( const std::string& name, E value ) {
      return add( name, value, std::nullopt );
    }

    // Member also accepted through its raw boolean or numeric value
    template < typename R,
      typename = std::enable_if_t< std::is_arithmetic< R >::value > >
    EnumBuilder& member( const std::string& name, E value, R raw ) {
      if constexpr ( std::is_same< R, bool >::value ) {
        return add( name, value, Value::from_bool(raw) );
      }
      else if constexpr ( std::is_integral< R >::value ) {
        return add( name, value,
          Value::from_int( static_cast< std::int64_t >(raw) ) );
      }
      else {
        return add( name, value,
          Value::from_float( static_cast< double >(raw) ) );
      }
    }

    EnumBuilder& member( const std::string& name, E value,
      const std::string& raw )
    {
      return add( name, value, Value::from_string(raw) );
    }

  private:
    friend struct internal::EnumSchema< E >;

    EnumBuilder& add( const std::string& name, E value,
      std::optional< Value > raw )
    {
      members_.push_back( EnumMember{ name, std::move(raw) } );
      values_.emplace_back( name, value );
      return *this;
    }

    std::vector< EnumMember > members_;
    std::vector< std::pair< std::string, E > > values_;
  };

  template < typename T >
  DescriptorPtr descriptor_of() {
    return TypeCache::global().descriptor( typeid(T),
      internal::type_label< T >(), []() { return shape< T >::describe(); } );
  }

  template < typename T >
  std::shared_ptr< const internal::RecordSchema< T > >
  internal::RecordSchema< T >::get()
  {
    // Open the descriptor entry first, so that fields naming T itself
    // resolve to a reference instead of re-entering this schema
    descriptor_of< T >();

    using Schema = internal::RecordSchema< T >;
    return TypeCache::global().entry< Schema >( typeid(Schema),
      record_traits< T >::name, []() -> std::shared_ptr< const Schema > {
        RecordBuilder< T > builder;
        record_traits< T >::describe( builder );

        auto schema = std::make_shared< Schema >();
        for ( const Field& f : builder.fields_ ) schema->names.push_back( f.name );
        schema->descriptor = Descriptor::record( record_traits< T >::name,
          std::move(builder.fields_) );
        schema->binders = std::move( builder.binders_ );
        schema->encoders = std::move( builder.encoders_ );
        return schema;
      } );
  }

  template < typename E >
  std::shared_ptr< const internal::EnumSchema< E > >
  internal::EnumSchema< E >::get()
  {
    using Schema = internal::EnumSchema< E >;
    return TypeCache::global().entry< Schema >( typeid(Schema),
      enum_traits< E >::name, []() -> std::shared_ptr< const Schema > {
        EnumBuilder< E > builder;
        enum_traits< E >::describe( builder );

        auto schema = std::make_shared< Schema >();
        schema->descriptor = Descriptor::enumeration( enum_traits< E >::name,
          std::move(builder.members_) );
        schema->values = std::move( builder.values_ );
        return schema;
      } );
  }

  // Built-in shapes

  template <>
  struct shape< bool > {
    static DescriptorPtr describe() { return Descriptor::boolean(); }
    static bool bind( const Value& v ) { return v.as_bool(); }
    static Value encode( bool b ) { return Value::from_bool( b ); }
  };

  // Integers narrower than 64 bits are range checked during decoding
  template < typename T >
  struct shape< T, std::enable_if_t< std::is_integral< T >::value
    && !std::is_same< T, bool >::value > >
  {
    static DescriptorPtr describe() {
      using limits = std::numeric_limits< T >;
      if constexpr ( std::is_signed< T >::value
        && sizeof(T) >= sizeof(std::int64_t) )
      {
        return Descriptor::integer();
      }
      else if constexpr ( std::is_unsigned< T >::value
        && sizeof(T) >= sizeof(std::int64_t) )
      {
        return Descriptor::integer_range( 0,
          std::numeric_limits< std::int64_t >::max() );
      }
      else {
        return Descriptor::integer_range(
          static_cast< std::int64_t >( limits::min() ),
          static_cast< std::int64_t >( limits::max() ) );
      }
    }
    static T bind( const Value& v ) { return static_cast< T >( v.as_int() ); }
    static Value encode( T i ) {
      return Value::from_int( static_cast< std::int64_t >(i) );
    }
  };

  template < typename T >
  struct shape< T, std::enable_if_t< std::is_floating_point< T >::value > > {
    static DescriptorPtr describe() { return Descriptor::floating(); }
    static T bind( const Value& v ) {
      return static_cast< T >( v.as_float() );
    }
    static Value encode( T d ) {
      return Value::from_float( static_cast< double >(d) );
    }
  };

  template <>
  struct shape< std::string > {
    static DescriptorPtr describe() { return Descriptor::string(); }
    static std::string bind( const Value& v ) { return v.as_string(); }
    static Value encode( const std::string& s ) {
      return Value::from_string( s );
    }
  };

  template <>
  struct shape< Timestamp > {
    static DescriptorPtr describe() { return Descriptor::temporal(); }
    static Timestamp bind( const Value& v ) { return v.as_timestamp(); }
    static Value encode( const Timestamp& t ) {
      return Value::from_timestamp( t );
    }
  };

  template <>
  struct shape< CalendarDuration > {
    static DescriptorPtr describe() { return Descriptor::calendar_duration(); }
    static CalendarDuration bind( const Value& v ) { return v.as_duration(); }
    static Value encode( const CalendarDuration& d ) {
      return Value::from_duration( d );
    }
  };

  // Untyped fields keep the decoded Value as-is
  template <>
  struct shape< Value > {
    static DescriptorPtr describe() { return Descriptor::dynamic(); }
    static Value bind( const Value& v ) { return v; }
    static Value encode( const Value& v ) { return v; }
  };

  template < typename U >
  struct shape< std::optional< U > > {
    static DescriptorPtr describe() {
      return Descriptor::optional( descriptor_of< U >() );
    }
    static std::optional< U > bind( const Value& v ) {
      if ( v.is_null() ) return std::nullopt;
      return shape< U >::bind( v );
    }
    static Value encode( const std::optional< U >& o ) {
      return o ? shape< U >::encode( *o ) : Value();
    }
  };

  template < typename U >
  struct shape< std::vector< U > > {
    static DescriptorPtr describe() {
      return Descriptor::sequence( descriptor_of< U >() );
    }
    static std::vector< U > bind( const Value& v ) {
      std::vector< U > out;
      out.reserve( v.as_list().size() );
      for ( const Value& item : v.as_list() ) {
        out.push_back( shape< U >::bind(item) );
      }
      return out;
    }
    static Value encode( const std::vector< U >& items ) {
      Value::List out;
      out.reserve( items.size() );
      for ( const auto& item : items ) out.push_back( shape< U >::encode(item) );
      return Value::from_list( std::move(out) );
    }
  };

  // Shared by std::map and std::unordered_map keyed by string
  template < typename M, typename U >
  struct string_map_shape {
    static DescriptorPtr describe() {
      return Descriptor::mapping( descriptor_of< U >() );
    }
    static M bind( const Value& v ) {
      M out;
      for ( const auto& [k, item] : v.as_map() ) {
        out.emplace( k, shape< U >::bind(item) );
      }
      return out;
    }
    static Value encode( const M& entries ) {
      Value::Map out;
      for ( const auto& [k, item] : entries ) {
        out.emplace_back( k, shape< U >::encode(item) );
      }
      return Value::from_map( std::move(out) );
    }
  };

  template < typename U >
  struct shape< std::map< std::string, U > >
    : string_map_shape< std::map< std::string, U >, U > {};

  template < typename U >
  struct shape< std::unordered_map< std::string, U > >
    : string_map_shape< std::unordered_map< std::string, U >, U > {};

  // Closed union. The decoder records which alternative it picked, and
  // binding follows that choice.
  template < typename... Alts >
  struct shape< std::variant< Alts... > > {
    using type = std::variant< Alts... >;

    static DescriptorPtr describe() {
      return Descriptor::tagged_union( { descriptor_of< Alts >()... } );
    }

    static type bind( const Value& v ) {
      if ( v.union_choices().empty() ) {
        throw TypeConfigException( std::string(), "value does not record "
          "which alternative of " + descriptor_of< type >()->display_name()
          + " it was decoded as" );
      }
      Value inner = v;
      const std::size_t index = inner.pop_union_choice();
      return bind_at< 0 >( index, inner );
    }

    static Value encode( const type& obj ) {
      Value out = std::visit( []( const auto& alt ) -> Value {
        return shape< std::decay_t< decltype(alt) > >::encode( alt );
      }, obj );
      out.push_union_choice( obj.index() );
      return out;
    }

  private:
    template < std::size_t I >
    static type bind_at( std::size_t index, const Value& v ) {
      if constexpr ( I == sizeof...(Alts) ) {
        throw TypeConfigException( std::string(), "alternative "
          + std::to_string( index ) + " is out of range for "
          + descriptor_of< type >()->display_name() );
      }
      else {
        using Alt = std::variant_alternative_t< I, type >;
        if ( index == I ) {
          return type( std::in_place_index< I >, shape< Alt >::bind(v) );
        }
        return bind_at< I + 1 >( index, v );
      }
    }
  };

  template < typename T >
  struct shape< T, std::enable_if_t< internal::is_record< T >::value > > {
    static DescriptorPtr describe() {
      return internal::RecordSchema< T >::get()->descriptor;
    }
    static T bind( const Value& v ) {
      return internal::RecordSchema< T >::get()->bind( v.as_record() );
    }
    static Value encode( const T& obj ) {
      return Value::from_record( internal::RecordSchema< T >::get()->encode(obj) );
    }
  };

  template < typename E >
  struct shape< E, std::enable_if_t< internal::is_enum_type< E >::value > > {
    static DescriptorPtr describe() {
      return internal::EnumSchema< E >::get()->descriptor;
    }
    static E bind( const Value& v ) {
      const std::string& member = v.as_enum().member;
      for ( const auto& [name, value] : internal::EnumSchema< E >::get()->values )
      {
        if ( name == member ) return value;
      }
      throw ParseException( std::string(), "unknown member " + member + " of "
        + enum_traits< E >::name );
    }
    static Value encode( E e ) {
      for ( const auto& [name, value] : internal::EnumSchema< E >::get()->values )
      {
        if ( value == e ) return Value::from_enum( enum_traits< E >::name, name );
      }
      throw MissingTypeException( std::string( "value of " )
        + enum_traits< E >::name + " has no declared member" );
    }
  };

  // Open polymorphic base. The concrete type is chosen during decoding and
  // recorded in the Value, so binding only has to look it up.
  template < typename B >
  struct shape< std::shared_ptr< B >,
    std::enable_if_t< internal::is_open_base< B >::value > >
  {
    using bindings = internal::PolymorphicBindings< B >;

    static DescriptorPtr describe() {
      return Descriptor::open_polymorphic( open_base_traits< B >::name );
    }

    static std::shared_ptr< B > bind( const Value& v ) {
      if ( v.is_null() ) return nullptr;
      const Value::Record& rec = v.as_record();
      auto entry = bindings::instance().by_name( rec.type );
      if ( !entry ) {
        throw TypeConfigException( std::string(), "no constructor registered "
          "for subtype " + rec.type + " of " + open_base_traits< B >::name );
      }
      return entry->factory( rec );
    }

    static Value encode( const std::shared_ptr< B >& obj ) {
      if ( !obj ) return Value();
      const B& ref = *obj;
      auto entry = bindings::instance().by_type( typeid(ref) );
      if ( !entry ) {
        throw MissingTypeException( std::string( "dynamic type of " )
          + open_base_traits< B >::name + " value is not a registered subtype" );
      }
      Value::Record rec = entry->encoder( ref );
      rec.tagged = true;
      return Value::from_record( std::move(rec) );
    }
  };

  // Make Derived a candidate whenever Base is the decode target. Returns
  // true so that registration can initialize a namespace-scope constant.
  template < typename Base, typename Derived >
  bool register_subclass(
    SubclassRegistry& registry = SubclassRegistry::global() )
  {
    static_assert( internal::is_open_base< Base >::value,
      "Base needs an open_base_traits specialization" );
    static_assert( internal::is_record< Derived >::value,
      "Derived needs a record_traits specialization" );
    static_assert( std::is_base_of< Base, Derived >::value,
      "Derived must inherit from Base" );
    static_assert( std::is_polymorphic< Base >::value,
      "Base must have a virtual member function" );

    const DescriptorPtr record = descriptor_of< Derived >();
    registry.add( open_base_traits< Base >::name,
      Candidate{ record->name(), record } );

    using Entry = typename internal::PolymorphicBindings< Base >::Entry;
    internal::PolymorphicBindings< Base >::instance().add( Entry{
      record->name(), std::type_index( typeid(Derived) ),
      []( const Value::Record& rec ) -> std::shared_ptr< Base > {
        return std::make_shared< Derived >(
          internal::RecordSchema< Derived >::get()->bind(rec) );
      },
      []( const Base& obj ) {
        return internal::RecordSchema< Derived >::get()->encode(
          static_cast< const Derived& >(obj) );
      } } );
    return true;
  }

  // Decode a value tree into T. A null document counts as an empty mapping.
  template < typename T >
  T from_node( const ordered_node& root, const Options& options = Options(),
    const SubclassRegistry& registry = SubclassRegistry::global() )
  {
    const ordered_node doc = root.is_null() ? ordered_node::mapping() : root;
    const Decoder decoder( options, registry );
    return shape< T >::bind( decoder.decode(doc, descriptor_of< T >()) );
  }

  template < typename T >
  T loads( const std::string& text, const Options& options = Options(),
    const SubclassRegistry& registry = SubclassRegistry::global() )
  {
    return from_node< T >( parse(text), options, registry );
  }

  template < typename T >
  T load( std::istream& in, const Options& options = Options(),
    const SubclassRegistry& registry = SubclassRegistry::global() )
  {
    std::ostringstream oss;
    oss << in.rdbuf();
    return loads< T >( oss.str(), options, registry );
  }

  template < typename T >
  Value to_value( const T& obj ) {
    return shape< T >::encode( obj );
  }

  template < typename T >
  ordered_node to_node( const T& obj ) {
    return value_to_node( to_value(obj) );
  }

  template < typename T >
  std::string dumps( const T& obj ) {
    return ordered_node::serialize( to_node(obj) );
  }

  // Layered configuration: later sources deep-merge over earlier ones
  // before a single decode
  class Sources {
  public:
    Sources& text( const std::string& text ) {
      return node( parse(text) );
    }

    Sources& stream( std::istream& in ) {
      std::ostringstream oss;
      oss << in.rdbuf();
      return text( oss.str() );
    }

    // A null document contributes nothing
    Sources& node( const ordered_node& doc ) {
      if ( !doc.is_null() ) merged_ = internal::deep_merge( merged_, doc );
      return *this;
    }

    const ordered_node& merged() const { return merged_; }

    template < typename T >
    T on( const Options& options = Options(),
      const SubclassRegistry& registry = SubclassRegistry::global() ) const
    {
      return from_node< T >( merged_, options, registry );
    }

  private:
    ordered_node merged_ = ordered_node::mapping();
  };

} // namespace conftype
