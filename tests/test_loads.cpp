// test_loads.cpp - Typed loading of C++ structs from YAML/JSON text

#include "conftype.hh"

#include <gtest/gtest.h>

#include <sstream>

using conftype::ErrorKind;
using conftype::Value;

namespace {

struct Simple {
  std::string a;
};

struct Conn {
  std::string host;
  std::int64_t port = 0;
  std::optional< std::map< std::string, std::string > > ssl;
};

struct Pipeline {
  std::string data_root;
  std::string pipeline_name;
  std::string data_type;
  bool production = false;
  std::optional< Conn > conn;
  std::optional< std::map< std::string, std::int64_t > > data_split;
  std::optional< std::string > tfx_root;
  std::optional< std::string > metadata_root;
  std::optional< std::vector< std::string > > beam_args;
};

enum class Color { Red, Green, Blue };

struct Palette {
  Color primary = Color::Red;
  std::vector< Color > accents;
};

struct Schedule {
  conftype::Timestamp start;
  conftype::CalendarDuration every;
};

struct Mixed {
  std::variant< std::int64_t, std::string > a;
  std::variant< std::int64_t, std::string > b;
};

struct Loose {
  Value foo;
};

// Alternatives that decode to values of the same kind
struct Overlapping {
  std::variant< std::vector< std::int64_t >, std::vector< std::string > > items;
  std::variant< std::int32_t, std::int64_t > count;
  std::variant< std::map< std::string, std::int64_t >,
    std::map< std::string, std::string > > table;
  std::variant< std::variant< bool, double >, std::string > nested;
  std::variant< std::int64_t, std::string > mode;
};

struct Small {
  std::uint8_t level = 0;
  std::optional< std::string > label;
};

class InputType {
public:
  virtual ~InputType() = default;
  virtual std::string summary() const = 0;
  virtual std::int64_t complex() const = 0;
};

struct StringImpl : InputType {
  std::string name;
  std::string age;

  std::string summary() const override {
    return name + " is " + age + " years old.";
  }
  std::int64_t complex() const override { return std::stoll( age ) * 3; }
};

struct IntImpl : InputType {
  std::int64_t area_code = 0;
  std::string phone_num;

  std::string summary() const override {
    return "The area code for " + phone_num + " is "
      + std::to_string( area_code );
  }
  std::int64_t complex() const override { return area_code - 10; }
};

struct Located {
  std::string location;
  std::shared_ptr< InputType > input_source;
};

class AmbigImplBase {
public:
  virtual ~AmbigImplBase() = default;
};

struct AmbigImplOne : AmbigImplBase {
  std::string bar;
};

struct AmbigImplTwo : AmbigImplBase {
  std::string bar;
};

struct Ambiguous {
  std::string a;
  std::shared_ptr< AmbigImplBase > foo;
};

struct Everything {
  std::string name;
  conftype::Timestamp at;
  conftype::CalendarDuration every;
  Color color = Color::Red;
  std::shared_ptr< InputType > input;
  std::vector< std::int64_t > nums;
  std::optional< std::string > note;
};

struct Layered {
  std::string name;
  std::int64_t port = 0;
  std::optional< std::map< std::string, std::int64_t > > extra;
};

int tag_factory_calls = 0;

struct Tagged {
  std::vector< std::string > tags;
};

} // namespace

namespace conftype {

template <> struct record_traits< Simple > {
  static constexpr const char* name = "Simple";
  static void describe( RecordBuilder< Simple >& b ) {
    b.field( "a", &Simple::a );
  }
};

template <> struct record_traits< Conn > {
  static constexpr const char* name = "Conn";
  static void describe( RecordBuilder< Conn >& b ) {
    b.field( "host", &Conn::host );
    b.field( "port", &Conn::port );
    b.field_factory( "ssl", &Conn::ssl,
      []() { return std::map< std::string, std::string >(); } );
  }
};

template <> struct record_traits< Pipeline > {
  static constexpr const char* name = "Pipeline";
  static void describe( RecordBuilder< Pipeline >& b ) {
    b.field( "data_root", &Pipeline::data_root );
    b.field( "pipeline_name", &Pipeline::pipeline_name );
    b.field( "data_type", &Pipeline::data_type );
    b.field( "production", &Pipeline::production );
    b.field( "conn", &Pipeline::conn );
    b.field( "data_split", &Pipeline::data_split );
    b.field( "tfx_root", &Pipeline::tfx_root );
    b.field( "metadata_root", &Pipeline::metadata_root );
    b.field_factory( "beam_args", &Pipeline::beam_args, []() {
      return std::vector< std::string >{
        "--direct_running_mode=multi_processing", "--direct_num_workers=0" };
    } );
  }
};

template <> struct enum_traits< Color > {
  static constexpr const char* name = "Color";
  static void describe( EnumBuilder< Color >& b ) {
    b.member( "RED", Color::Red, 1 );
    b.member( "GREEN", Color::Green, 2 );
    b.member( "BLUE", Color::Blue, 3 );
  }
};

template <> struct record_traits< Palette > {
  static constexpr const char* name = "Palette";
  static void describe( RecordBuilder< Palette >& b ) {
    b.field( "primary", &Palette::primary );
    b.field( "accents", &Palette::accents, std::vector< Color >() );
  }
};

template <> struct record_traits< Schedule > {
  static constexpr const char* name = "Schedule";
  static void describe( RecordBuilder< Schedule >& b ) {
    b.field( "start", &Schedule::start );
    b.field( "every", &Schedule::every );
  }
};

template <> struct record_traits< Mixed > {
  static constexpr const char* name = "Mixed";
  static void describe( RecordBuilder< Mixed >& b ) {
    b.field( "a", &Mixed::a );
    b.field( "b", &Mixed::b );
  }
};

template <> struct record_traits< Loose > {
  static constexpr const char* name = "Loose";
  static void describe( RecordBuilder< Loose >& b ) {
    b.field( "foo", &Loose::foo );
  }
};

template <> struct record_traits< Overlapping > {
  static constexpr const char* name = "Overlapping";
  static void describe( RecordBuilder< Overlapping >& b ) {
    b.field( "items", &Overlapping::items );
    b.field( "count", &Overlapping::count );
    b.field( "table", &Overlapping::table );
    b.field( "nested", &Overlapping::nested );
    b.field( "mode", &Overlapping::mode, std::string( "auto" ) );
  }
};

template <> struct record_traits< Small > {
  static constexpr const char* name = "Small";
  static void describe( RecordBuilder< Small >& b ) {
    b.field( "level", &Small::level, 1 );
    b.field( "label", &Small::label, std::string( "none" ) );
  }
};

template <> struct open_base_traits< InputType > {
  static constexpr const char* name = "InputType";
};

template <> struct record_traits< StringImpl > {
  static constexpr const char* name = "StringImpl";
  static void describe( RecordBuilder< StringImpl >& b ) {
    b.field( "name", &StringImpl::name );
    b.field( "age", &StringImpl::age );
  }
};

template <> struct record_traits< IntImpl > {
  static constexpr const char* name = "IntImpl";
  static void describe( RecordBuilder< IntImpl >& b ) {
    b.field( "area_code", &IntImpl::area_code );
    b.field( "phone_num", &IntImpl::phone_num );
  }
};

template <> struct record_traits< Located > {
  static constexpr const char* name = "Located";
  static void describe( RecordBuilder< Located >& b ) {
    b.field( "location", &Located::location );
    b.field( "input_source", &Located::input_source );
  }
};

template <> struct open_base_traits< AmbigImplBase > {
  static constexpr const char* name = "AmbigImplBase";
};

template <> struct record_traits< AmbigImplOne > {
  static constexpr const char* name = "AmbigImplOne";
  static void describe( RecordBuilder< AmbigImplOne >& b ) {
    b.field( "bar", &AmbigImplOne::bar );
  }
};

template <> struct record_traits< AmbigImplTwo > {
  static constexpr const char* name = "AmbigImplTwo";
  static void describe( RecordBuilder< AmbigImplTwo >& b ) {
    b.field( "bar", &AmbigImplTwo::bar );
  }
};

template <> struct record_traits< Ambiguous > {
  static constexpr const char* name = "Ambiguous";
  static void describe( RecordBuilder< Ambiguous >& b ) {
    b.field( "a", &Ambiguous::a );
    b.field( "foo", &Ambiguous::foo );
  }
};

template <> struct record_traits< Everything > {
  static constexpr const char* name = "Everything";
  static void describe( RecordBuilder< Everything >& b ) {
    b.field( "name", &Everything::name );
    b.field( "at", &Everything::at );
    b.field( "every", &Everything::every );
    b.field( "color", &Everything::color );
    b.field( "input", &Everything::input );
    b.field( "nums", &Everything::nums );
    b.field( "note", &Everything::note );
  }
};

template <> struct record_traits< Layered > {
  static constexpr const char* name = "Layered";
  static void describe( RecordBuilder< Layered >& b ) {
    b.field( "name", &Layered::name );
    b.field( "port", &Layered::port );
    b.field( "extra", &Layered::extra );
  }
};

template <> struct record_traits< Tagged > {
  static constexpr const char* name = "Tagged";
  static void describe( RecordBuilder< Tagged >& b ) {
    b.field_factory( "tags", &Tagged::tags, []() {
      ++tag_factory_calls;
      return std::vector< std::string >{ "default" };
    } );
  }
};

} // namespace conftype

namespace {

// Registration order decides the order of failure causes
const bool subclasses_registered =
  conftype::register_subclass< InputType, IntImpl >()
  && conftype::register_subclass< InputType, StringImpl >()
  && conftype::register_subclass< AmbigImplBase, AmbigImplOne >()
  && conftype::register_subclass< AmbigImplBase, AmbigImplTwo >();

} // namespace

TEST(LoadsTest, Simple) {
  EXPECT_EQ(conftype::loads< Simple >("a: hello").a, "hello");
}

TEST(LoadsTest, JsonText) {
  EXPECT_EQ(conftype::loads< Simple >(R"({"a": "json"})").a, "json");
}

TEST(LoadsTest, ComplexNestedRecords) {
  const std::string text = R"(
data_root: /some/path/here
pipeline_name: Penguin-Config
data_type: tfrecord
production: true
conn:
  host: test.server.io
  port: 443
)";
  const Pipeline p = conftype::loads< Pipeline >(text);
  EXPECT_EQ(p.data_root, "/some/path/here");
  EXPECT_EQ(p.pipeline_name, "Penguin-Config");
  EXPECT_EQ(p.data_type, "tfrecord");
  EXPECT_TRUE(p.production);
  ASSERT_TRUE(p.conn.has_value());
  EXPECT_EQ(p.conn->host, "test.server.io");
  EXPECT_EQ(p.conn->port, 443);
  ASSERT_TRUE(p.conn->ssl.has_value());
  EXPECT_TRUE(p.conn->ssl->empty());
  EXPECT_FALSE(p.data_split.has_value());
  EXPECT_FALSE(p.tfx_root.has_value());
  ASSERT_TRUE(p.beam_args.has_value());
  EXPECT_EQ(*p.beam_args,
            (std::vector<std::string>{"--direct_running_mode=multi_processing",
                                      "--direct_num_workers=0"}));
}

TEST(LoadsTest, MissingField) {
  try {
    conftype::loads< Pipeline >("data_root: /x\npipeline_name: p\n"
                                "data_type: t");
    FAIL() << "expected MalformedConfigException";
  } catch (const conftype::MalformedConfigException& e) {
    EXPECT_EQ(e.path(), ".production");
    EXPECT_STREQ(e.what(), "expected type Pipeline at <root>, no production "
                           "found");
  }
}

TEST(LoadsTest, Misformat) {
  EXPECT_THROW(conftype::loads< Conn >("host: h\nport: [443]"),
               conftype::MalformedConfigException);
  EXPECT_THROW(conftype::loads< Conn >("host: h\nport: 443\ncity: Paris"),
               conftype::UnexpectedKeysException);
}

TEST(LoadsTest, IgnoreUnexpected) {
  conftype::Options options;
  options.strict_unexpected_keys = false;
  EXPECT_EQ(conftype::loads< Simple >("a: hello\nb: extra", options).a,
            "hello");
}

TEST(LoadsTest, Enumerations) {
  const Palette p = conftype::loads< Palette >("primary: GREEN\n"
                                               "accents: [BLUE, 1, '2']");
  EXPECT_EQ(p.primary, Color::Green);
  EXPECT_EQ(p.accents,
            (std::vector<Color>{Color::Blue, Color::Red, Color::Green}));

  EXPECT_THROW(conftype::loads< Palette >("primary: PURPLE"),
               conftype::ParseException);
}

TEST(LoadsTest, DatesAndDurations) {
  const Schedule s = conftype::loads< Schedule >(
      "start: '1997-07-16T19:20:07+01:00'\nevery: 1w 2d");
  EXPECT_EQ(s.start.time_since_epoch(),
            std::chrono::microseconds(std::chrono::seconds(869077207)));
  EXPECT_EQ(s.every.days, 9);

  EXPECT_THROW(conftype::loads< Schedule >(
                   "start: '1997-07-16T19:20:07'\nevery: 1d"),
               conftype::ParseException);
}

TEST(LoadsTest, UnionFieldsBindFirstMatchingAlternative) {
  const Mixed m = conftype::loads< Mixed >("a: 1\nb: hello");
  ASSERT_EQ(m.a.index(), 0u);
  EXPECT_EQ(std::get< std::int64_t >(m.a), 1);
  ASSERT_EQ(m.b.index(), 1u);
  EXPECT_EQ(std::get< std::string >(m.b), "hello");

  EXPECT_THROW(conftype::loads< Mixed >("a: 1\nb: [x]"),
               conftype::TypeConfigException);
}

TEST(LoadsTest, UnionBindsTheAlternativeTheDecoderChose) {
  const Overlapping o = conftype::loads< Overlapping >(
      "items: [x]\ncount: 5000000000\ntable: {a: x}\nnested: 2");
  ASSERT_EQ(o.items.index(), 1u);
  EXPECT_EQ(std::get< 1 >(o.items), (std::vector< std::string >{"x"}));
  ASSERT_EQ(o.count.index(), 1u);
  EXPECT_EQ(std::get< std::int64_t >(o.count), 5000000000LL);
  ASSERT_EQ(o.table.index(), 1u);
  EXPECT_EQ(std::get< 1 >(o.table).at("a"), "x");
  ASSERT_EQ(o.nested.index(), 0u);
  ASSERT_EQ(std::get< 0 >(o.nested).index(), 1u);
  EXPECT_DOUBLE_EQ(std::get< double >(std::get< 0 >(o.nested)), 2.0);
  ASSERT_EQ(o.mode.index(), 1u);
  EXPECT_EQ(std::get< std::string >(o.mode), "auto");

  const Overlapping first = conftype::loads< Overlapping >(
      "items: [1]\ncount: 7\ntable: {a: 1}\nnested: true\nmode: 3");
  ASSERT_EQ(first.items.index(), 0u);
  EXPECT_EQ(std::get< 0 >(first.items), (std::vector< std::int64_t >{1}));
  ASSERT_EQ(first.count.index(), 0u);
  EXPECT_EQ(std::get< std::int32_t >(first.count), 7);
  ASSERT_EQ(first.table.index(), 0u);
  EXPECT_EQ(std::get< 0 >(first.table).at("a"), 1);
  ASSERT_EQ(std::get< 0 >(first.nested).index(), 0u);
  EXPECT_TRUE(std::get< bool >(std::get< 0 >(first.nested)));
  ASSERT_EQ(first.mode.index(), 0u);
  EXPECT_EQ(std::get< std::int64_t >(first.mode), 3);

  // Encoded values carry their alternative back through a tree
  const Overlapping back = conftype::from_node< Overlapping >(
      conftype::to_node(o));
  EXPECT_EQ(back.items.index(), 1u);
  EXPECT_EQ(back.count.index(), 1u);
  EXPECT_EQ(std::get< std::int64_t >(back.count), 5000000000LL);
  EXPECT_EQ(back.table.index(), 1u);
}

TEST(LoadsTest, AnyFieldKeepsDecodedValue) {
  const Loose l = conftype::loads< Loose >("foo: [1, 2]");
  ASSERT_EQ(l.foo.kind(), Value::Kind::List);
  EXPECT_EQ(l.foo, Value::from_list({Value::from_int(1), Value::from_int(2)}));

  const Loose nested = conftype::loads< Loose >("foo:\n  bar: [x, 3]");
  const Value::Map& m = nested.foo.as_map();
  ASSERT_EQ(m.size(), 1u);
  EXPECT_EQ(m[0].first, "bar");
  EXPECT_EQ(m[0].second.as_list()[0].as_string(), "x");
}

TEST(LoadsTest, RootMappingAndList) {
  const auto m = conftype::loads< std::map< std::string, std::int64_t > >(
      "a: 1\nb: 2");
  EXPECT_EQ(m.at("a"), 1);
  EXPECT_EQ(m.at("b"), 2);

  EXPECT_TRUE(conftype::loads< Palette >("primary: RED\naccents: []")
                  .accents.empty());
}

TEST(LoadsTest, EmptyDocumentUsesDefaults) {
  const Small s = conftype::loads< Small >("   \n");
  EXPECT_EQ(s.level, 1);
  ASSERT_TRUE(s.label.has_value());
  EXPECT_EQ(*s.label, "none");

  EXPECT_EQ(conftype::loads< Small >("~").level, 1);
  EXPECT_THROW(conftype::loads< Simple >(""),
               conftype::MalformedConfigException);
}

TEST(LoadsTest, ExplicitNullOverridesOptionalDefault) {
  EXPECT_FALSE(conftype::loads< Small >("label: ~").label.has_value());
}

TEST(LoadsTest, NarrowIntegerRange) {
  EXPECT_EQ(conftype::loads< Small >("level: 255").level, 255);
  EXPECT_THROW(conftype::loads< Small >("level: 300"),
               conftype::ParseException);
  EXPECT_THROW(conftype::loads< Small >("level: -1"),
               conftype::ParseException);
}

TEST(LoadsTest, DefaultFactoryRunsOnlyWhenAbsent) {
  tag_factory_calls = 0;
  EXPECT_EQ(conftype::loads< Tagged >("{}").tags,
            (std::vector<std::string>{"default"}));
  EXPECT_EQ(tag_factory_calls, 1);
  EXPECT_EQ(conftype::loads< Tagged >("tags: [a]").tags,
            (std::vector<std::string>{"a"}));
  EXPECT_EQ(tag_factory_calls, 1);
}

TEST(LoadsTest, LoadFromStream) {
  std::istringstream in("a: streamed\n");
  EXPECT_EQ(conftype::load< Simple >(in).a, "streamed");
}

TEST(LoadsTest, MalformedTextIsParseError) {
  EXPECT_THROW(conftype::loads< Simple >("a: [1, 2"),
               conftype::ParseException);
}

TEST(PolymorphicLoadsTest, StringImplSelected) {
  ASSERT_TRUE(subclasses_registered);
  const Located conf = conftype::loads< Located >(R"(
location: Europe
input_source:
  name: Thailand
  age: '12'
)");
  EXPECT_EQ(conf.location, "Europe");
  auto impl = std::dynamic_pointer_cast< StringImpl >(conf.input_source);
  ASSERT_NE(impl, nullptr);
  EXPECT_EQ(impl->name, "Thailand");
  EXPECT_EQ(conf.input_source->summary(), "Thailand is 12 years old.");
  EXPECT_EQ(conf.input_source->complex(), 36);
}

TEST(PolymorphicLoadsTest, IntImplSelected) {
  const Located conf = conftype::loads< Located >(R"(
location: Europe
input_source:
  area_code: 94
  phone_num: '1234567'
)");
  ASSERT_NE(std::dynamic_pointer_cast< IntImpl >(conf.input_source), nullptr);
  EXPECT_EQ(conf.input_source->summary(), "The area code for 1234567 is 94");
  EXPECT_EQ(conf.input_source->complex(), 84);
}

TEST(PolymorphicLoadsTest, FailureListsSubclasses) {
  try {
    conftype::loads< Located >(R"(
location: Europe
input_source:
  name: Thailand
  age: '12'
  city: Paris
)");
    FAIL() << "expected TypeConfigException";
  } catch (const conftype::TypeConfigException& e) {
    EXPECT_EQ(e.kind(), ErrorKind::TypeConfig);
    EXPECT_STREQ(e.what(),
                 "expected type InputType at .input_source, failed "
                 "subclasses:\n"
                 "- expected type IntImpl at .input_source, no area_code "
                 "found\n"
                 "- unexpected key(s) \"city\" detected for type StringImpl "
                 "at .input_source");
  }
}

TEST(PolymorphicLoadsTest, AmbiguousNeedsTypeKey) {
  try {
    conftype::loads< Ambiguous >("a: Europe\nfoo:\n  bar: Baz");
    FAIL() << "expected AmbiguousSubclassException";
  } catch (const conftype::AmbiguousSubclassException& e) {
    EXPECT_STREQ(e.what(),
                 "multiple subtypes of AmbigImplBase matched at .foo, use "
                 "'_type' to disambiguate:\n"
                 "- AmbigImplOne\n"
                 "- AmbigImplTwo");
  }

  const Ambiguous conf = conftype::loads< Ambiguous >(
      "a: Europe\nfoo:\n  _type: AmbigImplTwo\n  bar: Baz");
  auto two = std::dynamic_pointer_cast< AmbigImplTwo >(conf.foo);
  ASSERT_NE(two, nullptr);
  EXPECT_EQ(two->bar, "Baz");
}

TEST(EncodeTest, NodeRoundTrip) {
  Everything in;
  in.name = "sample";
  in.at = conftype::Timestamp(std::chrono::seconds(869077207));
  in.every.days = 2;
  in.every.hours = 3;
  in.color = Color::Blue;
  auto impl = std::make_shared< StringImpl >();
  impl->name = "Thailand";
  impl->age = "12";
  in.input = impl;
  in.nums = {1, 2, 3};

  const conftype::ordered_node node = conftype::to_node(in);
  ASSERT_TRUE(node.is_mapping());
  EXPECT_EQ(node.at("at").get_value< std::string >(), "1997-07-16T18:20:07Z");
  EXPECT_EQ(node.at("every").get_value< std::string >(), "2d3h");
  EXPECT_EQ(node.at("color").get_value< std::string >(), "BLUE");
  EXPECT_EQ(node.at("input").at("_type").get_value< std::string >(),
            "StringImpl");
  EXPECT_TRUE(node.at("note").is_null());

  const Everything out = conftype::from_node< Everything >(node);
  EXPECT_EQ(out.name, in.name);
  EXPECT_EQ(out.at, in.at);
  EXPECT_EQ(out.every, in.every);
  EXPECT_EQ(out.color, in.color);
  EXPECT_EQ(out.nums, in.nums);
  EXPECT_FALSE(out.note.has_value());
  auto back = std::dynamic_pointer_cast< StringImpl >(out.input);
  ASSERT_NE(back, nullptr);
  EXPECT_EQ(back->age, "12");

  EXPECT_EQ(conftype::to_value(out), conftype::to_value(in));
}

TEST(EncodeTest, TextRoundTrip) {
  Ambiguous in;
  in.a = "Europe";
  auto two = std::make_shared< AmbigImplTwo >();
  two->bar = "Baz";
  in.foo = two;

  const Ambiguous out = conftype::loads< Ambiguous >(conftype::dumps(in));
  EXPECT_EQ(out.a, "Europe");
  auto back = std::dynamic_pointer_cast< AmbigImplTwo >(out.foo);
  ASSERT_NE(back, nullptr);
  EXPECT_EQ(back->bar, "Baz");
}

TEST(SourcesTest, LaterSourcesWin) {
  conftype::Sources sources;
  sources.text("name: base\nport: 1\nextra:\n  a: 1")
      .text("port: 2\nextra:\n  b: 2");
  const Layered l = sources.on< Layered >();
  EXPECT_EQ(l.name, "base");
  EXPECT_EQ(l.port, 2);
  ASSERT_TRUE(l.extra.has_value());
  EXPECT_EQ(l.extra->at("a"), 1);
  EXPECT_EQ(l.extra->at("b"), 2);
}

TEST(SourcesTest, NullOverlayClears) {
  conftype::Sources sources;
  std::istringstream overlay("extra: ~\n");
  sources.text("name: base\nport: 1\nextra:\n  a: 1").stream(overlay);
  EXPECT_FALSE(sources.on< Layered >().extra.has_value());
}

TEST(SourcesTest, EmptySourcesAreIgnored) {
  conftype::Sources sources;
  sources.text("").text("name: n\nport: 3").text("~");
  EXPECT_EQ(sources.on< Layered >().port, 3);
}

TEST(SourcesTest, NumericKeysMergeWithTheirStringForm) {
  conftype::Sources sources;
  sources.text("1: a\n0.1: x\n2: b").text("'1': c\n'0.1': y");
  const auto merged = sources.on< std::map< std::string, std::string > >();
  ASSERT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged.at("1"), "c");
  EXPECT_EQ(merged.at("0.1"), "y");
  EXPECT_EQ(merged.at("2"), "b");

  // Float keys keep their exact text
  const auto floats = conftype::loads< std::map< std::string, std::string > >(
      "0.5: x\n1.0: y");
  EXPECT_EQ(floats.at("0.5"), "x");
  EXPECT_EQ(floats.at("1.0"), "y");
}
