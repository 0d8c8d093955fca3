// ╻ ╻┏━╸┏━┓┏━┓┏━┓╺┳╸┏━┓
// ┃┏┛┣╸ ┣┳┛┣┳┛┣━┫ ┃ ┣━┫
// ┗┛ ┗━╸╹┗╸╹┗╸╹ ╹ ╹ ╹ ╹
//  Validation ERRor Aggregation & TrAnslation
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the verrata authors
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <locale>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

namespace verrata {

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

namespace internal {

  // Constants defining the catalog domains, placeholder syntax, and the keys
  // used by the YAML document formats. This block provides a single location
  // for easy editing to allow for future changes.
  inline constexpr char PATH_DELIMITER = '.';

  inline const std::string OPEN_PLACEHOLDER = "%{";
  inline const std::string CLOSE_PLACEHOLDER = "}";
  inline const std::string PREFIX_SEPARATOR = ": ";

  inline const std::string ERRORS_DOMAIN = "errors";
  inline const std::string SCHEMA_FIELDS_DOMAIN = "schema_fields";
  inline const std::string COUNT = "count";

  inline const std::string ZERO_FORM = "zero";
  inline const std::string ONE_FORM = "one";
  inline const std::string OTHER_FORM = "other";

  inline const std::string DOC_ROOT = "root";
  inline const std::string CATALOG_ROOT = "catalog";
  inline const std::string STATE = "state";
  inline const std::string VALUE = "value";
  inline const std::string CONTEXT = "context";
  inline const std::string LOCALE = "locale";
  inline const std::string ERRORS = "errors";
  inline const std::string FIELDS = "fields";
  inline const std::string ASSOCIATIONS = "associations";
  inline const std::string SINGLE = "single";
  inline const std::string MANY = "many";
  inline const std::string TEMPLATE = "template";
  inline const std::string BINDINGS = "bindings";
  inline const std::string RESOLVED = "resolved";
  inline const std::string UNRESOLVED = "unresolved";

  // Connects path segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Append a numerical index to the end of a base path string
  inline std::string seq_indexed( const std::string& base, size_t idx ) {
    return base + '[' + std::to_string( idx ) + ']';
  }

  // Helper that checks whether an ordered_node is a non-null scalar field
  inline bool is_non_null_scalar( const ordered_node& n ) {
    return ( n.is_scalar() && !n.is_null() );
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

  // Shortest decimal form that reads back as the same double, e.g., 0.5
  // rather than 0.500000. Integral values keep a trailing ".0".
  inline std::string shortest_float_string( double v ) {
    if ( !std::isfinite(v) ) {
      if ( std::isnan(v) ) return ".nan";
      return v < 0 ? "-.inf" : ".inf";
    }

    std::string s;
    for ( int prec = 1; prec <= std::numeric_limits< double >::max_digits10;
      ++prec )
    {
      std::ostringstream oss;
      oss.imbue( std::locale::classic() );
      oss << std::setprecision( prec ) << v;
      s = oss.str();
      if ( std::strtod(s.c_str(), nullptr) == v ) break;
    }

    if ( s.find_first_of(".eE") == std::string::npos ) s += ".0";
    return s;
  }

  // Characters allowed in a "%{name}" placeholder name
  inline bool is_placeholder_name_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalnum( c ) || c == '_';
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return shortest_float_string(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // Compose "a.b[0].c: message (hint)" and throw it
  [[noreturn]] inline void throw_error_at(
    const std::vector< std::string >& path, const std::string& msg,
    const std::optional< std::string >& hint = std::nullopt )
  {
    std::ostringstream oss;
    oss << join_path( path ) << ": " << msg;
    if ( hint && !hint->empty() ) {
      oss << " (" << *hint << ')';
    }
    throw std::runtime_error( oss.str() );
  }

  // Lets std::visit take one lambda per alternative
  template < typename... Fs >
  struct Overloaded : Fs... { using Fs::operator()...; };

  template < typename... Fs >
  Overloaded( Fs... ) -> Overloaded< Fs... >;

} // namespace verrata::internal

  // Locale used whenever neither the resolution context nor the middleware
  // options name one
  inline const std::string DEFAULT_LOCALE = "en";

  // Placeholder name -> scalar value (integer, float, boolean or string)
  using Bindings = std::map< std::string, ordered_node >;

  // One validation failure on one field
  struct ErrorDetail {
    std::string message_template;
    Bindings bindings;

    ErrorDetail() = default;
    inline explicit ErrorDetail( std::string tmpl )
      : message_template( std::move(tmpl) ) {}

    template < typename T >
    ErrorDetail& bind( const std::string& name, const T& value );
    ErrorDetail& bind( const std::string& name, const char* value );
  };

  struct ValidationNode;

  // An association holding exactly one nested record
  struct Single {
    std::shared_ptr< const ValidationNode > node;
  };

  // An association holding an ordered collection of nested records
  struct Many {
    std::vector< ValidationNode > nodes;
  };

  using AssociationEntry = std::variant< Single, Many >;

  // One level of a validated record: its own field errors plus the results
  // for its nested associations
  struct ValidationNode {
    std::map< std::string, std::vector< ErrorDetail > > field_errors;
    std::map< std::string, AssociationEntry > associations;

    ValidationNode& add_error( const std::string& field, ErrorDetail detail );
    ValidationNode& add_single( const std::string& name, ValidationNode child );
    ValidationNode& add_many( const std::string& name,
      std::vector< ValidationNode > children );

    // True iff no field errors exist here or anywhere below
    bool is_valid() const;

    // Total number of ErrorDetail instances reachable from this node
    std::size_t error_count() const;
  };

  // Message | Tree
  using RawError = std::variant< std::string, ValidationNode >;

  // A flattened field failure, ready for formatting
  struct Leaf {
    std::string prefix;
    std::string field;
    std::string message_template;
    Bindings bindings;
  };

  // Immediate labels a nested leaf with its direct parent association only.
  // Path joins every enclosing association name with PATH_DELIMITER.
  enum class PrefixMode { Immediate, Path };

  // Pluggable localization. Only translate() must be provided; an absent
  // result means "no catalog entry" and triggers the caller's fallback.
  class Translator {
  public:
    virtual ~Translator() = default;

    virtual std::optional< std::string > translate( const std::string& domain,
      const std::string& key, const std::string& locale ) const = 0;

    virtual std::optional< std::string > translate_plural(
      const std::string& domain, const std::string& key,
      std::int64_t /*count*/, const std::string& locale ) const
    {
      return this->translate( domain, key, locale );
    }

    virtual std::string errors_domain() const {
      return internal::ERRORS_DOMAIN;
    }

    virtual std::string schema_fields_domain() const {
      return internal::SCHEMA_FIELDS_DOMAIN;
    }
  };

  // Never finds a translation, so every lookup falls back to its key
  class IdentityTranslator final : public Translator {
  public:
    std::optional< std::string > translate( const std::string&,
      const std::string&, const std::string& ) const override
    {
      return std::nullopt;
    }
  };

  // Per-locale, per-domain message tables loaded from YAML:
  //   locale -> domain -> msgid -> msgstr
  // where a msgstr is either a string or a mapping of plural forms
  // (zero/one/other)
  class Catalog {
  public:
    static Catalog parse( const std::string& text );
    static Catalog load( std::istream& in );

    // Entries from other replace entries with the same locale/domain/msgid
    void merge( const Catalog& other );

    std::optional< std::string > find( const std::string& locale,
      const std::string& domain, const std::string& msgid ) const;

    std::optional< std::string > find_plural( const std::string& locale,
      const std::string& domain, const std::string& msgid,
      std::int64_t count ) const;

    bool has_locale( const std::string& locale ) const;

    // Number of msgids across every locale and domain
    std::size_t size() const;

  private:

    // Plural form name -> msgstr. A plain msgstr is stored as OTHER_FORM.
    struct Entry {
      std::map< std::string, std::string > forms;
    };

    using DomainTable = std::map< std::string, Entry >;

    // locale -> domain -> msgid -> entry
    std::map< std::string, std::map< std::string, DomainTable > > locales_;

    const Entry* lookup( const std::string& locale, const std::string& domain,
      const std::string& msgid ) const;

    static Entry parse_entry( const ordered_node& msgstr,
      const std::vector< std::string >& path );
  };

  // Translator backed by a shared, read-only Catalog
  class CatalogTranslator : public Translator {
  public:
    inline explicit CatalogTranslator( std::shared_ptr< const Catalog > catalog,
      std::string errors_domain = internal::ERRORS_DOMAIN,
      std::string schema_fields_domain = internal::SCHEMA_FIELDS_DOMAIN )
      : catalog_( std::move(catalog) ),
        errors_domain_( std::move(errors_domain) ),
        schema_fields_domain_( std::move(schema_fields_domain) ) {}

    std::optional< std::string > translate( const std::string& domain,
      const std::string& key, const std::string& locale ) const override;

    std::optional< std::string > translate_plural( const std::string& domain,
      const std::string& key, std::int64_t count,
      const std::string& locale ) const override;

    std::string errors_domain() const override { return errors_domain_; }

    std::string schema_fields_domain() const override {
      return schema_fields_domain_;
    }

  private:
    std::shared_ptr< const Catalog > catalog_;
    std::string errors_domain_;
    std::string schema_fields_domain_;
  };

  enum class ResolutionState { Unresolved, Resolved };

  // Request context. values may carry a string "locale"; translator
  // overrides the one configured on the middleware.
  struct Context {
    ordered_node values = ordered_node::mapping();
    std::shared_ptr< const Translator > translator;

    std::optional< std::string > locale() const;
  };

  // Outcome of a resolver step
  struct Resolution {
    ordered_node value;
    std::vector< RawError > errors;
    ResolutionState state = ResolutionState::Unresolved;
    Context context;

    bool failed() const { return !errors.empty(); }

    // The errors as plain strings. Throws std::logic_error while any
    // validation tree is still present.
    std::vector< std::string > error_strings() const;
  };

  // One stage of a request-processing pipeline
  class Middleware {
  public:
    virtual ~Middleware() = default;
    virtual Resolution call( Resolution resolution ) const = 0;
  };

  struct TranslateOptions {
    std::string default_locale = DEFAULT_LOCALE;
    std::shared_ptr< const Translator > translator
      = std::make_shared< IdentityTranslator >();
    PrefixMode prefix_mode = PrefixMode::Immediate;
  };

  // Replaces the raw errors of a failed resolution with a sorted list of
  // rendered, localized strings. Everything else passes through untouched.
  class TranslateErrors : public Middleware {
  public:
    inline TranslateErrors() : TranslateErrors( TranslateOptions() ) {}
    inline explicit TranslateErrors( TranslateOptions options );

    Resolution call( Resolution resolution ) const override;

    // Render and stable-sort every raw error
    std::vector< std::string > render( const std::vector< RawError >& errors,
      const std::string& locale, const Translator& translator ) const;

    const TranslateOptions& options() const { return options_; }

  private:
    TranslateOptions options_;
  };

  // Runs its stages in insertion order, each seeing the previous output
  class Pipeline : public Middleware {
  public:
    Pipeline& then( std::shared_ptr< const Middleware > stage );

    Resolution call( Resolution resolution ) const override;

    std::size_t size() const { return stages_.size(); }

  private:
    std::vector< std::shared_ptr< const Middleware > > stages_;
  };

  // Core operations

  std::string interpolate( const std::string& tmpl, const Bindings& bindings );

  std::vector< Leaf > flatten( const ValidationNode& node,
    const std::string& prefix = "", PrefixMode mode = PrefixMode::Immediate );

  std::string format_message( const std::string& message,
    const std::string& locale, const Translator& translator,
    const std::optional< std::string >& domain = std::nullopt );

  std::string format_leaf( const Leaf& leaf, const std::string& locale,
    const Translator& translator );

  std::string format_leaf( const std::string& prefix, const std::string& field,
    const std::string& tmpl, const Bindings& bindings,
    const std::string& locale, const Translator& translator );

  // YAML document codec

  Resolution decode_resolution( const ordered_node& doc );
  Resolution parse_resolution( const std::string& text );
  Resolution load_resolution( std::istream& in );
  ordered_node encode_resolution( const Resolution& resolution );

namespace internal {

  // Walks a resolution document, tracking the path for error messages,
  // e.g., ["root", "errors[0]", "associations", "posts"]
  class DocumentDecoder {
  public:
    Resolution decode( const ordered_node& doc );

  private:
    std::vector< std::string > path_stack_;

    RawError decode_raw_error( const ordered_node& n );
    ValidationNode decode_node( const ordered_node& n );
    ErrorDetail decode_detail( const ordered_node& n );
    AssociationEntry decode_association( const ordered_node& n );
    Bindings decode_bindings( const ordered_node& n );

    [[noreturn]] void throw_error_at( const std::string& msg,
      const std::optional< std::string >& hint = std::nullopt ) const
    {
      internal::throw_error_at( path_stack_, msg, hint );
    }
  };

  // Integer "count" binding, if any, used to select plural forms
  inline std::optional< std::int64_t > plural_count( const Bindings& b ) {
    auto it = b.find( COUNT );
    if ( it == b.end() || !it->second.is_integer() ) return std::nullopt;
    return to_native_checked< std::int64_t >( it->second );
  }

  // Prefix for leaves found under association assoc_name
  inline std::string nested_prefix( const std::string& enclosing,
    const std::string& assoc_name, PrefixMode mode )
  {
    if ( mode == PrefixMode::Path && !enclosing.empty() ) {
      return join_path( { enclosing, assoc_name } );
    }
    // The enclosing name is dropped, not combined
    return assoc_name;
  }

  inline void flatten_into( const ValidationNode& node,
    const std::string& prefix, PrefixMode mode, std::vector< Leaf >& out )
  {
    // 1) This node's own field errors, labelled with the current prefix
    for ( const auto& [field, details] : node.field_errors ) {
      for ( const ErrorDetail& d : details ) {
        out.push_back( Leaf{ prefix, field, d.message_template, d.bindings } );
      }
    }

    // 2) Nested associations
    for ( const auto& assoc : node.associations ) {
      const std::string& name = assoc.first;
      const std::string child_prefix = nested_prefix( prefix, name, mode );
      std::visit( Overloaded{
        [&]( const Single& s ) {
          if ( !s.node ) {
            throw std::logic_error( "association '" + name
              + "' holds a null single entry" );
          }
          flatten_into( *s.node, child_prefix, mode, out );
        },
        [&]( const Many& m ) {
          for ( const ValidationNode& child : m.nodes ) {
            flatten_into( child, child_prefix, mode, out );
          }
        }
      }, assoc.second );
    }
  }

  inline ordered_node encode_node( const ValidationNode& node );

  inline ordered_node encode_detail( const ErrorDetail& d ) {
    // Details without bindings use the short string form
    if ( d.bindings.empty() ) return make_node_from( d.message_template );
    ordered_node out = ordered_node::mapping();
    out[ TEMPLATE ] = make_node_from( d.message_template );
    ordered_node b = ordered_node::mapping();
    for ( const auto& [name, value] : d.bindings ) b[ name ] = value;
    out[ BINDINGS ] = b;
    return out;
  }

  inline ordered_node encode_node( const ValidationNode& node ) {
    ordered_node out = ordered_node::mapping();

    if ( !node.field_errors.empty() ) {
      ordered_node fields = ordered_node::mapping();
      for ( const auto& [field, details] : node.field_errors ) {
        std::vector< ordered_node > seq;
        seq.reserve( details.size() );
        for ( const ErrorDetail& d : details ) seq.push_back( encode_detail(d) );
        fields[ field ] = make_node_from( seq );
      }
      out[ FIELDS ] = fields;
    }

    if ( !node.associations.empty() ) {
      ordered_node assocs = ordered_node::mapping();
      for ( const auto& [name, entry] : node.associations ) {
        ordered_node e = ordered_node::mapping();
        std::visit( Overloaded{
          [&]( const Single& s ) {
            e[ SINGLE ] = s.node ? encode_node( *s.node )
              : ordered_node::mapping();
          },
          [&]( const Many& m ) {
            std::vector< ordered_node > seq;
            seq.reserve( m.nodes.size() );
            for ( const ValidationNode& c : m.nodes ) {
              seq.push_back( encode_node(c) );
            }
            e[ MANY ] = make_node_from( seq );
          }
        }, entry );
        assocs[ name ] = e;
      }
      out[ ASSOCIATIONS ] = assocs;
    }
    return out;
  }

} // namespace verrata::internal

} // namespace verrata

template < typename T >
inline verrata::ErrorDetail& verrata::ErrorDetail::bind(
  const std::string& name, const T& value )
{
  bindings[ name ] = internal::make_node_from( value );
  return *this;
}

inline verrata::ErrorDetail& verrata::ErrorDetail::bind(
  const std::string& name, const char* value )
{
  return this->bind( name, std::string(value) );
}

inline verrata::ValidationNode& verrata::ValidationNode::add_error(
  const std::string& field, ErrorDetail detail )
{
  field_errors[ field ].push_back( std::move(detail) );
  return *this;
}

inline verrata::ValidationNode& verrata::ValidationNode::add_single(
  const std::string& name, ValidationNode child )
{
  associations.insert_or_assign( name,
    Single{ std::make_shared< const ValidationNode >( std::move(child) ) } );
  return *this;
}

inline verrata::ValidationNode& verrata::ValidationNode::add_many(
  const std::string& name, std::vector< ValidationNode > children )
{
  associations.insert_or_assign( name, Many{ std::move(children) } );
  return *this;
}

inline bool verrata::ValidationNode::is_valid() const {
  for ( const auto& [field, details] : field_errors ) {
    if ( !details.empty() ) return false;
  }
  for ( const auto& [name, entry] : associations ) {
    const bool valid = std::visit( internal::Overloaded{
      []( const Single& s ) { return !s.node || s.node->is_valid(); },
      []( const Many& m ) {
        return std::all_of( m.nodes.begin(), m.nodes.end(),
          []( const ValidationNode& c ) { return c.is_valid(); } );
      }
    }, entry );
    if ( !valid ) return false;
  }
  return true;
}

inline std::size_t verrata::ValidationNode::error_count() const {
  std::size_t count = 0;
  for ( const auto& [field, details] : field_errors ) count += details.size();
  for ( const auto& [name, entry] : associations ) {
    std::visit( internal::Overloaded{
      [&]( const Single& s ) { if ( s.node ) count += s.node->error_count(); },
      [&]( const Many& m ) {
        for ( const ValidationNode& c : m.nodes ) count += c.error_count();
      }
    }, entry );
  }
  return count;
}

// Catalog

inline verrata::Catalog verrata::Catalog::load( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return Catalog::parse( ss.str() );
}

inline verrata::Catalog verrata::Catalog::parse( const std::string& text ) {
  using internal::CATALOG_ROOT;
  using internal::to_string_any;

  Catalog catalog;
  const ordered_node doc = ordered_node::deserialize( text );

  // An empty document is an empty catalog
  if ( doc.is_null() ) return catalog;

  std::vector< std::string > path = { CATALOG_ROOT };
  if ( !doc.is_mapping() ) {
    internal::throw_error_at( path, "catalog must be a mapping of locales",
      std::string( "locale -> domain -> msgid -> msgstr" ) );
  }

  for ( const auto& [lk, lv] : doc.map_items() ) {
    const std::string locale = to_string_any( lk );
    path.push_back( locale );
    if ( !lv.is_mapping() ) {
      internal::throw_error_at( path, "locale must be a mapping of domains" );
    }

    for ( const auto& [dk, dv] : lv.map_items() ) {
      const std::string domain = to_string_any( dk );
      path.push_back( domain );
      if ( !dv.is_mapping() ) {
        internal::throw_error_at( path,
          "domain must be a mapping of msgid -> msgstr" );
      }

      DomainTable& table = catalog.locales_[ locale ][ domain ];
      for ( const auto& [mk, mv] : dv.map_items() ) {
        const std::string msgid = to_string_any( mk );
        path.push_back( msgid );
        table[ msgid ] = parse_entry( mv, path );
        path.pop_back();
      }
      path.pop_back();
    }
    path.pop_back();
  }
  return catalog;
}

inline verrata::Catalog::Entry verrata::Catalog::parse_entry(
  const ordered_node& msgstr, const std::vector< std::string >& path )
{
  using namespace internal;

  Entry entry;
  if ( msgstr.is_string() ) {
    entry.forms[ OTHER_FORM ] = to_native_checked< std::string >( msgstr );
    return entry;
  }

  if ( !msgstr.is_mapping() ) {
    throw_error_at( path, "message must be a string or a plural mapping" );
  }

  for ( const auto& [fk, fv] : msgstr.map_items() ) {
    const std::string form = to_string_any( fk );
    if ( form != ZERO_FORM && form != ONE_FORM && form != OTHER_FORM ) {
      throw_error_at( path, "unknown plural form '" + form + "'",
        std::string( "expected one of zero, one, other" ) );
    }
    if ( !fv.is_string() ) {
      std::vector< std::string > p2 = path;
      p2.push_back( form );
      throw_error_at( p2, "plural form must be a string" );
    }
    entry.forms[ form ] = to_native_checked< std::string >( fv );
  }
  return entry;
}

inline void verrata::Catalog::merge( const Catalog& other ) {
  for ( const auto& [locale, domains] : other.locales_ ) {
    for ( const auto& [domain, table] : domains ) {
      DomainTable& mine = locales_[ locale ][ domain ];
      for ( const auto& [msgid, entry] : table ) mine[ msgid ] = entry;
    }
  }
}

inline const verrata::Catalog::Entry* verrata::Catalog::lookup(
  const std::string& locale, const std::string& domain,
  const std::string& msgid ) const
{
  auto lit = locales_.find( locale );
  if ( lit == locales_.end() ) return nullptr;
  auto dit = lit->second.find( domain );
  if ( dit == lit->second.end() ) return nullptr;
  auto mit = dit->second.find( msgid );
  if ( mit == dit->second.end() ) return nullptr;
  return &mit->second;
}

inline std::optional< std::string > verrata::Catalog::find(
  const std::string& locale, const std::string& domain,
  const std::string& msgid ) const
{
  const Entry* e = lookup( locale, domain, msgid );
  if ( !e ) return std::nullopt;
  auto it = e->forms.find( internal::OTHER_FORM );
  if ( it == e->forms.end() ) return std::nullopt;
  return it->second;
}

inline std::optional< std::string > verrata::Catalog::find_plural(
  const std::string& locale, const std::string& domain,
  const std::string& msgid, std::int64_t count ) const
{
  const Entry* e = lookup( locale, domain, msgid );
  if ( !e ) return std::nullopt;

  std::string form = internal::OTHER_FORM;
  if ( count == 0 && e->forms.count(internal::ZERO_FORM) ) {
    form = internal::ZERO_FORM;
  }
  else if ( count == 1 && e->forms.count(internal::ONE_FORM) ) {
    form = internal::ONE_FORM;
  }

  auto it = e->forms.find( form );
  if ( it == e->forms.end() ) return std::nullopt;
  return it->second;
}

inline bool verrata::Catalog::has_locale( const std::string& locale ) const {
  return locales_.count( locale ) > 0;
}

inline std::size_t verrata::Catalog::size() const {
  std::size_t n = 0;
  for ( const auto& [locale, domains] : locales_ ) {
    for ( const auto& [domain, table] : domains ) n += table.size();
  }
  return n;
}

inline std::optional< std::string > verrata::CatalogTranslator::translate(
  const std::string& domain, const std::string& key,
  const std::string& locale ) const
{
  if ( !catalog_ ) return std::nullopt;
  return catalog_->find( locale, domain, key );
}

inline std::optional< std::string >
  verrata::CatalogTranslator::translate_plural( const std::string& domain,
    const std::string& key, std::int64_t count,
    const std::string& locale ) const
{
  if ( !catalog_ ) return std::nullopt;
  return catalog_->find_plural( locale, domain, key, count );
}

// Resolution

inline std::optional< std::string > verrata::Context::locale() const {
  if ( !values.is_mapping() || !values.contains(internal::LOCALE) ) {
    return std::nullopt;
  }
  const ordered_node& loc = values.at( internal::LOCALE );
  if ( !loc.is_string() ) return std::nullopt;
  return internal::to_native_checked< std::string >( loc );
}

inline std::vector< std::string > verrata::Resolution::error_strings() const {
  std::vector< std::string > out;
  out.reserve( errors.size() );
  for ( const RawError& raw : errors ) {
    const std::string* message = std::get_if< std::string >( &raw );
    if ( !message ) {
      throw std::logic_error(
        "errors still contain an untranslated validation tree" );
    }
    out.push_back( *message );
  }
  return out;
}

// Interpolation, flattening and formatting

// Substitute every bound "%{name}" in a single left-to-right pass. A name
// is one or more word characters; anything else after "%{" is literal text
// and scanning resumes right after the '%'. Unbound placeholders are kept as
// literal text and substituted values are never rescanned.
inline std::string verrata::interpolate( const std::string& tmpl,
  const Bindings& bindings )
{
  using internal::OPEN_PLACEHOLDER;
  using internal::CLOSE_PLACEHOLDER;

  std::string out;
  out.reserve( tmpl.size() );
  std::string::size_type pos = 0;

  while ( pos < tmpl.size() ) {
    const auto open = tmpl.find( OPEN_PLACEHOLDER, pos );
    if ( open == std::string::npos ) break;

    const auto name_start = open + OPEN_PLACEHOLDER.size();
    auto name_end = name_start;
    while ( name_end < tmpl.size()
      && internal::is_placeholder_name_char(tmpl[ name_end ]) ) ++name_end;

    out.append( tmpl, pos, open - pos );

    // Not a placeholder: keep the '%' and rescan from the next character
    if ( name_end == name_start
      || tmpl.compare(name_end, CLOSE_PLACEHOLDER.size(), CLOSE_PLACEHOLDER) )
    {
      out += tmpl[ open ];
      pos = open + 1;
      continue;
    }

    const std::string name = tmpl.substr( name_start, name_end - name_start );
    const auto close = name_end + CLOSE_PLACEHOLDER.size();
    auto it = bindings.find( name );
    if ( it != bindings.end() ) {
      out += internal::to_string_any( it->second );
    }
    else {
      out.append( tmpl, open, close - open );
    }
    pos = close;
  }

  out.append( tmpl, pos, std::string::npos );
  return out;
}

inline std::vector< verrata::Leaf > verrata::flatten(
  const ValidationNode& node, const std::string& prefix, PrefixMode mode )
{
  std::vector< Leaf > leaves;
  internal::flatten_into( node, prefix, mode, leaves );
  return leaves;
}

inline std::string verrata::format_message( const std::string& message,
  const std::string& locale, const Translator& translator,
  const std::optional< std::string >& domain )
{
  const std::string dom = domain ? *domain : translator.errors_domain();
  return translator.translate( dom, message, locale ).value_or( message );
}

inline std::string verrata::format_leaf( const Leaf& leaf,
  const std::string& locale, const Translator& translator )
{
  return format_leaf( leaf.prefix, leaf.field, leaf.message_template,
    leaf.bindings, locale, translator );
}

// Renders "[prefix: ]field message" with the field name and the message
// body looked up in separate catalog domains
inline std::string verrata::format_leaf( const std::string& prefix,
  const std::string& field, const std::string& tmpl, const Bindings& bindings,
  const std::string& locale, const Translator& translator )
{
  const std::string errors_domain = translator.errors_domain();

  std::optional< std::string > localized;
  if ( auto count = internal::plural_count(bindings) ) {
    localized = translator.translate_plural( errors_domain, tmpl, *count,
      locale );
  }
  else {
    localized = translator.translate( errors_domain, tmpl, locale );
  }

  const std::string message = interpolate( localized.value_or(tmpl), bindings );
  const std::string localized_field = translator.translate(
    translator.schema_fields_domain(), field, locale ).value_or( field );

  std::string out;
  if ( !prefix.empty() ) out += prefix + internal::PREFIX_SEPARATOR;
  out += localized_field;
  out += ' ';
  out += message;
  return out;
}

// Middleware

inline verrata::TranslateErrors::TranslateErrors( TranslateOptions options )
  : options_( std::move(options) )
{
  if ( !options_.translator ) {
    options_.translator = std::make_shared< IdentityTranslator >();
  }
}

inline std::vector< std::string > verrata::TranslateErrors::render(
  const std::vector< RawError >& errors, const std::string& locale,
  const Translator& translator ) const
{
  std::vector< std::string > out;
  for ( const RawError& raw : errors ) {
    std::visit( internal::Overloaded{
      [&]( const std::string& message ) {
        out.push_back( format_message(message, locale, translator) );
      },
      [&]( const ValidationNode& tree ) {
        for ( const Leaf& leaf : flatten(tree, "", options_.prefix_mode) ) {
          out.push_back( format_leaf(leaf, locale, translator) );
        }
      }
    }, raw );
  }

  // Traversal order is not part of the contract; the sort is
  std::stable_sort( out.begin(), out.end() );
  return out;
}

inline verrata::Resolution verrata::TranslateErrors::call(
  Resolution resolution ) const
{
  if ( !resolution.failed() ) return resolution;

  const std::string locale
    = resolution.context.locale().value_or( options_.default_locale );
  const Translator& translator = resolution.context.translator
    ? *resolution.context.translator : *options_.translator;

  std::vector< std::string > rendered
    = this->render( resolution.errors, locale, translator );

  std::vector< RawError > replaced;
  replaced.reserve( rendered.size() );
  for ( std::string& s : rendered ) {
    replaced.emplace_back( std::in_place_type< std::string >, std::move(s) );
  }
  resolution.errors = std::move( replaced );
  return resolution;
}

inline verrata::Pipeline& verrata::Pipeline::then(
  std::shared_ptr< const Middleware > stage )
{
  if ( !stage ) throw std::invalid_argument( "pipeline stage is null" );
  stages_.push_back( std::move(stage) );
  return *this;
}

inline verrata::Resolution verrata::Pipeline::call(
  Resolution resolution ) const
{
  for ( const auto& stage : stages_ ) {
    resolution = stage->call( std::move(resolution) );
  }
  return resolution;
}

// Document codec

inline verrata::Resolution verrata::internal::DocumentDecoder::decode(
  const ordered_node& doc )
{
  path_stack_.clear();
  path_stack_.push_back( DOC_ROOT );

  if ( !doc.is_mapping() ) {
    throw_error_at( "resolution document must be a mapping" );
  }

  Resolution resolution;
  for ( const auto& [mk, mv] : doc.map_items() ) {
    const std::string key = to_string_any( mk );
    path_stack_.push_back( key );

    if ( key == STATE ) {
      const std::string state = mv.is_string()
        ? to_native_checked< std::string >( mv ) : std::string();
      if ( state == RESOLVED ) resolution.state = ResolutionState::Resolved;
      else if ( state == UNRESOLVED ) {
        resolution.state = ResolutionState::Unresolved;
      }
      else {
        throw_error_at( "unknown resolution state",
          "expected '" + RESOLVED + "' or '" + UNRESOLVED + "'" );
      }
    }
    else if ( key == VALUE ) {
      resolution.value = mv;
    }
    else if ( key == CONTEXT ) {
      if ( !mv.is_mapping() ) throw_error_at( "context must be a mapping" );
      resolution.context.values = mv;
    }
    else if ( key == ERRORS ) {
      if ( !mv.is_sequence() ) throw_error_at( "errors must be a sequence" );
      for ( size_t i = 0; i < mv.size(); ++i ) {
        path_stack_.back() = seq_indexed( ERRORS, i );
        resolution.errors.push_back( decode_raw_error(mv.at( i )) );
      }
    }
    else {
      throw_error_at( "unknown key '" + key + "'",
        "expected state, value, context or errors" );
    }

    path_stack_.pop_back();
  }
  return resolution;
}

inline verrata::RawError verrata::internal::DocumentDecoder::decode_raw_error(
  const ordered_node& n )
{
  if ( n.is_string() ) {
    return RawError( std::in_place_type< std::string >,
      to_native_checked< std::string >( n ) );
  }
  if ( n.is_mapping() ) return RawError( decode_node(n) );
  throw_error_at( "error entry must be a message string or a validation tree" );
}

inline verrata::ValidationNode
  verrata::internal::DocumentDecoder::decode_node( const ordered_node& n )
{
  if ( !n.is_mapping() ) throw_error_at( "validation node must be a mapping" );

  ValidationNode node;
  for ( const auto& [mk, mv] : n.map_items() ) {
    const std::string key = to_string_any( mk );
    path_stack_.push_back( key );

    if ( key == FIELDS ) {
      if ( !mv.is_mapping() ) {
        throw_error_at( "fields must be a mapping of field -> errors" );
      }
      for ( const auto& [fk, fv] : mv.map_items() ) {
        const std::string field = to_string_any( fk );
        path_stack_.push_back( field );
        if ( !fv.is_sequence() ) {
          throw_error_at( "field errors must be a sequence" );
        }
        std::vector< ErrorDetail >& details = node.field_errors[ field ];
        for ( size_t i = 0; i < fv.size(); ++i ) {
          path_stack_.back() = seq_indexed( field, i );
          details.push_back( decode_detail(fv.at( i )) );
        }
        path_stack_.pop_back();
      }
    }
    else if ( key == ASSOCIATIONS ) {
      if ( !mv.is_mapping() ) {
        throw_error_at( "associations must be a mapping" );
      }
      for ( const auto& [ak, av] : mv.map_items() ) {
        const std::string name = to_string_any( ak );
        path_stack_.push_back( name );
        node.associations.insert_or_assign( name, decode_association(av) );
        path_stack_.pop_back();
      }
    }
    else {
      throw_error_at( "unknown key '" + key + "'",
        "expected " + FIELDS + " or " + ASSOCIATIONS );
    }

    path_stack_.pop_back();
  }
  return node;
}

inline verrata::ErrorDetail
  verrata::internal::DocumentDecoder::decode_detail( const ordered_node& n )
{
  // Short form: the template alone
  if ( n.is_string() ) return ErrorDetail( to_native_checked< std::string >(n) );

  if ( !n.is_mapping() ) {
    throw_error_at( "error detail must be a string or a mapping" );
  }
  if ( !n.contains(TEMPLATE) || !n.at(TEMPLATE).is_string() ) {
    throw_error_at( "error detail is missing a string '" + TEMPLATE + "'" );
  }

  ErrorDetail detail( to_native_checked< std::string >(n.at( TEMPLATE )) );
  for ( const auto& [mk, mv] : n.map_items() ) {
    const std::string key = to_string_any( mk );
    if ( key == TEMPLATE ) continue;
    path_stack_.push_back( key );
    if ( key == BINDINGS ) detail.bindings = decode_bindings( mv );
    else {
      throw_error_at( "unknown key '" + key + "'",
        "expected " + TEMPLATE + " or " + BINDINGS );
    }
    path_stack_.pop_back();
  }
  return detail;
}

inline verrata::Bindings verrata::internal::DocumentDecoder::decode_bindings(
  const ordered_node& n )
{
  if ( !n.is_mapping() ) throw_error_at( "bindings must be a mapping" );

  Bindings bindings;
  for ( const auto& [mk, mv] : n.map_items() ) {
    const std::string name = to_string_any( mk );
    if ( !is_non_null_scalar(mv) ) {
      path_stack_.push_back( name );
      throw_error_at( "binding value must be a non-null scalar" );
    }
    bindings[ name ] = mv;
  }
  return bindings;
}

inline verrata::AssociationEntry
  verrata::internal::DocumentDecoder::decode_association(
    const ordered_node& n )
{
  const bool has_single = n.is_mapping() && n.contains( SINGLE );
  const bool has_many = n.is_mapping() && n.contains( MANY );
  if ( !n.is_mapping() || n.size() != 1 || has_single == has_many ) {
    throw_error_at( "association entry must contain exactly one of '"
      + SINGLE + "' or '" + MANY + "'" );
  }

  if ( has_single ) {
    path_stack_.push_back( SINGLE );
    ValidationNode child = decode_node( n.at(SINGLE) );
    path_stack_.pop_back();
    return Single{ std::make_shared< const ValidationNode >( std::move(child) ) };
  }

  const ordered_node& seq = n.at( MANY );
  path_stack_.push_back( MANY );
  if ( !seq.is_sequence() ) throw_error_at( "'" + MANY + "' must be a sequence" );
  Many many;
  many.nodes.reserve( seq.size() );
  for ( size_t i = 0; i < seq.size(); ++i ) {
    path_stack_.back() = seq_indexed( MANY, i );
    many.nodes.push_back( decode_node(seq.at( i )) );
  }
  path_stack_.pop_back();
  return many;
}

inline verrata::Resolution verrata::decode_resolution(
  const ordered_node& doc )
{
  internal::DocumentDecoder decoder;
  return decoder.decode( doc );
}

inline verrata::Resolution verrata::parse_resolution(
  const std::string& text )
{
  return decode_resolution( ordered_node::deserialize(text) );
}

// Read from an input stream until end-of-file, then decode the resulting
// string
inline verrata::Resolution verrata::load_resolution( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_resolution( ss.str() );
}

inline verrata::ordered_node verrata::encode_resolution(
  const Resolution& resolution )
{
  using namespace internal;

  ordered_node out = ordered_node::mapping();
  out[ STATE ] = make_node_from( resolution.state == ResolutionState::Resolved
    ? RESOLVED : UNRESOLVED );
  if ( !resolution.value.is_null() ) out[ VALUE ] = resolution.value;
  if ( resolution.context.values.is_mapping()
    && resolution.context.values.size() > 0 )
  {
    out[ CONTEXT ] = resolution.context.values;
  }

  std::vector< ordered_node > errors;
  errors.reserve( resolution.errors.size() );
  for ( const RawError& raw : resolution.errors ) {
    std::visit( Overloaded{
      [&]( const std::string& message ) {
        errors.push_back( make_node_from(message) );
      },
      [&]( const ValidationNode& tree ) {
        errors.push_back( encode_node(tree) );
      }
    }, raw );
  }
  out[ ERRORS ] = make_node_from( errors );
  return out;
}
