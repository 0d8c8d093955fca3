// ╻ ╻┏━╸┏━┓┏━┓┏━┓╺┳╸┏━┓
// ┃┏┛┣╸ ┣┳┛┣┳┛┣━┫ ┃ ┣━┫
// ┗┛ ┗━╸╹┗╸╹┗╸╹ ╹ ╹ ╹ ╹
//  Validation ERRor Aggregation & TrAnslation
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the verrata authors
#pragma once

// Standard library includes
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "verrata.hh"

namespace verrata::cli {

  // Settings gathered from the command line
  struct Arguments {
    TranslateOptions options;
    std::vector< std::string > catalog_paths;
    bool show_help = false;
  };

  inline void print_usage( std::ostream& os ) {
    os << "usage: verrata [--catalog FILE]... [--locale LOCALE] [--full-path]"
      " < resolution.yaml\n"
      << "  --catalog FILE   load a YAML message catalog (repeatable,"
      " later files win)\n"
      << "  --locale LOCALE  locale used when the resolution context names"
      " none (default: " << DEFAULT_LOCALE << ")\n"
      << "  --full-path      prefix nested errors with the dotted association"
      " path\n";
  }

  // Parse the arguments that follow the program name. Throws
  // std::runtime_error on unknown options or a missing option value.
  inline Arguments parse_arguments( const std::vector< std::string >& args ) {
    Arguments parsed;
    for ( size_t i = 0; i < args.size(); ++i ) {
      const std::string& arg = args[ i ];
      if ( arg == "--help" || arg == "-h" ) {
        parsed.show_help = true;
      }
      else if ( arg == "--full-path" ) {
        parsed.options.prefix_mode = PrefixMode::Path;
      }
      else if ( arg == "--catalog" || arg == "--locale" ) {
        if ( i + 1 >= args.size() ) {
          throw std::runtime_error( "option '" + arg + "' requires a value" );
        }
        const std::string& value = args[ ++i ];
        if ( arg == "--catalog" ) parsed.catalog_paths.push_back( value );
        else parsed.options.default_locale = value;
      }
      else {
        throw std::runtime_error( "unknown option '" + arg + "'" );
      }
    }
    return parsed;
  }

  // Load and merge every catalog file in order
  inline std::shared_ptr< const Catalog > load_catalogs(
    const std::vector< std::string >& paths )
  {
    auto catalog = std::make_shared< Catalog >();
    for ( const auto& path : paths ) {
      std::ifstream in( path );
      if ( !in ) {
        throw std::runtime_error( "cannot open catalog '" + path + "'" );
      }
      try {
        catalog->merge( Catalog::load(in) );
      } catch ( const std::exception& ex ) {
        throw std::runtime_error( path + ": " + ex.what() );
      }
    }
    return catalog;
  }

  // Translate the resolution document read from in and write it to out.
  // Diagnostics go to err. Returns the process exit status.
  inline int run( const std::vector< std::string >& args, std::istream& in,
    std::ostream& out, std::ostream& err )
  {
    try {
      Arguments parsed = parse_arguments( args );
      if ( parsed.show_help ) {
        print_usage( out );
        return 0;
      }

      std::shared_ptr< const Catalog > catalog;
      if ( !parsed.catalog_paths.empty() ) {
        catalog = load_catalogs( parsed.catalog_paths );
        parsed.options.translator
          = std::make_shared< CatalogTranslator >( catalog );
      }

      Resolution resolution = load_resolution( in );

      const std::string locale
        = resolution.context.locale().value_or( parsed.options.default_locale );
      if ( catalog && !catalog->has_locale(locale) ) {
        err << "[verrata] warning: no catalog entries for locale '"
          << locale << "', messages are left untranslated\n";
      }

      TranslateErrors translate( parsed.options );
      resolution = translate.call( std::move(resolution) );
      out << ordered_node::serialize( encode_resolution(resolution) );
      return 0;
    } catch (const std::exception& ex) {
      err << "[verrata] error: " << ex.what() << "\n";
      return 1;
    }
  }

} // namespace verrata::cli
