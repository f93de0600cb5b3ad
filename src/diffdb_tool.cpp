#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <diffdb/differential.hpp>
#include <diffdb/encode.hpp>
#include <diffdb/log.hpp>

using namespace std::string_literals;

namespace constants {

constexpr auto help_option         = "help";
constexpr auto config_option       = "config";
constexpr auto database_option     = "database";
constexpr auto collection_option   = "collection";
constexpr auto log_level_option    = "log-level";
const auto log_level_default       = "info"s;
constexpr auto list_option         = "list";
constexpr auto status_option       = "status";
constexpr auto pending_option      = "pending";
constexpr auto reset_option        = "reset-conflicts";
constexpr auto delete_option       = "delete";

} // namespace constants

namespace {

/**
 * Command line values win over the YAML file, which wins over the default.
 */
template< typename T >
T get_option( const std::string& key,
              const T& default_value,
              const boost::program_options::variables_map& args,
              const YAML::Node& config )
{
  if( args.count( key ) )
    return args[ key ].as< T >();

  if( config && config[ key ] )
    return config[ key ].as< T >();

  return default_value;
}

diffdb::differential& open_collection( diffdb::database& db,
                                       const std::string& name,
                                       std::shared_ptr< diffdb::differential >& handle )
{
  if( name.empty() )
    throw std::runtime_error( "a collection is required" );

  auto diff = db.find_differential( name );
  if( !diff )
    throw std::system_error( diff.error() );

  handle = *diff;
  return *handle;
}

} // namespace

int main( int argc, char** argv )
{
  namespace po = boost::program_options;

  std::string log_level, collection;
  std::filesystem::path database_path;

  diffdb::log::initialize();

  try
  {
    po::options_description options;

    // clang-format off
    options.add_options()
      ( "help,h"                     , "Print this help message and exit" )
      ( "config"                     , po::value< std::string >(), "A YAML file providing option defaults" )
      ( "database,d"                 , po::value< std::string >(), "The differential database file" )
      ( "collection,c"               , po::value< std::string >(), "The collection to operate on" )
      ( "log-level,l"                , po::value< std::string >(), "The log filtering level" )
      ( constants::list_option       , "List the collections in the database" )
      ( constants::status_option     , "Print tracking and pending counts of the collection" )
      ( constants::pending_option    , "Print the identities with pending changes, as hex" )
      ( constants::reset_option      , "Start a new conflict tracking cycle" )
      ( constants::delete_option     , "Delete the collection" );
    // clang-format on

    po::variables_map args;
    po::store( po::parse_command_line( argc, argv, options ), args );

    if( args.count( constants::help_option ) )
    {
      std::cout << options << '\n';
      return EXIT_SUCCESS;
    }

    YAML::Node config;
    if( args.count( constants::config_option ) )
      config = YAML::LoadFile( args[ constants::config_option ].as< std::string >() );

    // clang-format off
    log_level     = get_option< std::string >( constants::log_level_option, constants::log_level_default, args, config );
    collection    = get_option< std::string >( constants::collection_option, ""s, args, config );
    database_path = get_option< std::string >( constants::database_option, ""s, args, config );
    // clang-format on

    if( !diffdb::log::set_level( log_level ) )
      throw std::runtime_error( "unknown log level " + log_level );

    if( database_path.empty() )
      throw std::runtime_error( "a database is required" );

    diffdb::database db;
    if( auto ec = db.open( database_path ); ec )
      throw std::system_error( ec );

    std::shared_ptr< diffdb::differential > handle;

    if( args.count( constants::list_option ) )
    {
      auto names = db.collections();
      if( !names )
        throw std::system_error( names.error() );

      for( const auto& name: *names )
        std::cout << name << '\n';
    }

    if( args.count( constants::status_option ) )
    {
      auto& diff = open_collection( db, collection, handle );

      auto tracking = diff.count_tracking();
      if( !tracking )
        throw std::system_error( tracking.error() );

      auto changes = diff.count_changes();
      if( !changes )
        throw std::system_error( changes.error() );

      std::cout << "tracking: " << *tracking << '\n' << "pending: " << *changes << '\n';
    }

    if( args.count( constants::pending_option ) )
    {
      auto& diff = open_collection( db, collection, handle );

      auto ids = diff.pending();
      if( !ids )
        throw std::system_error( ids.error() );

      for( const auto& id: *ids )
        std::cout << diffdb::encode::to_hex( id ) << '\n';
    }

    if( args.count( constants::reset_option ) )
    {
      auto& diff = open_collection( db, collection, handle );
      if( auto ec = diff.reset_conflict_tracking(); ec )
        throw std::system_error( ec );

      LOG_INFO( diffdb::log::instance(), "Started a new conflict tracking cycle for {}", collection );
    }

    if( args.count( constants::delete_option ) )
    {
      if( collection.empty() )
        throw std::runtime_error( "a collection is required" );

      handle.reset();
      if( auto ec = db.remove( collection ); ec )
        throw std::system_error( ec );
    }

    handle.reset();
    db.close();
  }
  catch( const std::exception& e )
  {
    LOG_ERROR( diffdb::log::instance(), "{}", std::string( e.what() ) );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
