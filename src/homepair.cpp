#include <iostream>
#include <fstream>
#include <iterator>
#include <cstdlib>
#include <sys/stat.h>

#include <nlohmann/json.hpp>

#include "Arguments.h"
#include "Logger.h"
#include "Database.h"
#include "Settings.h"
#include "Config.h"
#include "Crypto.h"
#include "ControllerId.h"
#include "DatabasePairingStore.h"
#include "PairingStatus.h"
#include "PairingsHandler.h"
#include "Event.h"

#ifndef _DATADIR
#define _DATADIR "."
#endif // _DATADIR

namespace homepair {

	using namespace nlohmann;

	const char g_usage[] =
		"Usage: homepair [options]\n"
		"\t-d|--datadir <dir>\n\t\tDirectory holding homepair.db (defaults to " _DATADIR ").\n"
		"\t-l|--loglevel <loglevel>\n\t\tSets the level of logging:\n"
		"\t\t\t0 = default\n"
		"\t\t\t1 = verbose\n"
		"\t\t\t99 = debug\n"
		"\t-c|--controller <uuid>\n\t\tIdentifier of the verified controller sending the request.\n"
		"\t-i|--input <file>\n\t\tReads the pairings request body from file (defaults to stdin).\n"
		"\t-o|--output <file>\n\t\tWrites the response body to file (defaults to stdout).\n"
		"\t--config <file>\n\t\tImports settings from a json object.\n"
		"\t--max-peers <n>\n\t\tLimits the number of pairings.\n"
		"\t--admin <uuid> --ltpk <hex>\n\t\tStores an admin pairing, as pair-setup would.\n"
		"\t--list\n\t\tPrints the stored pairings as json.\n"
	;

	std::string readFile( std::istream& stream_ ) {
		return std::string( std::istreambuf_iterator<char>( stream_ ), std::istreambuf_iterator<char>() );
	};

}; // namespace homepair

using namespace homepair;

int main( int argc_, char* argv_[] ) {

	Arguments arguments( argc_, argv_ );

	if ( arguments.exists( { "-h", "--help" } ) ) {
		std::cout << g_usage;
		return EXIT_SUCCESS;
	}

	Logger::LogLevel logLevel = Logger::LogLevel::NORMAL;
	if ( arguments.exists( { "-l", "--loglevel" } ) ) {
		try {
			logLevel = Logger::resolveLogLevel( std::stoi( arguments.get( { "-l", "--loglevel" } ) ) );
		} catch( const std::logic_error& ) {
			std::cerr << "Invalid log level.\n" << g_usage;
			return EXIT_FAILURE;
		}
	}
	auto logger = Logger::addReceiver<ConsoleLogger>( logLevel );

	// See if the datadir is read- and writable.
	std::string datadir = arguments.get( { "-d", "--datadir" }, _DATADIR );
	struct stat info;
	if (
		stat( datadir.c_str(), &info ) != 0
		|| ( info.st_mode & S_IFDIR ) == 0
	) {
		std::cerr << "Data directory is not read-writable (" << datadir << ").\n";
		return EXIT_FAILURE;
	}

	try {
		auto database = std::make_shared<Database>( datadir + "/homepair.db" );
		auto settings = std::make_shared<Settings>( database );
		auto config = std::make_shared<Config>( settings );
		auto store = std::make_shared<DatabasePairingStore>( database );
		auto emitter = std::make_shared<EventEmitter>();
		auto status = std::make_shared<PairingStatus>( settings, store );
		emitter->addListener( status );

		if ( arguments.exists( { "--config" } ) ) {
			std::ifstream file( arguments.get( { "--config" } ) );
			if ( ! file.is_open() ) {
				throw std::runtime_error( "unable to open config file " + arguments.get( { "--config" } ) );
			}
			settings->put( json::parse( readFile( file ) ) );
		}

		if ( arguments.exists( { "--max-peers" } ) ) {
			config->setMaxPeers( std::stoul( arguments.get( { "--max-peers" } ) ) );
		}

		if ( arguments.exists( { "--admin" } ) ) {
			Uuid id = Uuid::parse( arguments.get( { "--admin" } ) );
			std::string publicKey = Crypto::importPublicKey( hexDecode( arguments.get( { "--ltpk" } ) ) );
			{
				auto lock = store->lock();
				store->save( Pairing( id, publicKey, Pairing::Permissions::ADMIN ) );
			}
			Logger::logr( Logger::LogLevel::NORMAL, store.get(), "Admin pairing %s stored.", id.toString().c_str() );
			emitter->emit( Event( Event::Type::CONTROLLER_PAIRED, id ) );
		}

		if ( arguments.exists( { "--list" } ) ) {
			json result = json::array();
			std::vector<Pairing> pairings;
			{
				auto lock = store->lock();
				pairings = store->list();
			}
			for ( auto pairingIt = pairings.begin(); pairingIt != pairings.end(); pairingIt++ ) {
				result.push_back( pairingIt->getJson() );
			}
			std::cout << result.dump( 4 ) << "\n";

		} else if (
			arguments.exists( { "-i", "--input" } )
			|| ! arguments.exists( { "--admin" } )
		) {
			ControllerId controller;
			if ( arguments.exists( { "-c", "--controller" } ) ) {
				controller.set( Uuid::parse( arguments.get( { "-c", "--controller" } ) ) );
			}

			std::string body;
			if ( arguments.exists( { "-i", "--input" } ) ) {
				std::ifstream file( arguments.get( { "-i", "--input" } ), std::ios::binary );
				if ( ! file.is_open() ) {
					throw std::runtime_error( "unable to open input file " + arguments.get( { "-i", "--input" } ) );
				}
				body = readFile( file );
			} else {
				body = readFile( std::cin );
			}

			PairingsHandler handler( store, emitter, config );
			std::string response = handler.process( body, controller );
			Logger::logr( Logger::LogLevel::DEBUG, &handler, "Writing %zu byte %s response.", response.size(), PairingsHandler::contentType );

			if ( arguments.exists( { "-o", "--output" } ) ) {
				std::ofstream file( arguments.get( { "-o", "--output" } ), std::ios::binary | std::ios::trunc );
				if ( ! file.is_open() ) {
					throw std::runtime_error( "unable to open output file " + arguments.get( { "-o", "--output" } ) );
				}
				file.write( response.data(), response.size() );
			} else {
				std::cout.write( response.data(), response.size() );
				std::cout.flush();
			}
		}

		if ( settings->isDirty() ) {
			settings->commit();
		}

	} catch( const std::exception& exception_ ) {
		Logger::logr( Logger::LogLevel::ERROR, "homepair", "Aborted (%s).", exception_.what() );
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
};
