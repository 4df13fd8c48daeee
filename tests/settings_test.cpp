#include <cassert>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "Database.h"
#include "Settings.h"
#include "Config.h"

using namespace homepair;

int main() {

	auto database = std::make_shared<Database>( ":memory:" );

	{
		auto settings = std::make_shared<Settings>( database );
		assert( settings->count() == 0 );
		assert( ! settings->contains( "paired" ) );
		assert( settings->get<bool>( "paired", false ) == false );
		assert( settings->get( "name", std::string( "homepair" ) ) == "homepair" );

		settings->put( "paired", true );
		settings->put( "name", "bridge" );
		settings->put( "ratio", 0.5 );
		assert( settings->isDirty() );
		assert( settings->get<bool>( "paired" ) );
		assert( settings->get( "name" ) == "bridge" );
		assert( settings->get<double>( "ratio" ) == 0.5 );

		bool thrown = false;
		try {
			settings->get<int>( "name" );
		} catch( const std::invalid_argument& ) {
			thrown = true;
		}
		assert( thrown );

		settings->commit();
		assert( ! settings->isDirty() );
	}

	// A fresh instance reads back what was committed, and commits on destruction.
	{
		auto settings = std::make_shared<Settings>( database );
		assert( settings->count() == 3 );
		assert( settings->get<bool>( "paired", false ) );
		settings->remove( "ratio" );
		settings->put( nlohmann::json::parse( "{ \"max_peers\": 16, \"name\": \"lamp\", \"paired\": null }" ) );
		assert( ! settings->contains( "paired" ) );

		bool thrown = false;
		try {
			settings->put( nlohmann::json::parse( "[ 1, 2 ]" ) );
		} catch( const std::runtime_error& ) {
			thrown = true;
		}
		assert( thrown );
	}
	{
		auto settings = std::make_shared<Settings>( database );
		auto all = settings->getAll();
		assert( all.size() == 2 );
		assert( all.at( "name" ) == "lamp" );
		assert( all.at( "max_peers" ) == "16" );

		// The limit on the number of pairings is optional.
		Config config( settings );
		unsigned int maxPeers = 0;
		assert( config.getMaxPeers( maxPeers ) );
		assert( maxPeers == 16 );
		config.setMaxPeers( 2 );
		assert( config.getMaxPeers( maxPeers ) );
		assert( maxPeers == 2 );
		config.clearMaxPeers();
		assert( ! config.getMaxPeers( maxPeers ) );
		settings->put( Config::maxPeersKey, "many" );
		assert( ! config.getMaxPeers( maxPeers ) );
	}

	assert( database->getQueryValue<unsigned int>( "SELECT COUNT(*) FROM `settings`" ) == 2 );

	return 0;
}
