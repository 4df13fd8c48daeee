#include <cassert>
#include <memory>

#include "Database.h"
#include "DatabasePairingStore.h"
#include "Utils.h"

using namespace homepair;

int main() {

	auto database = std::make_shared<Database>( ":memory:" );
	DatabasePairingStore store( database );

	Uuid first = Uuid::parse( "6b7a3b52-6d0e-4c4e-9a43-0d2a4e7d6f01" );
	Uuid second = Uuid::parse( "0c1f5e2a-93b4-4d2c-8f0e-7a6b5c4d3e02" );
	std::string key = hexDecode( "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a" );

	auto lock = store.lock();
	assert( store.count() == 0 );
	assert( store.list().empty() );

	bool thrown = false;
	try {
		store.load( first );
	} catch( const PairingStore::NotFoundException& ) {
		thrown = true;
	}
	assert( thrown );

	// Records are listed in the order they were first stored, updates keep their position.
	store.save( Pairing( second, key, Pairing::Permissions::USER ) );
	store.save( Pairing( first, key, Pairing::Permissions::ADMIN ) );
	store.save( Pairing( second, key, Pairing::Permissions::ADMIN ) );
	assert( store.count() == 2 );
	auto pairings = store.list();
	assert( pairings.size() == 2 );
	assert( pairings[0].getId() == second );
	assert( pairings[0].isAdmin() );
	assert( pairings[1].getId() == first );

	Pairing loaded = store.load( first );
	assert( loaded.getPublicKey() == key );
	assert( loaded.getPermissions() == Pairing::Permissions::ADMIN );

	// Removing is idempotent.
	store.remove( first );
	store.remove( first );
	assert( store.count() == 1 );

	// Rows that do not describe a valid pairing are reported as store failures.
	database->putQuery( "UPDATE `pairings` SET `permissions`=7" );
	thrown = false;
	try {
		store.list();
	} catch( const PairingStore::StoreException& ) {
		thrown = true;
	}
	assert( thrown );

	return 0;
}
