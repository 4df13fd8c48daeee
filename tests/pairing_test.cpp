#include <cassert>
#include <string>
#include <stdexcept>

#include "Pairing.h"
#include "Uuid.h"
#include "Crypto.h"
#include "Utils.h"

using namespace homepair;

int main() {

	// Permissions.
	assert( Pairing::permissionsFromByte( 0x00 ) == Pairing::Permissions::USER );
	assert( Pairing::permissionsFromByte( 0x01 ) == Pairing::Permissions::ADMIN );
	assert( Pairing::permissionsToByte( Pairing::Permissions::USER ) == 0x00 );
	assert( Pairing::permissionsToByte( Pairing::Permissions::ADMIN ) == 0x01 );
	assert( Pairing::resolveTextPermissions( Pairing::Permissions::ADMIN ) == "admin" );
	bool thrown = false;
	try {
		Pairing::permissionsFromByte( 0x02 );
	} catch( const Pairing::UnknownPermissionException& ) {
		thrown = true;
	}
	assert( thrown );

	// Identifiers.
	Uuid id = Uuid::parse( "3F2504E0-4F89-11D3-9A0C-0305E82C3301" );
	assert( id.toString() == "3f2504e0-4f89-11d3-9a0c-0305e82c3301" );
	assert( id == Uuid::parse( "3f2504e0-4f89-11d3-9a0c-0305e82c3301" ) );
	assert( ! id.isNull() );
	assert( Uuid().isNull() );
	assert( Uuid::parse( "3f2504e04f8911d39a0c0305e82c3301" ) == id );
	assert( Uuid::parse( "3F2504E04F8911D39A0C0305E82C3301" ) == id );
	assert( Uuid::parse( "{3f2504e0-4f89-11d3-9a0c-0305e82c3301}" ) == id );
	assert( Uuid::parse( "urn:uuid:3f2504e0-4f89-11d3-9a0c-0305e82c3301" ) == id );
	assert( Uuid::parse( "3f2504e04f8911d39a0c0305e82c3301" ).toString() == "3f2504e0-4f89-11d3-9a0c-0305e82c3301" );
	const char* invalid[] = {
		"3f2504e0-4f89-11d3-9a0c-0305e82c330",
		"3f2504e0-4f89-11d3-9a0c-0305e82c330g",
		"{3f2504e0-4f89-11d3-9a0c-0305e82c33}",
		"{3f2504e0-4f89-11d3-9a0c-0305e82c3301",
		"{3f2504e04f8911d39a0c0305e82c3301}",
		"3f2504e04f8911d39a0c0305e82c330g",
		"3f2504e0-4f89-11d3-9a0c-0305e82c",
		"3f2504e04f8911d39a0c0305e82c33011",
		"urn:uuid:3f2504e0-4f89-11d3-9a0c-0305e82c330",
		"urn:uuid:{3f2504e0-4f89-11d3-9a0c-0305e82c3301}",
		"urn:uuid:3f2504e04f8911d39a0c0305e82c3301",
		"uuid:3f2504e0-4f89-11d3-9a0c-0305e82c3301",
		""
	};
	for ( auto text : invalid ) {
		thrown = false;
		try {
			Uuid::parse( text );
		} catch( const Uuid::InvalidUuidException& ) {
			thrown = true;
		}
		assert( thrown );
	}
	std::string withNull = "3f2504e0-4f89-11d3-9a0c-0305e82c3301";
	withNull[35] = '\0';
	thrown = false;
	try {
		Uuid::parse( withNull );
	} catch( const Uuid::InvalidUuidException& ) {
		thrown = true;
	}
	assert( thrown );
	std::string simpleWithNull = "3f2504e04f8911d39a0c0305e82c3301";
	simpleWithNull[31] = '\0';
	thrown = false;
	try {
		Uuid::parse( simpleWithNull );
	} catch( const Uuid::InvalidUuidException& ) {
		thrown = true;
	}
	assert( thrown );

	// Hex.
	assert( hexEncode( std::string( { '\x00', '\xab', '\x10' } ) ) == "00ab10" );
	assert( hexDecode( "00AB10" ) == std::string( { '\x00', '\xab', '\x10' } ) );
	thrown = false;
	try {
		hexDecode( "abc" );
	} catch( const std::invalid_argument& ) {
		thrown = true;
	}
	assert( thrown );

	// Long-term public keys.
	std::string key = hexDecode( "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a" );
	std::string other = hexDecode( "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c" );
	assert( Crypto::importPublicKey( key ) == key );
	assert( Crypto::equals( key, Crypto::importPublicKey( key ) ) );
	assert( ! Crypto::equals( key, other ) );
	assert( ! Crypto::equals( key, key.substr( 0, 31 ) ) );
	thrown = false;
	try {
		Crypto::importPublicKey( key.substr( 0, 31 ) );
	} catch( const Crypto::InvalidKeyException& ) {
		thrown = true;
	}
	assert( thrown );

	// Pairings.
	Pairing pairing( id, key, Pairing::Permissions::USER );
	assert( ! pairing.isAdmin() );
	pairing.setPermissions( Pairing::Permissions::ADMIN );
	assert( pairing.isAdmin() );
	nlohmann::json json = pairing.getJson();
	assert( json["id"] == "3f2504e0-4f89-11d3-9a0c-0305e82c3301" );
	assert( json["public_key"] == "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a" );
	assert( json["permissions"] == "admin" );

	return 0;
}
