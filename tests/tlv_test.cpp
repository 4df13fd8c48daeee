#include <cassert>
#include <string>

#include "Tlv.h"

using namespace homepair;

int main() {

	// Short values are encoded as a single item.
	Tlv::Container state = { Tlv::item( Tlv::Type::STATE, static_cast<uint8_t>( 0x01 ) ) };
	assert( Tlv::encode( state ) == std::string( { '\x06', '\x01', '\x01' } ) );
	assert( Tlv::encode( { Tlv::separator() } ) == std::string( { '\xff', '\x00' } ) );
	assert( Tlv::encode( { } ).empty() );

	// Values longer than a single fragment are split.
	std::string value( 300, 'a' );
	std::string encoded = Tlv::encode( { Tlv::item( Tlv::Type::PUBLIC_KEY, value ) } );
	assert( encoded.size() == 2 + 255 + 2 + 45 );
	assert( encoded[0] == '\x03' && static_cast<uint8_t>( encoded[1] ) == 0xff );
	assert( encoded[257] == '\x03' && encoded[258] == '\x2d' );
	assert( Tlv::decode( encoded ).at( 0x03 ) == value );

	// A value of exactly one fragment is closed by an empty fragment.
	value = std::string( 255, 'b' );
	encoded = Tlv::encode( { Tlv::item( Tlv::Type::CERTIFICATE, value ) } );
	assert( encoded.size() == 2 + 255 + 2 );
	assert( encoded[257] == '\x09' && encoded[258] == '\x00' );
	Tlv::Map decoded = Tlv::decode( encoded );
	assert( decoded.size() == 1 );
	assert( decoded.at( 0x09 ) == value );

	value = std::string( 510, 'c' );
	encoded = Tlv::encode( { Tlv::item( Tlv::Type::ENCRYPTED_DATA, value ), Tlv::item( Tlv::Type::STATE, static_cast<uint8_t>( 0x02 ) ) } );
	assert( encoded.size() == 3 * 2 + 510 + 3 );
	decoded = Tlv::decode( encoded );
	assert( decoded.at( 0x05 ) == value );
	assert( decoded.at( 0x06 ) == std::string( 1, '\x02' ) );

	// Consecutive items of the same type form one value, a separator ends a record.
	Tlv::Container parsed = Tlv::parse( std::string( { '\x01', '\x01', 'a', '\x01', '\x02', 'b', 'c', '\xff', '\x00', '\x01', '\x01', 'd' } ) );
	assert( parsed.size() == 3 );
	assert( parsed[0] == Tlv::Item( 0x01, "abc" ) );
	assert( parsed[1] == Tlv::separator() );
	assert( parsed[2] == Tlv::Item( 0x01, "d" ) );

	// Decoding into a map keeps the last value of a type.
	decoded = Tlv::decode( std::string( { '\x01', '\x01', 'a', '\xff', '\x00', '\x01', '\x01', 'd' } ) );
	assert( decoded.at( 0x01 ) == "d" );
	assert( decoded.at( 0xff ).empty() );

	// Truncated input.
	bool thrown = false;
	try {
		Tlv::decode( std::string( 1, '\x06' ) );
	} catch( const Tlv::DecodeException& ) {
		thrown = true;
	}
	assert( thrown );

	thrown = false;
	try {
		Tlv::decode( std::string( { '\x06', '\x02', '\x01' } ) );
	} catch( const Tlv::DecodeException& ) {
		thrown = true;
	}
	assert( thrown );

	// Error containers.
	Tlv::Error error( 0x00, Tlv::Code::UNKNOWN, "invalid" );
	assert( Tlv::encode( error.getContainer() ) == std::string( { '\x06', '\x01', '\x00', '\x07', '\x01', '\x01' } ) );
	Tlv::Error peers( 0x02, Tlv::Code::MAX_PEERS, "full" );
	assert( Tlv::encode( peers.getContainer() ) == std::string( { '\x06', '\x01', '\x02', '\x07', '\x01', '\x04' } ) );
	assert( Tlv::resolveTextCode( Tlv::Code::AUTHENTICATION ) == "authentication" );

	return 0;
}
