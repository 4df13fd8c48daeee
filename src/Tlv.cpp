#include <algorithm>

#include "Tlv.h"

namespace homepair {

	const std::map<Tlv::Code, std::string> Tlv::CodeText = {
		{ Tlv::Code::UNKNOWN, "unknown" },
		{ Tlv::Code::AUTHENTICATION, "authentication" },
		{ Tlv::Code::BACKOFF, "backoff" },
		{ Tlv::Code::MAX_PEERS, "max peers" },
		{ Tlv::Code::MAX_TRIES, "max tries" },
		{ Tlv::Code::UNAVAILABLE, "unavailable" },
		{ Tlv::Code::BUSY, "busy" },
	};

	// =====
	// Error
	// =====

	Tlv::Error::Error( uint8_t step_, Code code_, const std::string& message_ ) :
		std::runtime_error( message_ ),
		m_step( step_ ),
		m_code( code_ )
	{
	};

	Tlv::Container Tlv::Error::getContainer() const {
		return {
			Tlv::item( Tlv::Type::STATE, this->m_step ),
			Tlv::item( Tlv::Type::ERROR, Tlv::resolveCode( this->m_code ) )
		};
	};

	// ===
	// Tlv
	// ===

	Tlv::Item Tlv::item( Type type_, const std::string& value_ ) {
		return Item( Tlv::resolveType( type_ ), value_ );
	};

	Tlv::Item Tlv::item( Type type_, uint8_t value_ ) {
		return Item( Tlv::resolveType( type_ ), std::string( 1, static_cast<char>( value_ ) ) );
	};

	Tlv::Item Tlv::separator() {
		return Item( Tlv::resolveType( Tlv::Type::SEPARATOR ), "" );
	};

	std::string Tlv::encode( const Container& container_ ) {
		std::string result;
		for ( auto itemIt = container_.begin(); itemIt != container_.end(); itemIt++ ) {
			const std::string& value = itemIt->second;

			// Values that do not fit a single item are split into consecutive fragments of the same type. A fragment of
			// maximum length always announces another one, so a value of exactly n times the maximum length is closed
			// with an empty fragment.
			size_t offset = 0;
			size_t length;
			do {
				length = std::min<size_t>( value.size() - offset, TLV_MAX_FRAGMENT_LENGTH );
				result.push_back( static_cast<char>( itemIt->first ) );
				result.push_back( static_cast<char>( length ) );
				result.append( value, offset, length );
				offset += length;
			} while ( length == TLV_MAX_FRAGMENT_LENGTH );
		}
		return result;
	};

	Tlv::Map Tlv::decode( const std::string& data_ ) {
		Map result;
		Container container = Tlv::parse( data_ );
		for ( auto itemIt = container.begin(); itemIt != container.end(); itemIt++ ) {
			result[itemIt->first] = itemIt->second;
		}
		return result;
	};

	Tlv::Container Tlv::parse( const std::string& data_ ) {
		Container result;
		size_t offset = 0;
		while ( offset < data_.size() ) {
			if ( offset + 2 > data_.size() ) {
				throw DecodeException( stringFormat( "truncated tlv item header at offset %zu", offset ) );
			}
			uint8_t type = static_cast<uint8_t>( data_[offset] );
			size_t length = static_cast<uint8_t>( data_[offset + 1] );
			if ( offset + 2 + length > data_.size() ) {
				throw DecodeException( stringFormat( "truncated tlv item value at offset %zu", offset ) );
			}

			// Consecutive items of the same type are fragments of a single value.
			if (
				! result.empty()
				&& result.back().first == type
			) {
				result.back().second.append( data_, offset + 2, length );
			} else {
				result.push_back( Item( type, data_.substr( offset + 2, length ) ) );
			}

			offset += 2 + length;
		}
		return result;
	};

}; // namespace homepair
