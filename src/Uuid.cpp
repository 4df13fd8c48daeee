#include "Uuid.h"

#define UUID_TEXT_LENGTH 36
#define UUID_SIMPLE_LENGTH 32
#define UUID_URN_PREFIX "urn:uuid:"

namespace homepair {

	Uuid::Uuid() {
		uuid_clear( this->m_uuid );
	};

	Uuid Uuid::parse( const std::string& text_ ) {
		// The text comes straight from the wire and may contain anything, including embedded null characters which
		// would otherwise be silently cut off by the c string conversion below.
		if ( text_.find( '\0' ) != std::string::npos ) {
			throw InvalidUuidException( "invalid uuid length" );
		}

		// The simple, braced and urn forms are normalized to the hyphenated form before parsing.
		std::string text;
		const std::string urnPrefix( UUID_URN_PREFIX );
		if (
			text_.size() == urnPrefix.size() + UUID_TEXT_LENGTH
			&& text_.compare( 0, urnPrefix.size(), urnPrefix ) == 0
		) {
			text = text_.substr( urnPrefix.size() );
		} else if (
			text_.size() == UUID_TEXT_LENGTH + 2
			&& text_.front() == '{'
			&& text_.back() == '}'
		) {
			text = text_.substr( 1, UUID_TEXT_LENGTH );
		} else if ( text_.size() == UUID_SIMPLE_LENGTH ) {
			text = text_.substr( 0, 8 ) + "-" + text_.substr( 8, 4 ) + "-" + text_.substr( 12, 4 ) + "-" + text_.substr( 16, 4 ) + "-" + text_.substr( 20 );
		} else {
			text = text_;
		}
		if ( text.size() != UUID_TEXT_LENGTH ) {
			throw InvalidUuidException( "invalid uuid length" );
		}

		Uuid result;
		if ( 0 != uuid_parse( text.c_str(), result.m_uuid ) ) {
			throw InvalidUuidException( "invalid uuid " + text_ );
		}
		return result;
	};

	std::string Uuid::toString() const {
		char buffer[UUID_TEXT_LENGTH + 1];
		uuid_unparse_lower( this->m_uuid, buffer );
		return std::string( buffer, UUID_TEXT_LENGTH );
	};

	bool Uuid::isNull() const {
		return uuid_is_null( this->m_uuid ) == 1;
	};

	bool Uuid::operator==( const Uuid& other_ ) const {
		return uuid_compare( this->m_uuid, other_.m_uuid ) == 0;
	};

	bool Uuid::operator!=( const Uuid& other_ ) const {
		return uuid_compare( this->m_uuid, other_.m_uuid ) != 0;
	};

	bool Uuid::operator<( const Uuid& other_ ) const {
		return uuid_compare( this->m_uuid, other_.m_uuid ) < 0;
	};

}; // namespace homepair
