#pragma once

#include <string>
#include <stdexcept>
#include <ostream>

#include <uuid/uuid.h>

namespace homepair {

	class Uuid final {

	public:
		class InvalidUuidException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class InvalidUuidException

		Uuid();

		// Accepts the hyphenated, simple (32 hex digits), braced and urn:uuid: forms.
		static Uuid parse( const std::string& text_ );

		std::string toString() const;
		bool isNull() const;

		bool operator==( const Uuid& other_ ) const;
		bool operator!=( const Uuid& other_ ) const;
		bool operator<( const Uuid& other_ ) const;

		friend std::ostream& operator<<( std::ostream& out_, const Uuid& uuid_ ) { out_ << uuid_.toString(); return out_; }

	private:
		uuid_t m_uuid;

	}; // class Uuid

}; // namespace homepair
