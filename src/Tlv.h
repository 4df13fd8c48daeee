#pragma once

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <stdexcept>
#include <cstdint>

#include "Utils.h"

#define TLV_MAX_FRAGMENT_LENGTH 0xFF

namespace homepair {

	// ===
	// Tlv
	// ===

	// Binary type-length-value encoding used for all HAP pairing bodies (content type application/pairing+tlv8).
	// Values are plain byte strings, as they are on the wire.

	class Tlv final {

	public:
		// See table 5-6 of the HAP documentation.
		enum class Type: uint8_t {
			METHOD         = 0x00,
			IDENTIFIER     = 0x01,
			SALT           = 0x02,
			PUBLIC_KEY     = 0x03,
			PROOF          = 0x04,
			ENCRYPTED_DATA = 0x05,
			STATE          = 0x06,
			ERROR          = 0x07,
			RETRY_DELAY    = 0x08,
			CERTIFICATE    = 0x09,
			SIGNATURE      = 0x0a,
			PERMISSIONS    = 0x0b,
			FRAGMENT_DATA  = 0x0c,
			FRAGMENT_LAST  = 0x0d,
			FLAGS          = 0x13,
			SEPARATOR      = 0xff,
		}; // enum class Type
		ENUM_UTIL( Type );

		// See table 5-5 of the HAP documentation.
		enum class Code: uint8_t {
			UNKNOWN        = 0x01,
			AUTHENTICATION = 0x02,
			BACKOFF        = 0x03,
			MAX_PEERS      = 0x04,
			MAX_TRIES      = 0x05,
			UNAVAILABLE    = 0x06,
			BUSY           = 0x07,
		}; // enum class Code
		static const std::map<Code, std::string> CodeText;
		ENUM_UTIL_W_TEXT( Code, CodeText );

		typedef std::pair<uint8_t, std::string> Item;
		typedef std::vector<Item> Container;
		typedef std::map<uint8_t, std::string> Map;

		class DecodeException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class DecodeException

		// =====
		// Error
		// =====

		// A protocol level failure. It is sent to the controller in place of the regular response as a container
		// holding the step at which the exchange failed and the error code.
		class Error: public std::runtime_error {

		public:
			Error( uint8_t step_, Code code_, const std::string& message_ );

			uint8_t getStep() const { return this->m_step; };
			Code getCode() const { return this->m_code; };
			Container getContainer() const;

		private:
			uint8_t m_step;
			Code m_code;

		}; // class Error

		Tlv() = delete;

		static Item item( Type type_, const std::string& value_ );
		static Item item( Type type_, uint8_t value_ );
		static Item separator();

		static std::string encode( const Container& container_ );
		static Map decode( const std::string& data_ );
		static Container parse( const std::string& data_ );

	}; // class Tlv

}; // namespace homepair
