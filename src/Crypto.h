#pragma once

#include <string>
#include <stdexcept>

#define ED25519_PUBLIC_KEY_LENGTH 32

namespace homepair {

	class Crypto final {

	public:
		class InvalidKeyException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class InvalidKeyException

		Crypto() = delete;

		// Imports a raw Ed25519 public key (LTPK) and returns the key as exported again by OpenSSL. Keys OpenSSL
		// refuses to import result in an InvalidKeyException.
		static std::string importPublicKey( const std::string& key_ );
		static bool equals( const std::string& first_, const std::string& second_ );

	}; // class Crypto

}; // namespace homepair
