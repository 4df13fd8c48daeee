#include <memory>

#include <openssl/evp.h>
#include <openssl/crypto.h>

#include "Crypto.h"

namespace homepair {

	using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype( &::EVP_PKEY_free )>;

	std::string Crypto::importPublicKey( const std::string& key_ ) {
		if ( key_.size() != ED25519_PUBLIC_KEY_LENGTH ) {
			throw InvalidKeyException( "invalid ed25519 public key length" );
		}
		EVP_PKEY_ptr key( EVP_PKEY_new_raw_public_key( EVP_PKEY_ED25519, NULL, reinterpret_cast<const unsigned char*>( key_.data() ), key_.size() ), &::EVP_PKEY_free );
		if ( ! key ) {
			throw InvalidKeyException( "invalid ed25519 public key" );
		}

		std::string result( ED25519_PUBLIC_KEY_LENGTH, '\0' );
		size_t length = result.size();
		if ( 1 != EVP_PKEY_get_raw_public_key( key.get(), reinterpret_cast<unsigned char*>( &result[0] ), &length ) ) {
			throw InvalidKeyException( "unable to export ed25519 public key" );
		}
		result.resize( length );
		return result;
	};

	bool Crypto::equals( const std::string& first_, const std::string& second_ ) {
		return (
			first_.size() == second_.size()
			&& CRYPTO_memcmp( first_.data(), second_.data(), first_.size() ) == 0
		);
	};

}; // namespace homepair
