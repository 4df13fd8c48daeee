#pragma once

#include <string>
#include <map>
#include <stdexcept>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "Utils.h"
#include "Uuid.h"

namespace homepair {

	// =======
	// Pairing
	// =======

	// The long-term credentials of a paired controller: its identifier, Ed25519 public key (LTPK) and access level.

	class Pairing final {

	public:
		enum class Permissions: uint8_t {
			// v May use the accessory
			USER  = 0x00,
			// v May also add, remove and list pairings
			ADMIN = 0x01
		}; // enum class Permissions
		static const std::map<Permissions, std::string> PermissionsText;
		ENUM_UTIL_W_TEXT( Permissions, PermissionsText );

		class UnknownPermissionException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class UnknownPermissionException

		static Permissions permissionsFromByte( uint8_t byte_ );
		static uint8_t permissionsToByte( const Permissions& permissions_ );

		Pairing( const Uuid& id_, const std::string& publicKey_, const Permissions& permissions_ );

		friend std::ostream& operator<<( std::ostream& out_, const Pairing* pairing_ ) { out_ << "Pairing " << pairing_->m_id; return out_; }

		const Uuid& getId() const { return this->m_id; };
		const std::string& getPublicKey() const { return this->m_publicKey; };
		Permissions getPermissions() const { return this->m_permissions; };
		void setPermissions( const Permissions& permissions_ ) { this->m_permissions = permissions_; };
		bool isAdmin() const { return this->m_permissions == Permissions::ADMIN; };

		nlohmann::json getJson() const;

	private:
		Uuid m_id;
		std::string m_publicKey;
		Permissions m_permissions;

	}; // class Pairing

}; // namespace homepair
