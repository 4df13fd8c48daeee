#include "Pairing.h"

namespace homepair {

	using namespace nlohmann;

	const std::map<Pairing::Permissions, std::string> Pairing::PermissionsText = {
		{ Pairing::Permissions::USER, "user" },
		{ Pairing::Permissions::ADMIN, "admin" },
	};

	Pairing::Permissions Pairing::permissionsFromByte( uint8_t byte_ ) {
		switch( byte_ ) {
			case 0x00:
				return Permissions::USER;
			case 0x01:
				return Permissions::ADMIN;
			default:
				throw UnknownPermissionException( stringFormat( "unknown permission 0x%02x", byte_ ) );
		}
	};

	uint8_t Pairing::permissionsToByte( const Permissions& permissions_ ) {
		return Pairing::resolvePermissions( permissions_ );
	};

	Pairing::Pairing( const Uuid& id_, const std::string& publicKey_, const Permissions& permissions_ ) :
		m_id( id_ ),
		m_publicKey( publicKey_ ),
		m_permissions( permissions_ )
	{
	};

	json Pairing::getJson() const {
		json result = json::object();
		result["id"] = this->m_id.toString();
		result["public_key"] = hexEncode( this->m_publicKey );
		result["permissions"] = Pairing::resolveTextPermissions( this->m_permissions );
		return result;
	};

}; // namespace homepair
