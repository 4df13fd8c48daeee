#include "PairingsHandler.h"

#include "PairingStore.h"
#include "Event.h"
#include "Config.h"
#include "ControllerId.h"
#include "Crypto.h"
#include "Logger.h"

namespace homepair {

	const char* PairingsHandler::contentType = "application/pairing+tlv8";

	const std::map<PairingsHandler::Method, std::string> PairingsHandler::MethodText = {
		{ PairingsHandler::Method::ADD, "add" },
		{ PairingsHandler::Method::REMOVE, "remove" },
		{ PairingsHandler::Method::LIST, "list" },
	};

	PairingsHandler::PairingsHandler( std::shared_ptr<PairingStore> store_, std::shared_ptr<EventEmitter> emitter_, std::shared_ptr<Config> config_ ) :
		m_store( store_ ),
		m_emitter( emitter_ ),
		m_config( config_ )
	{
	};

	PairingsHandler::Operation PairingsHandler::parse( const std::string& body_ ) const {
		Tlv::Map input;
		try {
			input = Tlv::decode( body_ );
		} catch( const Tlv::DecodeException& exception_ ) {
			throw Tlv::Error( resolveStep( Step::UNKNOWN ), Tlv::Code::UNKNOWN, exception_.what() );
		}

		auto state = input.find( Tlv::resolveType( Tlv::Type::STATE ) );
		if (
			state == input.end()
			|| state->second.size() != 1
			|| static_cast<uint8_t>( state->second[0] ) != resolveStep( Step::REQUEST )
		) {
			throw Tlv::Error( resolveStep( Step::UNKNOWN ), Tlv::Code::UNKNOWN, "missing or invalid state" );
		}

		// Only the first byte of the method is significant, trailing bytes are ignored.
		auto method = input.find( Tlv::resolveType( Tlv::Type::METHOD ) );
		if (
			method == input.end()
			|| method->second.empty()
		) {
			throw Tlv::Error( resolveStep( Step::UNKNOWN ), Tlv::Code::UNKNOWN, "missing or invalid method" );
		}

		// From here on the request is known to be a pairings request and failures are reported as a response.
		auto require = [&input]( Tlv::Type type_ ) -> const std::string& {
			auto find = input.find( Tlv::resolveType( type_ ) );
			if ( find == input.end() ) {
				throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, stringFormat( "missing field %d", Tlv::resolveType( type_ ) ) );
			}
			return find->second;
		};

		Operation operation;
		operation.permissions = Pairing::Permissions::USER;
		switch( static_cast<uint8_t>( method->second[0] ) ) {
			case resolveMethod( Method::ADD ): {
				operation.method = Method::ADD;
				operation.pairingId = require( Tlv::Type::IDENTIFIER );
				operation.publicKey = require( Tlv::Type::PUBLIC_KEY );
				const std::string& permissions = require( Tlv::Type::PERMISSIONS );
				if ( permissions.size() != 1 ) {
					throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, "invalid permissions" );
				}
				try {
					operation.permissions = Pairing::permissionsFromByte( static_cast<uint8_t>( permissions[0] ) );
				} catch( const Pairing::UnknownPermissionException& exception_ ) {
					throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, exception_.what() );
				}
				break;
			}
			case resolveMethod( Method::REMOVE ):
				operation.method = Method::REMOVE;
				operation.pairingId = require( Tlv::Type::IDENTIFIER );
				break;
			case resolveMethod( Method::LIST ):
				operation.method = Method::LIST;
				break;
			default:
				throw Tlv::Error( resolveStep( Step::UNKNOWN ), Tlv::Code::UNKNOWN, stringFormat( "unknown method %d", static_cast<uint8_t>( method->second[0] ) ) );
		}
		return operation;
	};

	Tlv::Container PairingsHandler::handle( const Operation& operation_, const ControllerId& controller_ ) {
		Tlv::Container response = {
			Tlv::item( Tlv::Type::STATE, resolveStep( Step::RESPONSE ) )
		};
		std::shared_ptr<Event> event = nullptr;

		// The store stays locked from the admin check until the operation completes, and is released before any
		// event is emitted so listeners are free to use the store.
		{
			auto lock = this->m_store->lock();
			try {
				this->_authorize( controller_ );
				switch( operation_.method ) {
					case Method::ADD:
						event = this->_add( operation_ );
						break;
					case Method::REMOVE:
						event = this->_remove( operation_ );
						break;
					case Method::LIST:
						this->_list( response );
						break;
				}
			} catch( const Tlv::Error& ) {
				throw;
			} catch( const PairingStore::StoreException& exception_ ) {
				Logger::logr( Logger::LogLevel::ERROR, this, "Pairing store failure (%s).", exception_.what() );
				throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, exception_.what() );
			} catch( const std::runtime_error& exception_ ) {
				Logger::logr( Logger::LogLevel::ERROR, this, "Unable to %s pairing (%s).", resolveTextMethod( operation_.method ).c_str(), exception_.what() );
				throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, exception_.what() );
			}
		}

		if ( event ) {
			try {
				this->m_emitter->emit( *event );
			} catch( const std::exception& exception_ ) {
				Logger::logr( Logger::LogLevel::ERROR, this, "Event listener failed (%s).", exception_.what() );
			}
		}

		return response;
	};

	std::string PairingsHandler::process( const std::string& body_, const ControllerId& controller_ ) {
		Logger::log( Logger::LogLevel::VERBOSE, this, "Pairings M1 received." );
		try {
			Operation operation = this->parse( body_ );
			Tlv::Container response = this->handle( operation, controller_ );
			Logger::logr( Logger::LogLevel::VERBOSE, this, "Sending pairings %s M2.", resolveTextMethod( operation.method ).c_str() );
			return Tlv::encode( response );
		} catch( const Tlv::Error& error_ ) {
			Logger::logr( Logger::LogLevel::WARNING, this, "Pairings request rejected at step %d (%s).", error_.getStep(), error_.what() );
			return Tlv::encode( error_.getContainer() );
		}
	};

	void PairingsHandler::_authorize( const ControllerId& controller_ ) const {
		Uuid id;
		if ( ! controller_.get( id ) ) {
			throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::AUTHENTICATION, "unverified controller" );
		}
		try {
			if ( ! this->m_store->load( id ).isAdmin() ) {
				throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::AUTHENTICATION, "controller " + id.toString() + " is not an admin" );
			}
		} catch( const PairingStore::NotFoundException& ) {
			throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::AUTHENTICATION, "controller " + id.toString() + " is not paired" );
		}
	};

	std::shared_ptr<Event> PairingsHandler::_add( const Operation& operation_ ) {
		Uuid id = this->_parseId( operation_.pairingId );

		std::shared_ptr<Pairing> pairing = nullptr;
		try {
			pairing = std::make_shared<Pairing>( this->m_store->load( id ) );
		} catch( const PairingStore::NotFoundException& ) { /* new pairing */ }

		if ( pairing ) {

			// An existing pairing only has its permissions updated, and only when the request carries the same key.
			// A different key could be an attempt to take over the pairing.
			try {
				if ( ! Crypto::equals( Crypto::importPublicKey( pairing->getPublicKey() ), Crypto::importPublicKey( operation_.publicKey ) ) ) {
					throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, "public key mismatch for pairing " + id.toString() );
				}
			} catch( const Crypto::InvalidKeyException& exception_ ) {
				throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, exception_.what() );
			}
			pairing->setPermissions( operation_.permissions );
			this->m_store->save( *pairing );
			Logger::logr( Logger::LogLevel::NORMAL, this, "Pairing %s updated to %s.", id.toString().c_str(), Pairing::resolveTextPermissions( operation_.permissions ).c_str() );

		} else {

			unsigned int maxPeers;
			if (
				this->m_config->getMaxPeers( maxPeers )
				&& this->m_store->count() + 1 > maxPeers
			) {
				throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::MAX_PEERS, stringFormat( "maximum of %u pairings reached", maxPeers ) );
			}

			std::string publicKey;
			try {
				publicKey = Crypto::importPublicKey( operation_.publicKey );
			} catch( const Crypto::InvalidKeyException& exception_ ) {
				throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, exception_.what() );
			}
			this->m_store->save( Pairing( id, publicKey, operation_.permissions ) );
			Logger::logr( Logger::LogLevel::NORMAL, this, "Pairing %s added as %s.", id.toString().c_str(), Pairing::resolveTextPermissions( operation_.permissions ).c_str() );
		}

		return std::make_shared<Event>( Event::Type::CONTROLLER_PAIRED, id );
	};

	std::shared_ptr<Event> PairingsHandler::_remove( const Operation& operation_ ) {
		Uuid id = this->_parseId( operation_.pairingId );
		this->m_store->remove( id );
		Logger::logr( Logger::LogLevel::NORMAL, this, "Pairing %s removed.", id.toString().c_str() );
		return std::make_shared<Event>( Event::Type::CONTROLLER_UNPAIRED, id );
	};

	void PairingsHandler::_list( Tlv::Container& response_ ) const {
		auto pairings = this->m_store->list();
		for ( auto pairingIt = pairings.begin(); pairingIt != pairings.end(); pairingIt++ ) {
			response_.push_back( Tlv::item( Tlv::Type::IDENTIFIER, pairingIt->getId().toString() ) );
			response_.push_back( Tlv::item( Tlv::Type::PUBLIC_KEY, pairingIt->getPublicKey() ) );
			response_.push_back( Tlv::item( Tlv::Type::PERMISSIONS, Pairing::permissionsToByte( pairingIt->getPermissions() ) ) );
			response_.push_back( Tlv::separator() );
		}
		Logger::logr( Logger::LogLevel::VERBOSE, this, "Listing %zu pairing(s).", pairings.size() );
	};

	Uuid PairingsHandler::_parseId( const std::string& pairingId_ ) const {
		try {
			return Uuid::parse( pairingId_ );
		} catch( const Uuid::InvalidUuidException& exception_ ) {
			throw Tlv::Error( resolveStep( Step::RESPONSE ), Tlv::Code::UNKNOWN, exception_.what() );
		}
	};

}; // namespace homepair
