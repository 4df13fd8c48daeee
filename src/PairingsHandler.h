#pragma once

#include <string>
#include <memory>
#include <map>
#include <cstdint>

#include "Utils.h"
#include "Tlv.h"
#include "Pairing.h"

namespace homepair {

	class PairingStore;
	class EventEmitter;
	class Event;
	class Config;
	class ControllerId;

	// ===============
	// PairingsHandler
	// ===============

	// Handles the /pairings endpoint of the HAP protocol (par 5.10 - 5.12): a single M1 request from an admin
	// controller to add, remove or list pairings, answered with a single M2 response.

	class PairingsHandler final {

	public:
		static const char* contentType;

		enum class Step: uint8_t {
			UNKNOWN  = 0x00,
			REQUEST  = 0x01,
			RESPONSE = 0x02
		}; // enum class Step
		ENUM_UTIL( Step );

		enum class Method: uint8_t {
			ADD    = 0x03,
			REMOVE = 0x04,
			LIST   = 0x05
		}; // enum class Method
		static const std::map<Method, std::string> MethodText;
		ENUM_UTIL_W_TEXT( Method, MethodText );

		// A decoded request. The pairing id and public key are only used by add and remove and are kept as received
		// until the request is authorized.
		struct Operation {
			Method method;
			std::string pairingId;
			std::string publicKey;
			Pairing::Permissions permissions;
		}; // struct Operation

		PairingsHandler( std::shared_ptr<PairingStore> store_, std::shared_ptr<EventEmitter> emitter_, std::shared_ptr<Config> config_ );

		PairingsHandler( const PairingsHandler& ) = delete; // do not copy
		PairingsHandler& operator=( const PairingsHandler& ) = delete; // do not copy-assign

		friend std::ostream& operator<<( std::ostream& out_, const PairingsHandler* ) { out_ << "Pairings"; return out_; }

		Operation parse( const std::string& body_ ) const;
		Tlv::Container handle( const Operation& operation_, const ControllerId& controller_ );
		std::string process( const std::string& body_, const ControllerId& controller_ );

	private:
		std::shared_ptr<PairingStore> m_store;
		std::shared_ptr<EventEmitter> m_emitter;
		std::shared_ptr<Config> m_config;

		void _authorize( const ControllerId& controller_ ) const;
		std::shared_ptr<Event> _add( const Operation& operation_ );
		std::shared_ptr<Event> _remove( const Operation& operation_ );
		void _list( Tlv::Container& response_ ) const;
		Uuid _parseId( const std::string& pairingId_ ) const;

	}; // class PairingsHandler

}; // namespace homepair
