#pragma once

#include <string>
#include <vector>
#include <map>
#include <type_traits>
#include <iostream>
#include <stdexcept>

namespace homepair {

	std::string stringFormat( const std::string format_, ... );
	std::string hexEncode( const std::string& input_ );
	std::string hexDecode( const std::string& input_ );

	// =======
	// Defines
	// =======

	// NOTE the unary plus promotes single byte enums so they are streamed as numbers instead of characters.
	#define ENUM_UTIL_BASE(E) \
	typedef typename std::underlying_type<E>::type E ## _t; \
	friend constexpr inline E operator|( E a_, E b_ )    { return static_cast<E>( static_cast<E ## _t>( a_ ) | static_cast<E ## _t>( b_ ) ); }; \
	friend constexpr inline E operator&( E a_, E b_ )    { return static_cast<E>( static_cast<E ## _t>( a_ ) & static_cast<E ## _t>( b_ ) ); }; \
	friend inline E& operator|=( E& a_, E b_ ) { a_ = a_ | b_; return a_; }; \
	friend inline E& operator&=( E& a_, E b_ ) { a_ = a_ & b_; return a_; };

	#define ENUM_UTIL_W_TEXT(E,S) \
	ENUM_UTIL_BASE(E) \
	static constexpr inline E ## _t resolve ## E( const E& enum_ ) { \
		return static_cast<E ## _t>( enum_ ); \
	}; \
	static constexpr inline E resolve ## E( const E ## _t& enum_ ) { \
		return static_cast<E>( enum_ ); \
	}; \
	static inline std::string resolveText ## E( const E& enum_ ) { \
		return S.at( enum_ ); \
	}; \
	static inline E resolveText ## E( const std::string& enum_ ) { \
		for ( auto textIt = S.begin(); textIt != S.end(); textIt++ ) { \
			if ( textIt->second == enum_ ) { \
				return textIt->first; \
			} \
		} \
		throw std::invalid_argument( enum_ + " cannot be resolved to " + #E ); \
	}; \
	friend std::ostream& operator<<( std::ostream& os_, const E& enum_ ) { \
		auto textIt = S.find( enum_ ); \
		if ( textIt != S.end() ) { \
			os_ << textIt->second; \
		} else { \
			os_.setstate( std::ios::failbit ); \
		} \
		return os_; \
	};

	#define ENUM_UTIL(E) \
	ENUM_UTIL_BASE(E) \
	static constexpr inline E ## _t resolve ## E( const E& enum_ ) { \
		return static_cast<E ## _t>( enum_ ); \
	}; \
	static constexpr inline E resolve ## E( const E ## _t& enum_ ) { \
		return static_cast<E>( enum_ ); \
	}; \
	friend std::ostream& operator<<( std::ostream& os_, const E& enum_ ) { \
		os_ << +static_cast<E ## _t>( enum_ ); \
		return os_; \
	};

}; // namespace homepair
