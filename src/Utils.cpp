#include "Utils.h"

#include <sstream>
#include <iomanip>
#include <cstdarg>
#include <cstdio>

namespace homepair {

	std::string stringFormat( const std::string format_, ... ) {
		int size = 100;
		std::string str;
		va_list ap;
		while (1) {
			str.resize( size );
			va_start( ap, format_ );
			int n = vsnprintf( &str[0], size, format_.c_str(), ap );
			va_end( ap );
			if (
				n > -1
				&& n < size
			) {
				str.resize( n );
				return str;
			}
			if ( n > -1 ) {
				size = n + 1;
			} else {
				size *= 2;
			}
		}
	};

	std::string hexEncode( const std::string& input_ ) {
		std::stringstream ss;
		ss << std::hex << std::setfill( '0' );
		for ( auto inputIt = input_.begin(); inputIt != input_.end(); inputIt++ ) {
			ss << std::setw( 2 ) << static_cast<unsigned int>( static_cast<unsigned char>( *inputIt ) );
		}
		return ss.str();
	};

	std::string hexDecode( const std::string& input_ ) {
		if ( input_.size() % 2 != 0 ) {
			throw std::invalid_argument( "hex input has an odd length" );
		}
		auto nibble = []( char c_ ) -> int {
			if ( c_ >= '0' && c_ <= '9' ) {
				return c_ - '0';
			} else if ( c_ >= 'a' && c_ <= 'f' ) {
				return c_ - 'a' + 10;
			} else if ( c_ >= 'A' && c_ <= 'F' ) {
				return c_ - 'A' + 10;
			}
			throw std::invalid_argument( "hex input contains an invalid character" );
		};
		std::string result;
		result.reserve( input_.size() / 2 );
		for ( size_t i = 0; i < input_.size(); i += 2 ) {
			result.push_back( static_cast<char>( ( nibble( input_[i] ) << 4 ) | nibble( input_[i + 1] ) ) );
		}
		return result;
	};

} // namespace homepair
