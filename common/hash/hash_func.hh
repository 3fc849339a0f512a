#ifndef __COMMON_HASH_HASH_FUNC_HH__
#define __COMMON_HASH_HASH_FUNC_HH__

#include <cstring>
#include <stddef.h>
#include <stdint.h>

#define FNV32_OFFSET_BASIS 2166136261U
#define FNV32_PRIME        16777619U

/* Any deterministic, stateless function of the input bytes can be used */
typedef uint32_t (* HASH_FCN)( const char *data, size_t n );

class HashFunc {
public:
	// Multiplicative hash carried over from the chunk placement code
	static uint32_t hash( const char *data, size_t n ) {
		uint32_t hash = 388650013;
		uint32_t scale = 388650179;
		uint32_t hardener  = 1176845762;
		while ( n ) {
			hash *= scale;
			hash += *data++;
			n--;
		}
		return hash ^ hardener;
	}

	static uint32_t fnv1( const char *data, size_t n ) {
		uint32_t hash = FNV32_OFFSET_BASIS;
		for ( size_t i = 0; i < n; i++ ) {
			hash *= FNV32_PRIME;
			hash ^= ( uint8_t ) data[ i ];
		}
		return hash;
	}

	static uint32_t fnv1a( const char *data, size_t n ) {
		uint32_t hash = FNV32_OFFSET_BASIS;
		for ( size_t i = 0; i < n; i++ ) {
			hash ^= ( uint8_t ) data[ i ];
			hash *= FNV32_PRIME;
		}
		return hash;
	}

	// murmur3 finalizer
	static uint32_t mix32( uint32_t hash ) {
		hash ^= hash >> 16;
		hash *= 0x85ebca6bU;
		hash ^= hash >> 13;
		hash *= 0xc2b2ae35U;
		hash ^= hash >> 16;
		return hash;
	}

	/*
	 * FNV-1a maps strings that differ only in their last bytes to nearby
	 * values, so nodes named "10.0.0.1", "10.0.0.2", ... would end up next to
	 * each other on the ring. The finalizer spreads them out.
	 */
	static uint32_t fnv1aMix( const char *data, size_t n ) {
		return HashFunc::mix32( HashFunc::fnv1a( data, n ) );
	}

	// Returns 0 if the name is unknown
	static HASH_FCN byName( const char *name ) {
		if ( strcmp( name, "fnv1a_mix" ) == 0 )
			return HashFunc::fnv1aMix;
		else if ( strcmp( name, "fnv1a" ) == 0 )
			return HashFunc::fnv1a;
		else if ( strcmp( name, "fnv1" ) == 0 )
			return HashFunc::fnv1;
		else if ( strcmp( name, "multiplicative" ) == 0 )
			return HashFunc::hash;
		return 0;
	}
};

#endif
