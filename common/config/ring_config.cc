#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <unordered_set>
#include "ring_config.hh"
#include "../hash/consistent_hash.hh"

RingConfig::RingConfig() {
	this->ring.replicas = CONSISTENT_HASH_DEFAULT_REPLICAS;
	strncpy( this->ring.hashName, "fnv1a_mix", RING_HASH_NAME_MAX_LEN );
	this->ring.hashName[ RING_HASH_NAME_MAX_LEN ] = 0;
	this->ring.hash = HashFunc::fnv1aMix;
}

bool RingConfig::parse( const char *path ) {
	return Config::parse( path, "ring.ini" );
}

bool RingConfig::set( const char *section, const char *name, const char *value ) {
	if ( match( section, "ring" ) ) {
		if ( match( name, "replicas" ) ) {
			char *end;
			errno = 0;
			long replicas = strtol( value, &end, 10 );
			if ( end == value || *end != 0 || errno == ERANGE || replicas < INT_MIN || replicas > INT_MAX )
				return false;
			this->ring.replicas = ( int32_t ) replicas;
		} else if ( match( name, "hash" ) ) {
			strncpy( this->ring.hashName, value, RING_HASH_NAME_MAX_LEN );
			this->ring.hashName[ RING_HASH_NAME_MAX_LEN ] = 0;
			this->ring.hash = HashFunc::byName( value );
			if ( ! this->ring.hash )
				return false;
		} else {
			return false;
		}
	} else if ( match( section, "nodes" ) ) {
		this->nodes.push_back( value );
	} else {
		return false;
	}
	return true;
}

bool RingConfig::validate() {
	if ( this->ring.replicas < 1 )
		CFG_PARSE_ERROR( "RingConfig", "The number of replicas should be at least 1." );

	if ( ! this->ring.hash )
		CFG_PARSE_ERROR( "RingConfig", "Unsupported hash function: %s.", this->ring.hashName );

	std::unordered_set<std::string> seen;
	for ( size_t i = 0, len = this->nodes.size(); i < len; i++ ) {
		if ( ! seen.insert( this->nodes[ i ] ).second )
			CFG_PARSE_ERROR( "RingConfig", "Node %s is listed more than once.", this->nodes[ i ].c_str() );
	}

	return true;
}

void RingConfig::print( FILE *f ) {
	int width = 24;
	fprintf(
		f,
		"### Ring Configuration ###\n"
		"- Ring\n"
		"\t- %-*s : %d\n"
		"\t- %-*s : %s\n",
		width, "Replicas", this->ring.replicas,
		width, "Hash function", this->ring.hashName
	);

	fprintf( f, "- Nodes\n" );
	for ( int i = 0, len = this->nodes.size(); i < len; i++ )
		fprintf( f, "\t%d. %s\n", ( i + 1 ), this->nodes[ i ].c_str() );

	fprintf( f, "\n" );
}
