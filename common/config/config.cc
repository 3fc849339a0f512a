#include <cstdlib>
#include <cstring>
#include <string>
#include <ini.h>
#include "config.hh"
#include "../util/debug.hh"

int Config::handler( void *data, const char *section, const char *name, const char *value ) {
	Config *config = ( Config * ) data;
	if ( ! config->set( section, name, value ) ) {
		__ERROR__( "Config", "handler", "Invalid option: [%s] %s = %s.", section, name, value );
		return 0;
	}
	return 1;
}

bool Config::parse( const char *path, const char *filename ) {
	size_t pathLength = strlen( path );
	std::string fullPath( path );

	if ( pathLength == 0 || path[ pathLength - 1 ] != '/' )
		fullPath += '/';
	fullPath += filename;

	FILE *f = fopen( fullPath.c_str(), "r" );
	if ( ! f ) {
		__ERROR__( "Config", "parse", "Cannot open %s.", fullPath.c_str() );
		return false;
	}

	int ret = ini_parse_file( f, handler, this );
	fclose( f );
	if ( ret != 0 ) {
		if ( ret > 0 )
			__ERROR__( "Config", "parse", "Cannot parse %s (line %d).", fullPath.c_str(), ret );
		else
			__ERROR__( "Config", "parse", "Cannot parse %s.", fullPath.c_str() );
		return false;
	}

	return this->validate();
}

bool Config::override( OptionList &options ) {
	bool ret = true;
	for ( int i = 0, size = options.size(); i < size; i++ ) {
		if ( ! options[ i ].section || ! options[ i ].name || ! options[ i ].value ) {
			__ERROR__( "Config", "override", "Incomplete option at position %d.", i );
			ret = false;
			continue;
		}
		if ( ! this->set(
			options[ i ].section,
			options[ i ].name,
			options[ i ].value
		) ) {
			__ERROR__( "Config", "override", "Invalid option: [%s] %s = %s.", options[ i ].section, options[ i ].name, options[ i ].value );
			ret = false;
		}
	}
	return ret && this->validate();
}
