#ifndef __COMMON_CONFIG_RING_CONFIG_HH__
#define __COMMON_CONFIG_RING_CONFIG_HH__

#include <string>
#include <vector>
#include <cstdio>
#include <stdint.h>
#include "config.hh"
#include "../hash/hash_func.hh"

#define RING_HASH_NAME_MAX_LEN 31

class RingConfig : public Config {
public:
	struct {
		int32_t replicas;
		char hashName[ RING_HASH_NAME_MAX_LEN + 1 ];
		HASH_FCN hash;
	} ring;
	// Seed nodes, in file order
	std::vector<std::string> nodes;

	RingConfig();
	bool parse( const char *path );
	bool set( const char *section, const char *name, const char *value );
	bool validate();
	void print( FILE *f = stdout );
};

#endif
