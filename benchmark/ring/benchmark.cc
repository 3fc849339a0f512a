#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include "../../common/hash/consistent_hash.hh"
#include "../../common/util/time.hh"

int main( int argc, char **argv ) {
	if ( argc > 4 ) {
		fprintf( stderr, "Usage: %s [Number of nodes] [Number of keys] [Replicas]\n", argv[ 0 ] );
		return 1;
	}

	struct {
		int nodes;
		int keys;
		int replicas;
	} config;
	struct timespec startTime;
	double elapsedTime;
	char buf[ 32 ];

	config.nodes = argc > 1 ? atoi( argv[ 1 ] ) : 1000;
	config.keys = argc > 2 ? atoi( argv[ 2 ] ) : 1000000;
	config.replicas = argc > 3 ? atoi( argv[ 3 ] ) : CONSISTENT_HASH_DEFAULT_REPLICAS;
	if ( config.nodes < 1 || config.keys < 1 || config.replicas < 1 ) {
		fprintf( stderr, "All arguments should be positive integers.\n" );
		return 1;
	}

	printf(
		"Number of nodes : %d\n"
		"Number of keys  : %d\n"
		"Replicas        : %d\n\n",
		config.nodes, config.keys, config.replicas
	);

	std::vector<std::string> nodes, keys;
	nodes.reserve( config.nodes );
	for ( int i = 0; i < config.nodes; i++ ) {
		snprintf( buf, sizeof( buf ), "nodes-%d", i );
		nodes.push_back( buf );
	}
	keys.reserve( config.keys );
	for ( int i = 0; i < config.keys; i++ ) {
		snprintf( buf, sizeof( buf ), "key-%d", i );
		keys.push_back( buf );
	}

	ConsistentHashRing ring( config.replicas );
	std::string node;
	unsigned long found = 0;

	startTime = start_timer();
	for ( int i = 0; i < config.nodes; i++ )
		ring.add( nodes[ i ] );
	elapsedTime = get_elapsed_time( startTime );
	printf( "[add]    %10.3f ms (%.3f us/op)\n", elapsedTime * 1000.0, elapsedTime * 1e6 / config.nodes );

	startTime = start_timer();
	for ( int i = 0; i < config.keys; i++ ) {
		if ( ring.get( keys[ i ], node ) )
			found++;
	}
	elapsedTime = get_elapsed_time( startTime );
	printf( "[get]    %10.3f ms (%.3f us/op)\n", elapsedTime * 1000.0, elapsedTime * 1e6 / config.keys );

	startTime = start_timer();
	for ( int i = 0; i < config.nodes; i++ )
		ring.remove( nodes[ i ] );
	elapsedTime = get_elapsed_time( startTime );
	printf( "[remove] %10.3f ms (%.3f us/op)\n", elapsedTime * 1000.0, elapsedTime * 1e6 / config.nodes );

	if ( found != ( unsigned long ) config.keys ) {
		fprintf( stderr, "Only %lu of %d keys are resolved.\n", found, config.keys );
		return 1;
	}
	return 0;
}
