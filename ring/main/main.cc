#include <map>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <getopt.h>
#include <death_handler.h>
#include "../../common/config/ring_config.hh"
#include "../../common/hash/consistent_hash.hh"
#include "../../common/util/option.hh"

static bool lookup( ConsistentHashRing &ring, const char *key ) {
	std::string node;
	if ( ! ring.get( key, strlen( key ), node ) ) {
		fprintf( stderr, "Error: No nodes available for key: %s.\n", key );
		return false;
	}
	printf( "%s -> %s\n", key, node.c_str() );
	return true;
}

static bool distribution( ConsistentHashRing &ring, unsigned long count ) {
	std::map<std::string, unsigned long> statistic;
	std::map<std::string, unsigned long>::iterator it;
	std::vector<std::string> members = ring.members();
	std::string node;
	char key[ 32 ];

	if ( members.empty() ) {
		fprintf( stderr, "Error: No nodes available.\n" );
		return false;
	}
	for ( size_t i = 0, len = members.size(); i < len; i++ )
		statistic[ members[ i ] ] = 0;

	srand( time( 0 ) );
	for ( unsigned long i = 0; i < count; i++ ) {
		snprintf( key, sizeof( key ), "%d-%d", rand() % ( int ) ( i + 1 ), rand() % ( int ) ( i + 1 ) );
		if ( ! ring.get( key, strlen( key ), node ) )
			return false;
		statistic[ node ]++;
	}

	double mean = ( double ) count / members.size();
	printf( "### Distribution of %lu keys over %lu nodes ###\n", count, members.size() );
	for ( it = statistic.begin(); it != statistic.end(); it++ ) {
		printf(
			"\t- %-24s : %8lu (%.2fx mean)\n",
			it->first.c_str(), it->second,
			mean > 0 ? it->second / mean : 0.0
		);
	}
	return true;
}

int main( int argc, char **argv ) {
	int opt, ret = 0;
	bool verbose = false;
	unsigned long count = 0;
	char *path = NULL, path_default[] = "bin/config/local";
	OptionList options;
	struct option_t tmpOption;
	std::vector<std::string> nodes;
	static struct option long_options[] = {
		{ "path", required_argument, NULL, 'p' },
		{ "option", required_argument, NULL, 'o' },
		{ "node", required_argument, NULL, 'n' },
		{ "count", required_argument, NULL, 'c' },
		{ "help", no_argument, NULL, 'h' },
		{ "verbose", no_argument, NULL, 'v' },
		{ 0, 0, 0, 0 }
	};
	Debug::DeathHandler dh;

	//////////////////////////////////
	// Parse command-line arguments //
	//////////////////////////////////
	opterr = 0;
	while( ( opt = getopt_long( argc, argv,
	                            "p:o:n:c:hv",
	                            long_options, NULL ) ) != -1 ) {
		switch( opt ) {
			case 'p':
				path = optarg;
				break;
			case 'o':
				tmpOption.section = 0;
				tmpOption.name = 0;
				tmpOption.value = 0;
				for ( int i = optind - 1, j = 0; i < argc && argv[ i ][ 0 ] != '-' && j < 3; i++, j++ ) {
					switch( j ) {
						case 0:
							tmpOption.section = argv[ i ];
							break;
						case 1:
							tmpOption.name = argv[ i ];
							break;
						case 2:
							tmpOption.value = argv[ i ];
							break;
					}
					optind = i + 1;
				}
				options.push_back( tmpOption );
				break;
			case 'n':
				nodes.push_back( optarg );
				break;
			case 'c':
				count = strtoul( optarg, NULL, 10 );
				break;
			case 'h':
				ret = 0;
				goto usage;
			case 'v':
				verbose = true;
				break;
			default:
				ret = 1;
				goto usage;
		}
	}
	path = path == NULL ? path_default : path;

	//////////////////////////
	// Build the hash ring  //
	//////////////////////////
	{
		RingConfig config;
		if ( ! config.parse( path ) ) {
			fprintf( stderr, "Error: Cannot read the ring configuration from %s.\n", path );
			return 1;
		}
		if ( ! options.empty() && ! config.override( options ) ) {
			fprintf( stderr, "Error: Invalid configuration override.\n" );
			return 1;
		}

		ConsistentHashRing ring( config.nodes, config.ring.replicas, config.ring.hash );
		for ( size_t i = 0, len = nodes.size(); i < len; i++ )
			ring.add( nodes[ i ] );

		if ( verbose ) {
			config.print();
			ring.print();
		}

		if ( count > 0 && ! distribution( ring, count ) )
			return 1;

		if ( optind < argc ) {
			for ( int i = optind; i < argc; i++ ) {
				if ( ! lookup( ring, argv[ i ] ) )
					ret = 1;
			}
		} else if ( count == 0 ) {
			char *line = NULL;
			size_t size = 0;
			ssize_t len;
			while ( ( len = getline( &line, &size, stdin ) ) != -1 ) {
				if ( len > 0 && line[ len - 1 ] == '\n' )
					line[ --len ] = 0;
				if ( ! lookup( ring, line ) )
					ret = 1;
			}
			free( line );
		}
	}

	return ret;

usage:
	fprintf(
		stderr,
		"Usage: %s [OPTION]... [KEY]...\n"
		"Print the node owning each KEY on the consistent hash ring.\n"
		"Keys are read from standard input, one per line, when none is given.\n\n"
		"Mandatory arguments to long options are mandatory for short "
		"options too.\n"
		"  -p, --path         Specify the path to the directory containing the config file (ring.ini)\n"
		"  -o, --option       Override the options in the config file: [section] [name] [value]\n"
		"  -n, --node         Add a node to the ring in addition to the configured ones\n"
		"  -c, --count        Hash the given number of random keys and show the distribution\n"
		"  -v, --verbose      Show configuration and the ring\n"
		"  -h, --help         Display this help and exit\n",
		argv[ 0 ]
	);

	return ret;
}
