#include <set>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <assert.h>
#include "../../../common/hash/consistent_hash.hh"

static const char *addresses[] = {
	"192.168.0.1", "192.168.0.2", "192.168.0.3", "192.168.0.4"
};
static const int numAddresses = sizeof( addresses ) / sizeof( addresses[ 0 ] );

static uint32_t constantHash( const char *data, size_t n ) {
	return 42;
}

// "0100" -> 100, so that node positions can be chosen by name
static uint32_t decimalHash( const char *data, size_t n ) {
	std::string s( data, n );
	return ( uint32_t ) strtoul( s.c_str(), NULL, 10 );
}

static uint32_t pickyHash( const char *data, size_t n ) {
	std::string s( data, n );
	if ( s.find( "bad" ) != std::string::npos )
		throw std::runtime_error( "Refusing to hash " + s );
	return HashFunc::fnv1aMix( data, n );
}

static std::string owner( ConsistentHashRing &ring, const char *key ) {
	std::string node;
	bool ret = ring.get( key, node );
	assert( ret );
	return node;
}

void testInvalidReplicas() {
	int invalid[] = { 0, -1, -20 };
	for ( int i = 0; i < 3; i++ ) {
		bool thrown = false;
		try {
			ConsistentHashRing ring( invalid[ i ] );
		} catch ( std::invalid_argument &e ) {
			thrown = true;
		}
		assert( thrown );
	}

	ConsistentHashRing ring( 1 );
	assert( ring.getReplicas() == 1 );
	ConsistentHashRing defaultRing;
	assert( defaultRing.getReplicas() == CONSISTENT_HASH_DEFAULT_REPLICAS );
	printf( "Invalid replica count OK\n" );
}

void testEmptyRing() {
	ConsistentHashRing ring;
	std::string node = "untouched";

	assert( ! ring.get( "/hello.txt", node ) );
	assert( node == "untouched" );
	assert( ring.members().empty() );
	assert( ring.size() == 0 );
	assert( ring.positions() == 0 );

	// A node named by the empty string is a real node
	ring.add( "" );
	assert( ring.get( "/hello.txt", node ) );
	assert( node == "" );
	ring.remove( "" );
	node = "untouched";
	assert( ! ring.get( "/hello.txt", node ) );
	assert( node == "untouched" );
	printf( "Empty ring OK\n" );
}

void testLookup() {
	ConsistentHashRing ring( 20 );
	std::set<std::string> expected;
	for ( int i = 0; i < numAddresses; i++ ) {
		ring.add( addresses[ i ] );
		expected.insert( addresses[ i ] );
	}
	assert( ring.positions() <= ( size_t ) 20 * numAddresses );

	std::string first = owner( ring, "/hello.txt" );
	assert( expected.count( first ) == 1 );
	for ( int i = 0; i < 100; i++ )
		assert( owner( ring, "/hello.txt" ) == first );

	// Both overloads hash the same bytes
	std::string node;
	assert( ring.get( "/hello.txt", 10, node ) );
	assert( node == first );
	printf( "Lookup OK\n" );
}

void testMembership() {
	ConsistentHashRing ring;
	std::vector<std::string> members;

	ring.add( "a" );
	ring.add( "b" );
	assert( ring.contains( "a" ) && ring.contains( "b" ) );
	assert( ! ring.contains( "c" ) );
	members = ring.members();
	assert( members.size() == 2 );
	std::set<std::string> unique( members.begin(), members.end() );
	assert( unique.size() == 2 && unique.count( "a" ) && unique.count( "b" ) );

	ring.remove( "a" );
	assert( ! ring.contains( "a" ) );
	members = ring.members();
	assert( members.size() == 1 && members[ 0 ] == "b" );

	// Removing a non-member does nothing
	size_t positions = ring.positions();
	ring.remove( "a" );
	ring.remove( "never-added" );
	assert( ring.positions() == positions );
	assert( ring.size() == 1 );
	printf( "Membership OK\n" );
}

void testIdempotentAdd() {
	ConsistentHashRing once, twice;
	char key[ 32 ];

	once.add( "A" );
	once.add( "B" );
	twice.add( "A" );
	twice.add( "A" );
	twice.add( "B" );
	twice.add( "B" );

	assert( once.positions() == twice.positions() );
	assert( once.size() == 2 && twice.size() == 2 );
	for ( int i = 0; i < 1000; i++ ) {
		snprintf( key, sizeof( key ), "key-%d", i );
		assert( owner( once, key ) == owner( twice, key ) );
	}

	// One removal undoes any number of additions
	twice.remove( "B" );
	assert( ! twice.contains( "B" ) );
	assert( twice.positions() <= CONSISTENT_HASH_DEFAULT_REPLICAS );
	for ( int i = 0; i < 100; i++ ) {
		snprintf( key, sizeof( key ), "key-%d", i );
		assert( owner( twice, key ) == "A" );
	}
	printf( "Idempotent add OK\n" );
}

void testSeededRing() {
	std::vector<std::string> nodes( addresses, addresses + numAddresses );
	nodes.push_back( addresses[ 0 ] );
	ConsistentHashRing seeded( nodes ), ring;
	char key[ 32 ];

	for ( int i = 0; i < numAddresses; i++ )
		ring.add( addresses[ i ] );

	assert( seeded.size() == ( size_t ) numAddresses );
	assert( seeded.positions() == ring.positions() );
	for ( int i = 0; i < 1000; i++ ) {
		snprintf( key, sizeof( key ), "%d-%d", i, i * 7 );
		assert( owner( seeded, key ) == owner( ring, key ) );
	}
	printf( "Seeded ring OK\n" );
}

void testRemoveAll() {
	ConsistentHashRing ring;
	std::set<std::string> present;
	std::string node;
	char key[ 32 ];

	for ( int i = 0; i < numAddresses; i++ ) {
		ring.add( addresses[ i ] );
		present.insert( addresses[ i ] );
	}

	for ( int i = 0; i < numAddresses; i++ ) {
		ring.remove( addresses[ i ] );
		present.erase( addresses[ i ] );
		for ( int j = 0; j < 200; j++ ) {
			snprintf( key, sizeof( key ), "/file-%d", j );
			if ( present.empty() ) {
				assert( ! ring.get( key, node ) );
			} else {
				assert( ring.get( key, node ) );
				assert( present.count( node ) == 1 );
			}
		}
	}
	assert( ring.positions() == 0 );
	assert( ring.members().empty() );
	printf( "Remove all OK\n" );
}

void testSuccessor() {
	ConsistentHashRing ring( 1, decimalHash );

	// Positions: hash( "0" + name )
	ring.add( "100" );
	ring.add( "200" );
	ring.add( "300" );
	assert( ring.positions() == 3 );

	assert( owner( ring, "0" ) == "100" );
	assert( owner( ring, "50" ) == "100" );
	assert( owner( ring, "100" ) == "100" );
	assert( owner( ring, "101" ) == "200" );
	assert( owner( ring, "300" ) == "300" );
	// Past the largest position wraps around
	assert( owner( ring, "301" ) == "100" );
	assert( owner( ring, "4294967295" ) == "100" );

	ring.add( "0" );
	assert( owner( ring, "301" ) == "0" );
	assert( owner( ring, "0" ) == "0" );

	ring.remove( "200" );
	assert( owner( ring, "150" ) == "300" );
	assert( owner( ring, "50" ) == "100" );
	printf( "Nearest successor OK\n" );
}

void testCollisions() {
	ConsistentHashRing ring( 4, constantHash );
	std::string node;

	ring.add( "A" );
	assert( ring.positions() == 1 );
	assert( owner( ring, "x" ) == "A" );

	// The last node written to a position owns it
	ring.add( "B" );
	assert( ring.positions() == 1 );
	assert( owner( ring, "x" ) == "B" );

	// A does not own the position any more
	ring.remove( "A" );
	assert( ring.positions() == 1 );
	assert( owner( ring, "x" ) == "B" );

	ring.remove( "B" );
	assert( ring.positions() == 0 );
	assert( ! ring.get( "x", node ) );
	printf( "Collisions OK\n" );
}

void testThrowingHash() {
	ConsistentHashRing ring( CONSISTENT_HASH_DEFAULT_REPLICAS, pickyHash );
	std::string node;
	bool thrown;

	ring.add( "good" );
	size_t positions = ring.positions();

	thrown = false;
	try {
		ring.add( "bad-node" );
	} catch ( std::runtime_error &e ) {
		thrown = true;
	}
	assert( thrown );
	assert( ! ring.contains( "bad-node" ) );
	assert( ring.positions() == positions );

	thrown = false;
	try {
		ring.get( "bad-key", node );
	} catch ( std::runtime_error &e ) {
		thrown = true;
	}
	assert( thrown );

	// The lock has been released
	ring.add( "better" );
	assert( ring.size() == 2 );
	assert( owner( ring, "fine" ) == "good" || owner( ring, "fine" ) == "better" );

	thrown = false;
	try {
		std::vector<std::string> nodes;
		nodes.push_back( "good" );
		nodes.push_back( "bad" );
		ConsistentHashRing seeded( nodes, 3, pickyHash );
	} catch ( std::runtime_error &e ) {
		thrown = true;
	}
	assert( thrown );
	printf( "Throwing hash function OK\n" );
}

void testPrint() {
	ConsistentHashRing ring( 2 );
	ring.add( "a" );
	FILE *f = tmpfile();
	assert( f );
	ring.print( f );
	assert( ftell( f ) > 0 );
	fclose( f );
	printf( "Print OK\n" );
}

int main( int argc, char **argv ) {
	testInvalidReplicas();
	testEmptyRing();
	testLookup();
	testMembership();
	testIdempotentAdd();
	testSeededRing();
	testRemoveAll();
	testSuccessor();
	testCollisions();
	testThrowingHash();
	testPrint();
	printf( "Consistent hash ring OK\n" );
	return 0;
}
