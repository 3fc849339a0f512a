#ifndef __COMMON_HASH_CONSISTENT_HASH_HH__
#define __COMMON_HASH_CONSISTENT_HASH_HH__

#include <string>
#include <vector>
#include <cstdio>
#include <stdint.h>
#include <unordered_map>
#include <unordered_set>
#include "hash_func.hh"
#include "../lock/lock.hh"

#define CONSISTENT_HASH_DEFAULT_REPLICAS 20

/*
 * Maps keys onto a changing set of nodes. Every node is placed on a 32-bit
 * circle at `replicas' positions, hash( "<i>" + node ) for i in
 * [0, replicas). A key belongs to the node owning the first position at or
 * after hash( key ), wrapping around to the smallest position.
 *
 * add() and remove() hold the write lock for the whole transition; get()
 * and the other queries only take the read lock.
 */
class ConsistentHashRing {
private:
	struct RingState {
		std::unordered_set<std::string> members;
		// Position -> owner; the last node written to a position wins
		std::unordered_map<uint32_t, std::string> servers;
		// Sorted, duplicate-free key set of `servers'
		std::vector<uint32_t> circle;

		void swap( RingState &s );
	};

	uint32_t replicas;
	HASH_FCN hashFcn;
	RWLOCK_T lock;
	RingState state;

	ConsistentHashRing( const ConsistentHashRing & );
	ConsistentHashRing &operator=( const ConsistentHashRing & );

	void init( int replicas, HASH_FCN hashFcn );
	void locate( const std::string &node, std::vector<uint32_t> &positions );
	static bool detach( RingState &state, const std::string &node, const std::vector<uint32_t> &positions );
	static void attach( RingState &state, const std::string &node, const std::vector<uint32_t> &positions );

public:
	// Throws std::invalid_argument if replicas < 1
	ConsistentHashRing( int replicas = CONSISTENT_HASH_DEFAULT_REPLICAS, HASH_FCN hashFcn = 0 );
	ConsistentHashRing( const std::vector<std::string> &nodes, int replicas = CONSISTENT_HASH_DEFAULT_REPLICAS, HASH_FCN hashFcn = 0 );
	~ConsistentHashRing();

	// Adding a member again replaces its positions with identical ones
	void add( const std::string &node );
	// Removing a non-member does nothing
	void remove( const std::string &node );

	// Returns false if the ring has no nodes; `node' is left untouched
	bool get( const char *data, size_t n, std::string &node );
	bool get( const std::string &key, std::string &node );

	std::vector<std::string> members();
	bool contains( const std::string &node );
	size_t size();
	size_t positions();
	uint32_t getReplicas() const;

	void print( FILE *f = stdout );
};

#endif
