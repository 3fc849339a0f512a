#include <algorithm>
#include <stdexcept>
#include "consistent_hash.hh"
#include "../util/debug.hh"

void ConsistentHashRing::RingState::swap( RingState &s ) {
	this->members.swap( s.members );
	this->servers.swap( s.servers );
	this->circle.swap( s.circle );
}

ConsistentHashRing::ConsistentHashRing( int replicas, HASH_FCN hashFcn ) {
	this->init( replicas, hashFcn );
}

ConsistentHashRing::ConsistentHashRing( const std::vector<std::string> &nodes, int replicas, HASH_FCN hashFcn ) {
	this->init( replicas, hashFcn );

	std::vector<uint32_t> positions;
	try {
		for ( size_t i = 0, len = nodes.size(); i < len; i++ ) {
			positions.clear();
			this->locate( nodes[ i ], positions );
			ConsistentHashRing::detach( this->state, nodes[ i ], positions );
			ConsistentHashRing::attach( this->state, nodes[ i ], positions );
		}
	} catch ( ... ) {
		// The destructor does not run for a partially constructed ring
		RWLOCK_DESTROY( &this->lock );
		throw;
	}
}

ConsistentHashRing::~ConsistentHashRing() {
	RWLOCK_DESTROY( &this->lock );
}

void ConsistentHashRing::init( int replicas, HASH_FCN hashFcn ) {
	if ( replicas < 1 )
		throw std::invalid_argument( "The number of replicas should be at least 1." );
	this->replicas = ( uint32_t ) replicas;
	this->hashFcn = hashFcn ? hashFcn : HashFunc::fnv1aMix;
	RWLOCK_INIT( &this->lock, 0 );
}

void ConsistentHashRing::locate( const std::string &node, std::vector<uint32_t> &positions ) {
	char index[ 16 ];
	std::string buf;

	positions.reserve( this->replicas );
	buf.reserve( sizeof( index ) + node.size() );
	for ( uint32_t i = 0; i < this->replicas; i++ ) {
		int len = snprintf( index, sizeof( index ), "%u", i );
		buf.assign( index, len );
		buf.append( node );
		positions.push_back( this->hashFcn( buf.data(), buf.size() ) );
	}
}

bool ConsistentHashRing::detach( RingState &state, const std::string &node, const std::vector<uint32_t> &positions ) {
	std::unordered_map<uint32_t, std::string>::iterator it;
	std::unordered_set<uint32_t> memo;

	if ( state.members.erase( node ) == 0 )
		return false;

	for ( size_t i = 0, len = positions.size(); i < len; i++ ) {
		it = state.servers.find( positions[ i ] );
		// Skip positions taken over by a colliding node
		if ( it != state.servers.end() && it->second == node ) {
			state.servers.erase( it );
			memo.insert( positions[ i ] );
		}
	}

	if ( ! memo.empty() ) {
		std::vector<uint32_t> circle;
		circle.reserve( state.circle.size() - memo.size() );
		for ( size_t i = 0, len = state.circle.size(); i < len; i++ ) {
			if ( memo.find( state.circle[ i ] ) == memo.end() )
				circle.push_back( state.circle[ i ] );
		}
		state.circle.swap( circle );
	}
	return true;
}

void ConsistentHashRing::attach( RingState &state, const std::string &node, const std::vector<uint32_t> &positions ) {
	std::pair<std::unordered_map<uint32_t, std::string>::iterator, bool> ret;
	size_t count = state.circle.size();

	for ( size_t i = 0, len = positions.size(); i < len; i++ ) {
		ret = state.servers.insert( std::make_pair( positions[ i ], node ) );
		if ( ret.second )
			state.circle.push_back( positions[ i ] );
		else
			ret.first->second = node;
	}

	// Only the appended tail is out of order
	if ( state.circle.size() != count ) {
		std::vector<uint32_t>::iterator middle = state.circle.begin() + count;
		std::sort( middle, state.circle.end() );
		std::inplace_merge( state.circle.begin(), middle, state.circle.end() );
	}

	state.members.insert( node );
}

void ConsistentHashRing::add( const std::string &node ) {
	std::vector<uint32_t> positions;
	this->locate( node, positions );

	WRLOCK( &this->lock );
	try {
		RingState next( this->state );
		ConsistentHashRing::detach( next, node, positions );
		ConsistentHashRing::attach( next, node, positions );
		this->state.swap( next );
	} catch ( ... ) {
		RWUNLOCK( &this->lock );
		throw;
	}
	RWUNLOCK( &this->lock );

	__DEBUG__( GREEN, "ConsistentHashRing", "add", "Added node: %s.", node.c_str() );
}

void ConsistentHashRing::remove( const std::string &node ) {
	std::vector<uint32_t> positions;
	bool removed = false;
	this->locate( node, positions );

	WRLOCK( &this->lock );
	try {
		if ( this->state.members.find( node ) != this->state.members.end() ) {
			RingState next( this->state );
			removed = ConsistentHashRing::detach( next, node, positions );
			this->state.swap( next );
		}
	} catch ( ... ) {
		RWUNLOCK( &this->lock );
		throw;
	}
	RWUNLOCK( &this->lock );

	if ( removed ) {
		__DEBUG__( YELLOW, "ConsistentHashRing", "remove", "Removed node: %s.", node.c_str() );
	} else {
		__DEBUG__( YELLOW, "ConsistentHashRing", "remove", "Node %s is not a member.", node.c_str() );
	}
}

bool ConsistentHashRing::get( const char *data, size_t n, std::string &node ) {
	std::vector<uint32_t>::const_iterator it;
	uint32_t val = this->hashFcn( data, n );
	bool ret = false;

	RDLOCK( &this->lock );
	try {
		const std::vector<uint32_t> &circle = this->state.circle;
		if ( ! circle.empty() ) {
			it = std::lower_bound( circle.begin(), circle.end(), val );
			if ( it == circle.end() )
				it = circle.begin();
			node = this->state.servers.at( *it );
			ret = true;
		}
	} catch ( ... ) {
		RWUNLOCK( &this->lock );
		throw;
	}
	RWUNLOCK( &this->lock );

	return ret;
}

bool ConsistentHashRing::get( const std::string &key, std::string &node ) {
	return this->get( key.data(), key.size(), node );
}

std::vector<std::string> ConsistentHashRing::members() {
	std::vector<std::string> ret;

	RDLOCK( &this->lock );
	try {
		ret.assign( this->state.members.begin(), this->state.members.end() );
	} catch ( ... ) {
		RWUNLOCK( &this->lock );
		throw;
	}
	RWUNLOCK( &this->lock );

	return ret;
}

bool ConsistentHashRing::contains( const std::string &node ) {
	bool ret;
	RDLOCK( &this->lock );
	ret = this->state.members.find( node ) != this->state.members.end();
	RWUNLOCK( &this->lock );
	return ret;
}

size_t ConsistentHashRing::size() {
	size_t ret;
	RDLOCK( &this->lock );
	ret = this->state.members.size();
	RWUNLOCK( &this->lock );
	return ret;
}

size_t ConsistentHashRing::positions() {
	size_t ret;
	RDLOCK( &this->lock );
	ret = this->state.circle.size();
	RWUNLOCK( &this->lock );
	return ret;
}

uint32_t ConsistentHashRing::getReplicas() const {
	return this->replicas;
}

void ConsistentHashRing::print( FILE *f ) {
	std::unordered_map<uint32_t, std::string>::const_iterator it;

	RDLOCK( &this->lock );
	fprintf( f,
		"Consistent Hash Ring\n"
		"--------------------\n"
		"Members: %lu; Replicas: %u; Positions: %lu\n",
		this->state.members.size(), this->replicas, this->state.circle.size()
	);
	for ( size_t i = 0, len = this->state.circle.size(); i < len; i++ ) {
		it = this->state.servers.find( this->state.circle[ i ] );
		fprintf( f,
			"%lu. %u |--> %s\n",
			i + 1, it->first, it->second.c_str()
		);
	}
	RWUNLOCK( &this->lock );
}
