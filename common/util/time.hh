#ifndef __COMMON_UTIL_TIME_HH__
#define __COMMON_UTIL_TIME_HH__

#include <time.h>

#define start_timer() ( { \
	struct timespec ts; \
	clock_gettime( CLOCK_MONOTONIC, &ts ); \
	ts; \
} )

#define get_timer() start_timer()

// Seconds since start_time
#define get_elapsed_time(start_time) ( { \
	struct timespec end_time = get_timer(); \
	double elapsed_time = end_time.tv_sec - start_time.tv_sec; \
	elapsed_time += 1.0e-9 * ( end_time.tv_nsec - start_time.tv_nsec ); \
	elapsed_time; \
} )

#endif
