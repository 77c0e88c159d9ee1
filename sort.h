#ifndef __SORT
#define __SORT

// Rankings must be reproducible, so elements that compare equal keep their
// relative order (i.e. only stable sorting is used).

// Note that on OS X, the clang compiler defines __GNUC__
#if defined(_OPENMP) && !defined(__clang__)
	#include <parallel/algorithm>

	// Enable OpenMP-based parallel sorting
	#define	STABLE_SORT	__gnu_parallel::stable_sort
#else
	#include <algorithm>

	// Use standard serial-based sorting
	#define	STABLE_SORT	std::stable_sort
#endif // _OPENMP

#endif // __SORT
