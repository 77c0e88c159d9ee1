#ifndef __PRIMER_DIMER
#define __PRIMER_DIMER

#include <string>
#include <vector>

// The minimum number of consecutive complementary bases reported as a dimer region
#define	DEFAULT_MIN_DIMER_COMPLEMENTARY	4

// The number of 3' terminal bases compared for 3' end complementarity
#define	DIMER_THREE_PRIME_LENGTH	6

// Report at most this many complementary regions
#define	MAX_DIMER_REGIONS		5

typedef enum {
	DIMER_NONE,
	DIMER_LOW,
	DIMER_MODERATE,
	DIMER_SEVERE
} DimerSeverity;

// A run of complementary bases, in forward primer coordinates [start, end)
struct DimerRegion
{
	unsigned int start;
	unsigned int end;

	DimerRegion() : start(0), end(0)
	{
	};

	DimerRegion(const unsigned int &m_start, const unsigned int &m_end) :
		start(m_start), end(m_end)
	{
	};

	inline unsigned int length() const
	{
		return end - start;
	};
};

struct PrimerDimer
{
	bool has_dimer;

	// The longest run of consecutive complementary bases over all ungapped alignments
	unsigned int max_complementary;

	// The number of complementary bases between the primer 3' ends
	unsigned int three_prime_complementary;

	std::vector<DimerRegion> regions;

	DimerSeverity severity;

	// Empty when severity == DIMER_NONE
	std::string warning;

	PrimerDimer() :
		has_dimer(false), max_complementary(0), three_prime_complementary(0),
		severity(DIMER_NONE)
	{
	};
};

PrimerDimer check_primer_dimer(const std::string &m_forward, const std::string &m_reverse,
	const unsigned int &m_min_complementary = DEFAULT_MIN_DIMER_COMPLEMENTARY);

std::string severity_name(const DimerSeverity &m_severity);

#endif // __PRIMER_DIMER
