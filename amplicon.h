#ifndef __AMPLICON
#define __AMPLICON

#include <string>
#include <vector>
#include "binding.h"

// Extension time estimate (seconds per kilobase)
#define	EXTENSION_SEC_PER_KB		60.0f

#define	MAX_LIKELIHOOD_SCORE		100.0f

//////////////////////////////////////////////////////////////////////////////////////////////////////
// A predicted PCR product
// |--F-->  <--R--|
// ^ start        ^ end
//
// The product spans [start, end) on the plus strand of the template and includes both
// primer binding sites, so product_size == end - start.
//////////////////////////////////////////////////////////////////////////////////////////////////////
struct AmpliconPrediction
{
	PrimerBinding forward;
	PrimerBinding reverse;

	int product_size;
	std::string product_seq;

	int start;
	int end;

	float likelihood;
	bool is_primary;

	std::vector<std::string> warnings;

	// Estimated extension time in seconds (informational only)
	float extension_time;

	AmpliconPrediction() :
		product_size(0), start(0), end(0), likelihood(0.0f), is_primary(false),
		extension_time(0.0f)
	{
	};
};

struct sort_by_likelihood
{
	inline bool operator()(const AmpliconPrediction &m_a, const AmpliconPrediction &m_b) const
	{
		return (m_a.likelihood > m_b.likelihood);
	};
};

// The contribution of a single primer binding to the product likelihood score
float binding_score(const PrimerBinding &m_binding);

// Pair every valid forward binding with every valid reverse binding, keep the pairs whose
// product size is within [product_size_min, product_size_max], rank by likelihood and return
// at most max_products predictions. The first prediction (if any) is the primary product.
void predict_products(std::vector<AmpliconPrediction> &m_products,
	const std::vector<PrimerBinding> &m_forward,
	const std::vector<PrimerBinding> &m_reverse,
	const std::string &m_template, const PCRConfig &m_config);

#endif // __AMPLICON
