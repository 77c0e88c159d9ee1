#ifndef __ENGINE
#define __ENGINE

#include <string>
#include <vector>
#include <ostream>

#include "pcr_config.h"
#include "binding.h"
#include "amplicon.h"
#include "primer_dimer.h"

class BindingCache;

// Templates shorter than this are rejected without searching
#define	MIN_TEMPLATE_LENGTH		50

typedef enum {
	ENGINE_VALIDATING,
	ENGINE_SEARCHING_FORWARD,
	ENGINE_SEARCHING_REVERSE,
	ENGINE_PREDICTING_PRODUCTS,
	ENGINE_CHECKING_DIMER,
	ENGINE_ASSEMBLED
} EngineState;

std::string state_name(const EngineState &m_state);

// The outcome of a single in-silico PCR simulation
struct InsilicoPCRResult
{
	bool success;

	std::string template_name;
	size_t template_length;

	std::string forward_primer;
	std::string reverse_primer;

	// Ranked by decreasing likelihood, at most max_products
	std::vector<AmpliconPrediction> products;

	std::vector<PrimerBinding> forward_bindings;
	std::vector<PrimerBinding> reverse_bindings;

	// The parameters used for this simulation
	PCRConfig parameters;

	std::vector<std::string> warnings;
	std::vector<std::string> errors;

	PrimerDimer primer_dimer;
	bool has_primer_dimer;

	// The last state reached by the engine. A result that stopped early (i.e. a template
	// that is too short) stays in ENGINE_VALIDATING
	EngineState state;

	InsilicoPCRResult() :
		success(false), template_length(0), has_primer_dimer(false),
		state(ENGINE_VALIDATING)
	{
	};

	inline const AmpliconPrediction* primary_product() const
	{
		return products.empty() ? NULL : &products.front();
	};
};

class InsilicoPCR
{
	private:

		PCRConfig config;

		// Not owned. May be NULL.
		BindingCache *cache_ptr;

		// Not owned. May be NULL.
		std::ostream *log_ptr;

		void search(std::vector<PrimerBinding> &m_bindings, const std::string &m_name,
			const std::string &m_primer, const std::string &m_template,
			const Strand &m_strand) const;

	public:

		// The configuration is validated on construction
		InsilicoPCR(const PCRConfig &m_config = PCRConfig(),
			BindingCache *m_cache_ptr = NULL, std::ostream *m_log_ptr = NULL);

		// Simulate PCR for a single primer pair against a single template. The template must be
		// a plus strand, 5' -> 3' sequence. Simulation failures (a template that is too short) are
		// reported in the result and never thrown.
		InsilicoPCRResult run(const std::string &m_template,
			const std::string &m_forward_primer,
			const std::string &m_reverse_primer,
			const std::string &m_template_name = "template") const;

		inline const PCRConfig& get_config() const
		{
			return config;
		};
};

#endif // __ENGINE
