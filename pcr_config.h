#ifndef __PCR_CONFIG
#define __PCR_CONFIG

#include <string>
#include <vector>
#include <ostream>
#include "JSON.h"

#define	DEFAULT_MIN_3PRIME_MATCH		3
#define	DEFAULT_MAX_5PRIME_MISMATCH		2
#define	DEFAULT_MIN_TOTAL_MATCH_PERCENT		80.0f
#define	DEFAULT_THREE_PRIME_DG_MAX		-2.0f

// Salt and dNTP concentrations are in mM
#define	DEFAULT_NA_CONC				50.0f
#define	DEFAULT_MG_CONC				2.0f
#define	DEFAULT_DNTP_CONC			0.2f

#define	DEFAULT_PRODUCT_SIZE_MIN		50
#define	DEFAULT_PRODUCT_SIZE_MAX		10000
#define	DEFAULT_MAX_PRODUCTS			10
#define	DEFAULT_REPORT_THRESHOLD		70.0f
#define	DEFAULT_MAX_AMPLICON_FOR_EXTENSION	3000

// The in-silico PCR parameters. Every field has a name, a type and a default value;
// the field name is also the key used in configuration files and "--set key=value".
struct PCRConfig
{
	// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
	// ensure that every parameter is parsed, printed, hashed and serialized.
	#define PCR_CONFIG_MEMBERS \
		VARIABLE(int, min_3prime_match) \
		VARIABLE(int, max_5prime_mismatch) \
		VARIABLE(float, min_total_match_percent) \
		VARIABLE(float, three_prime_dg_max) \
		VARIABLE(float, na_conc) \
		VARIABLE(float, mg_conc) \
		VARIABLE(float, dntp_conc) \
		VARIABLE(int, product_size_min) \
		VARIABLE(int, product_size_max) \
		VARIABLE(int, max_products) \
		VARIABLE(float, report_threshold) \
		VARIABLE(bool, circular) \
		VARIABLE(int, max_amplicon_for_extension)

	#define VARIABLE(A, B) A B;
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	PCRConfig();

	// Assign a single parameter from its text representation. Unknown keys
	// and unparsable values are errors.
	void set(const std::string &m_key, const std::string &m_value);

	// Assign a single parameter from a JSON value
	void set(const std::string &m_key, const json::JSON &m_value);

	// Apply every key/value pair of a JSON map
	void load_json(const json::JSON &m_conf);
	void load_json_file(const std::string &m_filename);

	// Throw if the parameters are not self-consistent
	void validate() const;

	size_t hash() const;

	static bool is_key(const std::string &m_key);
	static std::vector<std::string> keys();

	bool operator==(const PCRConfig &m_rhs) const;

	inline bool operator!=(const PCRConfig &m_rhs) const
	{
		return !(*this == m_rhs);
	};
};

// One "key = value" line per parameter
std::ostream& operator<<(std::ostream &m_s, const PCRConfig &m_config);

#endif // __PCR_CONFIG
