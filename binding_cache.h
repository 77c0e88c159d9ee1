#ifndef __BINDING_CACHE
#define __BINDING_CACHE

#include <string>
#include <vector>
#include <unordered_map>
#include "binding.h"

#define	DEFAULT_BINDING_CACHE_SIZE	4096

// An optional cache of binding site searches that can be shared by many simulations
// (e.g. the same primer searched against the same template with different partner primers).
// Entries are keyed by the primer sequence, the strand, two independent digests of the template
// (std::hash and the zlib CRC-32) and a hash of the search parameters. The template text is not
// stored, so two templates of the same length are only confused if both digests collide.
// The cache is safe to use from multiple OpenMP threads.
class BindingCache
{
	private:

		struct Key
		{
			std::string primer;
			Strand strand;
			size_t template_len;
			size_t template_hash;
			unsigned long template_crc;
			size_t config_hash;

			inline bool operator==(const Key &m_rhs) const
			{
				return (strand == m_rhs.strand) &&
					(template_len == m_rhs.template_len) &&
					(template_hash == m_rhs.template_hash) &&
					(template_crc == m_rhs.template_crc) &&
					(config_hash == m_rhs.config_hash) &&
					(primer == m_rhs.primer);
			};
		};

		struct KeyHash
		{
			inline size_t operator()(const Key &m_key) const
			{
				size_t ret = std::hash<std::string>()(m_key.primer);

				ret ^= m_key.template_hash + 0x9e3779b9 + (ret << 6) + (ret >> 2);
				ret ^= size_t(m_key.template_crc) + 0x9e3779b9 + (ret << 6) + (ret >> 2);
				ret ^= m_key.config_hash + 0x9e3779b9 + (ret << 6) + (ret >> 2);
				ret ^= size_t(m_key.strand) + 0x9e3779b9 + (ret << 6) + (ret >> 2);

				return ret;
			};
		};

		typedef std::unordered_map<Key, std::vector<PrimerBinding>, KeyHash> CacheMap;

		CacheMap cache;

		size_t max_entries;
		size_t num_hit;
		size_t num_miss;

		static Key make_key(const std::string &m_primer, const Strand &m_strand,
			const std::string &m_template, const PCRConfig &m_config);

	public:

		BindingCache(const size_t &m_max_entries = DEFAULT_BINDING_CACHE_SIZE) :
			max_entries(m_max_entries), num_hit(0), num_miss(0)
		{
		};

		// Return true and fill m_bindings if the search result is cached. The primer
		// name of the cached bindings is replaced by m_name.
		bool find(std::vector<PrimerBinding> &m_bindings, const std::string &m_name,
			const std::string &m_primer, const Strand &m_strand,
			const std::string &m_template, const PCRConfig &m_config);

		// When full, the cache is emptied before adding the new entry
		void insert(const std::vector<PrimerBinding> &m_bindings,
			const std::string &m_primer, const Strand &m_strand,
			const std::string &m_template, const PCRConfig &m_config);

		void clear();

		size_t size() const;

		inline size_t hits() const
		{
			return num_hit;
		};

		inline size_t misses() const
		{
			return num_miss;
		};
};

#endif // __BINDING_CACHE
