#include <zlib.h>
#include <algorithm>
#include "binding_cache.h"

using namespace std;

BindingCache::Key BindingCache::make_key(const string &m_primer, const Strand &m_strand,
	const string &m_template, const PCRConfig &m_config)
{
	Key ret;

	ret.primer = m_primer;
	ret.strand = m_strand;
	ret.template_len = m_template.size();
	ret.template_hash = std::hash<string>()(m_template);

	// crc32() takes a 32-bit length, so long templates are digested in blocks
	const size_t max_block = 1UL << 30;

	ret.template_crc = crc32(0L, Z_NULL, 0);

	for(size_t i = 0;i < m_template.size();i += max_block){

		const size_t len = std::min(max_block, m_template.size() - i);

		ret.template_crc = crc32(ret.template_crc, (const Bytef*)(m_template.data() + i), (uInt)len);
	}

	ret.config_hash = m_config.hash();

	return ret;
}

bool BindingCache::find(vector<PrimerBinding> &m_bindings, const string &m_name,
	const string &m_primer, const Strand &m_strand,
	const string &m_template, const PCRConfig &m_config)
{
	// Hash the template outside of the critical section
	const Key key = make_key(m_primer, m_strand, m_template, m_config);

	bool found = false;

	#pragma omp critical (binding_cache)
	{
		CacheMap::const_iterator iter = cache.find(key);

		if( iter != cache.end() ){

			m_bindings = iter->second;
			found = true;
			++num_hit;
		}
		else{
			++num_miss;
		}
	}

	if(found){

		for(vector<PrimerBinding>::iterator i = m_bindings.begin();i != m_bindings.end();++i){
			i->name = m_name;
		}
	}

	return found;
}

void BindingCache::insert(const vector<PrimerBinding> &m_bindings,
	const string &m_primer, const Strand &m_strand,
	const string &m_template, const PCRConfig &m_config)
{
	if(max_entries == 0){
		return;
	}

	const Key key = make_key(m_primer, m_strand, m_template, m_config);

	#pragma omp critical (binding_cache)
	{
		if( cache.size() >= max_entries ){
			cache.clear();
		}

		cache[key] = m_bindings;
	}
}

void BindingCache::clear()
{
	#pragma omp critical (binding_cache)
	{
		cache.clear();
		num_hit = 0;
		num_miss = 0;
	}
}

size_t BindingCache::size() const
{
	size_t ret = 0;

	#pragma omp critical (binding_cache)
	ret = cache.size();

	return ret;
}
