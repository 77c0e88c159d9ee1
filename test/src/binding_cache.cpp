#include "AmpsimTest.h"

#include "binding_cache.h"

using namespace std;

TEST(binding_cache, find_and_insert)
{
	BindingCache cache;

	const PCRConfig config;

	const string tmpl = "TTTTTTTTTTGCGCATGCCGTAGCGGCTCGTTTTTTTTTT";
	const string primer = "GCGCATGCCGTAGCGGCTCG";

	vector<PrimerBinding> bindings;

	EXPECT_FALSE( cache.find(bindings, "forward", primer, Seq_strand_plus, tmpl, config) );
	EXPECT_EQ(cache.misses(), 1u);

	find_binding_sites(bindings, "forward", primer, tmpl, Seq_strand_plus, config);

	ASSERT_EQ( bindings.size(), 1u );

	cache.insert(bindings, primer, Seq_strand_plus, tmpl, config);

	EXPECT_EQ(cache.size(), 1u);

	vector<PrimerBinding> cached;

	ASSERT_TRUE( cache.find(cached, "pair_2_forward", primer, Seq_strand_plus, tmpl, config) );
	EXPECT_EQ(cache.hits(), 1u);

	ASSERT_EQ( cached.size(), 1u );

	// The cached bindings take the name of the new search
	EXPECT_EQ(cached[0].name, "pair_2_forward");
	EXPECT_EQ(cached[0].position, bindings[0].position);
	EXPECT_EQ(cached[0].target_seq, bindings[0].target_seq);

	// The strand, the template and the parameters are all part of the key
	EXPECT_FALSE( cache.find(cached, "forward", primer, Seq_strand_minus, tmpl, config) );
	EXPECT_FALSE( cache.find(cached, "forward", primer, Seq_strand_plus, tmpl + "A", config) );

	PCRConfig circular = config;

	circular.circular = true;

	EXPECT_FALSE( cache.find(cached, "forward", primer, Seq_strand_plus, tmpl, circular) );

	EXPECT_EQ(cache.misses(), 4u);

	cache.clear();

	EXPECT_EQ(cache.size(), 0u);
	EXPECT_EQ(cache.hits(), 0u);
	EXPECT_EQ(cache.misses(), 0u);
}

TEST(binding_cache, capacity)
{
	BindingCache cache(2);

	const PCRConfig config;
	const vector<PrimerBinding> bindings;

	cache.insert(bindings, "ACGT", Seq_strand_plus, "AAAA", config);
	cache.insert(bindings, "ACGT", Seq_strand_plus, "CCCC", config);

	EXPECT_EQ(cache.size(), 2u);

	// A full cache is emptied before the next insertion
	cache.insert(bindings, "ACGT", Seq_strand_plus, "GGGG", config);

	EXPECT_EQ(cache.size(), 1u);

	BindingCache disabled(0);

	disabled.insert(bindings, "ACGT", Seq_strand_plus, "AAAA", config);

	EXPECT_EQ(disabled.size(), 0u);
}

TEST(binding_cache, equal_length_templates)
{
	BindingCache cache;

	const PCRConfig config;

	const string primer = "GCGCATGCCGTAGCGGCTCG";

	// The same binding site at different positions in two templates of the same length
	const string tmpl_a = "TTTTTTTTTTGCGCATGCCGTAGCGGCTCGTTTTTTTTTT";
	const string tmpl_b = "TTTTTGCGCATGCCGTAGCGGCTCGTTTTTTTTTTTTTTT";

	ASSERT_EQ( tmpl_a.size(), tmpl_b.size() );

	vector<PrimerBinding> bindings_a;
	vector<PrimerBinding> bindings_b;

	find_binding_sites(bindings_a, "forward", primer, tmpl_a, Seq_strand_plus, config);
	find_binding_sites(bindings_b, "forward", primer, tmpl_b, Seq_strand_plus, config);

	ASSERT_EQ( bindings_a.size(), 1u );
	ASSERT_EQ( bindings_b.size(), 1u );

	cache.insert(bindings_a, primer, Seq_strand_plus, tmpl_a, config);

	vector<PrimerBinding> cached;

	// A template of the same length must not return the bindings of another template
	EXPECT_FALSE( cache.find(cached, "forward", primer, Seq_strand_plus, tmpl_b, config) );

	cache.insert(bindings_b, primer, Seq_strand_plus, tmpl_b, config);

	EXPECT_EQ(cache.size(), 2u);

	ASSERT_TRUE( cache.find(cached, "forward", primer, Seq_strand_plus, tmpl_a, config) );
	ASSERT_EQ( cached.size(), 1u );
	EXPECT_EQ(cached[0].position, 10);

	ASSERT_TRUE( cache.find(cached, "forward", primer, Seq_strand_plus, tmpl_b, config) );
	ASSERT_EQ( cached.size(), 1u );
	EXPECT_EQ(cached[0].position, 5);
}
