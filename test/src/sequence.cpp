#include "AmpsimTest.h"

#include <deque>
#include <fstream>
#include <stdio.h>
#include <zlib.h>

#include "sequence.h"

using namespace std;

TEST(sequence, reverse_complement)
{
	EXPECT_EQ( reverse_complement("AACGTT"), "AACGTT" );
	EXPECT_EQ( reverse_complement("ACCGGGT"), "ACCCGGT" );
	EXPECT_EQ( reverse_complement(""), "" );

	// Every IUPAC symbol has a complement
	EXPECT_EQ( reverse_complement("ACGTRYKMBVDHSWN"), "NWSDHBVKMRYACGT" );

	// Case is preserved
	EXPECT_EQ( reverse_complement("acgT"), "Acgt" );

	const string seq = "GATTACAnnRYkmBVDHsw";

	EXPECT_EQ( reverse_complement( reverse_complement(seq) ), seq );

	EXPECT_THROW( reverse_complement("ACGX"), const char* );
}

TEST(sequence, bases_match)
{
	EXPECT_TRUE( bases_match('A', 'A') );
	EXPECT_TRUE( bases_match('a', 'A') );
	EXPECT_FALSE( bases_match('A', 'C') );

	EXPECT_TRUE( bases_match('R', 'A') );
	EXPECT_TRUE( bases_match('R', 'G') );
	EXPECT_FALSE( bases_match('R', 'C') );
	EXPECT_FALSE( bases_match('R', 'Y') );

	EXPECT_TRUE( bases_match('n', 'G') );
	EXPECT_TRUE( bases_match('S', 'K') );
	EXPECT_TRUE( bases_match('U', 'T') );

	EXPECT_THROW( bases_match('A', '-'), const char* );
}

TEST(sequence, name)
{
	EXPECT_EQ( Sequence(">chr1 some description", "ACGT").name(), "chr1" );
	EXPECT_EQ( Sequence("> plasmid\tcircular", "ACGT").name(), "plasmid" );
	EXPECT_EQ( Sequence("contig_7", "ACGT").name(), "contig_7" );
	EXPECT_EQ( Sequence(">", "ACGT").name(), "" );
}

TEST(sequence, gc_count)
{
	EXPECT_EQ( gc_count("ACGTGCSN"), 4u );
	EXPECT_EQ( gc_count("gcat"), 2u );
	EXPECT_EQ( gc_count("ATATAT"), 0u );
}

TEST(sequence, pad_to_equal_length)
{
	string a = "ACG";
	string b = "A";

	pad_to_equal_length(a, b);

	EXPECT_EQ(a, "ACG");
	EXPECT_EQ(b, "ANN");

	a = "";
	b = "TT";

	pad_to_equal_length(a, b);

	EXPECT_EQ(a, "NN");
	EXPECT_EQ(b, "TT");
}

TEST(sequence, parse_fasta)
{
	const string filename = env->out_file("parse_fasta_test.fna");

	ofstream fout( filename.c_str() );

	ASSERT_TRUE(fout);

	fout << ">seq1 first record" << endl;
	fout << "acgtRYN" << endl;
	fout << "ACGT" << endl;
	fout << endl;
	fout << ">seq2" << endl;
	fout << "GG GG\r" << endl;

	fout.close();

	deque<Sequence> seq;

	parse_fasta(filename, seq);

	ASSERT_EQ( seq.size(), 2u );

	EXPECT_EQ( seq[0].name(), "seq1" );
	EXPECT_EQ( seq[0].def, ">seq1 first record" );

	// Templates are upper case and ambiguity codes become 'N'
	EXPECT_EQ( seq[0].seq, "ACGTNNNACGT" );

	EXPECT_EQ( seq[1].name(), "seq2" );
	EXPECT_EQ( seq[1].seq, "GGGG" );

	remove( filename.c_str() );
}

TEST(sequence, parse_fasta_gzip)
{
	const string filename = env->out_file("parse_fasta_test.fna.gz");

	gzFile fout = gzopen(filename.c_str(), "wb");

	ASSERT_TRUE(fout != NULL);

	gzputs(fout, ">compressed template\n");

	// A single sequence line that is longer than the read buffer
	for(int i = 0;i < 1000;++i){
		gzputs(fout, "ACGTA");
	}

	gzputs(fout, "\n");
	gzclose(fout);

	deque<Sequence> seq;

	parse_fasta(filename, seq);

	ASSERT_EQ( seq.size(), 1u );

	EXPECT_EQ( seq[0].name(), "compressed" );
	EXPECT_EQ( seq[0].length(), 5000u );
	EXPECT_EQ( seq[0].seq.substr(0, 10), "ACGTAACGTA" );

	remove( filename.c_str() );
}

TEST(sequence, parse_fasta_errors)
{
	deque<Sequence> seq;

	EXPECT_THROW( parse_fasta(env->out_file("no_such_file.fna"), seq), const char* );

	const string filename = env->out_file("parse_fasta_bad.fna");

	ofstream fout( filename.c_str() );

	ASSERT_TRUE(fout);

	fout << "ACGT" << endl;
	fout << ">late defline" << endl;
	fout.close();

	EXPECT_THROW( parse_fasta(filename, seq), const char* );

	fout.open( filename.c_str() );

	fout << ">bad symbol" << endl;
	fout << "ACGTXACGT" << endl;
	fout.close();

	seq.clear();

	EXPECT_THROW( parse_fasta(filename, seq), const char* );

	remove( filename.c_str() );
}
