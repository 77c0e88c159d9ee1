#include "AmpsimTest.h"

#include <getopt.h>
#include <string.h>
#include <vector>

#include "ampsim.h"

using namespace std;

// Parse a command line the way main() does. getopt keeps global state, so it is reset
// before every parse.
Options parse_command_line(const char *m_argv[], const int &m_argc)
{
	vector< vector<char> > buffer(m_argc);
	vector<char*> argv(m_argc + 1, (char*)NULL);

	for(int i = 0;i < m_argc;++i){

		buffer[i].assign(m_argv[i], m_argv[i] + strlen(m_argv[i]) + 1);
		argv[i] = &buffer[i][0];
	}

	optind = 0;

	Options ret;

	ret.load(m_argc, &argv[0]);

	return ret;
}

TEST(options, pcr_parameters)
{
	const char *argv[] = {"ampsim", "-t", "templates.fna", "-f", "ACGTACGT", "-r", "TTGGCCAA",
		"--o.json", "--size.max", "500", "--set", "circular=true", "--threshold.report", "60",
		"-v", "Silent", "--thread", "2"};

	const Options opt = parse_command_line( argv, sizeof(argv)/sizeof(argv[0]) );

	EXPECT_FALSE(opt.quit);
	EXPECT_FALSE(opt.error);
	EXPECT_EQ(opt.template_filename, "templates.fna");
	EXPECT_EQ(opt.forward_primer, "ACGTACGT");
	EXPECT_EQ(opt.reverse_primer, "TTGGCCAA");
	EXPECT_EQ(opt.output_format, Options::JSON_OUTPUT);
	EXPECT_EQ(opt.output_filter, Options::SILENT);
	EXPECT_EQ(opt.max_thread, 2u);

	EXPECT_EQ(opt.config.product_size_max, 500);
	EXPECT_TRUE(opt.config.circular);
	EXPECT_FLOAT_EQ(opt.config.report_threshold, 60.0f);

	// Unchanged parameters keep their defaults
	EXPECT_EQ(opt.config.product_size_min, DEFAULT_PRODUCT_SIZE_MIN);
}

TEST(options, primer_file)
{
	const char *argv[] = {"ampsim", "-t", "templates.fna", "-p", "primers.txt", "--o.fasta", "-o", "out.fna"};

	const Options opt = parse_command_line( argv, sizeof(argv)/sizeof(argv[0]) );

	EXPECT_FALSE(opt.quit);
	EXPECT_EQ(opt.primer_filename, "primers.txt");
	EXPECT_EQ(opt.output_filename, "out.fna");
	EXPECT_EQ(opt.output_format, Options::FASTA_OUTPUT);
}

// Invalid arguments stop the program with an error (and a non-zero exit status)
TEST(options, invalid)
{
	// No template
	const char *no_template[] = {"ampsim", "-f", "ACGTACGT", "-r", "TTGGCCAA"};

	EXPECT_TRUE( parse_command_line( no_template, sizeof(no_template)/sizeof(no_template[0]) ).error );

	// Missing reverse primer
	const char *no_reverse[] = {"ampsim", "-t", "templates.fna", "-f", "ACGTACGT"};

	EXPECT_TRUE( parse_command_line( no_reverse, sizeof(no_reverse)/sizeof(no_reverse[0]) ).error );

	// Both a primer file and individual primers
	const char *both[] = {"ampsim", "-t", "templates.fna", "-p", "primers.txt", "-f", "ACGTACGT"};

	EXPECT_TRUE( parse_command_line( both, sizeof(both)/sizeof(both[0]) ).error );

	// Inconsistent product size range
	const char *size_range[] = {"ampsim", "-t", "templates.fna", "-f", "ACGT", "-r", "ACGT",
		"--size.min", "20000"};

	EXPECT_TRUE( parse_command_line( size_range, sizeof(size_range)/sizeof(size_range[0]) ).error );

	const char *unknown_param[] = {"ampsim", "-t", "templates.fna", "-f", "ACGT", "-r", "ACGT",
		"--set", "primer_length=20"};

	EXPECT_TRUE( parse_command_line( unknown_param, sizeof(unknown_param)/sizeof(unknown_param[0]) ).error );

	const char *verbosity[] = {"ampsim", "-t", "templates.fna", "-f", "ACGT", "-r", "ACGT",
		"-v", "loud"};

	EXPECT_TRUE( parse_command_line( verbosity, sizeof(verbosity)/sizeof(verbosity[0]) ).error );

	// Printing the usage is not an error
	const char *usage[] = {"ampsim"};

	const Options usage_opt = parse_command_line( usage, sizeof(usage)/sizeof(usage[0]) );

	EXPECT_TRUE(usage_opt.quit);
	EXPECT_FALSE(usage_opt.error);
}
