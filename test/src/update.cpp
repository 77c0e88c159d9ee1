#include "AmpsimTest.h"

#include <sstream>

#include "update.h"

using namespace std;

TEST(update, advance)
{
	stringstream ssout;

	UpdateInfo progress("Simulating PCR: ", 4, ssout);

	EXPECT_EQ(progress.total(), 4u);
	EXPECT_EQ(progress.complete(), 0u);

	progress.advance();

	EXPECT_EQ(ssout.str(), "Simulating PCR: 25% (1 of 4)");

	progress.advance();

	EXPECT_EQ(progress.complete(), 2u);

	// The previous message is erased before the new message is written
	const string erase = string(12, '\b') + string(12, ' ') + string(12, '\b');

	EXPECT_EQ(ssout.str(), "Simulating PCR: 25% (1 of 4)" + erase + "50% (2 of 4)");

	progress.advance(2);
	progress.close();

	const string text = ssout.str();

	EXPECT_EQ( text.substr(text.size() - 14), "100% (4 of 4)\n" );
}
