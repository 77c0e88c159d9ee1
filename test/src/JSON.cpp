#include "AmpsimTest.h"

#include "JSON.h"

using namespace std;

TEST(JSON, parse)
{
	const json::JSON j("{\"name\":\"primer \\\"A\\\"\", \"size\":-12.5e1, \"count\":3,"
		" \"flag\":true, \"none\":null, \"list\":[1, \"two\", false]}");

	ASSERT_EQ(j.get_type(), json::JSON::JSON_MAP);
	EXPECT_EQ(j.size(), 6u);

	EXPECT_TRUE( j.has_key("name") );
	EXPECT_FALSE( j.has_key("missing") );

	EXPECT_EQ(j["name"].get_string(), "primer \"A\"");
	EXPECT_DOUBLE_EQ(j["size"].get_number(), -125.0);
	EXPECT_EQ(j["count"].get_int(), 3);
	EXPECT_TRUE( j["flag"].get_bool() );
	EXPECT_EQ(j["none"].get_type(), json::JSON::JSON_NONE);

	const json::JSON &list = j["list"];

	ASSERT_EQ(list.get_type(), json::JSON::JSON_ARRAY);
	ASSERT_EQ(list.size(), 3u);

	EXPECT_EQ(list[size_t(0)].get_int(), 1);
	EXPECT_EQ(list[size_t(1)].get_string(), "two");
	EXPECT_FALSE( list[size_t(2)].get_bool() );

	// Keys are sorted
	const vector<string> k = j.keys();

	ASSERT_EQ(k.size(), 6u);
	EXPECT_EQ(k.front(), "count");
	EXPECT_EQ(k.back(), "size");

	// Copies are deep
	json::JSON copy = j;

	copy = copy["list"];

	EXPECT_EQ(copy.size(), 3u);
	EXPECT_EQ(j.size(), 6u);
}

TEST(JSON, errors)
{
	EXPECT_THROW( json::JSON("{\"a\":1,}"), const char* );
	EXPECT_THROW( json::JSON("[1, 2"), const char* );
	EXPECT_THROW( json::JSON("{\"a\":1} extra"), const char* );
	EXPECT_THROW( json::JSON("{\"a\":1, \"a\":2}"), const char* );
	EXPECT_THROW( json::JSON("\"unterminated"), const char* );
	EXPECT_THROW( json::JSON("truth"), const char* );
	EXPECT_THROW( json::JSON(""), const char* );

	const json::JSON j("{\"a\":1.5, \"b\":\"text\"}");

	EXPECT_THROW( j["c"], const char* );
	EXPECT_THROW( j["a"].get_int(), const char* );
	EXPECT_THROW( json::JSON("1e20").get_int(), const char* );
	EXPECT_THROW( j["b"].get_number(), const char* );
	EXPECT_THROW( j[size_t(0)], const char* );
}

TEST(JSON, escape)
{
	EXPECT_EQ( json::escape("plain"), "plain" );
	EXPECT_EQ( json::escape("3' end"), "3' end" );
	EXPECT_EQ( json::escape("a\"b\\c"), "a\\\"b\\\\c" );
	EXPECT_EQ( json::escape("tab\there\n"), "tab\\there\\n" );
	EXPECT_EQ( json::escape( string(1, '\x01') ), "\\u0001" );

	// Escaped text can be read back
	const string text = "line 1\nline \"2\"\t\\";
	const json::JSON j("\"" + json::escape(text) + "\"");

	EXPECT_EQ(j.get_string(), text);
}
