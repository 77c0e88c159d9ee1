#include "JSON.h"
#include <stdlib.h>
#include <ctype.h>
#include <stdio.h>
#include <limits.h>

using namespace std;
using namespace json;

void skip_white_space(const string &m_text, size_t &m_pos);
string parse_string(const string &m_text, size_t &m_pos);
void append_utf8(string &m_str, unsigned int m_code_point);

JSON::JSON(const string &m_text) :
	value_type(JSON_NONE), bool_value(false), number_value(0.0),
	array_ptr(NULL), map_ptr(NULL)
{
	size_t pos = 0;

	parse(m_text, pos);

	skip_white_space(m_text, pos);

	if( pos != m_text.size() ){
		throw __FILE__ ":JSON: Unexpected text after JSON value";
	}
}

void JSON::copy(const JSON &m_rhs)
{
	clear();

	value_type = m_rhs.value_type;
	bool_value = m_rhs.bool_value;
	number_value = m_rhs.number_value;
	string_value = m_rhs.string_value;

	if(m_rhs.array_ptr != NULL){
		array_ptr = new Array(*m_rhs.array_ptr);
	}

	if(m_rhs.map_ptr != NULL){
		map_ptr = new Map(*m_rhs.map_ptr);
	}
}

void JSON::parse(const string &m_text, size_t &m_pos)
{
	clear();

	skip_white_space(m_text, m_pos);

	if( m_pos >= m_text.size() ){
		throw __FILE__ ":JSON::parse: Unexpected end of JSON text";
	}

	switch(m_text[m_pos]){
		case '{':
			parse_map(m_text, m_pos);
			break;
		case '[':
			parse_array(m_text, m_pos);
			break;
		case '"':
			string_value = parse_string(m_text, m_pos);
			value_type = JSON_STRING;
			break;
		case 't': case 'f': case 'n':
			parse_literal(m_text, m_pos);
			break;
		case '-': case '0': case '1': case '2': case '3': case '4':
		case '5': case '6': case '7': case '8': case '9':
			parse_number(m_text, m_pos);
			break;
		default:
			throw __FILE__ ":JSON::parse: Unable to infer JSON type";
	};
}

void JSON::parse_literal(const string &m_text, size_t &m_pos)
{
	if(m_text.compare(m_pos, 4, "true") == 0){

		value_type = JSON_BOOL;
		bool_value = true;
		m_pos += 4;
		return;
	}

	if(m_text.compare(m_pos, 5, "false") == 0){

		value_type = JSON_BOOL;
		bool_value = false;
		m_pos += 5;
		return;
	}

	if(m_text.compare(m_pos, 4, "null") == 0){

		value_type = JSON_NONE;
		m_pos += 4;
		return;
	}

	throw __FILE__ ":JSON::parse_literal: Unknown literal";
}

void JSON::parse_number(const string &m_text, size_t &m_pos)
{
	const char *begin = m_text.c_str() + m_pos;
	char *end = NULL;

	number_value = strtod(begin, &end);

	if(end == begin){
		throw __FILE__ ":JSON::parse_number: Invalid number";
	}

	m_pos += (end - begin);
	value_type = JSON_NUMBER;
}

void JSON::parse_array(const string &m_text, size_t &m_pos)
{
	// Skip the '['
	++m_pos;

	value_type = JSON_ARRAY;
	array_ptr = new Array;

	skip_white_space(m_text, m_pos);

	if( (m_pos < m_text.size() ) && (m_text[m_pos] == ']') ){

		++m_pos;
		return;
	}

	while(true){

		array_ptr->push_back( JSON() );
		array_ptr->back().parse(m_text, m_pos);

		skip_white_space(m_text, m_pos);

		if( m_pos >= m_text.size() ){
			throw __FILE__ ":JSON::parse_array: Unterminated array";
		}

		if(m_text[m_pos] == ','){

			++m_pos;
			continue;
		}

		if(m_text[m_pos] == ']'){

			++m_pos;
			return;
		}

		throw __FILE__ ":JSON::parse_array: Expected ',' or ']'";
	}
}

void JSON::parse_map(const string &m_text, size_t &m_pos)
{
	// Skip the '{'
	++m_pos;

	value_type = JSON_MAP;
	map_ptr = new Map;

	skip_white_space(m_text, m_pos);

	if( (m_pos < m_text.size() ) && (m_text[m_pos] == '}') ){

		++m_pos;
		return;
	}

	while(true){

		skip_white_space(m_text, m_pos);

		if( (m_pos >= m_text.size() ) || (m_text[m_pos] != '"') ){
			throw __FILE__ ":JSON::parse_map: Expected a quoted key";
		}

		const string key = parse_string(m_text, m_pos);

		if( map_ptr->find(key) != map_ptr->end() ){
			throw __FILE__ ":JSON::parse_map: Duplicate key";
		}

		skip_white_space(m_text, m_pos);

		if( (m_pos >= m_text.size() ) || (m_text[m_pos] != ':') ){
			throw __FILE__ ":JSON::parse_map: Expected ':'";
		}

		++m_pos;

		(*map_ptr)[key].parse(m_text, m_pos);

		skip_white_space(m_text, m_pos);

		if( m_pos >= m_text.size() ){
			throw __FILE__ ":JSON::parse_map: Unterminated map";
		}

		if(m_text[m_pos] == ','){

			++m_pos;
			continue;
		}

		if(m_text[m_pos] == '}'){

			++m_pos;
			return;
		}

		throw __FILE__ ":JSON::parse_map: Expected ',' or '}'";
	}
}

size_t JSON::size() const
{
	if(value_type == JSON_MAP){
		return map_ptr->size();
	}

	if(value_type == JSON_ARRAY){
		return array_ptr->size();
	}

	throw __FILE__ ":JSON::size: Illegal call to non-map/non-array object";
	return 0;
}

bool JSON::get_bool() const
{
	if(value_type != JSON_BOOL){
		throw __FILE__ ":JSON::get_bool: Non-bool value";
	}

	return bool_value;
}

double JSON::get_number() const
{
	if(value_type != JSON_NUMBER){
		throw __FILE__ ":JSON::get_number: Non-number value";
	}

	return number_value;
}

int JSON::get_int() const
{
	const double ret = get_number();

	if( !( (ret >= double(INT_MIN)) && (ret <= double(INT_MAX)) ) ){
		throw __FILE__ ":JSON::get_int: Integer value out of range";
	}

	if( ret != double( int(ret) ) ){
		throw __FILE__ ":JSON::get_int: Non-integer value";
	}

	return int(ret);
}

string JSON::get_string() const
{
	if(value_type != JSON_STRING){
		throw __FILE__ ":JSON::get_string: Non-string value";
	}

	return string_value;
}

bool JSON::has_key(const string &m_key) const
{
	if(value_type != JSON_MAP){
		throw __FILE__ ":JSON::has_key: Attempted to dereference non-map object";
	}

	return ( map_ptr->find(m_key) != map_ptr->end() );
}

vector<string> JSON::keys() const
{
	if(value_type != JSON_MAP){
		throw __FILE__ ":JSON::keys: Illegal call to non-map object";
	}

	vector<string> ret;

	ret.reserve( map_ptr->size() );

	// std::map keys are already sorted
	for(Map::const_iterator i = map_ptr->begin();i != map_ptr->end();++i){
		ret.push_back(i->first);
	}

	return ret;
}

const JSON& JSON::operator[](const string &m_key) const
{
	if(value_type != JSON_MAP){
		throw __FILE__ ":JSON[map]: Attempted to dereference non-map object";
	}

	Map::const_iterator iter = map_ptr->find(m_key);

	if( iter == map_ptr->end() ){
		throw __FILE__ ":JSON[map]: Did not find requested key in map";
	}

	return iter->second;
}

const JSON& JSON::operator[](const size_t &m_index) const
{
	if(value_type != JSON_ARRAY){
		throw __FILE__ ":JSON[array]: Attempted to dereference non-array object";
	}

	if( m_index >= array_ptr->size() ){
		throw __FILE__ ":JSON[array]: Index out of bounds";
	}

	return (*array_ptr)[m_index];
}

void skip_white_space(const string &m_text, size_t &m_pos)
{
	while( ( m_pos < m_text.size() ) && isspace(m_text[m_pos]) ){
		++m_pos;
	}
}

// Parse a double-quoted string starting at m_pos. On return, m_pos points
// just past the closing quote.
string parse_string(const string &m_text, size_t &m_pos)
{
	string ret;

	// Skip the opening quote
	++m_pos;

	while( m_pos < m_text.size() ){

		const char c = m_text[m_pos];

		++m_pos;

		if(c == '"'){
			return ret;
		}

		if(c != '\\'){

			ret.push_back(c);
			continue;
		}

		if( m_pos >= m_text.size() ){
			break;
		}

		const char esc = m_text[m_pos];

		++m_pos;

		switch(esc){
			case '"': case '\\': case '/':
				ret.push_back(esc);
				break;
			case 'b':
				ret.push_back('\b');
				break;
			case 'f':
				ret.push_back('\f');
				break;
			case 'n':
				ret.push_back('\n');
				break;
			case 'r':
				ret.push_back('\r');
				break;
			case 't':
				ret.push_back('\t');
				break;
			case 'u':
				{
					if(m_pos + 4 > m_text.size() ){
						throw __FILE__ ":parse_string: Truncated unicode escape";
					}

					const string hex = m_text.substr(m_pos, 4);
					char *end = NULL;

					const unsigned int code_point = strtoul(hex.c_str(), &end, 16);

					if(*end != '\0'){
						throw __FILE__ ":parse_string: Invalid unicode escape";
					}

					append_utf8(ret, code_point);
					m_pos += 4;
				}
				break;
			default:
				throw __FILE__ ":parse_string: Invalid escape sequence";
		};
	}

	throw __FILE__ ":parse_string: Unterminated string";
	return ret;
}

void append_utf8(string &m_str, unsigned int m_code_point)
{
	if(m_code_point < 0x80){
		m_str.push_back( char(m_code_point) );
	}
	else if(m_code_point < 0x800){

		m_str.push_back( char(0xC0 | (m_code_point >> 6) ) );
		m_str.push_back( char(0x80 | (m_code_point & 0x3F) ) );
	}
	else{
		m_str.push_back( char(0xE0 | (m_code_point >> 12) ) );
		m_str.push_back( char(0x80 | ( (m_code_point >> 6) & 0x3F) ) );
		m_str.push_back( char(0x80 | (m_code_point & 0x3F) ) );
	}
}

string json::escape(const string &m_str)
{
	string ret;

	ret.reserve( m_str.size() );

	for(string::const_iterator i = m_str.begin();i != m_str.end();++i){

		switch(*i){
			case '"':
				ret += "\\\"";
				break;
			case '\\':
				ret += "\\\\";
				break;
			case '\n':
				ret += "\\n";
				break;
			case '\r':
				ret += "\\r";
				break;
			case '\t':
				ret += "\\t";
				break;
			default:

				if( (unsigned char)(*i) < 0x20 ){

					char buffer[8];

					snprintf( buffer, sizeof(buffer), "\\u%04x", (unsigned int)( (unsigned char)(*i) ) );
					ret += buffer;
				}
				else{
					ret.push_back(*i);
				}

				break;
		};
	}

	return ret;
}
