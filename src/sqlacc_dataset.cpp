#include "sqlacc_dataset.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"

#include "sqlacc_debug.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sqlacc {

using duckdb::InvalidInputException;

// ============================================================================
// Minimal JSON scanning (arrays of flat objects)
// ============================================================================

static void SkipWhitespace(const string &json, idx_t &pos) {
	while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) {
		pos++;
	}
}

static void AppendUTF8(string &out, uint32_t cp) {
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

static uint32_t ParseHex4(const string &json, idx_t pos) {
	if (pos + 4 > json.size()) {
		throw InvalidInputException("Truncated \\u escape in dataset JSON");
	}
	uint32_t cp = 0;
	for (idx_t i = pos; i < pos + 4; i++) {
		char c = json[i];
		cp <<= 4;
		if (c >= '0' && c <= '9') {
			cp |= static_cast<uint32_t>(c - '0');
		} else if (c >= 'a' && c <= 'f') {
			cp |= static_cast<uint32_t>(c - 'a' + 10);
		} else if (c >= 'A' && c <= 'F') {
			cp |= static_cast<uint32_t>(c - 'A' + 10);
		} else {
			throw InvalidInputException("Invalid \\u escape in dataset JSON");
		}
	}
	return cp;
}

// Parse a JSON string starting at the opening quote; leaves pos after the closing quote.
static string ParseString(const string &json, idx_t &pos) {
	if (pos >= json.size() || json[pos] != '"') {
		throw InvalidInputException("Expected '\"' at offset " + std::to_string(pos) + " in dataset JSON");
	}
	pos++;
	string value;
	while (pos < json.size()) {
		char c = json[pos];
		if (c == '"') {
			pos++;
			return value;
		}
		if (c != '\\') {
			value += c;
			pos++;
			continue;
		}
		pos++;
		if (pos >= json.size()) {
			break;
		}
		char esc = json[pos++];
		switch (esc) {
		case '"':
		case '\\':
		case '/':
			value += esc;
			break;
		case 'b':
			value += '\b';
			break;
		case 'f':
			value += '\f';
			break;
		case 'n':
			value += '\n';
			break;
		case 'r':
			value += '\r';
			break;
		case 't':
			value += '\t';
			break;
		case 'u': {
			uint32_t cp = ParseHex4(json, pos);
			pos += 4;
			// surrogate pair
			if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 <= json.size() && json[pos] == '\\' && json[pos + 1] == 'u') {
				uint32_t low = ParseHex4(json, pos + 2);
				if (low >= 0xDC00 && low <= 0xDFFF) {
					cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
					pos += 6;
				}
			}
			AppendUTF8(value, cp);
			break;
		}
		default:
			throw InvalidInputException(string("Invalid escape '\\") + esc + "' in dataset JSON");
		}
	}
	throw InvalidInputException("Unterminated string in dataset JSON");
}

// Skip over any JSON value (string, number, literal, nested object/array)
static void SkipValue(const string &json, idx_t &pos) {
	SkipWhitespace(json, pos);
	if (pos >= json.size()) {
		throw InvalidInputException("Unexpected end of dataset JSON");
	}
	char c = json[pos];
	if (c == '"') {
		ParseString(json, pos);
		return;
	}
	if (c == '{' || c == '[') {
		int depth = 0;
		while (pos < json.size()) {
			char cur = json[pos];
			if (cur == '"') {
				ParseString(json, pos);
				continue;
			}
			if (cur == '{' || cur == '[') {
				depth++;
			} else if (cur == '}' || cur == ']') {
				depth--;
				if (depth == 0) {
					pos++;
					return;
				}
			}
			pos++;
		}
		throw InvalidInputException("Unbalanced brackets in dataset JSON");
	}
	// number or literal: runs until a delimiter
	idx_t start = pos;
	while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
	       !std::isspace(static_cast<unsigned char>(json[pos]))) {
		pos++;
	}
	if (pos == start) {
		throw InvalidInputException("Expected a value at offset " + std::to_string(start) + " in dataset JSON");
	}
}

static string ScanScalar(const string &json, idx_t &pos) {
	SkipWhitespace(json, pos);
	idx_t start = pos;
	SkipValue(json, pos);
	return json.substr(start, pos - start);
}

// Parse one object starting at '{'; leaves pos after the closing '}'.
static QueryDescriptor ParseDescriptor(const string &json, idx_t &pos, idx_t index) {
	QueryDescriptor descriptor;
	bool has_sql = false;
	pos++; // '{'
	SkipWhitespace(json, pos);
	if (pos < json.size() && json[pos] == '}') {
		pos++;
	} else {
		while (true) {
			SkipWhitespace(json, pos);
			string key = ParseString(json, pos);
			SkipWhitespace(json, pos);
			if (pos >= json.size() || json[pos] != ':') {
				throw InvalidInputException("Expected ':' after key \"" + key + "\" in dataset JSON");
			}
			pos++;
			SkipWhitespace(json, pos);

			bool is_string = pos < json.size() && json[pos] == '"';
			if (key == "SQL") {
				if (!is_string) {
					throw InvalidInputException("Field \"SQL\" of entry " + std::to_string(index) +
					                            " is not a string");
				}
				descriptor.sql = ParseString(json, pos);
				has_sql = true;
			} else if (key == "db_id" && is_string) {
				descriptor.db_id = ParseString(json, pos);
			} else if (key == "difficulty" && is_string) {
				descriptor.difficulty = ParseString(json, pos);
			} else if (key == "question_id" && !is_string) {
				string number = ScanScalar(json, pos);
				char *end = nullptr;
				long long id = std::strtoll(number.c_str(), &end, 10);
				if (end != number.c_str() && *end == '\0') {
					descriptor.question_id = static_cast<int64_t>(id);
					descriptor.has_question_id = true;
				}
			} else {
				SkipValue(json, pos);
			}

			SkipWhitespace(json, pos);
			if (pos >= json.size()) {
				throw InvalidInputException("Unterminated object in dataset JSON");
			}
			if (json[pos] == ',') {
				pos++;
				continue;
			}
			if (json[pos] == '}') {
				pos++;
				break;
			}
			throw InvalidInputException("Expected ',' or '}' at offset " + std::to_string(pos) +
			                            " in dataset JSON");
		}
	}
	if (!has_sql) {
		throw InvalidInputException("Entry " + std::to_string(index) + " of dataset has no \"SQL\" field");
	}
	return descriptor;
}

vector<QueryDescriptor> DatasetLoader::Parse(const string &json) {
	vector<QueryDescriptor> descriptors;
	idx_t pos = 0;
	SkipWhitespace(json, pos);
	if (pos >= json.size() || json[pos] != '[') {
		throw InvalidInputException("Dataset JSON must be an array of objects");
	}
	pos++;
	SkipWhitespace(json, pos);
	if (pos < json.size() && json[pos] == ']') {
		return descriptors;
	}
	while (true) {
		SkipWhitespace(json, pos);
		if (pos >= json.size() || json[pos] != '{') {
			throw InvalidInputException("Dataset entry " + std::to_string(descriptors.size()) +
			                            " is not a JSON object");
		}
		descriptors.push_back(ParseDescriptor(json, pos, descriptors.size()));
		SkipWhitespace(json, pos);
		if (pos >= json.size()) {
			throw InvalidInputException("Unterminated array in dataset JSON");
		}
		if (json[pos] == ',') {
			pos++;
			continue;
		}
		if (json[pos] == ']') {
			break;
		}
		throw InvalidInputException("Expected ',' or ']' at offset " + std::to_string(pos) + " in dataset JSON");
	}
	SQLACC_DEBUG_PRINT("Parsed " + std::to_string(descriptors.size()) + " dataset entries");
	return descriptors;
}

vector<QueryDescriptor> DatasetLoader::LoadFromFile(const string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw duckdb::IOException("Could not open dataset file: " + path);
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	try {
		return Parse(buffer.str());
	} catch (InvalidInputException &ex) {
		duckdb::ErrorData error(ex);
		throw InvalidInputException(path + ": " + error.Message());
	}
}

} // namespace sqlacc
