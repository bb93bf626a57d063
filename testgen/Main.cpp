#include <iostream>
#include <fstream>
#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <string>
#include "StringParts.h"

std::string outResult(nlohmann::json& jc, int indentLvl);
std::string func(nlohmann::json& jc, int indentLvl);
std::string body_(const std::vector<const nlohmann::json*>& cases, int indentLvl);
std::map<std::string, std::vector<const nlohmann::json*>> organizeJson(const nlohmann::json& root);

template<char OldVal, char NewVal, bool NeedEscape=false>
void escapeBackslashString(std::string& str);
void removeChar(std::string& str, char c);
bool validCase(const nlohmann::json& el);

int main(int argc, char** argv) {
	if (argc != 3) {
		std::cerr << "usage: mwtestgen <cases.json> <output.cpp>\n";
		return 1;
	}
	std::ifstream fileIn{ argv[1] };
	if (!fileIn) {
		std::cerr << "File not found: " << argv[1] << "\n";
		return 1;
	}
	nlohmann::json jcee = nlohmann::json::parse(fileIn, nullptr, false);
	if (jcee.is_discarded() or not jcee.is_array()) {
		std::cerr << "expected a JSON array of test cases in " << argv[1] << "\n";
		return 1;
	}
	for (auto& el : jcee) {
		if (not validCase(el)) {
			std::cerr << "invalid test case: " << el.dump() << "\n";
			return 1;
		}
		for (const char* field : { "input", "expected" }) {
			auto& arg = el[field].get_ref<std::string&>();
			escapeBackslashString<'\\', '\\', true>(arg);
			escapeBackslashString<'\n', 'n', true>(arg);
			escapeBackslashString<'\r', 'r', true>(arg);
			escapeBackslashString<'\t', 't', true>(arg);
			escapeBackslashString<'"', '"', true>(arg);
		}
	}

	std::ofstream fileOut{ argv[2] };
	if (!fileOut) {
		std::cerr << "cannot write " << argv[2] << "\n";
		return 1;
	}
	fileOut << outResult(jcee, 0);
	return 0;
}

std::string outResult(nlohmann::json& jc, int indentLvl) {
	return std::string{ includes } + anonNamespaceBegin + func(jc, indentLvl + 1) + anonNamespaceEnd;
}

std::string func(nlohmann::json& jc, int indentLvl) {
	std::string testName = "DirectiveCases";
	std::string res{};
	for (const auto& [section, cases] : organizeJson(jc)) {
		std::string name = section;
		removeChar(name, ' ');
		removeChar(name, '-');
		res.append(fmt::format("{0: <{3}}TEST({1}, {2}) {{\n{4}{0: <{3}}}}\n\n", "", testName, name, indentLvl * 4, body_(cases, indentLvl + 1)));
	}
	return res;
}

std::string body_(const std::vector<const nlohmann::json*>& cases, int indentLvl) {
	std::string res{};
	for (const auto* el : cases) {
		const auto& c = *el;
		const char* parseFunction = c.value("kind", std::string{ "markup" }) == "template" ? parseFunctions[1] : parseFunctions[0];
		res.append(fmt::format("{0: <{4}}auto tree{3:0>4d} = mark_weave::toDebugString({5}(\"{1}\"));\n"
			"{0: <{4}}EXPECT_EQ(tree{3:0>4d}, \"{2}\");\n\n", "",
			c["input"].get_ref<const std::string&>(), c["expected"].get_ref<const std::string&>(),
			c["example"].get<unsigned int>(), indentLvl * 4, parseFunction));
	}
	return res;
}

// Cases grouped by section, keeping the order of first appearance within each section.
std::map<std::string, std::vector<const nlohmann::json*>> organizeJson(const nlohmann::json& root) {
	std::map<std::string, std::vector<const nlohmann::json*>> res{};
	for (const auto& el : root) {
		res[el["section"].get<std::string>()].push_back(&el);
	}
	return res;
}

bool validCase(const nlohmann::json& el) {
	return el.is_object() and
		el.contains("section") and el["section"].is_string() and
		el.contains("example") and el["example"].is_number_unsigned() and
		el.contains("input") and el["input"].is_string() and
		el.contains("expected") and el["expected"].is_string() and
		(not el.contains("kind") or el["kind"] == "markup" or el["kind"] == "template");
}

template<char OldVal, char NewVal, bool NeedEscape>
void escapeBackslashString(std::string& str) {
	for (size_t i = 0; i < str.size(); ++i) {
		if (i = str.find(OldVal, i); i != std::string::npos) {
			str[i] = NewVal;
			if (NeedEscape) {
				str.insert(str.begin() + i, '\\');
			}
			++i;
		}
		else {
			break;
		}
	}
}

void removeChar(std::string& str, char c) {
	str.erase(std::remove(str.begin(), str.end(), c), str.end());
}
