/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include "mark_weave/MarkWeave.h"

namespace mwdump {
	enum class in_type : uint8_t {
		File, StdCIn
	};
	enum class out_format : uint8_t {
		Debug, Json
	};
	struct CmdArgInfo {
		in_type inSource;
		out_format format;
		bool asTemplate;
		bool verbose;
		bool noDirectives;
		std::string outFilename;
		std::string settingsFilename;
		std::vector<std::string> inFilenames;
	};
}

void configureParser(CLI::App& cmdArgParser, mwdump::CmdArgInfo& argInfo);
auto readAll(std::istream& in) -> std::string;
auto loadSettings(const std::string& filename) -> std::optional<mark_weave::ParserSettings>;
void dumpTree(const mark_weave::Element& root, mwdump::out_format format, std::ostream& out);

int main(int argc, char* argv[])
{
	mwdump::CmdArgInfo cmdArgResult{};

	CLI::App argProcessor{ "Parses markup or templates and prints the resulting document tree.", "mwdump" };

	configureParser(argProcessor, cmdArgResult);

	CLI11_PARSE(argProcessor, argc, argv);

	static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender{ plog::streamStdErr };
	plog::init(cmdArgResult.verbose ? plog::debug : plog::warning, &consoleAppender);

	cmdArgResult.inSource = cmdArgResult.inFilenames.empty() ? mwdump::in_type::StdCIn : mwdump::in_type::File;

	mark_weave::ParserSettings settings{};
	if (not cmdArgResult.settingsFilename.empty()) {
		auto loaded = loadSettings(cmdArgResult.settingsFilename);
		if (not loaded) {
			return 1;
		}
		settings = std::move(*loaded);
	}

	std::vector<mark_weave::ExtensionBundle> bundles;
	if (not cmdArgResult.noDirectives) {
		bundles.push_back(mark_weave::standardDirectives());
	}

	std::optional<std::ofstream> outFile;
	std::ostream* outStream = &std::cout;
	if (not cmdArgResult.outFilename.empty()) {
		outFile.emplace(cmdArgResult.outFilename);
		if (not *outFile) {
			std::cerr << "cannot open output file " << cmdArgResult.outFilename << "\n";
			return 1;
		}
		outStream = &*outFile;
	}

	auto process = [&](const std::string& input) {
		auto root = cmdArgResult.asTemplate ? mark_weave::parseTemplate(input, bundles, settings) : mark_weave::parseMarkup(input, bundles, settings);
		dumpTree(root, cmdArgResult.format, *outStream);
	};

	if (cmdArgResult.inSource == mwdump::in_type::StdCIn) {
		process(readAll(std::cin));
		return 0;
	}

	int failTally = 0;
	const bool singleFile = cmdArgResult.inFilenames.size() == 1;
	for (const auto& inFilename : cmdArgResult.inFilenames) {
		std::ifstream streamie{ inFilename, std::ios::binary };
		if (!streamie) {
			std::cerr << "file not found; skipping " << inFilename << "\n";
			++failTally;
			continue;
		}
		if (not singleFile) {
			*outStream << inFilename << ":\n";
		}
		process(readAll(streamie));
	}
	return failTally == 0 ? 0 : 1;
}

void configureParser(CLI::App& cmdArgParser, mwdump::CmdArgInfo& argInfo) {
	cmdArgParser.add_option("files", argInfo.inFilenames, "Markup or template files; standard input when omitted");
	cmdArgParser.add_option("-o, --output", argInfo.outFilename, "Write the tree to this file");
	cmdArgParser.add_option("-s, --settings", argInfo.settingsFilename, "JSON file with parser settings, configuration and document path")
		->check(CLI::ExistingFile);
	cmdArgParser.add_flag("-t, --template", argInfo.asTemplate, "Parse the input as a template");
	cmdArgParser.add_flag_function("-j, --json", [&argInfo](std::int64_t) { argInfo.format = mwdump::out_format::Json; }, "Print the tree as JSON");
	cmdArgParser.add_flag("--no-directives", argInfo.noDirectives, "Do not register the standard directives");
	cmdArgParser.add_flag("-v, --verbose", argInfo.verbose, "Log parser diagnostics to standard error");
}

auto readAll(std::istream& in) -> std::string {
	return std::string{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

auto loadSettings(const std::string& filename) -> std::optional<mark_weave::ParserSettings> {
	std::ifstream in{ filename };
	auto doc = nlohmann::json::parse(in, nullptr, false);
	if (doc.is_discarded()) {
		std::cerr << "settings file is not valid JSON: " << filename << "\n";
		return std::nullopt;
	}
	auto settings = mark_weave::ParserSettings::fromJson(doc);
	if (auto* error = std::get_if<std::string>(&settings)) {
		std::cerr << "invalid settings in " << filename << ": " << *error << "\n";
		return std::nullopt;
	}
	return std::get<mark_weave::ParserSettings>(std::move(settings));
}

void dumpTree(const mark_weave::Element& root, mwdump::out_format format, std::ostream& out) {
	if (format == mwdump::out_format::Json) {
		out << mark_weave::toJson(root).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
	}
	else {
		out << mark_weave::toDebugString(root);
	}
}
