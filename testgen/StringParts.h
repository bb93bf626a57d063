#ifndef STRING_PARTS_H
#define STRING_PARTS_H
#include <string_view>
using tgstr = const char*;
using tgsv = std::string_view;

tgstr includes =
"// generated by mwtestgen, do not edit\n"
"#include \"mark_weave/MarkWeave.h\"\n#include <gtest/gtest.h>\n\n";

tgstr anonNamespaceBegin = "namespace {\n";
tgstr anonNamespaceEnd = "}\n";

tgstr parseFunctions[] = { "mark_weave::parseMarkup", "mark_weave::parseTemplate" };

#endif
