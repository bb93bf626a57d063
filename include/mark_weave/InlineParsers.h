#ifndef MARK_WEAVE_INLINE_PARSERS_H
#define MARK_WEAVE_INLINE_PARSERS_H

#include <memory>
#include <string>
#include <vector>
#include "mark_weave/DelimitedText.h"
#include "mark_weave/Elements.h"
#include "mark_weave/PrefixedParser.h"

namespace mark_weave {
	namespace inline_parsers {

		// Collects spans, merging adjacent plain text into a single Text node.
		class SpanAccumulator {
		public:
			using element_type = Element;
			using result_type = std::vector<Element>;

			void addText(std::string_view text) { pending_.append(text); }

			void add(Element el) {
				if (el.isPlainText()) {
					pending_ += el.content;
					return;
				}
				flush();
				done_.push_back(std::move(el));
			}

			result_type finish() {
				flush();
				return std::move(done_);
			}

		private:
			void flush() {
				if (not pending_.empty()) {
					done_.push_back(elements::text(std::move(pending_)));
					pending_.clear();
				}
			}

			std::vector<Element> done_;
			std::string pending_;
		};

		class TextAccumulator {
		public:
			using element_type = std::string;
			using result_type = std::string;

			void addText(std::string_view text) { text_.append(text); }
			void add(const std::string& text) { text_ += text; }
			result_type finish() { return std::move(text_); }

		private:
			std::string text_;
		};

		/**
		The engine behind spans() and text(): alternates between scanning plain text and running
		the nested parser registered for the start character that stopped the scan.

		A nested parser that fails, or succeeds without consuming input, leaves its start
		character as literal text and scanning resumes one character later. The only failure
		is a failure of the scanner itself.
		*/
		template<typename Accumulator>
		Parser<typename Accumulator::result_type> inlineParser(const DelimitedText& base,
			const PrefixedDispatch<typename Accumulator::element_type>& dispatch) {
			using R = typename Accumulator::result_type;

			auto scanner = std::make_shared<const DelimitedText>(base.withNestedStart(CharClassifier::of(dispatch.startChars())));

			return Parser<R>([scanner, dispatch](const SourcePosition& in) -> Parsed<R> {
				Accumulator acc;
				SourcePosition curr = in;
				while (true) {
					auto chunk = scanner->scanNext(curr);
					if (!chunk) {
						return Failure{ chunk.failure().message, in, chunk.failure().maxOffset };
					}
					acc.addText(chunk.result().text);
					if (chunk.result().stop != StopReason::NestedStart) {
						return Success<R>{ acc.finish(), chunk.next() };
					}

					const auto& at = chunk.next();
					const char startChar = chunk.result().startChar;
					auto res = dispatch.parse(at);
					if (res and res.next().offset() > at.offset()) {
						acc.add(std::move(res.result()));
						curr = res.next();
					}
					else {
						acc.addText(std::string_view{ &startChar, 1 });
						curr = at.consume(1);
					}
				}
			});
		}

		template<typename Accumulator>
		Parser<typename Accumulator::result_type> inlineParser(const DelimitedText& base,
			const std::vector<PrefixedParser<typename Accumulator::element_type>>& nested) {
			return inlineParser<Accumulator>(base, PrefixedDispatch<typename Accumulator::element_type>{ nested });
		}

		inline Parser<std::vector<Element>> spans(const DelimitedText& text, const std::vector<PrefixedParser<Element>>& nested) {
			return inlineParser<SpanAccumulator>(text, nested);
		}

		// Same as above with a dispatch built once and shared between many span parsers.
		inline Parser<std::vector<Element>> spans(const DelimitedText& text, const PrefixedDispatch<Element>& nested) {
			return inlineParser<SpanAccumulator>(text, nested);
		}

		// Like spans() but producing plain text, used for escapes inside quoted or raw text.
		inline Parser<std::string> text(const DelimitedText& text, const std::vector<PrefixedParser<std::string>>& nested) {
			return inlineParser<TextAccumulator>(text, nested);
		}
	}
}

#endif
