#ifndef MARK_WEAVE_ELEMENTS_H
#define MARK_WEAVE_ELEMENTS_H

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "mark_weave/IntegralTypes.h"
#include "markweave_export.h"

namespace mark_weave {

	struct ParsedDirective;

	struct InvalidInfo {
		std::string message;
		std::string source;
	};

	struct StyleInfo {
		std::vector<std::string> styles;
	};

	struct FragmentInfo {
		std::string name;
	};

	// A separator directive inside a parent body, grouped with its content after parsing.
	struct SeparatorInfo {
		std::shared_ptr<const ParsedDirective> directive;
	};

	struct Element {
		enum class type_e : UTinyInt {
			Text,
			TemplateString,
			SpanSequence,
			Paragraph,
			BlockSequence,
			InvalidSpan,
			InvalidBlock,
			TemplateElement,
			TemplateSpanSequence,
			TemplateRoot,
			RootElement,
			SeparatorMarker,
			PageBreak,
			Fragment
		};

		inline bool isPlainText() const noexcept {
			return flavor == type_e::Text and not std::holds_alternative<StyleInfo>(crtrstc);
		}
		inline bool isInvalid() const noexcept {
			return flavor == type_e::InvalidSpan or flavor == type_e::InvalidBlock;
		}
		inline bool isBlock() const noexcept {
			return flavor == type_e::Paragraph or
				flavor == type_e::BlockSequence or
				flavor == type_e::InvalidBlock or
				flavor == type_e::PageBreak or
				flavor == type_e::Fragment or
				flavor == type_e::RootElement;
		}

		type_e flavor;
		std::string content;
		std::vector<Element> children;

		std::variant<std::monostate, InvalidInfo, StyleInfo, FragmentInfo, SeparatorInfo> crtrstc;

		MARKWEAVE_EXPORT bool operator==(const Element& rhs) const;
		bool operator!=(const Element& rhs) const { return !operator==(rhs); }

		/**
		Depth-first walk over a tree. Every node with children is visited twice, once on the
		way down and once on the way back up (retracting() is true); leaves are visited once.
		*/
		class const_walker {
		public:
			using value_type = Element;
			using pointer_type = const Element*;
			using reference = const Element&;

			const_walker() noexcept : current_{ nullptr }, retracting_{ false } {}
			explicit const_walker(pointer_type root) noexcept : current_{ root }, retracting_{ false } {}

			reference operator*() const noexcept { return *current_; }
			pointer_type operator->() const noexcept { return current_; }

			MARKWEAVE_EXPORT const_walker& operator++();
			MARKWEAVE_EXPORT const_walker operator++(int);

			bool retracting() const noexcept { return retracting_; }
			// Number of ancestors of the current node.
			UInt depth() const noexcept { return static_cast<UInt>(parents_.size()); }

			bool operator==(const const_walker& rhs) const noexcept { return current_ == rhs.current_ and retracting_ == rhs.retracting_ and parents_.size() == rhs.parents_.size(); }
			bool operator!=(const const_walker& rhs) const noexcept { return !operator==(rhs); }

		private:
			struct Frame {
				pointer_type node;
				std::size_t childIndex;
			};

			pointer_type current_;
			bool retracting_;
			std::vector<Frame> parents_;
		};

		const_walker walkBegin() const noexcept { return const_walker{ this }; }
		const_walker walkEnd() const noexcept { return const_walker{}; }
	};

	namespace elements {
		MARKWEAVE_EXPORT Element text(std::string content);
		MARKWEAVE_EXPORT Element templateString(std::string content);
		MARKWEAVE_EXPORT Element spanSequence(std::vector<Element> spans, std::vector<std::string> styles = {});
		MARKWEAVE_EXPORT Element paragraph(std::vector<Element> spans, std::vector<std::string> styles = {});
		MARKWEAVE_EXPORT Element blockSequence(std::vector<Element> blocks, std::vector<std::string> styles = {});
		MARKWEAVE_EXPORT Element invalidSpan(std::string message, std::string source);
		MARKWEAVE_EXPORT Element invalidBlock(std::string message, std::string source);
		MARKWEAVE_EXPORT Element templateElement(Element wrapped);
		MARKWEAVE_EXPORT Element templateSpanSequence(std::vector<Element> spans);
		MARKWEAVE_EXPORT Element templateRoot(std::vector<Element> spans);
		MARKWEAVE_EXPORT Element rootElement(std::vector<Element> blocks);
		MARKWEAVE_EXPORT Element separatorMarker(std::shared_ptr<const ParsedDirective> directive);
		MARKWEAVE_EXPORT Element pageBreak();
		MARKWEAVE_EXPORT Element fragment(std::string name, Element content);

		MARKWEAVE_EXPORT const char* typeName(Element::type_e flavor) noexcept;
	}
}

#endif
