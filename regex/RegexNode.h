
#ifndef REGEX_NODE_H_
#define REGEX_NODE_H_

#include "RegexCommon.h"
#include <QString>
#include <memory>
#include <vector>

enum RegexNodeType : uint8_t {
	/* STRUCTURE FOR A COMPILED REGULAR EXPRESSION.
	 *
	 * The compiled form is a syntax tree.  The root is always a CONCAT node.
	 * Leaf nodes either consume exactly one character (LITERAL, ANY, ANY_OF,
	 * ANY_BUT), consume the text of an earlier capture (BACK_REF) or consume
	 * nothing (BOL, EOL).  Interior nodes own their children in 'children':
	 *
	 *   CONCAT       children matched one after the other
	 *   ALTERNATION  each child is one branch (always a CONCAT), tried in order
	 *   GROUP        exactly one child, the body; 'index' is the capture
	 *                number or 0 for grouping only
	 *   QUANTIFIED   exactly one child, repeated 'min' to 'max' times
	 *
	 * The node types are:
	 */

	// Zero width positional assertions.
	BOL = 1, // Match position at beginning of line.
	EOL = 2, // Match position at end of line.

	// Single character nodes.
	LITERAL = 3, // Match this character ('ch').
	ANY     = 4, // Match any one character except newline (implements '.')
	ANY_OF  = 5, // Match any character in 'set'.
	ANY_BUT = 6, // Match any character not in 'set'.

	BACK_REF = 7, // Match latest text captured by group 'index'

	// Structural nodes.
	CONCAT      = 8,
	ALTERNATION = 9,
	GROUP       = 10,
	QUANTIFIED  = 11
};

struct RegexNode {
public:
	explicit RegexNode(RegexNodeType node_type);

private:
	RegexNode(const RegexNode &) = delete;
	RegexNode &operator=(const RegexNode &) = delete;

public:
	// True for the node types that always consume exactly one character.
	bool isSimple() const {
		return type == LITERAL || type == ANY || type == ANY_OF || type == ANY_BUT;
	}

	bool matchesChar(code_point c) const;
	bool inClass(code_point c) const;

	const RegexNode *child(size_t n) const {
		return children[n].get();
	}

	QString toString() const;

public:
	RegexNodeType type;
	code_point    ch;              // LITERAL (already folded if caseInsensitive)
	bool          caseInsensitive; // LITERAL, BACK_REF, ANY_OF, ANY_BUT
	char_set      set;             // ANY_OF, ANY_BUT
	size_t        index;           // GROUP, BACK_REF
	unsigned long min;             // QUANTIFIED
	unsigned long max;             // QUANTIFIED, REG_INFINITY if unbounded
	bool          lazy;            // QUANTIFIED

	std::vector<std::unique_ptr<RegexNode>> children;
};

#endif
