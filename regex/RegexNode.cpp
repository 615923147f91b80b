#include "RegexNode.h"
#include <QStringList>

namespace {

//------------------------------------------------------------------------------
// Name: describe_char
//------------------------------------------------------------------------------
QString describe_char(code_point c) {
	if (c >= 0x20 && c < 0x7f) {
		return QString(QChar::fromLatin1(static_cast<char>(c)));
	}

	if (c <= UCHAR_MAX) {
		return QString::fromLatin1("\\x%1").arg(c, 2, 16, QLatin1Char('0'));
	}

	return QString::fromLatin1("\\x{%1}").arg(c, 4, 16, QLatin1Char('0'));
}

//------------------------------------------------------------------------------
// Name: describe_set
// Desc: prints a class operand with runs of three or more characters
//       collapsed into ranges, e.g. "0-9_"
//------------------------------------------------------------------------------
QString describe_set(const char_set &set) {
	QString result;

	const byte_set &low = set.low();

	code_point c = 0;
	while (c <= UCHAR_MAX) {
		if (!low[c]) {
			++c;
			continue;
		}

		code_point last = c;
		while (last < UCHAR_MAX && low[last + 1]) {
			++last;
		}

		if (last - c >= 2) {
			result += describe_char(c) + QLatin1Char('-') + describe_char(last);
		} else {
			for (code_point i = c; i <= last; ++i) {
				result += describe_char(i);
			}
		}

		c = last + 1;
	}

	for (const char_set::range &r : set.ranges()) {
		result += describe_char(r.first);
		if (r.second != r.first) {
			result += QLatin1Char('-') + describe_char(r.second);
		}
	}

	return result;
}

}

//------------------------------------------------------------------------------
// Name: RegexNode
//------------------------------------------------------------------------------
RegexNode::RegexNode(RegexNodeType node_type) : type(node_type), ch('\0'), caseInsensitive(false), index(0), min(REG_ONE), max(REG_ONE), lazy(false) {
}

//------------------------------------------------------------------------------
// Name: matchesChar
// Desc: single character test for the SIMPLE node types. The caller is
//       responsible for the end of string check.
//------------------------------------------------------------------------------
bool RegexNode::matchesChar(code_point c) const {
	switch (type) {
	case LITERAL:
		return (caseInsensitive ? fold_case(c) : c) == ch;
	case ANY:
		return c != '\n';
	case ANY_OF:
		return inClass(c);
	case ANY_BUT:
		return !inClass(c);
	default:
		return false;
	}
}

// Letters outside ASCII are only folded here, the compiler adds both cases
// of the ASCII ones to 'set'.
bool RegexNode::inClass(code_point c) const {
	if (set.contains(c)) {
		return true;
	}

	return caseInsensitive && c > 0x7F && (set.contains(fold_case(c)) || set.contains(upper_case(c)));
}

//------------------------------------------------------------------------------
// Name: toString
// Desc: s-expression like dump of the tree, used by --debug and the tests
//------------------------------------------------------------------------------
QString RegexNode::toString() const {

	QStringList parts;

	switch (type) {
	case BOL:
		return QLatin1String("^");
	case EOL:
		return QLatin1String("$");
	case LITERAL:
		return QLatin1Char('\'') + describe_char(ch) + QLatin1Char('\'') + (caseInsensitive ? QString::fromLatin1("/i") : QString());
	case ANY:
		return QLatin1String("any");
	case ANY_OF:
		return QLatin1Char('[') + describe_set(set) + QLatin1Char(']');
	case ANY_BUT:
		return QLatin1String("[^") + describe_set(set) + QLatin1Char(']');
	case BACK_REF:
		return QString::fromLatin1("\\%1").arg(index) + (caseInsensitive ? QString::fromLatin1("/i") : QString());
	case CONCAT:
		for (const std::unique_ptr<RegexNode> &node : children) {
			parts << node->toString();
		}
		return QLatin1String("cat(") + parts.join(QLatin1Char(' ')) + QLatin1Char(')');
	case ALTERNATION:
		for (const std::unique_ptr<RegexNode> &node : children) {
			parts << node->toString();
		}
		return QLatin1String("alt(") + parts.join(QLatin1String(" | ")) + QLatin1Char(')');
	case GROUP:
		if (index == 0) {
			return QLatin1String("group(") + child(0)->toString() + QLatin1Char(')');
		}
		return QString::fromLatin1("group%1(").arg(index) + child(0)->toString() + QLatin1Char(')');
	case QUANTIFIED: {
		QString bounds = (max == REG_INFINITY) ? QString::fromLatin1("{%1,}").arg(min) : QString::fromLatin1("{%1,%2}").arg(min).arg(max);
		if (lazy) {
			bounds += QLatin1Char('?');
		}
		return QLatin1String("rep") + bounds + QLatin1Char('(') + child(0)->toString() + QLatin1Char(')');
	}
	}

	return QLatin1String("?");
}
