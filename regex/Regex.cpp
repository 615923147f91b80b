#include "Regex.h"
#include <cctype>
#include <climits>
#include <cstring>
#include <cstdint>
#include <stdexcept>

#define NO_PAREN    0 // Only set by initial call to "chunk".
#define PAREN       1 // Used for normal capturing parentheses.
#define NO_CAPTURE  2 // Non-capturing parentheses (grouping only).
#define INSENSITIVE 3 // Case insensitive parenthetical construct
#define SENSITIVE   4 // Case sensitive parenthetical construct

namespace {

const char Shortcut_Chars[] = "dDwWsS";

bool is_shortcut(char c) {
	return c != '\0' && strchr(Shortcut_Chars, c) != nullptr;
}

size_t saturating_add(size_t a, size_t b) {
	return (a > SIZE_MAX - b) ? SIZE_MAX : a + b;
}

size_t saturating_mul(size_t a, unsigned long b) {
	if (a == 0 || b == 0) {
		return 0;
	}

	return (a > SIZE_MAX / b) ? SIZE_MAX : a * b;
}

}

/*----------------------------------------------------------------------*
 * CompileRE
 *
 * Compiles a regular expression into the syntax tree used by
 * 'ExecRE'.
 *
 * The default behaviour wrt. case sensitivity can be controlled
 * through the defaultFlags argument (Markus Schwarzenberg).
 *
 * Beware that the optimization code at the end knows about the shape
 * of the tree: the root is always a CONCAT node.
 *----------------------------------------------------------------------*/
Regex::Regex(const char *exp, int defaultFlags) : match_start_('\0'), anchor_(false), min_width_(0), Total_Paren(0), Reg_Start(nullptr), Reg_Parse(nullptr), Reg_End(nullptr), Paren_Depth(0), Is_Case_Insensitive(false) {

	if (!exp) {
		throw std::invalid_argument("NULL argument, 'CompileRE'");
	}

	regex_ = QString::fromUtf8(exp);

	/*  Schwarzenberg:
	 * If defaultFlags = 0 use standard defaults:
	 *   Is_Case_Insensitive: Case sensitive is the default
	 */
	Is_Case_Insensitive = ((defaultFlags & REDFLT_CASE_INSENSITIVE) ? true : false);

	Reg_Start   = exp;
	Reg_Parse   = exp;
	Reg_End     = exp + strlen(exp);
	Total_Paren = 1;
	Paren_Depth = 0;

	std::unique_ptr<RegexNode> body = chunk(NO_PAREN, exp, &min_width_);

	if (body->type == CONCAT) {
		root_ = std::move(body);
	} else {
		root_.reset(new RegexNode(CONCAT));
		root_->children.push_back(std::move(body));
	}

	// The parse pointers refer to the caller's buffer.
	Reg_Start = nullptr;
	Reg_Parse = nullptr;
	Reg_End   = nullptr;

	/*----------------------------------------*
	 * Dig out information for optimizations. *
	 *----------------------------------------*/

	if (root_->children.empty()) {
		return;
	}

	const RegexNode *first = root_->child(0);

	if (first->type == BOL) {
		anchor_ = true;
	} else {
		// Allow x+ or x{2,} at the start of the regex to be optimized.
		if (first->type == QUANTIFIED && first->min > REG_ZERO) {
			first = first->child(0);
		}

		if (first->type == LITERAL && !first->caseInsensitive && first->ch <= 0x7F) {
			match_start_ = static_cast<char>(first->ch);
		}
	}
}

/*----------------------------------------------------------------------*
 * chunk                                                                *
 *                                                                      *
 * Process main body of regex or process a parenthesized "thing".       *
 *                                                                      *
 * Caller must absorb opening parenthesis. 'open_paren' points at it    *
 * (or at the start of the regex) and is used for error offsets.        *
 *----------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::chunk(int paren, const char *open_paren, size_t *width_param) {

	size_t this_paren = 0;
	const bool old_sensitive = Is_Case_Insensitive;
	std::vector<std::unique_ptr<RegexNode>> branches;

	*width_param = 0;

	if (++Paren_Depth > MaxParenDepth) {
		throw RegexException(RegexError::TooComplex, offset(open_paren), "parentheses nested deeper than %d", MaxParenDepth);
	}

	// Capture numbers follow the order of the opening parentheses.

	if (paren == PAREN) {
		if (Total_Paren >= NSUBEXP) {
			throw RegexException(RegexError::TooComplex, offset(open_paren), "number of ()'s > %d", NSUBEXP - 1);
		}

		this_paren = Total_Paren;
		Total_Paren++;
	} else if (paren == INSENSITIVE) {
		Is_Case_Insensitive = true;
	} else if (paren == SENSITIVE) {
		Is_Case_Insensitive = false;
	}

	// Pick up the branches.

	for (;;) {
		size_t width_local;
		std::unique_ptr<RegexNode> this_branch = alternative(&width_local);

		if (this_branch->children.empty() && (*Reg_Parse == '|' || !branches.empty())) {
			throw RegexException(RegexError::DanglingAlternation, offset(branches.empty() ? Reg_Parse : Reg_Parse - 1), "empty alternative next to '|'");
		}

		if (branches.empty() || width_local < *width_param) {
			*width_param = width_local;
		}

		branches.push_back(std::move(this_branch));

		if (*Reg_Parse != '|') {
			break;
		}

		Reg_Parse++;
	}

	// Check for proper termination.

	if (paren != NO_PAREN && *Reg_Parse != ')') {
		throw RegexException(RegexError::UnbalancedGroup, offset(open_paren), "missing right parenthesis ')'");
	} else if (paren == NO_PAREN && *Reg_Parse != '\0') {
		if (*Reg_Parse == ')') {
			throw RegexException(RegexError::UnbalancedGroup, offset(Reg_Parse), "missing left parenthesis '('");
		} else {
			throw std::logic_error("internal error #2, 'chunk'"); // "Can't happen" - should have been caught earlier
		}
	}

	if (paren != NO_PAREN) {
		Reg_Parse++;
	}

	std::unique_ptr<RegexNode> body;

	if (branches.size() == 1) {
		body = std::move(branches[0]);
	} else {
		body.reset(new RegexNode(ALTERNATION));
		body->children = std::move(branches);
	}

	Is_Case_Insensitive = old_sensitive;
	--Paren_Depth;

	if (paren == NO_PAREN) {
		return body;
	}

	std::unique_ptr<RegexNode> group(new RegexNode(GROUP));
	group->index = this_paren;
	group->children.push_back(std::move(body));
	return group;
}

/*----------------------------------------------------------------------*
 * alternative - Processes one alternative of an '|' operator.
 *
 * Returns a CONCAT node holding the pieces, possibly none.
 *----------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::alternative(size_t *width_param) {

	std::unique_ptr<RegexNode> ret_val(new RegexNode(CONCAT));

	*width_param = 0;

	// Loop until we hit the start of the next alternative, the end of this set of alternatives (end of parentheses), or the end of the regex.

	while (*Reg_Parse != '|' && *Reg_Parse != ')' && *Reg_Parse != '\0') {

		if (skip_comment()) {
			continue;
		}

		size_t width_local;
		ret_val->children.push_back(piece(&width_local));
		*width_param = saturating_add(*width_param, width_local);
	}

	return ret_val;
}

/*----------------------------------------------------------------------*
 * skip_comment
 *
 * Steps over a (?#...) comment. The comment ends at the first ')'.
 *----------------------------------------------------------------------*/
bool Regex::skip_comment() {

	if (Reg_Parse[0] != '(' || Reg_Parse[1] != '?' || Reg_Parse[2] != '#') {
		return false;
	}

	const char *const open_paren = Reg_Parse;

	Reg_Parse += 3;

	while (*Reg_Parse != ')' && *Reg_Parse != '\0') {
		Reg_Parse++;
	}

	if (*Reg_Parse != ')') {
		throw RegexException(RegexError::UnbalancedGroup, offset(open_paren), "missing right parenthesis ')' after comment");
	}

	Reg_Parse++;
	return true;
}

/*--------------------------------------------------------------------*
 * piece - something followed by possible '*', '+', '?', or "{m,n}"
 *
 * Note that the branching code sequences used for the general cases of
 * *, +. ?, and {m,n} became a single QUANTIFIED node. The matcher picks
 * a fast loop when the operand is a single character node.
 *
 * A trailing '?' turns the quantifier lazy. "{}" and "{,}" are the same
 * as '*', "{n}" means exactly n.
 *--------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::piece(size_t *width_param) {

	unsigned long min_max[2] = {REG_ZERO, REG_INFINITY};
	size_t width_local;

	std::unique_ptr<RegexNode> ret_val = atom(&width_local);

	const char op_code = *Reg_Parse;

	if (!isQuantifier(op_code)) {
		*width_param = width_local;
		return ret_val;
	}

	const char *const quantifier = Reg_Parse;

	if (ret_val->type == BOL || ret_val->type == EOL) {
		throw RegexException(RegexError::InvalidQuantifier, offset(quantifier), "%c operand could be empty", op_code);
	}

	if (op_code == '{') { // {n,m} quantifier present, extract the values.

		unsigned long value[2] = {REG_ZERO, REG_ZERO};
		int digit_present[2]   = {0, 0};
		int comma_present      = 0;

		Reg_Parse++;

		for (int i = 0; i < 2; i++) {
			while (safe_ctype<isdigit>(*Reg_Parse)) {
				value[i] = (value[i] * 10UL) + static_cast<unsigned long>(*Reg_Parse - '0');

				if (value[i] > MaxBraceValue) {
					throw RegexException(RegexError::InvalidQuantifier, offset(quantifier), "%s operand of {m,n} > %lu", (i == 0) ? "min" : "max", MaxBraceValue);
				}

				digit_present[i]++;
				Reg_Parse++;
			}

			if (!comma_present && *Reg_Parse == ',') {
				comma_present++;
				Reg_Parse++;
			}
		}

		if (*Reg_Parse != '}') {
			throw RegexException(RegexError::InvalidQuantifier, offset(quantifier), "{m,n} specification missing right '}'");
		}

		min_max[0] = value[0];

		if (comma_present) {
			if (digit_present[1]) {
				min_max[1] = value[1];
			}
		} else if (digit_present[0]) {
			min_max[1] = value[0]; // {x} means {x,x}
		}

		if (min_max[0] > min_max[1]) {
			throw RegexException(RegexError::InvalidQuantifier, offset(quantifier), "{%lu,%lu} is an invalid range", min_max[0], min_max[1]);
		}
	} else if (op_code == '+') {
		min_max[0] = REG_ONE;
	} else if (op_code == '?') {
		min_max[1] = REG_ONE;
	}

	Reg_Parse++;

	bool lazy = false;
	if (*Reg_Parse == '?') {
		lazy = true;
		Reg_Parse++;
	}

	if (isQuantifier(*Reg_Parse)) {
		if (op_code == '{') {
			throw RegexException(RegexError::InvalidQuantifier, offset(Reg_Parse), "nested quantifiers, {m,n}%c", *Reg_Parse);
		} else {
			throw RegexException(RegexError::InvalidQuantifier, offset(Reg_Parse), "nested quantifiers, %c%c", op_code, *Reg_Parse);
		}
	}

	// "x{1,1}" is the same as "x".

	if (min_max[0] == REG_ONE && min_max[1] == REG_ONE) {
		*width_param = width_local;
		return ret_val;
	}

	*width_param = saturating_mul(width_local, min_max[0]);

	std::unique_ptr<RegexNode> node(new RegexNode(QUANTIFIED));
	node->min  = min_max[0];
	node->max  = min_max[1];
	node->lazy = lazy;
	node->children.push_back(std::move(ret_val));
	return node;
}

/*--------------------------------------------------------------------*
 * atom - Process one regex item at the lowest level
 *
 * ENHANCEMENT NOTE:  Have to take care of the '.' with respect to
 * newlines, it never matches one.
 *--------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::atom(size_t *width_param) {

	std::unique_ptr<RegexNode> ret_val;
	const char *const atom_start = Reg_Parse;

	*width_param = 0;

	switch (*Reg_Parse++) {
	case '^':
		ret_val.reset(new RegexNode(BOL));
		break;

	case '$':
		ret_val.reset(new RegexNode(EOL));
		break;

	case '.':
		ret_val.reset(new RegexNode(ANY));
		*width_param = 1;
		break;

	case '(': {
		int paren = PAREN;

		if (*Reg_Parse == '?') { // Special parenthetical expression
			Reg_Parse++;

			if (*Reg_Parse == ':') {
				paren = NO_CAPTURE;
			} else if (*Reg_Parse == 'i') {
				paren = INSENSITIVE;
			} else if (*Reg_Parse == 'I') {
				paren = SENSITIVE;
			} else {
				throw RegexException(RegexError::InvalidQuantifier, offset(atom_start), "invalid grouping syntax");
			}

			Reg_Parse++;
		}

		ret_val = chunk(paren, atom_start, width_param);
		break;
	}

	case '\0':
	case '|':
	case ')':
		throw std::logic_error("internal error #3, 'atom'"); // Supposed to be caught earlier.

	case '?':
	case '+':
	case '*':
		throw RegexException(RegexError::InvalidQuantifier, offset(atom_start), "%c follows nothing", *atom_start);

	case '{':
		throw RegexException(RegexError::InvalidQuantifier, offset(atom_start), "{m,n} follows nothing");

	case '[':
		ret_val = char_class(atom_start);
		*width_param = 1;
		break;

	case '\\':
		if (*Reg_Parse == '\0') {
			throw RegexException(RegexError::InvalidEscape, offset(atom_start), "trailing \\");
		}

		if ((ret_val = shortcut_escape(*Reg_Parse))) {
			Reg_Parse++;
			*width_param = 1;
			break;
		}

		if ((ret_val = back_ref(Reg_Parse))) {
			// The width of the captured text is unknown here.
			Reg_Parse++;
			break;
		}

		// Fall through to literal handling.

	default:
		Reg_Parse--;
		ret_val = literal();
		*width_param = 1;
		break;
	}

	return ret_val;
}

/*--------------------------------------------------------------------*
 * literal
 *
 * Emits one LITERAL node for the character at Reg_Parse, handling
 * numeric and literal escapes.
 *--------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::literal() {

	code_point c;

	if (*Reg_Parse == '\\') {
		const char *const escape = Reg_Parse;
		uint8_t test;
		char value;

		Reg_Parse++; // Point to escaped character

		if ((test = numeric_escape(*Reg_Parse, &Reg_Parse))) {
			c = test;
		} else if ((value = literal_escape(*Reg_Parse)) != '\0') {
			c = to_index(value);
		} else {
			throw RegexException(RegexError::InvalidEscape, offset(escape), "\\%c is an invalid escape sequence", *Reg_Parse);
		}

		Reg_Parse++;
	} else {
		c = pattern_char();
	}

	return literal_node(c);
}

std::unique_ptr<RegexNode> Regex::literal_node(code_point c) const {

	std::unique_ptr<RegexNode> node(new RegexNode(LITERAL));

	if (Is_Case_Insensitive && (fold_case(c) != c || upper_case(c) != c)) {
		node->ch = fold_case(c);
		node->caseInsensitive = true;
	} else {
		node->ch = c;
	}

	return node;
}

//------------------------------------------------------------------------------
// Name: pattern_char
// Desc: decodes the (possibly multi byte) character at Reg_Parse and steps
//       over it
//------------------------------------------------------------------------------
code_point Regex::pattern_char() {
	code_point c;
	Reg_Parse += decode_char(Reg_Parse, Reg_End, &c);
	return c;
}

/*--------------------------------------------------------------------*
 * char_class - Process a [...] bracket expression. Reg_Parse points
 * just past the '['.
 *--------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::char_class(const char *class_start) {

	std::unique_ptr<RegexNode> ret_val;
	code_point last_emit = 0;
	char_set set;
	uint8_t test;
	char value;

	// Handle characters that can only occur at the start of a class.

	if (*Reg_Parse == '^') { // Complement of range.
		ret_val.reset(new RegexNode(ANY_BUT));
		Reg_Parse++;
	} else {
		ret_val.reset(new RegexNode(ANY_OF));
	}

	if (*Reg_Parse == ']' || *Reg_Parse == '-') {
		// If '-' or ']' is the first character in a class, it is a literal character in the class.

		last_emit = to_index(*Reg_Parse);
		add_class_range(set, last_emit, last_emit);
		Reg_Parse++;
	}

	// Handle the rest of the class characters.

	while (*Reg_Parse != '\0' && *Reg_Parse != ']') {
		if (*Reg_Parse == '-') { // Process a range, e.g [a-z].
			Reg_Parse++;

			if (*Reg_Parse == ']' || *Reg_Parse == '\0') {
				/* If '-' is the last character in a class it is a literal
				   character.  If 'Reg_Parse' points to the end of the
				   regex string, an error will be generated later. */

				add_class_range(set, '-', '-');
				last_emit = '-';
			} else {
				const char *const range_end = Reg_Parse;
				code_point last_value;

				if (*Reg_Parse == '\\') {
					/* Handle escaped characters within a class range.
					   Specifically disallow shortcut escapes as the end of
					   a class range.  To allow this would mean that
					   constructs like "[a-\s]" would be valid. */

					Reg_Parse++;

					if ((test = numeric_escape(*Reg_Parse, &Reg_Parse))) {
						last_value = test;
					} else if ((value = literal_escape(*Reg_Parse)) != '\0') {
						last_value = to_index(value);
					} else if (is_shortcut(*Reg_Parse)) {
						throw RegexException(RegexError::InvalidCharClass, offset(range_end), "\\%c is not allowed as range operand", *Reg_Parse);
					} else {
						throw RegexException(RegexError::InvalidCharClass, offset(range_end), "\\%c is an invalid char class escape sequence", *Reg_Parse);
					}

					Reg_Parse++;
				} else {
					last_value = pattern_char();
				}

				if (last_emit > last_value) {
					throw RegexException(RegexError::InvalidCharClass, offset(range_end), "invalid [] range");
				}

				add_class_range(set, last_emit, last_value);
				last_emit = last_value;
			}
		} else if (*Reg_Parse == '\\') {
			const char *const escape = Reg_Parse;

			Reg_Parse++;

			if (*Reg_Parse == '\0') {
				break; // Reported as a missing ']' below.
			}

			if ((test = numeric_escape(*Reg_Parse, &Reg_Parse))) {
				last_emit = test;
				add_class_range(set, last_emit, last_emit);
			} else if ((value = literal_escape(*Reg_Parse)) != '\0') {
				last_emit = to_index(value);
				add_class_range(set, last_emit, last_emit);
			} else if (is_shortcut(*Reg_Parse)) {
				if (Reg_Parse[1] == '-' && Reg_Parse[2] != ']') {
					// Specifically disallow shortcut escapes as the start of a character class range.
					throw RegexException(RegexError::InvalidCharClass, offset(escape), "\\%c not allowed as range operand", *Reg_Parse);
				}

				if (safe_ctype<isupper>(*Reg_Parse)) {
					// Everything the shortcut does not name, except newline.
					byte_set complement = ~shortcut_class(*Reg_Parse);
					complement.reset(to_index('\n'));
					set.add(complement);
					set.add(UCHAR_MAX + 1, MaxCodePoint);
				} else {
					set.add(shortcut_class(*Reg_Parse));
				}
			} else {
				throw RegexException(RegexError::InvalidCharClass, offset(escape), "\\%c is an invalid char class escape sequence", *Reg_Parse);
			}

			Reg_Parse++;
		} else {
			// Ordinary class character.
			last_emit = pattern_char();
			add_class_range(set, last_emit, last_emit);
		}
	}

	if (*Reg_Parse != ']') {
		throw RegexException(RegexError::InvalidCharClass, offset(class_start), "missing right ']'");
	}

	Reg_Parse++;

	// A negated class never matches a newline.
	if (ret_val->type == ANY_BUT) {
		set.add('\n');
	}

	ret_val->set = set;
	ret_val->caseInsensitive = Is_Case_Insensitive;
	return ret_val;
}

//------------------------------------------------------------------------------
// Name: add_class_range
// Desc: adds 'first' to 'last' to a class, with the other case of every ASCII
//       letter in it when compiling case insensitive
//------------------------------------------------------------------------------
void Regex::add_class_range(char_set &set, code_point first, code_point last) const {

	set.add(first, last);

	if (Is_Case_Insensitive) {
		for (code_point c = first; c <= last && c <= 0x7F; c++) {
			if (safe_ctype<isalpha>(static_cast<char>(c))) {
				set.add(fold_case(c));
				set.add(upper_case(c));
			}
		}
	}
}

/*--------------------------------------------------------------------*
 * shortcut_escape
 *
 * Recognizes character class shortcut escapes \d \D \w \W \s \S and
 * returns the matching ANY_OF or ANY_BUT node, or NULL if 'c' is not a
 * shortcut letter. The upper case forms never match a newline.
 *--------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::shortcut_escape(char c) const {

	if (!is_shortcut(c)) {
		return nullptr;
	}

	std::unique_ptr<RegexNode> ret_val(new RegexNode(safe_ctype<isupper>(c) ? ANY_BUT : ANY_OF));
	ret_val->set.add(shortcut_class(c));

	if (ret_val->type == ANY_BUT) {
		ret_val->set.add('\n');
	}

	return ret_val;
}

/*--------------------------------------------------------------------*
 * back_ref
 *
 * Process a request for a back reference, \1 through \9. The group
 * must already have been opened. Returns NULL if 'c' does not start a
 * back reference.
 *--------------------------------------------------------------------*/
std::unique_ptr<RegexNode> Regex::back_ref(const char *c) {

	const int paren_no = (*c - '0');

	if (!safe_ctype<isdigit>(*c) || // Only \1, \2, ... \9 are supported.
	    paren_no == 0) {            // Should be caught by numeric_escape.
		return nullptr;
	}

	if (static_cast<size_t>(paren_no) >= Total_Paren) {
		throw RegexException(RegexError::InvalidBackreference, offset(c - 1), "\\%d is an illegal back reference", paren_no);
	}

	std::unique_ptr<RegexNode> ret_val(new RegexNode(BACK_REF));
	ret_val->index = static_cast<size_t>(paren_no);
	ret_val->caseInsensitive = Is_Case_Insensitive;
	return ret_val;
}

/*--------------------------------------------------------------------*
 * numeric_escape
 *
 * Implements hex and octal numeric escape sequence syntax.
 *
 * Hexadecimal Escape: \x##    Max of two digits  Must have leading 'x'.
 * Octal Escape:       \0###   Max of three digits and not greater
 *                             than 377 octal.  Must have leading zero.
 *
 * Returns the actual character value or NULL if not a valid hex or
 * octal escape.  Throws if \x0, \x00, \0, \00, \000, or \0000 is
 * specified. On success '*parse' points at the last digit used.
 *--------------------------------------------------------------------*/
uint8_t Regex::numeric_escape(char c, const char **parse) const {

	static const char digits[] = "fedcbaFEDCBA9876543210";

	static const unsigned int digit_val[] = {15, 14, 13, 12, 11, 10,              // Lower case Hex digits
	                                         15, 14, 13, 12, 11, 10,              // Upper case Hex digits
	                                         9,  8,  7,  6,  5,  4,  3, 2, 1, 0}; // Decimal Digits

	const char *digit_str;
	unsigned int value = 0;
	unsigned int radix = 8;
	int width = 3; // Can not be bigger than \0377
	int pos_delta = 14;

	switch (c) {
	case '0':
		digit_str = digits + pos_delta; // Only use Octal digits, i.e. 0-7.
		break;

	case 'x':
	case 'X':
		width = 2; // Can not be bigger than \xff
		radix = 16;
		pos_delta = 0;
		digit_str = digits; // Use all of the digit characters.
		break;

	default:
		return '\0'; // Not a numeric escape
	}

	const char *scan = *parse;
	scan++; // Only change *parse on success.

	const char *pos_ptr = (*scan != '\0') ? strchr(digit_str, *scan) : nullptr;

	for (int i = 0; pos_ptr != nullptr && (i < width); i++) {
		const size_t pos = static_cast<size_t>(pos_ptr - digit_str) + pos_delta;
		value = (value * radix) + digit_val[pos];

		/* If this digit makes the value over 255, treat this digit as a literal
		   character instead of part of the numeric escape.  For example, \0777
		   will be processed as \077 (an '?') and a literal '7' character, NOT
		   511 decimal which is > 255. */

		if (value > 255) {
			// Back out calculations for last digit processed.
			value -= digit_val[pos];
			value /= radix;
			break;
		}

		scan++;
		pos_ptr = (*scan != '\0') ? strchr(digit_str, *scan) : nullptr;
	}

	// Handle the case of "\0" i.e. trying to specify a NULL character.

	if (value == 0) {
		if (c == '0') {
			throw RegexException(RegexError::InvalidEscape, offset(*parse - 1), "\\00 is an invalid octal escape");
		} else {
			throw RegexException(RegexError::InvalidEscape, offset(*parse - 1), "\\%c0 is an invalid hexadecimal escape", c);
		}
	}

	// Point to the last character of the number on success.

	scan--;
	*parse = scan;

	return static_cast<uint8_t>(value);
}

bool Regex::isQuantifier(char c) const {
	return c == '*' || c == '+' || c == '?' || c == '{';
}

size_t Regex::offset(const char *p) const {
	return static_cast<size_t>(p - Reg_Start);
}

/*======================================================================*
 *  Regex execution related code
 *======================================================================*/

std::unique_ptr<RegexMatch> Regex::ExecRE(const char *string, const char *end) const {
	std::unique_ptr<RegexMatch> match(new RegexMatch(this));
	match->ExecRE(string, end);
	return match;
}
