#ifndef REGEX_COMMON_H_
#define REGEX_COMMON_H_

#include <cstdint>
#include <cstddef>
#include <climits>
#include <cctype>
#include <bitset>
#include <utility>
#include <vector>

/* Number of text capturing parentheses allowed (group 0 is the whole
   match). */
#define NSUBEXP 50

#define REG_INFINITY ULONG_MAX
#define REG_ZERO     0UL
#define REG_ONE      1UL

/* The numeric maximum value for the operands of {m,n}. */
const unsigned long MaxBraceValue = 65535UL;

/* Deepest parenthesis nesting accepted by the compiler. */
const int MaxParenDepth = 1000;

/* Patterns and text are UTF-8.  A byte that does not start a well formed
   sequence is a character of its own, numbered InvalidByteBase + byte so
   that it can never equal a real code point below U+0100. */
typedef uint32_t code_point;

const code_point MaxCodePoint    = 0x10FFFF;
const code_point InvalidByteBase = 0xDC00;

/* One bit per byte value; the shortcut escape tables. */
typedef std::bitset<UCHAR_MAX + 1> byte_set;

/* Set of code points for [...] classes and shortcut escapes.  U+0000 to
   U+00FF live in a bitmap, anything above in a list of ranges. */
class char_set {
public:
	typedef std::pair<code_point, code_point> range;

public:
	void add(code_point c);
	void add(code_point first, code_point last);
	void add(const byte_set &bytes);
	bool contains(code_point c) const;

	const byte_set &low() const {
		return low_;
	}

	const std::vector<range> &ranges() const {
		return high_;
	}

private:
	byte_set           low_;
	std::vector<range> high_;
};

/* The <cctype> functions are undefined for negative values other than EOF,
   so plain 'char' must be widened through 'unsigned char' first. */
template <int (&F)(int)>
bool safe_ctype(char c) {
	return F(static_cast<unsigned char>(c)) != 0;
}

inline unsigned char to_index(char c) {
	return static_cast<unsigned char>(c);
}

inline bool is_word_char(char c) {
	return safe_ctype<isalnum>(c) || c == '_';
}

size_t decode_char(const char *p, const char *end, code_point *ch);
size_t char_length(const char *p, const char *end);
const char *previous_char(const char *start, const char *p);

code_point fold_case(code_point c);
code_point upper_case(code_point c);

const byte_set &shortcut_class(char c);
char literal_escape(char c);

#endif
