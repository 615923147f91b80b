#include "RegexCommon.h"
#include <QChar>
#include <QtDebug>

namespace {

/*--------------------------------------------------------------------*
 * init_ansi_classes
 *
 * Generate the shortcut character sets using locale aware ANSI C
 * functions.
 *--------------------------------------------------------------------*/
struct AnsiClasses {
	AnsiClasses() {
		for (int i = 1; i <= UCHAR_MAX; i++) {

			const char ch = static_cast<char>(i);

			if (safe_ctype<isdigit>(ch)) {
				digits.set(i);
			}

			if (is_word_char(ch)) {
				word.set(i);
			}

			if (safe_ctype<isspace>(ch)) {
				space.set(i);
			}
		}

		if (digits.count() != 10) {
			qDebug("init_ansi_classes: locale reports %u digits", static_cast<unsigned>(digits.count()));
		}
	}

	byte_set digits;
	byte_set word;
	byte_set space;
};

const AnsiClasses &ansi_classes() {
	static const AnsiClasses classes;
	return classes;
}

bool is_continuation(char c) {
	return (to_index(c) & 0xC0) == 0x80;
}

}

void char_set::add(code_point c) {
	add(c, c);
}

//------------------------------------------------------------------------------
// Name: add
// Desc: adds the inclusive range 'first' to 'last'
//------------------------------------------------------------------------------
void char_set::add(code_point first, code_point last) {

	for (; first <= last && first <= UCHAR_MAX; ++first) {
		low_.set(first);
	}

	if (first <= last) {
		high_.push_back(range(first, last));
	}
}

void char_set::add(const byte_set &bytes) {
	low_ |= bytes;
}

bool char_set::contains(code_point c) const {

	if (c <= UCHAR_MAX) {
		return low_[c];
	}

	for (const range &r : high_) {
		if (c >= r.first && c <= r.second) {
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: decode_char
// Desc: reads the character starting at 'p' (which must be before 'end')
//       into '*ch' and returns its length in bytes.  Truncated, overlong
//       and surrogate sequences yield a single invalid byte character.
//------------------------------------------------------------------------------
size_t decode_char(const char *p, const char *end, code_point *ch) {

	const unsigned char lead = to_index(*p);

	size_t length;
	code_point value;

	if (lead < 0x80) {
		*ch = lead;
		return 1;
	} else if (lead >= 0xC2 && lead <= 0xDF) {
		length = 2;
		value  = lead & 0x1F;
	} else if (lead >= 0xE0 && lead <= 0xEF) {
		length = 3;
		value  = lead & 0x0F;
	} else if (lead >= 0xF0 && lead <= 0xF4) {
		length = 4;
		value  = lead & 0x07;
	} else {
		*ch = InvalidByteBase + lead;
		return 1;
	}

	if (static_cast<size_t>(end - p) < length) {
		*ch = InvalidByteBase + lead;
		return 1;
	}

	for (size_t i = 1; i < length; ++i) {
		if (!is_continuation(p[i])) {
			*ch = InvalidByteBase + lead;
			return 1;
		}

		value = (value << 6) | (to_index(p[i]) & 0x3F);
	}

	if ((length == 3 && value < 0x800) || (length == 4 && (value < 0x10000 || value > MaxCodePoint)) || (value >= 0xD800 && value <= 0xDFFF)) {
		*ch = InvalidByteBase + lead;
		return 1;
	}

	*ch = value;
	return length;
}

size_t char_length(const char *p, const char *end) {
	code_point ch;
	return decode_char(p, end, &ch);
}

//------------------------------------------------------------------------------
// Name: previous_char
// Desc: start of the character that ends at 'p'.  'start' must be a
//       character boundary at or before 'p', and 'p' must be after it.
//       A lead byte is never a continuation byte, so a well formed
//       sequence ending exactly at 'p' is always the one decode_char saw.
//------------------------------------------------------------------------------
const char *previous_char(const char *start, const char *p) {

	for (size_t length = 2; length <= 4 && static_cast<size_t>(p - start) >= length; ++length) {
		if (char_length(p - length, p) == length) {
			return p - length;
		}
	}

	return p - 1;
}

//------------------------------------------------------------------------------
// Name: fold_case
// Desc: the lower case form used for case insensitive comparisons
//------------------------------------------------------------------------------
code_point fold_case(code_point c) {

	if (c <= 0x7F) {
		return static_cast<code_point>(tolower(static_cast<int>(c)));
	}

	return QChar::toCaseFolded(c);
}

code_point upper_case(code_point c) {

	if (c <= 0x7F) {
		return static_cast<code_point>(toupper(static_cast<int>(c)));
	}

	return QChar::toUpper(c);
}

//------------------------------------------------------------------------------
// Name: shortcut_class
// Desc: Returns the character set named by a shortcut escape letter, one of
//       d, w or s. The negated forms (\D, \W, \S) use the same set with
//       the ANY_BUT node type.
//------------------------------------------------------------------------------
const byte_set &shortcut_class(char c) {

	const AnsiClasses &classes = ansi_classes();

	switch (tolower(to_index(c))) {
	case 'd':
		return classes.digits;
	case 'w':
		return classes.word;
	default:
		return classes.space;
	}
}

/*--------------------------------------------------------------------*
 * literal_escape
 *
 * Recognize escaped literal characters (prefixed with backslash),
 * and translate them into the corresponding character.
 *
 * Returns the proper character value or NULL if not a valid literal
 * escape.
 *--------------------------------------------------------------------*/
char literal_escape(char c) {

	static const char valid_escape[] = {
		'a', 'e', 'f', 'n',  'r', 't', 'v', '(', ')', '-', '[', ']', '<', '>',
		'{', '}', '.', '\\', '|', '^', '$', '*', '+', '?', '&', '/', '\0'
	};

	static const char value[] = {
		'\a', 0x1B, '\f', '\n', '\r', '\t', '\v', '(', ')', '-', '[', ']', '<', '>',
		'{',  '}',  '.',  '\\', '|',  '^',  '$',  '*', '+', '?', '&', '/', '\0'
	};

	for (int i = 0; valid_escape[i] != '\0'; i++) {
		if (c == valid_escape[i]) {
			return value[i];
		}
	}

	return '\0';
}
