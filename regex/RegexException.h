
#ifndef REGEX_EXCEPTION_H_
#define REGEX_EXCEPTION_H_

#include <exception>
#include <cstdarg>
#include <cstddef>
#include <cstdio>

enum class RegexError {
	UnbalancedGroup,
	InvalidQuantifier,
	InvalidBackreference,
	InvalidCharClass,
	DanglingAlternation,
	InvalidEscape,
	TooComplex
};

inline const char *errorName(RegexError kind) {
	switch (kind) {
	case RegexError::UnbalancedGroup:      return "UnbalancedGroup";
	case RegexError::InvalidQuantifier:    return "InvalidQuantifier";
	case RegexError::InvalidBackreference: return "InvalidBackreference";
	case RegexError::InvalidCharClass:     return "InvalidCharClass";
	case RegexError::DanglingAlternation:  return "DanglingAlternation";
	case RegexError::InvalidEscape:        return "InvalidEscape";
	case RegexError::TooComplex:           return "TooComplex";
	}

	return "Unknown";
}

class RegexException : public std::exception {
public:
	RegexException(RegexError kind, size_t offset, const char *format, ...) : kind_(kind), offset_(offset) {
		va_list ap;
		va_start(ap, format);
		vsnprintf(error_, sizeof(error_), format, ap);
		va_end(ap);
	}

	const char *what() const noexcept {
		return error_;
	}

public:
	RegexError kind() const {
		return kind_;
	}

	// Offset into the pattern where the problem was detected.
	size_t offset() const {
		return offset_;
	}

private:
	RegexError kind_;
	size_t     offset_;
	char       error_[255];
};

#endif
