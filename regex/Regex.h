#ifndef REGEX_H_
#define REGEX_H_

#include <memory>
#include <QString>
#include "RegexCommon.h"
#include "RegexNode.h"
#include "RegexMatch.h"
#include "RegexException.h"

// Flags for CompileRE default settings (Markus Schwarzenberg)
enum RE_DEFAULT_FLAG {
	REDFLT_STANDARD = 0,
	REDFLT_CASE_INSENSITIVE = 1
};

/* The compiled form of a regular expression.  Immutable once constructed,
   so one instance may be shared by any number of RegexMatch objects. */
class Regex {
	friend class RegexMatch;
public:
	/**
	 * @brief Compiles a regular expression into the syntax tree used by 'ExecRE'.
	 * @param exp - String containing the regex specification.
	 * @param defaultFlags - Flags for default RE-operation
	 * @throws RegexException if the expression is malformed
	 */
	Regex(const char *exp, int defaultFlags);

private:
	Regex(const Regex &) = delete;
	Regex &operator=(const Regex &) = delete;

public:
	/**
	 * @brief ExecRE - Match the compiled expression against a string.
	 * @param string - Text to search within.
	 * @param end - Pointer to the end of 'string'.  If NULL will scan from 'string' until '\0' is found.
	 * @return the match result, never NULL; test it with RegexMatch::matched()
	 */
	std::unique_ptr<RegexMatch> ExecRE(const char *string, const char *end) const;

public:
	// Number of capturing parentheses, not counting the implicit group 0.
	size_t captureCount() const {
		return Total_Paren - 1;
	}

	const RegexNode *root() const {
		return root_.get();
	}

	QString pattern() const {
		return regex_;
	}

	bool anchored() const {
		return anchor_;
	}

private:
	// for CompileRE
	std::unique_ptr<RegexNode> chunk(int paren, const char *open_paren, size_t *width_param);
	std::unique_ptr<RegexNode> alternative(size_t *width_param);
	std::unique_ptr<RegexNode> piece(size_t *width_param);
	std::unique_ptr<RegexNode> atom(size_t *width_param);
	std::unique_ptr<RegexNode> char_class(const char *class_start);
	std::unique_ptr<RegexNode> back_ref(const char *c);
	std::unique_ptr<RegexNode> shortcut_escape(char c) const;
	std::unique_ptr<RegexNode> literal();
	std::unique_ptr<RegexNode> literal_node(code_point c) const;
	uint8_t numeric_escape(char c, const char **parse) const;
	code_point pattern_char();
	void add_class_range(char_set &set, code_point first, code_point last) const;
	bool skip_comment();
	bool isQuantifier(char c) const;
	size_t offset(const char *p) const;

private:
	std::unique_ptr<RegexNode> root_;
	char                       match_start_; // ASCII character that must begin a match; '\0' if none obvious.
	bool                       anchor_;      // Is the match anchored (at beginning-of-line only)?
	size_t                     min_width_;   // No match can be shorter than this.
	size_t                     Total_Paren;  // Parentheses, (),  counter.
	QString                    regex_;

	// Parse state, only meaningful during construction.
	const char * Reg_Start;           // Beginning of the user's regex, for error offsets
	const char * Reg_Parse;           // Input scan ptr (scans user's regex)
	const char * Reg_End;             // The terminating NUL of the user's regex
	int          Paren_Depth;
	bool         Is_Case_Insensitive;
};

#endif
