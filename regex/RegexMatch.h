
#ifndef REGEX_MATCH_H_
#define REGEX_MATCH_H_

#include "RegexCommon.h"
#include <QByteArray>
#include <vector>

struct Capture {
	const char *start;
	const char *end;
};

class Regex;
struct RegexNode;

class RegexMatch {
	friend class Regex;
public:
	// Node visits allowed per start position before the search is abandoned.
	static const unsigned long DefaultStepLimit = 1000000UL;

	// Pending continuations plus choice points allowed per start position.
	static const size_t StackLimit = 4000000;

public:
	explicit RegexMatch(const Regex *regex);

private:
	RegexMatch(const RegexMatch &) = delete;
	RegexMatch& operator=(const RegexMatch &) = delete;

public:
	/**
	 * @brief ExecRE - Match a 'Regex' against a string.
	 * @param string - Text to search within, ^ matches here.
	 * @param end - Pointer to the end of 'string', $ matches here.  If NULL will scan from 'string' until '\0' is found.
	 * @param from - First position a match may begin at; defaults to 'string' if NULL.
	 * @return true if a match was found. False on no match and when a resource limit was hit, see limitExceeded()
	 */
	bool ExecRE(const char *string, const char *end, const char *from = nullptr);

	// 0 disables the step limit; the stack limit always applies.
	void setStepLimit(unsigned long limit) {
		step_limit_ = limit;
	}

	unsigned long stepLimit() const {
		return step_limit_;
	}

public:
	bool matched() const {
		return matched_;
	}

	bool limitExceeded() const {
		return Limit_Exceeded;
	}

	size_t captureCount() const;
	bool isSet(size_t index) const;
	Capture capture(size_t index) const;
	long startOffset(size_t index) const;
	long endOffset(size_t index) const;
	QByteArray captured(size_t index) const;

private:
	// Alternatives left open at a choice point, tried when the rest fails.
	enum ChoiceKind {
		BRANCH,  // the next branch of an ALTERNATION
		ITERATE, // one more iteration of a lazy QUANTIFIED node
		PROCEED, // stop iterating a greedy QUANTIFIED node
		FEWER,   // give back one character of a greedy single character run
		MORE     // take one more character into a lazy single character run
	};

	/* The "rest of the match" is a chain of these, linked by index into
	   frames_.  NoFrame ends the chain: the whole pattern has matched. */
	struct Frame {
		enum Kind {
			SEQUENCE, // continue with the child after 'position' of the CONCAT 'node'
			CLOSE,    // record group 'node' as spanning 'mark' to input
			REPEAT    // iteration 'count' of QUANTIFIED 'node', begun at 'mark', is done
		};

		Kind             kind;
		const RegexNode *node;
		size_t           position;
		unsigned long    count;
		const char *     mark;
		size_t           next;
	};

	// Everything needed to resume matching at a choice point.
	struct Choice {
		ChoiceKind       kind;
		const RegexNode *node;
		const char *     input;  // input position when the choice was made
		const char *     save;   // FEWER, MORE: where the run began
		unsigned long    count;  // BRANCH: branch to try; FEWER, MORE: run length
		size_t           cont;
		size_t           frames; // frames_.size() when the choice was made
		size_t           undo;   // undo_.size() when the choice was made
	};

	// Capture state overwritten by a CLOSE frame, restored on backtrack.
	struct Undo {
		size_t      paren_no;
		const char *start;
		const char *end;
	};

	bool attempt(const char *string);
	bool match();
	bool proceed();
	bool repeat(const RegexNode *node, unsigned long count, size_t next);
	bool repeat_simple(const RegexNode *node);
	bool backtrack();
	bool enter();
	void push_frame(const Frame &frame);
	void push_choice(ChoiceKind kind, const RegexNode *node, const char *save, unsigned long count);
	unsigned long greedy(const RegexNode *p, unsigned long max, const char **stop) const;
	bool atEndOfString(const char *p) const;

private:
	const Regex *const regex_;

private:
	const char *input;         // String-input pointer.
	const char *startOfString; // Beginning of input, for ^ checks.
	const char *endOfString;   // Logical end of input, for $ checks.

	const RegexNode *node_;    // Node to match next, NULL to continue with cont_
	size_t           cont_;    // The rest of the match, an index into frames_

	unsigned long steps_;      // Node visits during the current attempt
	unsigned long step_limit_;

	std::vector<Frame>  frames_;
	std::vector<Choice> choices_;
	std::vector<Undo>   undo_;

	std::vector<const char *> startp_; // Captured text starting locations.
	std::vector<const char *> endp_;   // Captured text ending locations.

	bool matched_;
	bool Limit_Exceeded; // Stack or step limit exceeded flag
};

#endif
