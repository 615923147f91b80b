
#include "RegexMatch.h"
#include "Regex.h"
#include <QtDebug>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace {

const size_t NoFrame = static_cast<size_t>(-1);

}

const unsigned long RegexMatch::DefaultStepLimit;
const size_t RegexMatch::StackLimit;

//------------------------------------------------------------------------------
// Name: RegexMatch
//------------------------------------------------------------------------------
RegexMatch::RegexMatch(const Regex *regex) : regex_(regex), input(nullptr), startOfString(nullptr), endOfString(nullptr), node_(nullptr), cont_(NoFrame), steps_(0), step_limit_(DefaultStepLimit), startp_(regex->Total_Paren, nullptr), endp_(regex->Total_Paren, nullptr), matched_(false), Limit_Exceeded(false) {
}

//------------------------------------------------------------------------------
// Name:     ExecRE
// Synopsis: match a 'Regex' structure against a string
// Desc:     Start positions from 'from' up to and including 'end' are tried
//           left to right, one character at a time, and the first one that
//           matches wins.  A regex that begins with ^ is only tried at
//           'string' itself.  Matches never extend past 'end'.
//------------------------------------------------------------------------------
bool RegexMatch::ExecRE(const char *string, const char *end, const char *from) {

	// Check for valid parameters.
	if (!string) {
		throw std::invalid_argument("NULL parameter to 'ExecRE'");
	}

	if (!end) {
		end = string + strlen(string);
	}

	if (!from) {
		from = string;
	}

	startOfString  = string;
	endOfString    = end;
	matched_       = false;
	Limit_Exceeded = false;

	std::fill(startp_.begin(), startp_.end(), nullptr);
	std::fill(endp_.begin(),   endp_.end(),   nullptr);

	// Nothing shorter than the regex's minimum width can match.  Every
	// character takes at least one byte, so the byte count is a safe bound.
	if (from > end || static_cast<size_t>(end - from) < regex_->min_width_) {
		return false;
	}

	const char *const last = end - regex_->min_width_;

	if (regex_->anchor_) {
		// Search is anchored at BOL

		if (from == string) {
			matched_ = attempt(string);
		}
	} else if (regex_->match_start_ != '\0') {
		// We know what char match must start with.  It is ASCII, so it
		// never shows up in the middle of a multi byte character.

		for (const char *str = from; str <= last && str < end && !Limit_Exceeded; str++) {
			if (*str == regex_->match_start_ && attempt(str)) {
				matched_ = true;
				break;
			}
		}
	} else {
		// General case

		const char *str = from;
		while (str <= last && !Limit_Exceeded) {
			if (attempt(str)) {
				matched_ = true;
				break;
			}

			if (str == end) {
				break;
			}

			str += char_length(str, end);
		}
	}

	if (Limit_Exceeded) {
		matched_ = false;
		std::fill(startp_.begin(), startp_.end(), nullptr);
		std::fill(endp_.begin(),   endp_.end(),   nullptr);
	}

	return matched_;
}

//------------------------------------------------------------------------------
// Name: attempt
// Desc: try match at specific point, returns: false failure, true success.
//       Each pass of the loop either matches node_, follows the frame chain
//       or, after a failure, resumes from the newest choice point.
//------------------------------------------------------------------------------
bool RegexMatch::attempt(const char *string) {

	input = string;
	node_ = regex_->root_.get();
	cont_ = NoFrame;

	// The step budget is per start position.
	steps_ = 0;

	frames_.clear();
	choices_.clear();
	undo_.clear();

	std::fill(startp_.begin(), startp_.end(), nullptr);
	std::fill(endp_.begin(),   endp_.end(),   nullptr);

	for (;;) {
		if (!enter()) {
			return false;
		}

		bool ok;

		if (node_) {
			ok = match();
		} else if (cont_ == NoFrame) {
			startp_[0] = string;
			endp_[0]   = input; // <-- One char AFTER matched string!
			return true;
		} else {
			ok = proceed();
		}

		while (!ok) {
			if (choices_.empty() || !enter()) {
				return false;
			}

			ok = backtrack();
		}
	}
}

//------------------------------------------------------------------------------
// Name: enter
// Desc: per step bookkeeping, returns false once either resource limit has
//       been reached
//------------------------------------------------------------------------------
bool RegexMatch::enter() {

	if (step_limit_ != 0 && ++steps_ > step_limit_) {
		qDebug("step limit of %lu exceeded, please respecify expression", step_limit_);
		Limit_Exceeded = true;
		return false;
	}

	if (frames_.size() + choices_.size() + undo_.size() > StackLimit) {
		qDebug("backtracking stack limit exceeded, please respecify expression");
		Limit_Exceeded = true;
		return false;
	}

	return true;
}

//------------------------------------------------------------------------------
// Name: match
// Desc: Conceptually the strategy is simple: check to see whether node_
//       matches at input, then leave the rest of the match to proceed().
//       Alternatives and repetitions record a choice point to come back to
//       when the rest fails.
//------------------------------------------------------------------------------
bool RegexMatch::match() {

	const RegexNode *const node = node_;

	switch (node->type) {
	case BOL:
		if (input != startOfString) {
			return false;
		}

		node_ = nullptr;
		return true;

	case EOL:
		if (!atEndOfString(input)) {
			return false;
		}

		node_ = nullptr;
		return true;

	case LITERAL:
	case ANY:
	case ANY_OF:
	case ANY_BUT: {
		if (atEndOfString(input)) {
			return false;
		}

		code_point c;
		const size_t length = decode_char(input, endOfString, &c);

		if (!node->matchesChar(c)) {
			return false;
		}

		input += length;
		node_ = nullptr;
		return true;
	}

	case BACK_REF: {
		const size_t paren_no = node->index;

		if (paren_no >= startp_.size() || startp_[paren_no] == nullptr || endp_[paren_no] == nullptr) {
			return false;
		}

		const char *captured      = startp_[paren_no];
		const char *const cap_end = endp_[paren_no];

		if (node->caseInsensitive) {
			const char *str = input;

			while (captured < cap_end) {
				if (atEndOfString(str)) {
					return false;
				}

				code_point want;
				code_point got;
				captured += decode_char(captured, cap_end, &want);
				str      += decode_char(str, endOfString, &got);

				if (fold_case(want) != fold_case(got)) {
					return false;
				}
			}

			input = str;
		} else {
			const size_t len = static_cast<size_t>(cap_end - captured);

			if (static_cast<size_t>(endOfString - input) < len || memcmp(captured, input, len) != 0) {
				return false;
			}

			input += len;
		}

		node_ = nullptr;
		return true;
	}

	case GROUP:
		if (node->index != 0) {
			const Frame close = {Frame::CLOSE, node, 0, REG_ZERO, input, cont_};
			push_frame(close);
		}

		node_ = node->child(0);
		return true;

	case CONCAT:
		if (node->children.empty()) {
			node_ = nullptr;
			return true;
		}

		// The last child needs no frame of its own, it continues with cont_.
		if (node->children.size() > 1) {
			const Frame sequence = {Frame::SEQUENCE, node, 0, REG_ZERO, nullptr, cont_};
			push_frame(sequence);
		}

		node_ = node->child(0);
		return true;

	case ALTERNATION:
		if (node->children.size() > 1) {
			push_choice(BRANCH, node, nullptr, 1);
		}

		node_ = node->child(0);
		return true;

	case QUANTIFIED:
		if (node->child(0)->isSimple()) {
			return repeat_simple(node);
		}

		return repeat(node, REG_ZERO, cont_);
	}

	qDebug("memory corruption, 'match'");
	return false;
}

//------------------------------------------------------------------------------
// Name: proceed
// Desc: continue the match with the frame at the head of the chain
//------------------------------------------------------------------------------
bool RegexMatch::proceed() {

	// A copy, pushing frames may move the vector.
	const Frame frame = frames_[cont_];

	switch (frame.kind) {
	case Frame::SEQUENCE: {
		const size_t position = frame.position + 1;

		cont_ = frame.next;

		if (position + 1 < frame.node->children.size()) {
			const Frame sequence = {Frame::SEQUENCE, frame.node, position, REG_ZERO, nullptr, frame.next};
			push_frame(sequence);
		}

		node_ = frame.node->child(position);
		return true;
	}

	case Frame::CLOSE: {
		const size_t paren_no = frame.node->index;
		const Undo undo       = {paren_no, startp_[paren_no], endp_[paren_no]};

		undo_.push_back(undo);

		startp_[paren_no] = frame.mark;
		endp_[paren_no]   = input;

		cont_ = frame.next;
		return true;
	}

	case Frame::REPEAT:
		// An iteration that matched the empty string ends the loop.
		if (input == frame.mark) {
			cont_ = frame.next;
			return true;
		}

		return repeat(frame.node, frame.count + 1, frame.next);
	}

	qDebug("memory corruption, 'proceed'");
	return false;
}

//------------------------------------------------------------------------------
// Name: repeat
// Desc: general case of a QUANTIFIED node, 'count' iterations have matched so
//       far and 'next' is the rest of the match.  Greedy tries another
//       iteration before the rest of the match, lazy the other way around.
//------------------------------------------------------------------------------
bool RegexMatch::repeat(const RegexNode *node, unsigned long count, size_t next) {

	const Frame iteration = {Frame::REPEAT, node, 0, count, input, next};

	cont_ = next;

	if (node->lazy) {
		if (count < node->min) {
			push_frame(iteration);
			node_ = node->child(0);
			return true;
		}

		if (count < node->max) {
			push_frame(iteration);
			push_choice(ITERATE, node, nullptr, count);
			cont_ = next;
		}

		node_ = nullptr;
		return true;
	}

	if (count < node->max) {
		if (count >= node->min) {
			push_choice(PROCEED, node, nullptr, count);
		}

		push_frame(iteration);
		node_ = node->child(0);
		return true;
	}

	node_ = nullptr;
	return true;
}

//------------------------------------------------------------------------------
// Name: repeat_simple
// Desc: QUANTIFIED node whose operand is a single character.  The run is
//       measured once with greedy() and a choice point gives back (greedy)
//       or takes (lazy) one character at a time if the rest fails.
//------------------------------------------------------------------------------
bool RegexMatch::repeat_simple(const RegexNode *node) {

	const RegexNode *const operand = node->child(0);
	const char *const save         = input;
	const char *stop;

	if (!node->lazy) {
		const unsigned long num_matched = greedy(operand, node->max, &stop);

		if (num_matched < node->min) {
			return false;
		}

		input = stop;

		if (num_matched > node->min) {
			push_choice(FEWER, node, save, num_matched);
		}
	} else {
		const unsigned long num_matched = greedy(operand, node->min, &stop);

		if (num_matched < node->min) {
			return false;
		}

		input = stop;

		if (num_matched < node->max) {
			push_choice(MORE, node, save, num_matched);
		}
	}

	node_ = nullptr;
	return true;
}

//------------------------------------------------------------------------------
// Name: backtrack
// Desc: pops the newest choice point, restores the state saved with it and
//       takes its next alternative.  Returns false if that alternative fails
//       at once.
//------------------------------------------------------------------------------
bool RegexMatch::backtrack() {

	const Choice choice = choices_.back();
	choices_.pop_back();

	input = choice.input;
	node_ = nullptr;
	cont_ = choice.cont;

	frames_.erase(frames_.begin() + static_cast<std::ptrdiff_t>(choice.frames), frames_.end());

	while (undo_.size() > choice.undo) {
		const Undo &undo = undo_.back();
		startp_[undo.paren_no] = undo.start;
		endp_[undo.paren_no]   = undo.end;
		undo_.pop_back();
	}

	switch (choice.kind) {
	case BRANCH:
		if (choice.count + 1 < choice.node->children.size()) {
			push_choice(BRANCH, choice.node, nullptr, choice.count + 1);
		}

		node_ = choice.node->child(choice.count);
		return true;

	case ITERATE:
		node_ = choice.node->child(0);
		return true;

	case PROCEED:
		return true;

	case FEWER: {
		const unsigned long count = choice.count - 1;

		input = previous_char(choice.save, choice.input);

		if (count > choice.node->min) {
			push_choice(FEWER, choice.node, choice.save, count);
		}

		return true;
	}

	case MORE: {
		if (atEndOfString(input)) {
			return false;
		}

		code_point c;
		const size_t length = decode_char(input, endOfString, &c);

		if (!choice.node->child(0)->matchesChar(c)) {
			return false;
		}

		input += length;

		const unsigned long count = choice.count + 1;

		if (count < choice.node->max) {
			push_choice(MORE, choice.node, choice.save, count);
		}

		return true;
	}
	}

	qDebug("memory corruption, 'backtrack'");
	return false;
}

//------------------------------------------------------------------------------
// Name: push_frame
// Desc: makes 'frame' the head of the chain
//------------------------------------------------------------------------------
void RegexMatch::push_frame(const Frame &frame) {
	frames_.push_back(frame);
	cont_ = frames_.size() - 1;
}

void RegexMatch::push_choice(ChoiceKind kind, const RegexNode *node, const char *save, unsigned long count) {
	const Choice choice = {kind, node, input, save, count, cont_, frames_.size(), undo_.size()};
	choices_.push_back(choice);
}

//------------------------------------------------------------------------------
// Name: greedy
// Desc: Repeatedly match something simple up to "max" times.  Uses unsigned
//       long variables to maximize the amount of text matchable for
//       unbounded qualifiers like '*' and '+'.  '*stop' is set to the end of
//       the run.
// Returns: the actual number of matches.
//------------------------------------------------------------------------------
unsigned long RegexMatch::greedy(const RegexNode *p, unsigned long max, const char **stop) const {

	unsigned long count = REG_ZERO;
	const char *input_str = input;

	while (count < max && !atEndOfString(input_str)) {
		code_point c;
		const size_t length = decode_char(input_str, endOfString, &c);

		if (!p->matchesChar(c)) {
			break;
		}

		input_str += length;
		count++;
	}

	*stop = input_str;
	return count;
}

//------------------------------------------------------------------------------
// Name: atEndOfString
//------------------------------------------------------------------------------
bool RegexMatch::atEndOfString(const char *p) const {
	return p >= endOfString;
}

size_t RegexMatch::captureCount() const {
	return regex_->captureCount();
}

bool RegexMatch::isSet(size_t index) const {
	return matched_ && index < startp_.size() && startp_[index] != nullptr && endp_[index] != nullptr;
}

Capture RegexMatch::capture(size_t index) const {
	Capture cap;
	cap.start = isSet(index) ? startp_[index] : nullptr;
	cap.end   = isSet(index) ? endp_[index]   : nullptr;
	return cap;
}

long RegexMatch::startOffset(size_t index) const {
	return isSet(index) ? static_cast<long>(startp_[index] - startOfString) : -1;
}

long RegexMatch::endOffset(size_t index) const {
	return isSet(index) ? static_cast<long>(endp_[index] - startOfString) : -1;
}

QByteArray RegexMatch::captured(size_t index) const {
	if (!isSet(index)) {
		return QByteArray();
	}

	return QByteArray(startp_[index], static_cast<int>(endp_[index] - startp_[index]));
}
